#pragma once

#include <string>
#include <optional>
#include <algorithm>
#include <cctype>

namespace gateway::domain {

enum class Side {
    BUY,
    SELL
};

inline std::string toString(Side side) {
    switch (side) {
        case Side::BUY: return "BUY";
        case Side::SELL: return "SELL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Распознать сторону сделки по полю action/signal
 *
 * Принимает "BUY", "buy", "BUY_SIGNAL", "SELL_SIGNAL" и т.п.
 * BUY проверяется первым.
 */
inline std::optional<Side> parseSide(const std::string& action) {
    std::string upper = action;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper.find("BUY") != std::string::npos) return Side::BUY;
    if (upper.find("SELL") != std::string::npos) return Side::SELL;
    return std::nullopt;
}

} // namespace gateway::domain
