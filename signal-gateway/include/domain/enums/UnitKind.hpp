#pragma once

#include <string>
#include <algorithm>
#include <cctype>

namespace gateway::domain {

/**
 * @brief Единицы, в которых клиент передаёт SL/TP
 */
enum class UnitKind {
    PIPS,
    POINTS,
    PRICE
};

inline std::string toString(UnitKind kind) {
    switch (kind) {
        case UnitKind::PIPS: return "pips";
        case UnitKind::POINTS: return "points";
        case UnitKind::PRICE: return "price";
        default: return "points";
    }
}

// Неизвестная единица трактуется как points
inline UnitKind parseUnitKind(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "pips" || lower == "pip") return UnitKind::PIPS;
    if (lower == "price") return UnitKind::PRICE;
    return UnitKind::POINTS;
}

} // namespace gateway::domain
