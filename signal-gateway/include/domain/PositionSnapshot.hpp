#pragma once

#include <string>
#include <map>

namespace gateway::domain {

/**
 * @brief Число открытых позиций: всего и по инструментам
 *
 * degraded == true: upstream недоступен, счётчики нулевые (fail open).
 */
struct PositionSnapshot {
    int total = 0;
    std::map<std::string, int> perInstrument;
    bool degraded = false;

    int countFor(const std::string& instrument) const {
        auto it = perInstrument.find(instrument);
        return it != perInstrument.end() ? it->second : 0;
    }
};

} // namespace gateway::domain
