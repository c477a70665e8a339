#pragma once

#include <optional>

namespace gateway::domain {

struct DailyLossInfo {
    bool enabled = false;
    bool ok = true;
    std::optional<double> startBalance;
    std::optional<double> balanceNow;
    double drawdownPct = 0.0;
    double limitPct = 0.0;
};

} // namespace gateway::domain
