#pragma once

#include <cstdint>

namespace gateway::domain {

struct SizingResult {
    int64_t units = 1;
    double appliedRiskPct = 0.0;
};

} // namespace gateway::domain
