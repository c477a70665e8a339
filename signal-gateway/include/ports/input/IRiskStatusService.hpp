#pragma once

#include "domain/RiskStatus.hpp"

namespace gateway::ports::input {

class IRiskStatusService {
public:
    virtual ~IRiskStatusService() = default;
    virtual domain::RiskStatus snapshot() = 0;
};

} // namespace gateway::ports::input
