#pragma once

#include "domain/CopyTradeOrder.hpp"
#include "domain/ExecutionOutcome.hpp"

namespace gateway::ports::output {

/**
 * @brief Интерфейс copy-trade relay (вторая цель исполнения)
 */
class ICopyTradeRelay {
public:
    virtual ~ICopyTradeRelay() = default;

    virtual domain::TargetOutcome forward(const domain::CopyTradeOrder& order) = 0;
};

} // namespace gateway::ports::output
