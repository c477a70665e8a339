#pragma once

#include "domain/PositionSnapshot.hpp"

namespace gateway::ports::output {

/**
 * @brief Счётчики открытых позиций для concurrency guard
 *
 * Никогда не бросает: при сбое upstream — нули с degraded = true.
 */
class IPositionCensus {
public:
    virtual ~IPositionCensus() = default;
    virtual domain::PositionSnapshot openPositions() = 0;
};

} // namespace gateway::ports::output
