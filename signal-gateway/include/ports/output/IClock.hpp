#pragma once

#include "domain/Timestamp.hpp"
#include "domain/LocalTime.hpp"

namespace gateway::ports::output {

class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() const = 0;

    /**
     * @brief Локальное время в торговой таймзоне
     */
    virtual domain::LocalTime localNow() const = 0;
};

} // namespace gateway::ports::output
