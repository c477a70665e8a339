#pragma once

#include "domain/Notification.hpp"

namespace gateway::ports::output {

/**
 * @brief Канал уведомлений (fire-and-forget)
 *
 * Реализация не должна блокировать и не должна бросать исключения.
 */
class INotifier {
public:
    virtual ~INotifier() = default;
    virtual void notify(const domain::Notification& notification) = 0;
};

} // namespace gateway::ports::output
