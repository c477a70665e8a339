#pragma once

#include "domain/Signal.hpp"
#include "domain/AuditRecord.hpp"
#include "domain/DryRunReport.hpp"

namespace gateway::ports::input {

/**
 * @brief Интерфейс обработки торговых сигналов
 */
class ISignalService {
public:
    virtual ~ISignalService() = default;

    /**
     * @brief Полная обработка сигнала: дедупликация, guard'ы, сайзинг, исполнение
     *
     * Не бросает — любой сбой отражается в статусе записи.
     */
    virtual domain::AuditRecord process(const domain::Signal& signal) = 0;

    /**
     * @brief Расчёт без исполнения, дедупликации и аудита
     */
    virtual domain::DryRunReport preview(const domain::Signal& signal) = 0;
};

} // namespace gateway::ports::input
