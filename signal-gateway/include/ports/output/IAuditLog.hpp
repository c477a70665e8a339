#pragma once

#include "domain/AuditRecord.hpp"

namespace gateway::ports::output {

/**
 * @brief Append-only журнал обработанных сигналов
 */
class IAuditLog {
public:
    virtual ~IAuditLog() = default;
    virtual void append(const domain::AuditRecord& record) = 0;
};

} // namespace gateway::ports::output
