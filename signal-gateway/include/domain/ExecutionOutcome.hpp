#pragma once

#include <string>
#include <vector>

namespace gateway::domain {

/**
 * @brief Результат вызова одной цели исполнения (broker / copy-trade)
 *
 * skipped == true: вызов не выполнялся (dry-run или форвардинг выключен),
 * считается успешным.
 */
struct TargetOutcome {
    std::string target;
    bool success = false;
    int statusCode = 0;
    std::string message;
    bool skipped = false;

    static TargetOutcome noop(const std::string& target, const std::string& message) {
        return TargetOutcome{target, true, 200, message, true};
    }

    static TargetOutcome failure(const std::string& target, int statusCode, const std::string& message) {
        return TargetOutcome{target, false, statusCode, message, false};
    }
};

enum class AggregateStatus {
    OK,
    PARTIAL,
    ERROR
};

inline std::string toString(AggregateStatus status) {
    switch (status) {
        case AggregateStatus::OK: return "ok";
        case AggregateStatus::PARTIAL: return "partial";
        default: return "error";
    }
}

/**
 * @brief ok — все цели успешны, error — все провалились, иначе partial
 */
inline AggregateStatus aggregate(const std::vector<TargetOutcome>& outcomes) {
    size_t succeeded = 0;
    for (const auto& o : outcomes) {
        if (o.success) ++succeeded;
    }
    if (succeeded == outcomes.size()) return AggregateStatus::OK;
    if (succeeded == 0) return AggregateStatus::ERROR;
    return AggregateStatus::PARTIAL;
}

struct ExecutionReport {
    AggregateStatus status = AggregateStatus::ERROR;
    TargetOutcome broker;
    TargetOutcome copyTrade;
};

} // namespace gateway::domain
