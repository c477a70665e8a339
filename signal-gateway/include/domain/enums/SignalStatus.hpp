#pragma once

#include <string>

namespace gateway::domain {

/**
 * @brief Итоговый статус обработки сигнала
 *
 * OK / PARTIAL / ERROR — результат исполнения на двух целях.
 * IGNORED — дубликат order_id.
 * SKIPPED — торговля выключена (kill switch).
 * REJECTED — сигнал некорректен или отклонён guard'ом.
 */
enum class SignalStatus {
    OK,
    PARTIAL,
    ERROR,
    IGNORED,
    SKIPPED,
    REJECTED
};

inline std::string toString(SignalStatus status) {
    switch (status) {
        case SignalStatus::OK: return "ok";
        case SignalStatus::PARTIAL: return "partial";
        case SignalStatus::ERROR: return "error";
        case SignalStatus::IGNORED: return "ignored";
        case SignalStatus::SKIPPED: return "skipped";
        case SignalStatus::REJECTED: return "rejected";
        default: return "error";
    }
}

} // namespace gateway::domain
