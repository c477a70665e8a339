#pragma once

#include <string>
#include <vector>

namespace gateway::domain {

struct GuardDecision {
    std::string guard;
    bool passed = true;
    std::string reason;

    static GuardDecision pass(const std::string& guard) {
        return GuardDecision{guard, true, ""};
    }

    static GuardDecision veto(const std::string& guard, const std::string& reason) {
        return GuardDecision{guard, false, reason};
    }
};

/**
 * @brief Результат цепочки guard'ов
 *
 * decisions содержит все выполненные проверки, последняя — вето (если было).
 */
struct GuardVerdict {
    bool admitted = true;
    std::vector<GuardDecision> decisions;

    const GuardDecision* veto() const {
        if (admitted || decisions.empty()) {
            return nullptr;
        }
        return &decisions.back();
    }
};

} // namespace gateway::domain
