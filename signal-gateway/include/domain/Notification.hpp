#pragma once

#include <string>
#include <vector>
#include <utility>

namespace gateway::domain {

/**
 * @brief Уведомление для side-channel (Discord embed)
 */
struct Notification {
    std::string title;
    int color = 0x2ecc71;
    std::vector<std::pair<std::string, std::string>> fields;
};

} // namespace gateway::domain
