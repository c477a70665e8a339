#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace gateway::utils {

/**
 * @brief Генератор коротких идентификаторов
 *
 * Используется для order_id сигналов без идентификатора ("tv-xxxxxxxx")
 * и clientOrderId copy-trade ордеров ("tv_v1-xxxxxxxx").
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @param prefix Префикс (например, "tv", "tv_v1")
     * @return ID в формате "prefix-xxxxxxxx"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint32_t> dist;

        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(8) << dist(gen);
        return ss.str();
    }
};

} // namespace gateway::utils
