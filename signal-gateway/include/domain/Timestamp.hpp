#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace gateway::domain {

/**
 * @brief Временная метка (UTC)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    Timestamp operator+(std::chrono::milliseconds delta) const {
        return Timestamp(value + delta);
    }

    // Возраст относительно другой метки
    std::chrono::milliseconds since(const Timestamp& earlier) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value - earlier.value);
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }
};

} // namespace gateway::domain
