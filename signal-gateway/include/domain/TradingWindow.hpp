#pragma once

#include "LocalTime.hpp"
#include <string>
#include <optional>
#include <sstream>
#include <array>
#include <algorithm>
#include <cctype>

namespace gateway::domain {

/**
 * @brief Торговое окно: дни недели + локальный интервал времени
 *
 * Формат: "[DAYS ]HH:MM-HH:MM"
 *   "09:30-16:00"              — каждый день
 *   "MON-FRI 09:30-16:00"      — диапазон дней
 *   "MON,WED,FRI 08:00-12:00"  — список дней
 *
 * Если start > end, окно переходит через полночь ("22:00-02:00").
 * Границы включительно.
 */
class TradingWindow {
public:
    std::array<bool, 7> days{{true, true, true, true, true, true, true}};
    int startMinute = 0;
    int endMinute = 24 * 60 - 1;

    static std::optional<TradingWindow> parse(const std::string& spec) {
        std::string trimmed = trim(spec);
        if (trimmed.empty()) {
            return std::nullopt;
        }

        TradingWindow window;
        std::string timePart = trimmed;

        auto space = trimmed.find(' ');
        if (space != std::string::npos) {
            auto days = parseDays(trim(trimmed.substr(0, space)));
            if (!days) {
                return std::nullopt;
            }
            window.days = *days;
            timePart = trim(trimmed.substr(space + 1));
        }

        auto dash = timePart.find('-');
        if (dash == std::string::npos) {
            return std::nullopt;
        }

        auto start = parseMinute(trim(timePart.substr(0, dash)));
        auto end = parseMinute(trim(timePart.substr(dash + 1)));
        if (!start || !end) {
            return std::nullopt;
        }

        window.startMinute = *start;
        window.endMinute = *end;
        return window;
    }

    bool contains(const LocalTime& local) const {
        if (startMinute <= endMinute) {
            return days[local.weekday % 7] &&
                   local.minuteOfDay >= startMinute && local.minuteOfDay <= endMinute;
        }

        // Через полночь: хвост после полуночи относится к дню открытия окна
        if (local.minuteOfDay >= startMinute) {
            return days[local.weekday % 7];
        }
        if (local.minuteOfDay <= endMinute) {
            return days[(local.weekday + 6) % 7];
        }
        return false;
    }

private:
    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    static std::optional<int> parseMinute(const std::string& hhmm) {
        auto colon = hhmm.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= hhmm.size()) {
            return std::nullopt;
        }
        try {
            size_t consumedH = 0;
            size_t consumedM = 0;
            int h = std::stoi(hhmm.substr(0, colon), &consumedH);
            int m = std::stoi(hhmm.substr(colon + 1), &consumedM);
            if (consumedH != colon || consumedM != hhmm.size() - colon - 1) {
                return std::nullopt;
            }
            if (h < 0 || h > 23 || m < 0 || m > 59) {
                return std::nullopt;
            }
            return h * 60 + m;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    static std::optional<int> parseDay(const std::string& token) {
        static const std::array<const char*, 7> names{{"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"}};
        std::string upper = token;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (size_t i = 0; i < names.size(); ++i) {
            if (upper == names[i]) {
                return static_cast<int>(i);
            }
        }
        return std::nullopt;
    }

    static std::optional<std::array<bool, 7>> parseDays(const std::string& spec) {
        std::array<bool, 7> result{};

        std::stringstream ss(spec);
        std::string item;
        bool any = false;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            auto dash = item.find('-');
            if (dash == std::string::npos) {
                auto day = parseDay(item);
                if (!day) return std::nullopt;
                result[*day] = true;
            } else {
                auto from = parseDay(item.substr(0, dash));
                auto to = parseDay(item.substr(dash + 1));
                if (!from || !to) return std::nullopt;
                // FRI-MON тоже допустим
                for (int d = *from;; d = (d + 1) % 7) {
                    result[d] = true;
                    if (d == *to) break;
                }
            }
            any = true;
        }

        if (!any) {
            return std::nullopt;
        }
        return result;
    }
};

} // namespace gateway::domain
