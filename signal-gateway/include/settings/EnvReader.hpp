#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <vector>
#include <sstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <type_traits>
#include <iostream>

namespace gateway::settings {

/**
 * @brief Чтение переменных окружения с дефолтами
 *
 * Некорректные числа не роняют сервис: логируется предупреждение
 * и используется значение по умолчанию.
 */
class EnvReader {
public:
    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : defaultValue;
    }

    static bool getBool(const char* name, bool defaultValue) {
        const char* value = std::getenv(name);
        if (!value) {
            return defaultValue;
        }
        std::string lower = toLower(trim(value));
        return lower == "true" || lower == "1" || lower == "yes";
    }

    static int getInt(const char* name, int defaultValue) {
        const char* value = std::getenv(name);
        if (!value) {
            return defaultValue;
        }
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            std::cerr << "[EnvReader] Invalid integer in " << name << ": " << value << std::endl;
            return defaultValue;
        }
    }

    static double getDouble(const char* name, double defaultValue) {
        const char* value = std::getenv(name);
        if (!value) {
            return defaultValue;
        }
        double parsed = 0.0;
        try {
            parsed = std::stod(value);
        } catch (const std::exception&) {
            parsed = std::nan("");
        }
        if (std::isfinite(parsed)) {
            return parsed;
        }
        std::cerr << "[EnvReader] Invalid number in " << name << ": " << value << std::endl;
        return defaultValue;
    }

    /**
     * @brief "US30, nas100 ,XAUUSD" → {"US30", "NAS100", "XAUUSD"}
     */
    static std::vector<std::string> parseList(const std::string& raw) {
        std::vector<std::string> result;
        std::stringstream ss(raw);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = toUpper(trim(item));
            if (!item.empty()) {
                result.push_back(item);
            }
        }
        return result;
    }

    /**
     * @brief Карта "символ → число" из JSON или из "K:V,K:V"
     *
     * JSON: {"EURUSD": 100000, "XAUUSD": 5000}
     * Список: "EURUSD:100000, XAUUSD:5000"
     * Ключи приводятся к верхнему регистру, некорректные пары пропускаются.
     */
    template <typename T>
    static std::map<std::string, T> parseSymbolMap(const std::string& raw) {
        std::map<std::string, T> result;
        std::string trimmed = trim(raw);
        if (trimmed.empty()) {
            return result;
        }

        if (trimmed.front() == '{') {
            try {
                auto json = nlohmann::json::parse(trimmed);
                for (auto it = json.begin(); it != json.end(); ++it) {
                    std::optional<T> value;
                    if (it.value().is_number()) {
                        value = convert<T>(it.value().get<double>());
                    } else if (it.value().is_string()) {
                        value = convert<T>(std::stod(it.value().get<std::string>()));
                    }
                    if (value) {
                        result[toUpper(it.key())] = *value;
                    } else {
                        std::cerr << "[EnvReader] Skipping invalid entry: " << it.key() << std::endl;
                    }
                }
                return result;
            } catch (const std::exception& e) {
                std::cerr << "[EnvReader] Invalid JSON symbol map, trying K:V form: " << e.what() << std::endl;
                result.clear();
            }
        }

        std::stringstream ss(trimmed);
        std::string part;
        while (std::getline(ss, part, ',')) {
            auto colon = part.rfind(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string key = toUpper(trim(part.substr(0, colon)));
            std::string value = trim(part.substr(colon + 1));
            std::optional<T> converted;
            try {
                converted = convert<T>(std::stod(value));
            } catch (const std::exception&) {
                converted.reset();
            }
            if (converted) {
                result[key] = *converted;
            } else {
                std::cerr << "[EnvReader] Skipping invalid entry: " << part << std::endl;
            }
        }
        return result;
    }

    /**
     * @brief double → T; nullopt для NaN/inf и значений вне диапазона целого T
     */
    template <typename T>
    static std::optional<T> convert(double value) {
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
        if constexpr (std::is_integral_v<T>) {
            // max() + 1 — точная степень двойки, сравнение строгое
            constexpr double upper = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
            constexpr double lower = static_cast<double>(std::numeric_limits<T>::min());
            if (value < lower || value >= upper) {
                return std::nullopt;
            }
        }
        return static_cast<T>(value);
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    static std::string toUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
};

} // namespace gateway::settings
