#pragma once

#include "domain/InstrumentMeta.hpp"
#include "settings/EnvReader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <vector>
#include <string>
#include <stdexcept>
#include <iostream>

namespace gateway::settings {

/**
 * @brief Справочник инструментов
 *
 * По умолчанию — встроенный набор (FX мажоры, золото, индексы).
 * INSTRUMENT_CATALOG_PATH заменяет его целиком JSON файлом вида:
 *
 * {
 *   "EUR_USD": {"aliases": ["EURUSD", "FX:EURUSD"], "kind": "fx", "pip": 0.0001},
 *   "US30_USD": {"aliases": ["US30", "DJI"], "kind": "index", "point": 1.0}
 * }
 *
 * Нечитаемый или некорректный файл — ошибка конфигурации, сервис не стартует.
 */
class InstrumentCatalogSettings {
public:
    InstrumentCatalogSettings() {
        std::string path = EnvReader::getEnvOrDefault("INSTRUMENT_CATALOG_PATH", "");
        if (path.empty()) {
            instruments_ = builtIn();
        } else {
            instruments_ = loadFile(path);
        }
        std::cout << "[InstrumentCatalogSettings] Loaded " << instruments_.size()
                  << " instruments" << (path.empty() ? " (built-in)" : " from " + path) << std::endl;
    }

    explicit InstrumentCatalogSettings(std::vector<domain::InstrumentMeta> instruments)
        : instruments_(std::move(instruments))
    {}

    const std::vector<domain::InstrumentMeta>& getInstruments() const { return instruments_; }

    static std::vector<domain::InstrumentMeta> builtIn() {
        using domain::InstrumentClass;
        return {
            {"EUR_USD", InstrumentClass::FX, 0.0001, std::nullopt, {"EURUSD", "FX:EURUSD", "OANDA:EURUSD"}},
            {"GBP_USD", InstrumentClass::FX, 0.0001, std::nullopt, {"GBPUSD", "FX:GBPUSD", "OANDA:GBPUSD"}},
            {"USD_JPY", InstrumentClass::FX, 0.01, std::nullopt, {"USDJPY", "FX:USDJPY", "OANDA:USDJPY"}},
            {"XAU_USD", InstrumentClass::METAL, std::nullopt, 0.1,
             {"XAUUSD", "GOLD", "OANDA:XAUUSD", "FOREXCOM:XAUUSD"}},
            {"US30_USD", InstrumentClass::INDEX, std::nullopt, 1.0,
             {"US30", "US30USD", "OANDA:US30USD", "DJI", "US30.CASH"}},
            {"NAS100_USD", InstrumentClass::INDEX, std::nullopt, 1.0,
             {"NAS100", "US100", "NAS100USD", "OANDA:NAS100USD"}}
        };
    }

    static std::vector<domain::InstrumentMeta> parse(const nlohmann::json& json) {
        if (!json.is_object()) {
            throw std::runtime_error("Instrument catalog must be a JSON object");
        }

        std::vector<domain::InstrumentMeta> result;
        for (auto it = json.begin(); it != json.end(); ++it) {
            const auto& j = it.value();
            domain::InstrumentMeta meta;
            meta.id = EnvReader::toUpper(it.key());
            meta.instrumentClass = domain::parseInstrumentClass(j.value("kind", "other"));
            if (j.contains("pip") && j["pip"].is_number()) {
                meta.pipSize = j["pip"].get<double>();
            }
            if (j.contains("point") && j["point"].is_number()) {
                meta.pointSize = j["point"].get<double>();
            }
            if (j.contains("aliases") && j["aliases"].is_array()) {
                for (const auto& alias : j["aliases"]) {
                    meta.aliases.push_back(alias.get<std::string>());
                }
            }
            result.push_back(std::move(meta));
        }
        return result;
    }

private:
    std::vector<domain::InstrumentMeta> instruments_;

    static std::vector<domain::InstrumentMeta> loadFile(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open instrument catalog: " + path);
        }
        try {
            return parse(nlohmann::json::parse(in));
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid instrument catalog " + path + ": " + e.what());
        }
    }
};

} // namespace gateway::settings
