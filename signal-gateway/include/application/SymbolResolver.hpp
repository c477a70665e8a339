#pragma once

#include "domain/InstrumentMeta.hpp"
#include "domain/RiskPolicy.hpp"
#include "settings/InstrumentCatalogSettings.hpp"
#include <unordered_map>
#include <map>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <iostream>

namespace gateway::application {

/**
 * @brief Нормализация клиентских символов в канонические id инструментов
 *
 * Таблица алиасов строится один раз из справочника и далее только читается,
 * поэтому resolve() безопасен для одновременных вызовов.
 *
 * Ключ таблицы — нормализованная форма: верхний регистр без ':' и '.'.
 * Канонический id отображается сам в себя.
 */
class SymbolResolver {
public:
    explicit SymbolResolver(std::shared_ptr<settings::InstrumentCatalogSettings> catalog) {
        for (const auto& meta : catalog->getInstruments()) {
            std::string id = normalize(meta.id);
            instruments_[id] = meta;
            instruments_[id].id = id;
            aliases_[id] = id;
            for (const auto& alias : meta.aliases) {
                aliases_[normalize(alias)] = id;
            }
        }
        std::cout << "[SymbolResolver] " << instruments_.size() << " instruments, "
                  << aliases_.size() << " aliases" << std::endl;
    }

    /**
     * @brief Канонический id для клиентского символа
     *
     * Неизвестный символ возвращается в нормализованной форме.
     */
    std::string resolve(const std::string& raw) const {
        std::string key = normalize(raw);
        auto it = aliases_.find(key);
        return it != aliases_.end() ? it->second : key;
    }

    const domain::InstrumentMeta* find(const std::string& instrumentId) const {
        auto it = instruments_.find(instrumentId);
        return it != instruments_.end() ? &it->second : nullptr;
    }

    /**
     * @brief Перевести allow-list и per-instrument карты политики в канонические id
     *
     * Оператор может писать в конфигурации "US30" или "OANDA:US30USD" —
     * guard'ы и сайзер сравнивают только канонические id.
     */
    domain::RiskPolicy canonicalize(const domain::RiskPolicy& policy) const {
        domain::RiskPolicy result = policy;

        result.allowList.clear();
        for (const auto& symbol : policy.allowList) {
            std::string id = resolve(symbol);
            if (std::find(result.allowList.begin(), result.allowList.end(), id) == result.allowList.end()) {
                result.allowList.push_back(id);
            }
        }

        result.instrumentUnitCaps = remap(policy.instrumentUnitCaps);
        result.instrumentRiskCaps = remap(policy.instrumentRiskCaps);
        result.instrumentMinStop = remap(policy.instrumentMinStop);
        result.instrumentMaxOpen = remap(policy.instrumentMaxOpen);
        return result;
    }

    static std::string normalize(const std::string& raw) {
        std::string result;
        result.reserve(raw.size());
        for (unsigned char c : raw) {
            if (c == ':' || c == '.' || std::isspace(c)) {
                continue;
            }
            result.push_back(static_cast<char>(std::toupper(c)));
        }
        return result;
    }

private:
    std::unordered_map<std::string, std::string> aliases_;
    std::unordered_map<std::string, domain::InstrumentMeta> instruments_;

    template <typename T>
    std::map<std::string, T> remap(const std::map<std::string, T>& source) const {
        std::map<std::string, T> result;
        for (const auto& [symbol, value] : source) {
            result[resolve(symbol)] = value;
        }
        return result;
    }
};

} // namespace gateway::application
