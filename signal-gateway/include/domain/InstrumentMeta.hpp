#pragma once

#include "enums/InstrumentClass.hpp"
#include <string>
#include <vector>
#include <optional>

namespace gateway::domain {

/**
 * @brief Справочные данные инструмента
 *
 * Загружаются один раз при старте, на запросах не изменяются.
 * FX инструменты задают pipSize, индексы и металлы — pointSize.
 */
struct InstrumentMeta {
    std::string id;
    InstrumentClass instrumentClass = InstrumentClass::OTHER;
    std::optional<double> pipSize;
    std::optional<double> pointSize;
    std::vector<std::string> aliases;
};

} // namespace gateway::domain
