#pragma once

#include <string>

namespace gateway::domain {

enum class InstrumentClass {
    FX,
    METAL,
    INDEX,
    OTHER
};

inline std::string toString(InstrumentClass cls) {
    switch (cls) {
        case InstrumentClass::FX: return "fx";
        case InstrumentClass::METAL: return "metal";
        case InstrumentClass::INDEX: return "index";
        default: return "other";
    }
}

inline InstrumentClass parseInstrumentClass(const std::string& str) {
    if (str == "fx") return InstrumentClass::FX;
    if (str == "metal") return InstrumentClass::METAL;
    if (str == "index") return InstrumentClass::INDEX;
    return InstrumentClass::OTHER;
}

} // namespace gateway::domain
