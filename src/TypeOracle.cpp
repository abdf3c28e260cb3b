#include "TypeOracle.h"

namespace Cil {

    std::string_view ToString(FlavorKind kind) {
        switch (kind) {
            case FlavorKind::Boolean: return "Boolean";
            case FlavorKind::Char: return "Char";
            case FlavorKind::I1: return "I1";
            case FlavorKind::U1: return "U1";
            case FlavorKind::I2: return "I2";
            case FlavorKind::U2: return "U2";
            case FlavorKind::I4: return "I4";
            case FlavorKind::U4: return "U4";
            case FlavorKind::I8: return "I8";
            case FlavorKind::U8: return "U8";
            case FlavorKind::R4: return "R4";
            case FlavorKind::R8: return "R8";
            case FlavorKind::I: return "I";
            case FlavorKind::U: return "U";
            case FlavorKind::String: return "String";
            case FlavorKind::Class: return "Class";
            case FlavorKind::ValueType: return "ValueType";
            case FlavorKind::Array: return "Array";
            case FlavorKind::Void: return "Void";
            case FlavorKind::Pointer: return "Pointer";
            case FlavorKind::GenericParameter: return "GenericParameter";
            case FlavorKind::Other: return "Other";
        }
        return "Unknown";
    }

} // namespace Cil
