#include "CustomAttributeTypes.h"

#include <format>
#include <type_traits>

#include "TextEncoding.h"

namespace CustomAttribute {

    std::optional<SerializationType> ToSerializationType(uint8_t raw) {
        switch (raw) {
            case 0x02: return SerializationType::Boolean;
            case 0x03: return SerializationType::Char;
            case 0x04: return SerializationType::I1;
            case 0x05: return SerializationType::U1;
            case 0x06: return SerializationType::I2;
            case 0x07: return SerializationType::U2;
            case 0x08: return SerializationType::I4;
            case 0x09: return SerializationType::U4;
            case 0x0A: return SerializationType::I8;
            case 0x0B: return SerializationType::U8;
            case 0x0C: return SerializationType::R4;
            case 0x0D: return SerializationType::R8;
            case 0x0E: return SerializationType::String;
            case 0x1D: return SerializationType::SZArray;
            case 0x50: return SerializationType::Type;
            case 0x51: return SerializationType::TaggedObject;
            case 0x55: return SerializationType::Enum;
            default: return std::nullopt;
        }
    }

    std::string_view ToString(ArgumentKind kind) {
        switch (kind) {
            case ArgumentKind::Void: return "Void";
            case ArgumentKind::Bool: return "Bool";
            case ArgumentKind::Char: return "Char";
            case ArgumentKind::I1: return "I1";
            case ArgumentKind::U1: return "U1";
            case ArgumentKind::I2: return "I2";
            case ArgumentKind::U2: return "U2";
            case ArgumentKind::I4: return "I4";
            case ArgumentKind::U4: return "U4";
            case ArgumentKind::I8: return "I8";
            case ArgumentKind::U8: return "U8";
            case ArgumentKind::R4: return "R4";
            case ArgumentKind::R8: return "R8";
            case ArgumentKind::I: return "I";
            case ArgumentKind::U: return "U";
            case ArgumentKind::String: return "String";
            case ArgumentKind::Type: return "Type";
            case ArgumentKind::Array: return "Array";
            case ArgumentKind::Enum: return "Enum";
        }
        return "Unknown";
    }

    bool operator==(const VoidValue&, const VoidValue&) {
        return true;
    }

    bool operator==(const NativeInt& lhs, const NativeInt& rhs) {
        return lhs.value == rhs.value;
    }

    bool operator==(const NativeUInt& lhs, const NativeUInt& rhs) {
        return lhs.value == rhs.value;
    }

    bool operator==(const TypeName& lhs, const TypeName& rhs) {
        return lhs.name == rhs.name;
    }

    bool operator==(const ArrayValue& lhs, const ArrayValue& rhs) {
        return lhs.elements == rhs.elements;
    }

    bool operator==(const EnumValue& lhs, const EnumValue& rhs) {
        if (lhs.typeName != rhs.typeName) {
            return false;
        }
        if (!lhs.underlying || !rhs.underlying) {
            return lhs.underlying == rhs.underlying;
        }
        return *lhs.underlying == *rhs.underlying;
    }

    bool operator==(const Argument& lhs, const Argument& rhs) {
        return lhs.value == rhs.value;
    }

    bool operator==(const NamedArgument& lhs, const NamedArgument& rhs) {
        return lhs.isField == rhs.isField && lhs.name == rhs.name &&
               lhs.argType == rhs.argType && lhs.value == rhs.value;
    }

    const std::vector<Argument>* Argument::Elements() const {
        if (const auto* array = As<ArrayValue>()) {
            return &array->elements;
        }
        return nullptr;
    }

    std::string Argument::ToString() const {
        const auto label = CustomAttribute::ToString(Kind());
        return std::visit([label]<typename T0>(const T0& v) -> std::string {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, VoidValue>) {
                return std::string(label);
            } else if constexpr (std::is_same_v<T, bool>) {
                return std::format("{}({})", label, v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, char32_t>) {
                return std::format("{}('{}' U+{:04X})", label, Text::EncodeUtf8(v), static_cast<uint32_t>(v));
            } else if constexpr (std::is_same_v<T, NativeInt> || std::is_same_v<T, NativeUInt>) {
                return std::format("{}({})", label, v.value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return std::format("{}(\"{}\")", label, v);
            } else if constexpr (std::is_same_v<T, TypeName>) {
                return std::format("{}(\"{}\")", label, v.name);
            } else if constexpr (std::is_same_v<T, ArrayValue>) {
                std::string result = std::string(label) + "[";
                for (size_t i = 0; i < v.elements.size(); ++i) {
                    if (i > 0) {
                        result += ", ";
                    }
                    result += v.elements[i].ToString();
                }
                return result + "]";
            } else if constexpr (std::is_same_v<T, EnumValue>) {
                const auto inner = v.underlying ? v.underlying->ToString() : std::string("?");
                return std::format("{}({}, {})", label, v.typeName, inner);
            } else {
                return std::format("{}({})", label, v);
            }
        }, value);
    }

    Argument MakeVoid() {
        return Argument{VoidValue{}};
    }

    Argument MakeType(std::string name) {
        return Argument{TypeName{std::move(name)}};
    }

    Argument MakeArray(std::vector<Argument> elements) {
        return Argument{ArrayValue{std::move(elements)}};
    }

    Argument MakeEnum(std::string typeName, Argument underlying) {
        return Argument{EnumValue{std::move(typeName), std::make_shared<const Argument>(std::move(underlying))}};
    }

    std::string NamedArgument::ToString() const {
        return std::format("{} {} [{}] = {}", isField ? "field" : "property", name, argType, value.ToString());
    }

    std::string Value::ToString() const {
        std::string result;
        for (size_t i = 0; i < fixedArgs.size(); ++i) {
            result += std::format("fixed[{}] {}\n", i, fixedArgs[i].ToString());
        }
        for (size_t i = 0; i < namedArgs.size(); ++i) {
            result += std::format("named[{}] {}\n", i, namedArgs[i].ToString());
        }
        if (result.empty()) {
            result = "(empty)\n";
        }
        return result;
    }

} // namespace CustomAttribute
