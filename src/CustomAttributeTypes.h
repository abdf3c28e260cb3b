#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace CustomAttribute {

    // CorSerializationType, ECMA-335 II.23.3
    enum class SerializationType : uint8_t {
        Boolean = 0x02,
        Char = 0x03,
        I1 = 0x04,
        U1 = 0x05,
        I2 = 0x06,
        U2 = 0x07,
        I4 = 0x08,
        U4 = 0x09,
        I8 = 0x0A,
        U8 = 0x0B,
        R4 = 0x0C,
        R8 = 0x0D,
        String = 0x0E,
        SZArray = 0x1D,
        Type = 0x50,
        TaggedObject = 0x51,
        Enum = 0x55,
    };

    constexpr uint8_t kFieldMarker = 0x53;
    constexpr uint8_t kPropertyMarker = 0x54;

    std::optional<SerializationType> ToSerializationType(uint8_t raw);

    // Order matches the alternatives of ArgumentVariant.
    enum class ArgumentKind {
        Void,
        Bool,
        Char,
        I1,
        U1,
        I2,
        U2,
        I4,
        U4,
        I8,
        U8,
        R4,
        R8,
        I,
        U,
        String,
        Type,
        Array,
        Enum,
    };

    std::string_view ToString(ArgumentKind kind);

    struct Argument;

    struct VoidValue {};

    struct NativeInt {
        intptr_t value = 0;
    };

    struct NativeUInt {
        uintptr_t value = 0;
    };

    struct TypeName {
        std::string name;
    };

    struct ArrayValue {
        std::vector<Argument> elements;
    };

    struct EnumValue {
        std::string typeName;
        std::shared_ptr<const Argument> underlying;
    };

    bool operator==(const VoidValue& lhs, const VoidValue& rhs);
    bool operator==(const NativeInt& lhs, const NativeInt& rhs);
    bool operator==(const NativeUInt& lhs, const NativeUInt& rhs);
    bool operator==(const TypeName& lhs, const TypeName& rhs);
    bool operator==(const ArrayValue& lhs, const ArrayValue& rhs);
    // Compares the underlying values, not the shared_ptr identity.
    bool operator==(const EnumValue& lhs, const EnumValue& rhs);

    using ArgumentVariant = std::variant<VoidValue, bool, char32_t, int8_t, uint8_t, int16_t, uint16_t,
                                         int32_t, uint32_t, int64_t, uint64_t, float, double,
                                         NativeInt, NativeUInt, std::string, TypeName, ArrayValue, EnumValue>;

    struct Argument {
        ArgumentVariant value;

        [[nodiscard]] ArgumentKind Kind() const { return static_cast<ArgumentKind>(value.index()); }

        template<typename T>
        [[nodiscard]] const T* As() const { return std::get_if<T>(&value); }

        // Element list for Array, nullptr otherwise.
        [[nodiscard]] const std::vector<Argument>* Elements() const;

        [[nodiscard]] std::string ToString() const;
    };

    bool operator==(const Argument& lhs, const Argument& rhs);

    Argument MakeVoid();
    Argument MakeType(std::string name);
    Argument MakeArray(std::vector<Argument> elements);
    Argument MakeEnum(std::string typeName, Argument underlying);

    struct NamedArgument {
        bool isField = false;
        std::string name;
        std::string argType;
        Argument value;

        [[nodiscard]] std::string ToString() const;
    };

    bool operator==(const NamedArgument& lhs, const NamedArgument& rhs);

    struct Value {
        std::vector<Argument> fixedArgs;
        std::vector<NamedArgument> namedArgs;

        [[nodiscard]] bool Empty() const { return fixedArgs.empty() && namedArgs.empty(); }
        [[nodiscard]] std::string ToString() const;
    };

} // namespace CustomAttribute
