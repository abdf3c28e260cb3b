#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Cil {

    using TypeHandle = uint32_t;

    enum class FlavorKind {
        Boolean,
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
        Class,
        ValueType,
        Array,
        Void,
        Pointer,
        GenericParameter,
        Other,
    };

    struct Flavor {
        FlavorKind kind = FlavorKind::Other;
        uint32_t rank = 0; // only meaningful for arrays
    };

    std::string_view ToString(FlavorKind kind);

    // The slice of a type system that custom attribute decoding needs.
    class TypeOracle {
    public:
        virtual ~TypeOracle() = default;

        [[nodiscard]] virtual Flavor GetFlavor(TypeHandle type) const = 0;
        [[nodiscard]] virtual std::string FullName(TypeHandle type) const = 0;
        // One level up the inheritance chain; empty at the root or when the type is unresolved.
        [[nodiscard]] virtual std::optional<TypeHandle> Base(TypeHandle type) const = 0;
        [[nodiscard]] virtual std::optional<TypeHandle> ArrayElementType(TypeHandle type) const = 0;
    };

    // A constructor parameter row. Sequence 0 is the return value.
    struct ParamInfo {
        uint32_t sequence = 0;
        std::optional<TypeHandle> resolvedType;
    };

} // namespace Cil
