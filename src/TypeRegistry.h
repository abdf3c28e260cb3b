#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ParseTypes.h"
#include "TypeOracle.h"

namespace Cil {

    constexpr auto kSystemObject = "System.Object";
    constexpr auto kSystemValueType = "System.ValueType";
    constexpr auto kSystemEnum = "System.Enum";
    constexpr auto kSystemString = "System.String";
    constexpr auto kSystemType = "System.Type";

    // In-memory type system. Handles are indices into the registry and stay valid for its lifetime.
    class TypeRegistry final : public TypeOracle {
    public:
        TypeRegistry();

        [[nodiscard]] Flavor GetFlavor(TypeHandle type) const override;
        [[nodiscard]] std::string FullName(TypeHandle type) const override;
        [[nodiscard]] std::optional<TypeHandle> Base(TypeHandle type) const override;
        [[nodiscard]] std::optional<TypeHandle> ArrayElementType(TypeHandle type) const override;

        TypeHandle AddType(FlavorKind kind, std::string fullName, std::optional<TypeHandle> base = std::nullopt);
        TypeHandle AddClass(std::string fullName, std::optional<TypeHandle> base = std::nullopt);
        TypeHandle AddValueType(std::string fullName);
        TypeHandle AddEnum(std::string fullName);
        TypeHandle AddArray(TypeHandle element, uint32_t rank = 1);

        [[nodiscard]] std::optional<TypeHandle> Primitive(FlavorKind kind) const;
        [[nodiscard]] std::optional<TypeHandle> FindByName(std::string_view fullName) const;
        [[nodiscard]] size_t Count() const { return mEntries.size(); }

        // Resolves a textual type such as "i4", "string[]", "enum Foo.Bar" or "System.Type".
        // Unknown plain names become classes without base information, like unresolved TypeRefs.
        [[nodiscard]] ParseExpected<TypeHandle> Resolve(std::string_view text);

    private:
        struct Entry {
            Flavor flavor{};
            std::string fullName;
            std::optional<TypeHandle> base;
            std::optional<TypeHandle> element;
        };

        TypeHandle Push(Entry entry);

        std::vector<Entry> mEntries;
        std::unordered_map<std::string, TypeHandle> mByName;
        std::unordered_map<FlavorKind, TypeHandle> mPrimitives;
    };

} // namespace Cil
