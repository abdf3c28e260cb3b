#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "EnumClassifier.h"
#include "ParseTypes.h"
#include "TypeRegistry.h"

namespace Config {

    constexpr auto kParserSection = "parser";
    constexpr auto kEnumsSection = "enums";
    constexpr auto kTypesSection = "types";

    constexpr auto kStrictUtf8Key = "strict_utf8";
    constexpr auto kKnownKey = "known";
    constexpr auto kRemoveKey = "remove";
    constexpr auto kReplaceKnownKey = "replace_known";
    constexpr auto kNamespacesKey = "namespaces";
    constexpr auto kSuffixesKey = "suffixes";

    enum class TypeKind {
        Class,
        ValueType,
        Enum,
    };

    // One entry of the [types] section, e.g. "Contoso.Gizmo = class : System.Object".
    struct TypeDeclaration {
        std::string fullName;
        TypeKind kind = TypeKind::Class;
        std::optional<std::string> base;
    };

    struct Settings {
        bool strictUtf8 = false;

        std::vector<std::string> addKnownEnums;
        std::vector<std::string> removeKnownEnums;
        bool replaceKnownEnums = false;
        std::vector<std::string> enumNamespaces;
        std::vector<std::string> enumSuffixes;

        std::vector<TypeDeclaration> types;

        void ApplyTo(CustomAttribute::EnumClassifier& classifier) const;
        // Registers the declared types in order. Fails on duplicates or an unresolvable base.
        [[nodiscard]] ParseExpected<void> ApplyTo(Cil::TypeRegistry& registry) const;
    };

    [[nodiscard]] ParseExpected<Settings> ParseText(std::string_view text);
    [[nodiscard]] ParseExpected<Settings> Load(const std::filesystem::path& path);

} // namespace Config
