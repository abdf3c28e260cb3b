#include "AttributeConfig.h"

#include <print>

#include "ParseHelpers.h"
#include "ini.h"

namespace {

    using namespace ParseHelpers;
    using Config::Settings;
    using Config::TypeDeclaration;
    using Config::TypeKind;

    struct ParseState {
        Settings settings;
        std::string error;
    };

    void AppendList(std::string_view key, std::string_view value, std::vector<std::string>& out) {
        for (const auto item : SplitList(value)) {
            if (item.empty()) {
                std::println("[Config] Ignoring empty item in '{}'", key);
                continue;
            }
            out.emplace_back(item);
        }
    }

    bool ParseTypeKind(std::string_view text, TypeKind& out) {
        if (EqualsIgnoreCase(text, "class")) {
            out = TypeKind::Class;
        } else if (EqualsIgnoreCase(text, "valuetype")) {
            out = TypeKind::ValueType;
        } else if (EqualsIgnoreCase(text, "enum")) {
            out = TypeKind::Enum;
        } else {
            return false;
        }
        return true;
    }

    // "kind" or "kind : Base". Only classes take an explicit base.
    bool ParseTypeDeclaration(std::string_view name, std::string_view value, TypeDeclaration& out, std::string& error) {
        out.fullName = std::string(name);
        const auto colon = value.find(':');
        const auto kindText = Trim(value.substr(0, colon));
        if (!ParseTypeKind(kindText, out.kind)) {
            error = std::format("Unknown type kind '{}' for '{}'", kindText, name);
            return false;
        }
        if (colon == std::string_view::npos) {
            return true;
        }

        const auto base = Trim(value.substr(colon + 1));
        if (base.empty()) {
            error = std::format("Missing base type after ':' for '{}'", name);
            return false;
        }
        if (out.kind != TypeKind::Class) {
            error = std::format("Only classes may declare a base type ('{}')", name);
            return false;
        }
        out.base = std::string(base);
        return true;
    }

    int HandleEntry(Settings& settings, const char* section, const char* key, const char* value, std::string& error) {
        const auto secStr = std::string_view(section);
        const auto keyStr = std::string_view(key);
        const auto valStr = Trim(std::string_view(value));

        if (EqualsIgnoreCase(secStr, Config::kParserSection)) {
            if (EqualsIgnoreCase(keyStr, Config::kStrictUtf8Key)) {
                if (!ParseBool(valStr, settings.strictUtf8)) {
                    error = std::format("Invalid boolean '{}' for '{}'", valStr, keyStr);
                    return 0;
                }
                return 1;
            }
        }
        else if (EqualsIgnoreCase(secStr, Config::kEnumsSection)) {
            if (EqualsIgnoreCase(keyStr, Config::kKnownKey)) {
                AppendList(keyStr, valStr, settings.addKnownEnums);
                return 1;
            }
            if (EqualsIgnoreCase(keyStr, Config::kRemoveKey)) {
                AppendList(keyStr, valStr, settings.removeKnownEnums);
                return 1;
            }
            if (EqualsIgnoreCase(keyStr, Config::kReplaceKnownKey)) {
                if (!ParseBool(valStr, settings.replaceKnownEnums)) {
                    error = std::format("Invalid boolean '{}' for '{}'", valStr, keyStr);
                    return 0;
                }
                return 1;
            }
            if (EqualsIgnoreCase(keyStr, Config::kNamespacesKey)) {
                AppendList(keyStr, valStr, settings.enumNamespaces);
                return 1;
            }
            if (EqualsIgnoreCase(keyStr, Config::kSuffixesKey)) {
                AppendList(keyStr, valStr, settings.enumSuffixes);
                return 1;
            }
        }
        else if (EqualsIgnoreCase(secStr, Config::kTypesSection)) {
            TypeDeclaration declaration;
            if (!ParseTypeDeclaration(Trim(keyStr), valStr, declaration, error)) {
                return 0;
            }
            settings.types.push_back(std::move(declaration));
            return 1;
        }
        else {
            error = std::format("Unknown section '{}'", secStr);
            return 0;
        }

        error = std::format("Unknown key '{}' in section '{}'", keyStr, secStr);
        return 0;
    }

    // inih keeps going after a rejected line; only the first error is reported.
    int IniHandler(void* user, const char* section, const char* key, const char* value) {
        auto* state = static_cast<ParseState*>(user);
        std::string error;
        const int result = HandleEntry(state->settings, section, key, value, error);
        if (result == 0 && state->error.empty()) {
            state->error = std::move(error);
        }
        return result;
    }

    ParseExpected<Settings> Finish(int parseResult, ParseState& state, std::string_view source) {
        if (parseResult == 0) {
            return std::move(state.settings);
        }
        if (parseResult > 0) {
            if (state.error.empty()) {
                return Fail("Failed to parse {} at line {}", source, parseResult);
            }
            return Fail("Failed to parse {} at line {}: {}", source, parseResult, state.error);
        }
        if (parseResult == -1) {
            return Fail("Could not open {}", source);
        }
        return Fail("Failed to parse {}", source);
    }

} // namespace

namespace Config {

    void Settings::ApplyTo(CustomAttribute::EnumClassifier& classifier) const {
        if (replaceKnownEnums) {
            classifier.ClearKnownEnums();
        }
        for (const auto& name : addKnownEnums) {
            classifier.AddKnownEnum(name);
        }
        for (const auto& name : removeKnownEnums) {
            classifier.RemoveKnownEnum(name);
        }
        for (const auto& prefix : enumNamespaces) {
            classifier.AddNamespace(prefix);
        }
        for (const auto& suffix : enumSuffixes) {
            classifier.AddSuffix(suffix);
        }
    }

    ParseExpected<void> Settings::ApplyTo(Cil::TypeRegistry& registry) const {
        for (const auto& type : types) {
            if (registry.FindByName(type.fullName)) {
                return Fail("Type '{}' is already registered", type.fullName);
            }
            switch (type.kind) {
                case TypeKind::Enum:
                    registry.AddEnum(type.fullName);
                    break;
                case TypeKind::ValueType:
                    registry.AddValueType(type.fullName);
                    break;
                case TypeKind::Class: {
                    std::optional<Cil::TypeHandle> base;
                    if (type.base) {
                        auto resolved = registry.Resolve(*type.base);
                        if (!resolved) return std::unexpected(resolved.error());
                        base = *resolved;
                    }
                    registry.AddClass(type.fullName, base);
                    break;
                }
            }
        }
        return {};
    }

    ParseExpected<Settings> ParseText(std::string_view text) {
        ParseState state;
        const int parseResult = ini_parse_string_length(text.data(), text.size(), IniHandler, &state);
        return Finish(parseResult, state, "configuration");
    }

    ParseExpected<Settings> Load(const std::filesystem::path& path) {
        ParseState state;
        const int parseResult = ini_parse(path.string().c_str(), IniHandler, &state);
        return Finish(parseResult, state, path.string());
    }

} // namespace Config
