#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "TypeOracle.h"

namespace CustomAttribute {

    // Decides whether a Class-typed constructor parameter holds an enum (4-byte value)
    // or a System.Type reference (serialized string). Used when the declaring assembly
    // cannot be loaded, so the definition of the type is not available.
    class EnumClassifier {
    public:
        static constexpr size_t kMaxInheritanceDepth = 10;
        static constexpr int kEnumThreshold = 2;

        // Starts with the built-in BCL table, namespaces and suffixes.
        EnumClassifier();

        static const EnumClassifier& Default();

        [[nodiscard]] bool IsEnum(const Cil::TypeOracle& oracle, Cil::TypeHandle type) const;

        // Definitive answer from the base type chain, or nullopt if no base is known.
        [[nodiscard]] static std::optional<bool> AnalyzeInheritance(const Cil::TypeOracle& oracle, Cil::TypeHandle type);

        // Known-table lookup, then the namespace/suffix score.
        [[nodiscard]] bool IsKnownEnum(std::string_view fullName) const;
        [[nodiscard]] int Score(std::string_view fullName) const;

        void AddKnownEnum(std::string fullName);
        bool RemoveKnownEnum(const std::string& fullName);
        void ClearKnownEnums();
        [[nodiscard]] bool HasKnownEnum(const std::string& fullName) const;
        [[nodiscard]] size_t KnownEnumCount() const { return mKnownEnums.size(); }

        void AddNamespace(std::string prefix);
        void AddSuffix(std::string suffix);
        [[nodiscard]] const std::vector<std::string>& Namespaces() const { return mNamespaces; }
        [[nodiscard]] const std::vector<std::string>& Suffixes() const { return mSuffixes; }

    private:
        std::unordered_set<std::string> mKnownEnums;
        std::vector<std::string> mNamespaces;
        std::vector<std::string> mSuffixes;
    };

} // namespace CustomAttribute
