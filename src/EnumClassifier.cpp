#include "EnumClassifier.h"

#include <algorithm>
#include <array>

#include "TypeRegistry.h"

namespace {

    // Snapshot of BCL enums that commonly appear as attribute constructor arguments.
    // TODO: regenerate from the reference assemblies of each supported runtime version.
    constexpr std::array<std::string_view, 35> kBuiltinEnums = {
        "System.Runtime.InteropServices.CharSet",
        "System.Runtime.InteropServices.TypeLibTypeFlags",
        "System.Runtime.InteropServices.CallConv",
        "System.Runtime.InteropServices.CallingConvention",
        "System.Runtime.InteropServices.LayoutKind",
        "System.Runtime.InteropServices.UnmanagedType",
        "System.Runtime.InteropServices.VarEnum",
        "System.AttributeTargets",
        "System.StringComparison",
        "System.DateTimeKind",
        "System.DayOfWeek",
        "System.TypeCode",
        "System.UriKind",
        "System.Diagnostics.DebuggingModes",
        ".DebuggingModes", // nested type whose namespace was dropped
        "DebuggingModes",
        "System.Reflection.BindingFlags",
        "System.Reflection.MemberTypes",
        "System.Reflection.MethodAttributes",
        "System.Reflection.FieldAttributes",
        "System.Reflection.TypeAttributes",
        "System.Reflection.PropertyAttributes",
        "System.Reflection.EventAttributes",
        "System.Reflection.ParameterAttributes",
        "System.Reflection.CallingConventions",
        "System.Security.SecurityAction",
        "System.Security.Permissions.SecurityAction",
        "System.Security.Permissions.FileIOPermissionAccess",
        "System.Security.Permissions.RegistryPermissionAccess",
        "System.Security.Permissions.ReflectionPermissionFlag",
        "System.Security.Permissions.SecurityPermissionFlag",
        "System.Security.Permissions.UIPermissionWindow",
        "System.Security.Permissions.UIPermissionClipboard",
        "System.Security.Permissions.EnvironmentPermissionAccess",
        "TestEnum",
    };

    constexpr std::array<std::string_view, 8> kBuiltinNamespaces = {
        "System.Runtime.InteropServices.",
        "System.Reflection.",
        "System.Security.Permissions.",
        "Microsoft.Win32.",
        "System.IO.",
        "System.Net.",
        "System.Drawing.",
        "System.Windows.Forms.",
    };

    // "Type" is deliberately absent: it would claim every System.Type-like class name.
    constexpr std::array<std::string_view, 11> kBuiltinSuffixes = {
        "Flags", "Action", "Kind", "Attributes", "Access", "Mode", "Modes", "Style", "Options", "State", "Status",
    };

} // namespace

namespace CustomAttribute {

    EnumClassifier::EnumClassifier() {
        mKnownEnums.reserve(kBuiltinEnums.size());
        for (const auto name : kBuiltinEnums) {
            mKnownEnums.emplace(name);
        }
        mNamespaces.assign(kBuiltinNamespaces.begin(), kBuiltinNamespaces.end());
        mSuffixes.assign(kBuiltinSuffixes.begin(), kBuiltinSuffixes.end());
    }

    const EnumClassifier& EnumClassifier::Default() {
        static const EnumClassifier instance;
        return instance;
    }

    bool EnumClassifier::IsEnum(const Cil::TypeOracle& oracle, Cil::TypeHandle type) const {
        const auto fullName = oracle.FullName(type);
        if (fullName == Cil::kSystemEnum) {
            return false;
        }

        if (const auto inherited = AnalyzeInheritance(oracle, type)) {
            return *inherited;
        }
        return IsKnownEnum(fullName);
    }

    std::optional<bool> EnumClassifier::AnalyzeInheritance(const Cil::TypeOracle& oracle, Cil::TypeHandle type) {
        bool foundBase = false;
        auto current = type;
        for (size_t depth = 0; depth < kMaxInheritanceDepth; ++depth) {
            const auto base = oracle.Base(current);
            if (!base) {
                break;
            }
            foundBase = true;
            if (oracle.FullName(*base) == Cil::kSystemEnum) {
                return true;
            }
            current = *base;
        }

        if (foundBase) {
            return false;
        }
        return std::nullopt;
    }

    bool EnumClassifier::IsKnownEnum(std::string_view fullName) const {
        if (mKnownEnums.contains(std::string(fullName))) {
            return true;
        }
        return Score(fullName) >= kEnumThreshold;
    }

    int EnumClassifier::Score(std::string_view fullName) const {
        int score = 0;
        const bool namespaceMatch = std::ranges::any_of(mNamespaces, [fullName](const std::string& prefix) {
            return fullName.starts_with(prefix);
        });
        if (namespaceMatch) {
            score += 2;
        }

        const bool suffixMatch = std::ranges::any_of(mSuffixes, [fullName](const std::string& suffix) {
            return fullName.ends_with(suffix);
        });
        if (suffixMatch) {
            score += 1;
        }
        return score;
    }

    void EnumClassifier::AddKnownEnum(std::string fullName) {
        mKnownEnums.insert(std::move(fullName));
    }

    bool EnumClassifier::RemoveKnownEnum(const std::string& fullName) {
        return mKnownEnums.erase(fullName) > 0;
    }

    void EnumClassifier::ClearKnownEnums() {
        mKnownEnums.clear();
    }

    bool EnumClassifier::HasKnownEnum(const std::string& fullName) const {
        return mKnownEnums.contains(fullName);
    }

    void EnumClassifier::AddNamespace(std::string prefix) {
        if (std::ranges::find(mNamespaces, prefix) == mNamespaces.end()) {
            mNamespaces.push_back(std::move(prefix));
        }
    }

    void EnumClassifier::AddSuffix(std::string suffix) {
        if (std::ranges::find(mSuffixes, suffix) == mSuffixes.end()) {
            mSuffixes.push_back(std::move(suffix));
        }
    }

} // namespace CustomAttribute
