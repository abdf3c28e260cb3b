#include "TypeRegistry.h"

#include <array>
#include <utility>

#include "ParseHelpers.h"

namespace {

    using Cil::FlavorKind;
    using namespace ParseHelpers;

    struct PrimitiveName {
        FlavorKind kind;
        std::string_view fullName;
    };

    constexpr std::array kPrimitiveNames = {
        PrimitiveName{FlavorKind::Boolean, "System.Boolean"},
        PrimitiveName{FlavorKind::Char, "System.Char"},
        PrimitiveName{FlavorKind::I1, "System.SByte"},
        PrimitiveName{FlavorKind::U1, "System.Byte"},
        PrimitiveName{FlavorKind::I2, "System.Int16"},
        PrimitiveName{FlavorKind::U2, "System.UInt16"},
        PrimitiveName{FlavorKind::I4, "System.Int32"},
        PrimitiveName{FlavorKind::U4, "System.UInt32"},
        PrimitiveName{FlavorKind::I8, "System.Int64"},
        PrimitiveName{FlavorKind::U8, "System.UInt64"},
        PrimitiveName{FlavorKind::R4, "System.Single"},
        PrimitiveName{FlavorKind::R8, "System.Double"},
        PrimitiveName{FlavorKind::I, "System.IntPtr"},
        PrimitiveName{FlavorKind::U, "System.UIntPtr"},
        PrimitiveName{FlavorKind::String, "System.String"},
        PrimitiveName{FlavorKind::Void, "System.Void"},
    };

    struct Keyword {
        std::string_view text;
        FlavorKind kind;
    };

    // ILAsm and C# spellings; "object" and "type" are handled separately because they are classes.
    constexpr std::array kKeywords = {
        Keyword{"bool", FlavorKind::Boolean},   Keyword{"boolean", FlavorKind::Boolean},
        Keyword{"char", FlavorKind::Char},
        Keyword{"i1", FlavorKind::I1},          Keyword{"sbyte", FlavorKind::I1},
        Keyword{"u1", FlavorKind::U1},          Keyword{"byte", FlavorKind::U1},
        Keyword{"i2", FlavorKind::I2},          Keyword{"short", FlavorKind::I2},
        Keyword{"u2", FlavorKind::U2},          Keyword{"ushort", FlavorKind::U2},
        Keyword{"i4", FlavorKind::I4},          Keyword{"int", FlavorKind::I4},
        Keyword{"u4", FlavorKind::U4},          Keyword{"uint", FlavorKind::U4},
        Keyword{"i8", FlavorKind::I8},          Keyword{"long", FlavorKind::I8},
        Keyword{"u8", FlavorKind::U8},          Keyword{"ulong", FlavorKind::U8},
        Keyword{"r4", FlavorKind::R4},          Keyword{"float", FlavorKind::R4},
        Keyword{"r8", FlavorKind::R8},          Keyword{"double", FlavorKind::R8},
        Keyword{"i", FlavorKind::I},            Keyword{"nint", FlavorKind::I},
        Keyword{"u", FlavorKind::U},            Keyword{"nuint", FlavorKind::U},
        Keyword{"string", FlavorKind::String},
        Keyword{"void", FlavorKind::Void},
    };

    std::string_view StripKeyword(std::string_view text, std::string_view keyword) {
        if (text.size() <= keyword.size() || !StartsWithIgnoreCase(text, keyword)) {
            return {};
        }
        const char separator = text[keyword.size()];
        if (separator != ' ' && separator != '\t') {
            return {};
        }
        return Trim(text.substr(keyword.size()));
    }

} // namespace

namespace Cil {

    TypeRegistry::TypeRegistry() {
        const auto object = AddType(FlavorKind::Class, kSystemObject);
        const auto valueType = AddType(FlavorKind::Class, kSystemValueType, object);
        AddType(FlavorKind::Class, kSystemEnum, valueType);
        AddType(FlavorKind::Class, kSystemType, object);
        AddType(FlavorKind::Class, "System.Array", object);

        for (const auto& primitive : kPrimitiveNames) {
            const auto base = primitive.kind == FlavorKind::String ? object : valueType;
            mPrimitives[primitive.kind] = AddType(primitive.kind, std::string(primitive.fullName), base);
        }
    }

    Flavor TypeRegistry::GetFlavor(TypeHandle type) const {
        if (type >= mEntries.size()) {
            return Flavor{FlavorKind::Other, 0};
        }
        return mEntries[type].flavor;
    }

    std::string TypeRegistry::FullName(TypeHandle type) const {
        if (type >= mEntries.size()) {
            return {};
        }
        return mEntries[type].fullName;
    }

    std::optional<TypeHandle> TypeRegistry::Base(TypeHandle type) const {
        if (type >= mEntries.size()) {
            return std::nullopt;
        }
        return mEntries[type].base;
    }

    std::optional<TypeHandle> TypeRegistry::ArrayElementType(TypeHandle type) const {
        if (type >= mEntries.size()) {
            return std::nullopt;
        }
        return mEntries[type].element;
    }

    TypeHandle TypeRegistry::AddType(FlavorKind kind, std::string fullName, std::optional<TypeHandle> base) {
        const uint32_t rank = kind == FlavorKind::Array ? 1 : 0;
        return Push(Entry{Flavor{kind, rank}, std::move(fullName), base, std::nullopt});
    }

    TypeHandle TypeRegistry::AddClass(std::string fullName, std::optional<TypeHandle> base) {
        return AddType(FlavorKind::Class, std::move(fullName), base);
    }

    TypeHandle TypeRegistry::AddValueType(std::string fullName) {
        return AddType(FlavorKind::ValueType, std::move(fullName), FindByName(kSystemValueType));
    }

    TypeHandle TypeRegistry::AddEnum(std::string fullName) {
        return AddType(FlavorKind::ValueType, std::move(fullName), FindByName(kSystemEnum));
    }

    TypeHandle TypeRegistry::AddArray(TypeHandle element, uint32_t rank) {
        std::string name = FullName(element);
        name += rank <= 1 ? "[]" : "[" + std::string(rank - 1, ',') + "]";
        if (auto existing = FindByName(name); existing && ArrayElementType(*existing) == element) {
            return *existing;
        }
        return Push(Entry{Flavor{FlavorKind::Array, rank}, std::move(name), FindByName("System.Array"), element});
    }

    std::optional<TypeHandle> TypeRegistry::Primitive(FlavorKind kind) const {
        const auto it = mPrimitives.find(kind);
        if (it == mPrimitives.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TypeHandle> TypeRegistry::FindByName(std::string_view fullName) const {
        const auto it = mByName.find(std::string(fullName));
        if (it == mByName.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    ParseExpected<TypeHandle> TypeRegistry::Resolve(std::string_view text) {
        text = Trim(text);
        if (text.empty()) {
            return Fail("Empty type name");
        }

        if (text.back() == ']') {
            const auto open = text.rfind('[');
            if (open == std::string_view::npos || open == 0) {
                return Fail("Malformed array type '{}'", text);
            }
            const auto dims = text.substr(open + 1, text.size() - open - 2);
            uint32_t rank = 1;
            for (const char c : dims) {
                if (c == ',') {
                    ++rank;
                } else if (c != ' ') {
                    return Fail("Sized array bounds are not supported in '{}'", text);
                }
            }
            auto element = Resolve(text.substr(0, open));
            if (!element) return std::unexpected(element.error());
            return AddArray(*element, rank);
        }

        if (text.back() == '*') {
            auto pointee = Resolve(text.substr(0, text.size() - 1));
            if (!pointee) return std::unexpected(pointee.error());
            const auto name = FullName(*pointee) + "*";
            if (auto existing = FindByName(name)) {
                return *existing;
            }
            return AddType(FlavorKind::Pointer, name);
        }

        if (text.front() == '!') {
            if (auto existing = FindByName(text)) {
                return *existing;
            }
            return AddType(FlavorKind::GenericParameter, std::string(text));
        }

        if (auto name = StripKeyword(text, "class"); !name.empty()) {
            if (auto existing = FindByName(name)) {
                return *existing;
            }
            return AddClass(std::string(name));
        }
        if (auto name = StripKeyword(text, "valuetype"); !name.empty()) {
            if (auto existing = FindByName(name)) {
                return *existing;
            }
            return AddValueType(std::string(name));
        }
        if (auto name = StripKeyword(text, "enum"); !name.empty()) {
            if (auto existing = FindByName(name)) {
                return *existing;
            }
            return AddEnum(std::string(name));
        }

        for (const auto& keyword : kKeywords) {
            if (EqualsIgnoreCase(text, keyword.text)) {
                return *Primitive(keyword.kind);
            }
        }
        if (EqualsIgnoreCase(text, "object")) {
            return *FindByName(kSystemObject);
        }
        if (EqualsIgnoreCase(text, "type")) {
            return *FindByName(kSystemType);
        }

        if (auto existing = FindByName(text)) {
            return *existing;
        }
        if (text.find_first_of(" \t,") != std::string_view::npos) {
            return Fail("Invalid type name '{}'", text);
        }
        return AddClass(std::string(text));
    }

    TypeHandle TypeRegistry::Push(Entry entry) {
        const auto handle = static_cast<TypeHandle>(mEntries.size());
        mByName.try_emplace(entry.fullName, handle);
        mEntries.push_back(std::move(entry));
        return handle;
    }

} // namespace Cil
