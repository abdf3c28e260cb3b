#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "BlobBuilder.h"
#include "BlobHeap.h"
#include "CustomAttributeParser.h"
#include "TypeRegistry.h"

using namespace CustomAttribute;
using Cil::FlavorKind;

namespace {

std::vector<Cil::ParamInfo> Params(std::initializer_list<Cil::TypeHandle> types) {
    std::vector<Cil::ParamInfo> params;
    uint32_t sequence = 1;
    for (const auto type : types) {
        params.push_back(Cil::ParamInfo{sequence++, type});
    }
    return params;
}

ParseExpected<Value> Decode(std::span<const uint8_t> data,
                            const Cil::TypeRegistry& registry,
                            std::initializer_list<Cil::TypeHandle> types,
                            ParserOptions options = {}) {
    const auto params = Params(types);
    return ParseData(data, params, registry, options);
}

Cil::TypeHandle Prim(const Cil::TypeRegistry& registry, FlavorKind kind) {
    return *registry.Primitive(kind);
}

Cil::TypeHandle Object(const Cil::TypeRegistry& registry) {
    return *registry.FindByName(Cil::kSystemObject);
}

} // namespace

TEST_CASE("Empty blob decodes to an empty value")
{
    Cil::TypeRegistry registry;
    const std::vector<uint8_t> empty;
    const auto value = Decode(empty, registry, {Prim(registry, FlavorKind::I4)});
    REQUIRE(value.has_value());
    CHECK(value->Empty());
}

TEST_CASE("Prolog must be 0x0001")
{
    Cil::TypeRegistry registry;

    SECTION("Wrong value") {
        BlobBuilder blob;
        blob.U16(0x0002).U16(0);
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }

    SECTION("Byte-swapped") {
        BlobBuilder blob;
        blob.Bytes({0x00, 0x01});
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }

    SECTION("Truncated") {
        BlobBuilder blob;
        blob.U8(0x01);
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }

    SECTION("Prolog alone is a valid attribute without arguments") {
        BlobBuilder blob;
        blob.Prolog();
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE(value.has_value());
        CHECK(value->Empty());
    }
}

TEST_CASE("Int32 and String constructor arguments")
{
    Cil::TypeRegistry registry;
    const std::vector<uint8_t> blob = {
        0x01, 0x00, 0x2A, 0x00, 0x00, 0x00, 0x05, 0x48, 0x65, 0x6C, 0x6C, 0x6F, 0x00, 0x00
    };

    const auto value = Decode(blob, registry, {Prim(registry, FlavorKind::I4), Prim(registry, FlavorKind::String)});
    REQUIRE(value.has_value());
    REQUIRE(value->fixedArgs.size() == 2);
    CHECK(value->fixedArgs[0] == Argument{int32_t{42}});
    CHECK(value->fixedArgs[1] == Argument{std::string("Hello")});
    CHECK(value->namedArgs.empty());
    CHECK(value->ToString() == "fixed[0] I4(42)\nfixed[1] String(\"Hello\")\n");
}

TEST_CASE("Fixed primitives decode with their declared widths")
{
    Cil::TypeRegistry registry;
    BlobBuilder blob;
    blob.Prolog()
        .U8(1)
        .U8(0xFE)
        .U8(0xFE)
        .U16(0xFFFE)
        .U16(0xFFFE)
        .U32(0xFFFFFFFE)
        .I64(-3)
        .U64(0xFFFFFFFFFFFFFFFFull)
        .F32(1.5f)
        .F64(-0.25)
        .U16(0);

    const auto value = Decode(blob.View(), registry, {
        Prim(registry, FlavorKind::Boolean),
        Prim(registry, FlavorKind::I1),
        Prim(registry, FlavorKind::U1),
        Prim(registry, FlavorKind::I2),
        Prim(registry, FlavorKind::U2),
        Prim(registry, FlavorKind::U4),
        Prim(registry, FlavorKind::I8),
        Prim(registry, FlavorKind::U8),
        Prim(registry, FlavorKind::R4),
        Prim(registry, FlavorKind::R8),
    });
    REQUIRE(value.has_value());
    const auto& args = value->fixedArgs;
    REQUIRE(args.size() == 10);
    CHECK(*args[0].As<bool>());
    CHECK(*args[1].As<int8_t>() == -2);
    CHECK(*args[2].As<uint8_t>() == 0xFE);
    CHECK(*args[3].As<int16_t>() == -2);
    CHECK(*args[4].As<uint16_t>() == 0xFFFE);
    CHECK(*args[5].As<uint32_t>() == 0xFFFFFFFEu);
    CHECK(*args[6].As<int64_t>() == -3);
    CHECK(*args[7].As<uint64_t>() == 0xFFFFFFFFFFFFFFFFull);
    CHECK(*args[8].As<float>() == Catch::Approx(1.5f));
    CHECK(*args[9].As<double>() == Catch::Approx(-0.25));
}

TEST_CASE("Native integers use the host pointer width")
{
    Cil::TypeRegistry registry;
    BlobBuilder blob;
    blob.Prolog();
    if constexpr (sizeof(intptr_t) == 8) {
        blob.I64(-5).U64(7);
    } else {
        blob.I32(-5).U32(7);
    }

    const auto value = Decode(blob.View(), registry, {Prim(registry, FlavorKind::I), Prim(registry, FlavorKind::U)});
    REQUIRE(value.has_value());
    REQUIRE(value->fixedArgs.size() == 2);
    CHECK(value->fixedArgs[0].Kind() == ArgumentKind::I);
    CHECK(value->fixedArgs[0].As<NativeInt>()->value == -5);
    CHECK(value->fixedArgs[1].Kind() == ArgumentKind::U);
    CHECK(value->fixedArgs[1].As<NativeUInt>()->value == 7u);
}

TEST_CASE("Char arguments are UTF-16 code units")
{
    Cil::TypeRegistry registry;
    const auto charType = Prim(registry, FlavorKind::Char);

    SECTION("BMP character") {
        BlobBuilder blob;
        blob.Prolog().U16(0x00E9);
        const auto value = Decode(blob.View(), registry, {charType});
        REQUIRE(value.has_value());
        CHECK(*value->fixedArgs[0].As<char32_t>() == U'\u00E9');
    }

    SECTION("Lone surrogate becomes the replacement character") {
        BlobBuilder blob;
        blob.Prolog().U16(0xD800);
        const auto value = Decode(blob.View(), registry, {charType});
        REQUIRE(value.has_value());
        CHECK(*value->fixedArgs[0].As<char32_t>() == U'\uFFFD');
    }
}

TEST_CASE("Null string marker decodes like an empty string")
{
    Cil::TypeRegistry registry;
    const auto stringType = Prim(registry, FlavorKind::String);

    BlobBuilder nullString;
    nullString.Prolog().NullStr();
    BlobBuilder emptyString;
    emptyString.Prolog().U8(0x00);

    const auto fromNull = Decode(nullString.View(), registry, {stringType});
    const auto fromEmpty = Decode(emptyString.View(), registry, {stringType});
    REQUIRE(fromNull.has_value());
    REQUIRE(fromEmpty.has_value());
    CHECK(fromNull->fixedArgs[0] == Argument{std::string()});
    CHECK(fromNull->fixedArgs == fromEmpty->fixedArgs);
}

TEST_CASE("String length must fit the blob")
{
    Cil::TypeRegistry registry;
    BlobBuilder blob;
    blob.Prolog().U8(10).Bytes({'a', 'b'});
    const auto value = Decode(blob.View(), registry, {Prim(registry, FlavorKind::String)});
    REQUIRE_FALSE(value.has_value());
    CHECK(value.error().kind == ParseErrorKind::Malformed);
}

TEST_CASE("Malformed UTF-8 is repaired unless strict")
{
    Cil::TypeRegistry registry;
    const auto stringType = Prim(registry, FlavorKind::String);
    BlobBuilder blob;
    blob.Prolog().U8(3).Bytes({'A', 0xC3, 'B'});

    SECTION("Lenient") {
        const auto value = Decode(blob.View(), registry, {stringType});
        REQUIRE(value.has_value());
        CHECK(*value->fixedArgs[0].As<std::string>() == "A\xEF\xBF\xBD" "B");
    }

    SECTION("Strict") {
        ParserOptions options;
        options.strictUtf8 = true;
        const auto value = Decode(blob.View(), registry, {stringType}, options);
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }

    SECTION("Valid multi-byte text passes through") {
        BlobBuilder valid;
        valid.Prolog().Str("caf\xC3\xA9");
        const auto value = Decode(valid.View(), registry, {stringType});
        REQUIRE(value.has_value());
        CHECK(*value->fixedArgs[0].As<std::string>() == "caf\xC3\xA9");
    }
}

TEST_CASE("Array arguments")
{
    Cil::TypeRegistry registry;
    const auto intArray = registry.AddArray(Prim(registry, FlavorKind::I4));

    SECTION("Elements decode with the element type") {
        BlobBuilder blob;
        blob.Prolog().I32(3).I32(1).I32(2).I32(3);
        const auto value = Decode(blob.View(), registry, {intArray});
        REQUIRE(value.has_value());
        const auto* elements = value->fixedArgs[0].Elements();
        REQUIRE(elements != nullptr);
        REQUIRE(elements->size() == 3);
        CHECK((*elements)[2] == Argument{int32_t{3}});
        CHECK(value->fixedArgs[0].ToString() == "Array[I4(1), I4(2), I4(3)]");
    }

    SECTION("Null and zero-length arrays are identical") {
        BlobBuilder nullArray;
        nullArray.Prolog().I32(-1);
        BlobBuilder emptyArray;
        emptyArray.Prolog().I32(0);

        const auto fromNull = Decode(nullArray.View(), registry, {intArray});
        const auto fromEmpty = Decode(emptyArray.View(), registry, {intArray});
        REQUIRE(fromNull.has_value());
        REQUIRE(fromEmpty.has_value());
        CHECK(fromNull->fixedArgs[0] == MakeArray({}));
        CHECK(fromNull->fixedArgs == fromEmpty->fixedArgs);
    }

    SECTION("Other negative lengths are rejected") {
        BlobBuilder blob;
        blob.Prolog().I32(-2);
        const auto value = Decode(blob.View(), registry, {intArray});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }

    SECTION("Length larger than the remaining data is rejected") {
        BlobBuilder blob;
        blob.Prolog().I32(0x7FFFFFFF).I32(1);
        const auto value = Decode(blob.View(), registry, {intArray});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }

    SECTION("Multi-dimensional arrays are not supported") {
        const auto matrix = registry.AddArray(Prim(registry, FlavorKind::I4), 2);
        BlobBuilder blob;
        blob.Prolog().I32(0);
        const auto value = Decode(blob.View(), registry, {matrix});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }

    SECTION("Missing element type fails once elements are present") {
        const auto broken = registry.AddType(FlavorKind::Array, "Broken[]");

        BlobBuilder withElements;
        withElements.Prolog().I32(1).I32(5);
        const auto failed = Decode(withElements.View(), registry, {broken});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().message == "Array type has no base element type information");

        BlobBuilder nullArray;
        nullArray.Prolog().I32(-1);
        const auto empty = Decode(nullArray.View(), registry, {broken});
        REQUIRE(empty.has_value());
        CHECK(empty->fixedArgs[0] == MakeArray({}));
    }
}

TEST_CASE("System.Type, System.String and System.Object parameters")
{
    Cil::TypeRegistry registry;

    SECTION("Type") {
        BlobBuilder blob;
        blob.Prolog().Str("Contoso.Widget, Contoso");
        const auto value = Decode(blob.View(), registry, {*registry.FindByName(Cil::kSystemType)});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == MakeType("Contoso.Widget, Contoso"));
    }

    SECTION("Boxed Int32") {
        BlobBuilder blob;
        blob.Prolog().U8(0x08).I32(-9);
        const auto value = Decode(blob.View(), registry, {Object(registry)});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == Argument{int32_t{-9}});
    }

    SECTION("Boxed string") {
        BlobBuilder blob;
        blob.Prolog().U8(0x0E).Str("hi");
        const auto value = Decode(blob.View(), registry, {Object(registry)});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == Argument{std::string("hi")});
    }

    SECTION("Boxed enum carries its type name") {
        BlobBuilder blob;
        blob.Prolog().U8(0x55).Str("Contoso.Shade").I32(2);
        const auto value = Decode(blob.View(), registry, {Object(registry)});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == MakeEnum("Contoso.Shade", Argument{int32_t{2}}));
        CHECK(value->fixedArgs[0].ToString() == "Enum(Contoso.Shade, I4(2))");
    }

    SECTION("Boxed array of strings") {
        BlobBuilder blob;
        blob.Prolog().U8(0x1D).U8(0x0E).I32(2).Str("a").NullStr();
        const auto value = Decode(blob.View(), registry, {Object(registry)});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == MakeArray({Argument{std::string("a")}, Argument{std::string()}}));
    }

    SECTION("Unknown tag") {
        BlobBuilder blob;
        blob.Prolog().U8(0x99);
        const auto value = Decode(blob.View(), registry, {Object(registry)});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }
}

TEST_CASE("Value types read a 4-byte value")
{
    Cil::TypeRegistry registry;
    const auto point = registry.AddValueType("Contoso.Point");
    BlobBuilder blob;
    blob.Prolog().I32(7);
    const auto value = Decode(blob.View(), registry, {point});
    REQUIRE(value.has_value());
    CHECK(value->fixedArgs[0] == MakeEnum("Contoso.Point", Argument{int32_t{7}}));
}

TEST_CASE("Class parameters are classified as enum or type")
{
    Cil::TypeRegistry registry;

    SECTION("Known BCL enum without base information") {
        const auto targets = registry.AddClass("System.AttributeTargets");
        BlobBuilder blob;
        blob.Prolog().I32(4);
        const auto value = Decode(blob.View(), registry, {targets});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == MakeEnum("System.AttributeTargets", Argument{int32_t{4}}));
    }

    SECTION("Base chain reaching System.Enum") {
        const auto shade = registry.AddClass("Contoso.Shade", registry.FindByName(Cil::kSystemEnum));
        BlobBuilder blob;
        blob.Prolog().I32(1);
        const auto value = Decode(blob.View(), registry, {shade});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0].Kind() == ArgumentKind::Enum);
    }

    SECTION("Known base without System.Enum overrides the table") {
        const auto charSet = registry.AddClass("System.Runtime.InteropServices.CharSet", Object(registry));
        BlobBuilder blob;
        blob.Prolog().Str("X");
        const auto value = Decode(blob.View(), registry, {charSet});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == MakeType("X"));
    }

    SECTION("Unknown class reads a type name") {
        const auto widget = registry.AddClass("MyApp.UserType");
        BlobBuilder blob;
        blob.Prolog().Str("MyApp.Other");
        const auto value = Decode(blob.View(), registry, {widget});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == MakeType("MyApp.Other"));
    }

    SECTION("Enum with fewer than four bytes falls back to a type name") {
        const auto targets = registry.AddClass("System.AttributeTargets");
        BlobBuilder blob;
        blob.Prolog().Str("ab");
        const auto value = Decode(blob.View(), registry, {targets});
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == MakeType("ab"));
    }

    SECTION("Custom classifier") {
        EnumClassifier classifier;
        classifier.AddKnownEnum("Contoso.Size");
        const auto size = registry.AddClass("Contoso.Size");
        BlobBuilder blob;
        blob.Prolog().I32(3);

        ParserOptions options;
        options.enumClassifier = &classifier;
        const auto value = Decode(blob.View(), registry, {size}, options);
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == MakeEnum("Contoso.Size", Argument{int32_t{3}}));
    }
}

TEST_CASE("Unsupported parameter flavors are rejected")
{
    Cil::TypeRegistry registry;
    BlobBuilder blob;
    blob.Prolog().I32(0);

    const auto pointer = registry.Resolve("i4*");
    const auto generic = registry.Resolve("!0");
    REQUIRE(pointer.has_value());
    REQUIRE(generic.has_value());

    for (const auto type : {*pointer, *generic}) {
        const auto value = Decode(blob.View(), registry, {type});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }
}

TEST_CASE("Constructor parameter rows")
{
    Cil::TypeRegistry registry;
    const auto i4 = Prim(registry, FlavorKind::I4);
    const auto u1 = Prim(registry, FlavorKind::U1);

    SECTION("Rows are ordered by sequence and the return slot is ignored") {
        const std::vector<Cil::ParamInfo> params = {
            {2, u1},
            {0, i4},
            {1, i4},
        };
        BlobBuilder blob;
        blob.Prolog().I32(10).U8(20);
        const auto value = ParseData(blob.View(), params, registry);
        REQUIRE(value.has_value());
        REQUIRE(value->fixedArgs.size() == 2);
        CHECK(value->fixedArgs[0] == Argument{int32_t{10}});
        CHECK(value->fixedArgs[1] == Argument{uint8_t{20}});
    }

    SECTION("Unresolved rows are skipped when others resolve") {
        const std::vector<Cil::ParamInfo> params = {
            {1, std::nullopt},
            {2, i4},
        };
        BlobBuilder blob;
        blob.Prolog().I32(5);
        const auto value = ParseData(blob.View(), params, registry);
        REQUIRE(value.has_value());
        REQUIRE(value->fixedArgs.size() == 1);
        CHECK(value->fixedArgs[0] == Argument{int32_t{5}});
    }

    SECTION("No resolved rows fails") {
        const std::vector<Cil::ParamInfo> params = {{1, std::nullopt}};
        BlobBuilder blob;
        blob.Prolog().I32(5);
        const auto value = ParseData(blob.View(), params, registry);
        REQUIRE_FALSE(value.has_value());
    }

    SECTION("A declared argument needs data") {
        BlobBuilder blob;
        blob.Prolog();
        const auto value = Decode(blob.View(), registry, {i4});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }
}

TEST_CASE("Recursion depth is bounded")
{
    Cil::TypeRegistry registry;

    SECTION("Tagged object chain") {
        // Each 0x51 adds one nesting level; the final I4 tag is one more.
        BlobBuilder ok;
        ok.Prolog().Repeat(0x51, 48).U8(0x08).I32(7);
        const auto accepted = Decode(ok.View(), registry, {Object(registry)});
        REQUIRE(accepted.has_value());
        CHECK(accepted->fixedArgs[0] == Argument{int32_t{7}});

        BlobBuilder deep;
        deep.Prolog().Repeat(0x51, 49).U8(0x08).I32(7);
        const auto rejected = Decode(deep.View(), registry, {Object(registry)});
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error().kind == ParseErrorKind::RecursionLimit);
    }

    SECTION("Nested arrays") {
        auto build = [](size_t innerArrays) {
            BlobBuilder blob;
            blob.Prolog().U8(0x1D);
            for (size_t i = 0; i < innerArrays; ++i) {
                blob.U8(0x1D).I32(1);
            }
            blob.U8(0x08).I32(1).I32(42);
            return blob;
        };

        const auto ok = build(47);
        const auto accepted = Decode(ok.View(), registry, {Object(registry)});
        REQUIRE(accepted.has_value());

        const auto deep = build(48);
        const auto rejected = Decode(deep.View(), registry, {Object(registry)});
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error().kind == ParseErrorKind::RecursionLimit);
    }
}

TEST_CASE("Named arguments")
{
    Cil::TypeRegistry registry;

    SECTION("Single Int32 field") {
        BlobBuilder blob;
        blob.Prolog().U16(1).U8(0x53).U8(0x08).Str("Value").I32(42);
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE(value.has_value());
        REQUIRE(value->namedArgs.size() == 1);
        const NamedArgument expected{true, "Value", "I4", Argument{int32_t{42}}};
        CHECK(value->namedArgs[0] == expected);
        CHECK(value->namedArgs[0].ToString() == "field Value [I4] = I4(42)");
    }

    SECTION("Mixed fixed and named arguments") {
        BlobBuilder blob;
        blob.Prolog()
            .I32(-1)
            .Str("x")
            .U16(1)
            .U8(0x54).U8(0x02).Str("Enabled").U8(1);
        const auto value = Decode(blob.View(), registry,
                                  {Prim(registry, FlavorKind::I4), Prim(registry, FlavorKind::String)});
        REQUIRE(value.has_value());
        REQUIRE(value->fixedArgs.size() == 2);
        CHECK(value->fixedArgs[0] == Argument{int32_t{-1}});
        CHECK(value->fixedArgs[1] == Argument{std::string("x")});
        REQUIRE(value->namedArgs.size() == 1);
        CHECK_FALSE(value->namedArgs[0].isField);
        CHECK(value->namedArgs[0].name == "Enabled");
        CHECK(value->namedArgs[0].argType == "Boolean");
        CHECK(value->namedArgs[0].value == Argument{true});
    }

    SECTION("Type and string values") {
        BlobBuilder blob;
        blob.Prolog().U16(2)
            .U8(0x54).U8(0x50).Str("Target").Str("System.Int32")
            .U8(0x53).U8(0x0E).Str("Label").NullStr();
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE(value.has_value());
        REQUIRE(value->namedArgs.size() == 2);
        CHECK(value->namedArgs[0].argType == "Type");
        CHECK(value->namedArgs[0].value == MakeType("System.Int32"));
        CHECK(value->namedArgs[1].value == Argument{std::string()});
    }

    SECTION("Names are read byte by byte") {
        BlobBuilder blob;
        blob.Prolog().U16(1).U8(0x53).U8(0x04).U8(2).Bytes({'n', 0xE9}).U8(0xFF);
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE(value.has_value());
        CHECK(value->namedArgs[0].name == "n\xC3\xA9");
        CHECK(value->namedArgs[0].value == Argument{int8_t{-1}});
    }

    SECTION("Declared count larger than the data stops early") {
        BlobBuilder blob;
        blob.Prolog().U16(3).U8(0x53).U8(0x08).Str("A").I32(1);
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE(value.has_value());
        CHECK(value->namedArgs.size() == 1);
    }

    SECTION("Missing count means no named arguments") {
        BlobBuilder blob;
        blob.Prolog().I32(9).U8(0);
        const auto value = Decode(blob.View(), registry, {Prim(registry, FlavorKind::I4)});
        REQUIRE(value.has_value());
        CHECK(value->namedArgs.empty());
    }

    SECTION("Invalid kind marker") {
        BlobBuilder blob;
        blob.Prolog().U16(1).U8(0x52).U8(0x08).Str("A").I32(1);
        const auto value = Decode(blob.View(), registry, {});
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::Malformed);
    }

    SECTION("Enum, array and boxed tags are not accepted at the top level") {
        for (const uint8_t tag : {uint8_t{0x55}, uint8_t{0x1D}, uint8_t{0x51}}) {
            BlobBuilder blob;
            blob.Prolog().U16(1).U8(0x53).U8(tag).Str("A").I32(1);
            const auto value = Decode(blob.View(), registry, {});
            REQUIRE_FALSE(value.has_value());
            CHECK(value.error().kind == ParseErrorKind::Malformed);
        }
    }
}

TEST_CASE("Parsing from a blob heap")
{
    Cil::TypeRegistry registry;
    BlobBuilder heapBytes;
    heapBytes.U8(0x00).U8(0x06).Prolog().I32(99);
    const auto heap = Cil::BlobHeap::FromBytes(heapBytes.View());
    REQUIRE(heap.has_value());
    const auto params = Params({Prim(registry, FlavorKind::I4)});

    SECTION("Index 0 is always empty") {
        const auto value = ParseBlob(*heap, 0, params, registry);
        REQUIRE(value.has_value());
        CHECK(value->Empty());
    }

    SECTION("Valid index") {
        const auto value = ParseBlob(*heap, 1, params, registry);
        REQUIRE(value.has_value());
        CHECK(value->fixedArgs[0] == Argument{int32_t{99}});
    }

    SECTION("Index past the end") {
        const auto value = ParseBlob(*heap, 100, params, registry);
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().kind == ParseErrorKind::OutOfBounds);
    }
}

TEST_CASE("A parser decodes its blob once")
{
    Cil::TypeRegistry registry;
    BlobBuilder blob;
    blob.Prolog().U16(0);

    Parser parser(blob.View(), registry);
    const auto first = parser.Parse({});
    REQUIRE(first.has_value());
    const auto second = parser.Parse({});
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().kind == ParseErrorKind::Malformed);
}
