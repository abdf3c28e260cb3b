#include "CustomAttributeParser.h"

#include <algorithm>
#include <iterator>
#include <vector>

#include "TextEncoding.h"
#include "TypeRegistry.h"

namespace {

    using Cil::FlavorKind;
    using namespace CustomAttribute;

    class DepthGuard {
    public:
        explicit DepthGuard(uint32_t& depth) : mDepth(depth) { ++mDepth; }
        ~DepthGuard() { --mDepth; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        uint32_t& mDepth;
    };

    // Named arguments only carry primitives, strings and types.
    std::optional<std::string_view> NamedArgumentTypeName(uint8_t tag) {
        const auto type = ToSerializationType(tag);
        if (!type) {
            return std::nullopt;
        }
        switch (*type) {
            case SerializationType::Boolean: return "Boolean";
            case SerializationType::Char: return "Char";
            case SerializationType::I1: return "I1";
            case SerializationType::U1: return "U1";
            case SerializationType::I2: return "I2";
            case SerializationType::U2: return "U2";
            case SerializationType::I4: return "I4";
            case SerializationType::U4: return "U4";
            case SerializationType::I8: return "I8";
            case SerializationType::U8: return "U8";
            case SerializationType::R4: return "R4";
            case SerializationType::R8: return "R8";
            case SerializationType::String: return "String";
            case SerializationType::Type: return "Type";
            default: return std::nullopt;
        }
    }

    template<typename T>
    ParseExpected<Argument> ReadScalar(Cil::SafeSpanReader& reader) {
        auto value = reader.ReadLE<T>();
        if (!value) return std::unexpected(value.error());
        return Argument{*value};
    }

    ParseExpected<Argument> ReadNativeInt(Cil::SafeSpanReader& reader) {
        if constexpr (sizeof(intptr_t) == 8) {
            auto value = reader.ReadLE<int64_t>();
            if (!value) return std::unexpected(value.error());
            return Argument{NativeInt{static_cast<intptr_t>(*value)}};
        } else {
            auto value = reader.ReadLE<int32_t>();
            if (!value) return std::unexpected(value.error());
            return Argument{NativeInt{static_cast<intptr_t>(*value)}};
        }
    }

    ParseExpected<Argument> ReadNativeUInt(Cil::SafeSpanReader& reader) {
        if constexpr (sizeof(uintptr_t) == 8) {
            auto value = reader.ReadLE<uint64_t>();
            if (!value) return std::unexpected(value.error());
            return Argument{NativeUInt{static_cast<uintptr_t>(*value)}};
        } else {
            auto value = reader.ReadLE<uint32_t>();
            if (!value) return std::unexpected(value.error());
            return Argument{NativeUInt{static_cast<uintptr_t>(*value)}};
        }
    }

    ParseExpected<Argument> ReadChar(Cil::SafeSpanReader& reader) {
        auto unit = reader.ReadLE<uint16_t>();
        if (!unit) return std::unexpected(unit.error());
        return Argument{Text::FromUtf16CodeUnit(*unit)};
    }

    ParseExpected<Argument> ReadBool(Cil::SafeSpanReader& reader) {
        auto byte = reader.ReadLE<uint8_t>();
        if (!byte) return std::unexpected(byte.error());
        return Argument{*byte != 0};
    }

    // -1 is the null array. Every element takes at least one byte, so a count
    // above the remaining size can never be satisfied.
    ParseExpected<std::optional<size_t>> ReadElementCount(Cil::SafeSpanReader& reader) {
        const auto offset = reader.Offset();
        auto count = reader.ReadLE<int32_t>();
        if (!count) return std::unexpected(count.error());
        if (*count == -1) {
            return std::optional<size_t>{};
        }
        if (*count < 0) {
            return Fail("Invalid array length {} at offset {}", *count, offset);
        }
        if (static_cast<size_t>(*count) > reader.Remaining()) {
            return Fail("Array length {} at offset {} exceeds the {} remaining bytes",
                        *count, offset, reader.Remaining());
        }
        return std::optional<size_t>{static_cast<size_t>(*count)};
    }

} // namespace

namespace CustomAttribute {

    Parser::Parser(std::span<const uint8_t> data, const Cil::TypeOracle& oracle, ParserOptions options)
        : mReader(data), mOracle(oracle), mOptions(options) {}

    ParseExpected<Value> Parser::Parse(std::span<const Cil::ParamInfo> params) {
        if (mConsumed) {
            return Fail("Parser has already consumed its blob");
        }
        mConsumed = true;

        Value result;
        if (mReader.Size() == 0) {
            return result;
        }

        auto prolog = mReader.ReadLE<uint16_t>();
        if (!prolog) return std::unexpected(prolog.error());
        if (*prolog != kProlog) {
            return Fail("Invalid custom attribute prolog 0x{:04X}, expected 0x{:04X}", *prolog, kProlog);
        }

        auto fixedArgs = ParseFixedArguments(params);
        if (!fixedArgs) return std::unexpected(fixedArgs.error());
        result.fixedArgs = std::move(*fixedArgs);

        // Blobs emitted without the NumNamed field are accepted.
        if (mReader.Remaining() < 2) {
            return result;
        }

        auto numNamed = mReader.ReadLE<uint16_t>();
        if (!numNamed) return std::unexpected(numNamed.error());
        result.namedArgs.reserve(std::min<size_t>(*numNamed, mReader.Remaining()));

        for (uint16_t i = 0; i < *numNamed; ++i) {
            auto named = ParseNamedArgument();
            if (!named) return std::unexpected(named.error());
            if (!*named) {
                break;
            }
            result.namedArgs.push_back(std::move(**named));
        }
        return result;
    }

    ParseExpected<std::vector<Argument>> Parser::ParseFixedArguments(std::span<const Cil::ParamInfo> params) {
        std::vector<Cil::ParamInfo> ordered;
        ordered.reserve(params.size());
        std::ranges::copy_if(params, std::back_inserter(ordered),
                             [](const Cil::ParamInfo& param) { return param.sequence != 0; });
        std::ranges::stable_sort(ordered, {}, &Cil::ParamInfo::sequence);

        std::vector<Cil::TypeHandle> types;
        types.reserve(ordered.size());
        for (const auto& param : ordered) {
            if (param.resolvedType) {
                types.push_back(*param.resolvedType);
            }
        }

        if (types.empty() && !ordered.empty()) {
            return Fail("None of the {} constructor parameters has a resolved type", ordered.size());
        }

        std::vector<Argument> arguments;
        arguments.reserve(types.size());
        for (size_t i = 0; i < types.size(); ++i) {
            if (mReader.AtEnd()) {
                return Fail("Not enough data for fixed argument {} at offset {}", i, mReader.Offset());
            }
            auto argument = ParseFixedArgument(types[i]);
            if (!argument) return std::unexpected(argument.error());
            arguments.push_back(std::move(*argument));
        }
        return arguments;
    }

    ParseExpected<Argument> Parser::ParseFixedArgument(Cil::TypeHandle type) {
        const auto flavor = mOracle.GetFlavor(type);
        switch (flavor.kind) {
            case FlavorKind::Boolean: return ReadBool(mReader);
            case FlavorKind::Char: return ReadChar(mReader);
            case FlavorKind::I1: return ReadScalar<int8_t>(mReader);
            case FlavorKind::U1: return ReadScalar<uint8_t>(mReader);
            case FlavorKind::I2: return ReadScalar<int16_t>(mReader);
            case FlavorKind::U2: return ReadScalar<uint16_t>(mReader);
            case FlavorKind::I4: return ReadScalar<int32_t>(mReader);
            case FlavorKind::U4: return ReadScalar<uint32_t>(mReader);
            case FlavorKind::I8: return ReadScalar<int64_t>(mReader);
            case FlavorKind::U8: return ReadScalar<uint64_t>(mReader);
            case FlavorKind::R4: return ReadScalar<float>(mReader);
            case FlavorKind::R8: return ReadScalar<double>(mReader);
            case FlavorKind::I: return ReadNativeInt(mReader);
            case FlavorKind::U: return ReadNativeUInt(mReader);
            case FlavorKind::String: {
                auto text = ParseString();
                if (!text) return std::unexpected(text.error());
                return Argument{std::move(*text)};
            }
            case FlavorKind::Class:
                return ParseClassArgument(type);
            case FlavorKind::ValueType: {
                auto value = mReader.ReadLE<int32_t>();
                if (!value) return std::unexpected(value.error());
                return MakeEnum(mOracle.FullName(type), Argument{*value});
            }
            case FlavorKind::Array:
                return ParseArrayArgument(type, flavor);
            case FlavorKind::Void:
                return MakeVoid();
            default:
                return Fail("Unsupported type flavor {} for '{}' at offset {}",
                            Cil::ToString(flavor.kind), mOracle.FullName(type), mReader.Offset());
        }
    }

    ParseExpected<Argument> Parser::ParseClassArgument(Cil::TypeHandle type) {
        const auto fullName = mOracle.FullName(type);

        if (fullName == Cil::kSystemType) {
            auto name = ParseString();
            if (!name) return std::unexpected(name.error());
            return MakeType(std::move(*name));
        }
        if (fullName == Cil::kSystemString) {
            auto text = ParseString();
            if (!text) return std::unexpected(text.error());
            return Argument{std::move(*text)};
        }
        if (fullName == Cil::kSystemObject) {
            auto tag = mReader.ReadLE<uint8_t>();
            if (!tag) return std::unexpected(tag.error());
            return ParseByTag(*tag);
        }

        // Enums from unloaded assemblies surface as plain classes.
        if (Classifier().IsEnum(mOracle, type) && mReader.CanRead(4)) {
            auto value = mReader.ReadLE<int32_t>();
            if (!value) return std::unexpected(value.error());
            return MakeEnum(fullName, Argument{*value});
        }

        auto name = ParseString();
        if (!name) return std::unexpected(name.error());
        return MakeType(std::move(*name));
    }

    ParseExpected<Argument> Parser::ParseArrayArgument(Cil::TypeHandle type, Cil::Flavor flavor) {
        if (flavor.rank != 1) {
            return Fail("Multi-dimensional array '{}' (rank {}) is not supported", mOracle.FullName(type), flavor.rank);
        }

        auto count = ReadElementCount(mReader);
        if (!count) return std::unexpected(count.error());
        if (!*count) {
            return MakeArray({});
        }

        const auto element = mOracle.ArrayElementType(type);
        if (!element) {
            return Fail("Array type has no base element type information");
        }

        std::vector<Argument> elements;
        elements.reserve(**count);
        for (size_t i = 0; i < **count; ++i) {
            auto value = ParseFixedArgument(*element);
            if (!value) return std::unexpected(value.error());
            elements.push_back(std::move(*value));
        }
        return MakeArray(std::move(elements));
    }

    ParseExpected<std::optional<NamedArgument>> Parser::ParseNamedArgument() {
        if (mReader.AtEnd()) {
            return std::optional<NamedArgument>{};
        }

        const auto offset = mReader.Offset();
        auto marker = mReader.ReadLE<uint8_t>();
        if (!marker) return std::unexpected(marker.error());
        if (*marker != kFieldMarker && *marker != kPropertyMarker) {
            return Fail("Invalid named argument kind 0x{:02X} at offset {}", *marker, offset);
        }

        auto tag = mReader.ReadLE<uint8_t>();
        if (!tag) return std::unexpected(tag.error());
        const auto typeName = NamedArgumentTypeName(*tag);
        if (!typeName) {
            return Fail("Unsupported named argument type 0x{:02X} at offset {}", *tag, offset + 1);
        }

        auto nameLength = mReader.ReadCompressedUInt();
        if (!nameLength) return std::unexpected(nameLength.error());
        auto nameBytes = mReader.PeekBytes(*nameLength);
        if (!nameBytes) return std::unexpected(nameBytes.error());
        std::string name = Text::Latin1ToUtf8(*nameBytes);
        if (auto seek = mReader.Seek(mReader.Offset() + *nameLength); !seek) {
            return std::unexpected(seek.error());
        }

        auto value = ParseByTag(*tag);
        if (!value) return std::unexpected(value.error());

        return NamedArgument{*marker == kFieldMarker, std::move(name), std::string(*typeName), std::move(*value)};
    }

    ParseExpected<Argument> Parser::ParseByTag(uint8_t tag) {
        DepthGuard guard(mDepth);
        if (mDepth >= kMaxRecursionDepth) {
            return FailWith(ParseErrorKind::RecursionLimit,
                            "Maximum nesting depth of {} exceeded at offset {}", kMaxRecursionDepth, mReader.Offset());
        }

        const auto type = ToSerializationType(tag);
        if (!type) {
            return Fail("Unsupported serialization type tag 0x{:02X} at offset {}", tag, mReader.Offset());
        }

        switch (*type) {
            case SerializationType::Boolean: return ReadBool(mReader);
            case SerializationType::Char: return ReadChar(mReader);
            case SerializationType::I1: return ReadScalar<int8_t>(mReader);
            case SerializationType::U1: return ReadScalar<uint8_t>(mReader);
            case SerializationType::I2: return ReadScalar<int16_t>(mReader);
            case SerializationType::U2: return ReadScalar<uint16_t>(mReader);
            case SerializationType::I4: return ReadScalar<int32_t>(mReader);
            case SerializationType::U4: return ReadScalar<uint32_t>(mReader);
            case SerializationType::I8: return ReadScalar<int64_t>(mReader);
            case SerializationType::U8: return ReadScalar<uint64_t>(mReader);
            case SerializationType::R4: return ReadScalar<float>(mReader);
            case SerializationType::R8: return ReadScalar<double>(mReader);
            case SerializationType::String: {
                auto text = ParseString();
                if (!text) return std::unexpected(text.error());
                return Argument{std::move(*text)};
            }
            case SerializationType::Type: {
                auto name = ParseString();
                if (!name) return std::unexpected(name.error());
                return MakeType(std::move(*name));
            }
            case SerializationType::TaggedObject: {
                auto inner = mReader.ReadLE<uint8_t>();
                if (!inner) return std::unexpected(inner.error());
                return ParseByTag(*inner);
            }
            case SerializationType::Enum: {
                auto enumName = ParseString();
                if (!enumName) return std::unexpected(enumName.error());
                auto value = mReader.ReadLE<int32_t>();
                if (!value) return std::unexpected(value.error());
                return MakeEnum(std::move(*enumName), Argument{*value});
            }
            case SerializationType::SZArray:
                return ParseTaggedArray();
        }
        return Fail("Unsupported serialization type tag 0x{:02X}", tag);
    }

    ParseExpected<Argument> Parser::ParseTaggedArray() {
        auto elementTag = mReader.ReadLE<uint8_t>();
        if (!elementTag) return std::unexpected(elementTag.error());

        auto count = ReadElementCount(mReader);
        if (!count) return std::unexpected(count.error());
        if (!*count) {
            return MakeArray({});
        }

        std::vector<Argument> elements;
        elements.reserve(**count);
        for (size_t i = 0; i < **count; ++i) {
            auto value = ParseByTag(*elementTag);
            if (!value) return std::unexpected(value.error());
            elements.push_back(std::move(*value));
        }
        return MakeArray(std::move(elements));
    }

    ParseExpected<std::string> Parser::ParseString() {
        auto first = mReader.PeekByte();
        if (!first) return std::unexpected(first.error());
        if (*first == 0xFF) {
            if (auto skip = mReader.Seek(mReader.Offset() + 1); !skip) {
                return std::unexpected(skip.error());
            }
            return std::string{};
        }

        const auto offset = mReader.Offset();
        auto length = mReader.ReadCompressedUInt();
        if (!length) return std::unexpected(length.error());
        if (*length > mReader.Remaining()) {
            return Fail("String length {} at offset {} exceeds the {} remaining bytes",
                        *length, offset, mReader.Remaining());
        }

        auto raw = mReader.ReadString(*length);
        if (!raw) return std::unexpected(raw.error());
        if (Text::IsValidUtf8(*raw)) {
            return std::move(*raw);
        }
        if (mOptions.strictUtf8) {
            return Fail("Invalid UTF-8 in string at offset {}", offset);
        }
        return Text::RepairUtf8(*raw);
    }

    const EnumClassifier& Parser::Classifier() const {
        return mOptions.enumClassifier ? *mOptions.enumClassifier : EnumClassifier::Default();
    }

    ParseExpected<Value> ParseBlob(const Cil::BlobHeap& heap, uint32_t index,
                                   std::span<const Cil::ParamInfo> params,
                                   const Cil::TypeOracle& oracle, ParserOptions options) {
        if (index == 0) {
            return Value{};
        }
        auto data = heap.Get(index);
        if (!data) return std::unexpected(data.error());
        return ParseData(*data, params, oracle, options);
    }

    ParseExpected<Value> ParseData(std::span<const uint8_t> data,
                                   std::span<const Cil::ParamInfo> params,
                                   const Cil::TypeOracle& oracle, ParserOptions options) {
        Parser parser(data, oracle, options);
        return parser.Parse(params);
    }

} // namespace CustomAttribute
