#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "BlobHeap.h"
#include "CustomAttributeTypes.h"
#include "EnumClassifier.h"
#include "ParseTypes.h"
#include "SafeSpanReader.h"
#include "TypeOracle.h"

namespace CustomAttribute {

    constexpr uint16_t kProlog = 0x0001;
    constexpr uint32_t kMaxRecursionDepth = 50;

    struct ParserOptions {
        // Reject malformed UTF-8 instead of substituting U+FFFD.
        bool strictUtf8 = false;
        // nullptr selects EnumClassifier::Default().
        const EnumClassifier* enumClassifier = nullptr;
    };

    // Decodes one CustomAttribute value blob (ECMA-335 II.23.3).
    // The fixed arguments are shaped by the constructor parameters; the named
    // arguments carry their own serialization tags. Single use.
    class Parser {
    public:
        Parser(std::span<const uint8_t> data, const Cil::TypeOracle& oracle, ParserOptions options = {});

        [[nodiscard]] ParseExpected<Value> Parse(std::span<const Cil::ParamInfo> params);

    private:
        ParseExpected<std::vector<Argument>> ParseFixedArguments(std::span<const Cil::ParamInfo> params);
        ParseExpected<Argument> ParseFixedArgument(Cil::TypeHandle type);
        ParseExpected<Argument> ParseClassArgument(Cil::TypeHandle type);
        ParseExpected<Argument> ParseArrayArgument(Cil::TypeHandle type, Cil::Flavor flavor);
        ParseExpected<std::optional<NamedArgument>> ParseNamedArgument();

        // Recursive decode driven by an embedded serialization tag.
        ParseExpected<Argument> ParseByTag(uint8_t tag);
        ParseExpected<std::string> ParseString();
        ParseExpected<Argument> ParseTaggedArray();

        [[nodiscard]] const EnumClassifier& Classifier() const;

        Cil::SafeSpanReader mReader;
        const Cil::TypeOracle& mOracle;
        ParserOptions mOptions;
        uint32_t mDepth = 0;
        bool mConsumed = false;
    };

    // Decodes the blob at `index` of the #Blob heap. Index 0 is the null blob and yields an empty value.
    [[nodiscard]] ParseExpected<Value> ParseBlob(const Cil::BlobHeap& heap, uint32_t index,
                                                 std::span<const Cil::ParamInfo> params,
                                                 const Cil::TypeOracle& oracle, ParserOptions options = {});

    [[nodiscard]] ParseExpected<Value> ParseData(std::span<const uint8_t> data,
                                                 std::span<const Cil::ParamInfo> params,
                                                 const Cil::TypeOracle& oracle, ParserOptions options = {});

} // namespace CustomAttribute
