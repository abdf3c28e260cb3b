#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Text {

    constexpr char32_t kReplacementChar = 0xFFFD;

    // Appends the UTF-8 encoding of a scalar value; surrogates and out-of-range values become U+FFFD.
    void AppendUtf8(std::string& out, char32_t codePoint);
    [[nodiscard]] std::string EncodeUtf8(char32_t codePoint);

    // A single UTF-16 code unit as a scalar value. Lone surrogates map to U+FFFD.
    [[nodiscard]] char32_t FromUtf16CodeUnit(uint16_t unit);

    [[nodiscard]] bool IsValidUtf8(std::string_view text);

    // Replaces each maximal invalid subsequence with U+FFFD.
    [[nodiscard]] std::string RepairUtf8(std::string_view text);

    // Each byte is taken as one character in U+0000..U+00FF.
    [[nodiscard]] std::string Latin1ToUtf8(std::span<const uint8_t> bytes);

} // namespace Text
