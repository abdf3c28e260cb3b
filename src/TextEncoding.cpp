#include "TextEncoding.h"

namespace {

    struct SequenceCheck {
        bool valid = false;
        size_t length = 1; // bytes consumed, or the maximal invalid prefix when !valid
    };

    bool InRange(unsigned char byte, unsigned char low, unsigned char high) {
        return byte >= low && byte <= high;
    }

    SequenceCheck CheckSequence(std::string_view text, size_t i) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            return {true, 1};
        }

        size_t expected = 0;
        unsigned char secondLow = 0x80;
        unsigned char secondHigh = 0xBF;
        if (InRange(lead, 0xC2, 0xDF)) {
            expected = 2;
        } else if (lead == 0xE0) {
            expected = 3;
            secondLow = 0xA0;
        } else if (InRange(lead, 0xE1, 0xEC) || InRange(lead, 0xEE, 0xEF)) {
            expected = 3;
        } else if (lead == 0xED) {
            expected = 3;
            secondHigh = 0x9F; // excludes encoded surrogates
        } else if (lead == 0xF0) {
            expected = 4;
            secondLow = 0x90;
        } else if (InRange(lead, 0xF1, 0xF3)) {
            expected = 4;
        } else if (lead == 0xF4) {
            expected = 4;
            secondHigh = 0x8F;
        } else {
            return {false, 1};
        }

        for (size_t k = 1; k < expected; ++k) {
            if (i + k >= text.size()) {
                return {false, k};
            }
            const auto byte = static_cast<unsigned char>(text[i + k]);
            const bool ok = k == 1 ? InRange(byte, secondLow, secondHigh) : InRange(byte, 0x80, 0xBF);
            if (!ok) {
                return {false, k};
            }
        }
        return {true, expected};
    }

} // namespace

namespace Text {

    void AppendUtf8(std::string& out, char32_t codePoint) {
        if ((codePoint >= 0xD800 && codePoint <= 0xDFFF) || codePoint > 0x10FFFF) {
            codePoint = kReplacementChar;
        }

        if (codePoint <= 0x7F) {
            out.push_back(static_cast<char>(codePoint));
        } else if (codePoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codePoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        } else if (codePoint <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((codePoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((codePoint >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        }
    }

    std::string EncodeUtf8(char32_t codePoint) {
        std::string out;
        AppendUtf8(out, codePoint);
        return out;
    }

    char32_t FromUtf16CodeUnit(uint16_t unit) {
        if (unit >= 0xD800 && unit <= 0xDFFF) {
            return kReplacementChar; // half of a surrogate pair cannot stand alone
        }
        return static_cast<char32_t>(unit);
    }

    bool IsValidUtf8(std::string_view text) {
        size_t i = 0;
        while (i < text.size()) {
            const auto check = CheckSequence(text, i);
            if (!check.valid) {
                return false;
            }
            i += check.length;
        }
        return true;
    }

    std::string RepairUtf8(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        size_t i = 0;
        while (i < text.size()) {
            const auto check = CheckSequence(text, i);
            if (check.valid) {
                out.append(text.substr(i, check.length));
            } else {
                AppendUtf8(out, kReplacementChar);
            }
            i += check.length;
        }
        return out;
    }

    std::string Latin1ToUtf8(std::span<const uint8_t> bytes) {
        std::string out;
        out.reserve(bytes.size());
        for (const uint8_t byte : bytes) {
            AppendUtf8(out, static_cast<char32_t>(byte));
        }
        return out;
    }

} // namespace Text
