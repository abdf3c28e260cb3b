#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

enum class ParseErrorKind {
    Malformed,
    RecursionLimit,
    OutOfBounds,
};

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Malformed;
    std::string message;
};

template<typename T>
using ParseExpected = std::expected<T, ParseError>;

inline std::string_view ToString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::Malformed: return "Malformed";
        case ParseErrorKind::RecursionLimit: return "RecursionLimit";
        case ParseErrorKind::OutOfBounds: return "OutOfBounds";
    }
    return "Unknown";
}

inline ParseError MakeParseError(std::string message, ParseErrorKind kind = ParseErrorKind::Malformed) {
    return ParseError{kind, std::move(message)};
}

inline std::unexpected<ParseError> Fail(const std::string& message) {
    return std::unexpected(MakeParseError(message));
}

template<typename... Args>
 std::unexpected<ParseError> Fail(std::format_string<Args...> fmt, Args&&... args) {
    return std::unexpected(MakeParseError(std::format(fmt, std::forward<Args>(args)...)));
}

template<typename... Args>
std::unexpected<ParseError> FailWith(ParseErrorKind kind, std::format_string<Args...> fmt, Args&&... args) {
    return std::unexpected(MakeParseError(std::format(fmt, std::forward<Args>(args)...), kind));
}
