#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ParseHelpers {

    constexpr auto kListDelimiter = ',';

    std::string_view Trim(std::string_view s);
    bool EqualsIgnoreCase(std::string_view a, std::string_view b);
    bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix);

    // Splits on kListDelimiter and trims each item. Empty items are kept so callers can report them.
    std::vector<std::string_view> SplitList(std::string_view value);

    // Accepts true/false, yes/no, on/off and 1/0 in any case.
    bool ParseBool(std::string_view s, bool& out);

    // Decimal, or hexadecimal with a 0x prefix.
    bool ParseUInt32(std::string_view s, uint32_t& out);

} // namespace ParseHelpers
