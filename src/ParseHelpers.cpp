#include "ParseHelpers.h"

#include <cctype>
#include <charconv>

namespace ParseHelpers {

    std::string_view Trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.remove_prefix(1);
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.remove_suffix(1);
        }
        return s;
    }

    bool EqualsIgnoreCase(const std::string_view a, const std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        return StartsWithIgnoreCase(a, b);
    }

    bool StartsWithIgnoreCase(const std::string_view text, const std::string_view prefix) {
        if (prefix.size() > text.size()) {
            return false;
        }
        for (size_t i = 0; i < prefix.size(); ++i) {
            const auto ct = static_cast<unsigned char>(text[i]);
            const auto cp = static_cast<unsigned char>(prefix[i]);
            if (std::tolower(ct) != std::tolower(cp)) {
                return false;
            }
        }
        return true;
    }

    std::vector<std::string_view> SplitList(std::string_view value) {
        std::vector<std::string_view> items;
        if (Trim(value).empty()) {
            return items;
        }
        size_t start = 0;
        while (true) {
            const auto delim = value.find(kListDelimiter, start);
            if (delim == std::string_view::npos) {
                items.push_back(Trim(value.substr(start)));
                break;
            }
            items.push_back(Trim(value.substr(start, delim - start)));
            start = delim + 1;
        }
        return items;
    }

    bool ParseBool(std::string_view s, bool& out) {
        s = Trim(s);
        if (EqualsIgnoreCase(s, "true") || EqualsIgnoreCase(s, "yes") || EqualsIgnoreCase(s, "on") || s == "1") {
            out = true;
            return true;
        }
        if (EqualsIgnoreCase(s, "false") || EqualsIgnoreCase(s, "no") || EqualsIgnoreCase(s, "off") || s == "0") {
            out = false;
            return true;
        }
        return false;
    }

    bool ParseUInt32(std::string_view s, uint32_t& out) {
        s = Trim(s);
        int base = 10;
        if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
            s = s.substr(2);
            base = 16;
        }
        if (s.empty()) {
            return false;
        }
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, base);
        return ec == std::errc() && ptr == s.data() + s.size();
    }

} // namespace ParseHelpers
