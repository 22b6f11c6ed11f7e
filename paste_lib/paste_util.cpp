#include <algorithm>
#include <cctype>
#include <charconv>

#include <paste_util.h>

namespace paste_util
{
    //////////////////////////////////////////////////////////////////////

    std::string to_lowercase(std::string const &s)
    {
        std::string r = s;
        std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return r;
    }

    //////////////////////////////////////////////////////////////////////

    std::string_view trim(std::string_view s)
    {
        auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; };
        while(!s.empty() && is_space(s.front())) {
            s.remove_prefix(1);
        }
        while(!s.empty() && is_space(s.back())) {
            s.remove_suffix(1);
        }
        return s;
    }

    //////////////////////////////////////////////////////////////////////

    std::optional<double> double_from_string_view(std::string_view s)
    {
        if(s.empty() || s[0] == '+') {
            return std::nullopt;
        }
        double value;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, std::chars_format::fixed);
        if(ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    //////////////////////////////////////////////////////////////////////

    std::optional<int> int_from_string_view(std::string_view s)
    {
        if(s.empty() || s[0] == '+') {
            return std::nullopt;
        }
        int value;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if(ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

}    // namespace paste_util
