#pragma once

#include <chrono>
#include <iterator>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace paste_util
{
    //////////////////////////////////////////////////////////////////////

    struct paste_timer
    {
        paste_timer() = default;

        std::chrono::time_point<std::chrono::high_resolution_clock> time_point_begin;

        void reset()
        {
            time_point_begin = std::chrono::high_resolution_clock::now();
        }

        double elapsed_seconds() const
        {
            auto time_point_end = std::chrono::high_resolution_clock::now();
            auto diff = time_point_end - time_point_begin;
            auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(diff);
            return microseconds.count() / 1000000.0;
        }
    };

    //////////////////////////////////////////////////////////////////////

    std::string to_lowercase(std::string const &s);

    // strip leading and trailing whitespace (including \r)
    std::string_view trim(std::string_view s);

    // whole string must be a number, no leading '+'
    std::optional<double> double_from_string_view(std::string_view s);
    std::optional<int> int_from_string_view(std::string_view s);

    //////////////////////////////////////////////////////////////////////

    template <typename... args> void print(char const *fmt, args &&...arguments)
    {
        fmt::vformat_to(std::ostream_iterator<char>(std::cout), fmt, fmt::make_format_args(arguments...));
    }

    //////////////////////////////////////////////////////////////////////
    // get number of elements in an array

    template <typename T, size_t N> constexpr size_t array_length(T const (&)[N])
    {
        return N;
    }

}    // namespace paste_util

//////////////////////////////////////////////////////////////////////
// if there's a `to_string()` member function, you can use this
// to make a type formattable. If there's no to_string() method, compile fails

#define PASTE_MAKE_FORMATTER(PASTE_TYPE)                                         \
    template <> struct fmt::formatter<PASTE_TYPE> : fmt::formatter<std::string> \
    {                                                                            \
        auto format(PASTE_TYPE const &e, fmt::format_context &ctx) const         \
        {                                                                        \
            return fmt::format_to(ctx.out(), "{}", e.to_string());               \
        }                                                                        \
    }
