//////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "paste_error_codes.h"
#include "paste_log.h"

//////////////////////////////////////////////////////////////////////
// log and return the first error, the log context says which file

#define CHECK(x)                                                                                                            \
    do {                                                                                                                    \
        ::paste_lib::paste_error_code __error = (x);                                                                        \
        if(__error != ::paste_lib::ok) {                                                                                    \
            LOG_ERROR("{} from `{}` at line {}", ::paste_lib::get_error_text(__error), #x, __LINE__);                       \
            return __error;                                                                                                 \
        }                                                                                                                   \
    } while(false)

#define FAIL_IF(condition, error_code)                                                                                      \
    do {                                                                                                                    \
        if(condition) {                                                                                                     \
            LOG_ERROR("{} because `{}` at line {}", ::paste_lib::get_error_text(error_code), #condition, __LINE__);         \
            return error_code;                                                                                              \
        }                                                                                                                   \
    } while(false)

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

#define PASTE_ERROR_ENUM(name) error_##name,

    enum paste_error_code : uint32_t
    {
        ok,
        PASTE_ERROR_CODES(PASTE_ERROR_ENUM)
    };

#undef PASTE_ERROR_ENUM

    char const *get_error_text(paste_error_code error_code);

    //////////////////////////////////////////////////////////////////////
    // convert a char to a string

    inline std::string string_from_char(int c)
    {
        if(c >= ' ' && c < 127) {
            return std::string({ static_cast<char>(c) });
        }
        return fmt::format("0x{:02x}", static_cast<uint8_t>(c));
    }

    //////////////////////////////////////////////////////////////////////

    struct paste_error
    {
        paste_error_code error_code{};
        std::string message{};
        std::string filename{};
        int line_number{};

        paste_error() = default;

        paste_error(paste_error_code code, std::string const &msg, std::string const &file, int line)
            : error_code(code), message(msg), filename(file), line_number(line)
        {
        }
    };

}    // namespace paste_lib
