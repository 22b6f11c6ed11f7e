//////////////////////////////////////////////////////////////////////

#include "paste_error.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////
    // the code's name without the error_ prefix, "?" for anything else

    char const *get_error_text(paste_error_code error_code)
    {
#define PASTE_ERROR_NAME(name) \
    case error_##name:         \
        return #name;

        switch(error_code) {
        case ok:
            return "ok";
            PASTE_ERROR_CODES(PASTE_ERROR_NAME)
        }

#undef PASTE_ERROR_NAME

        return "?";
    }
}    // namespace paste_lib
