#pragma once

#include "paste_enums.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////
    // persists from line to line, coordinates are modal

    struct paste_state
    {
        // real world units (already scaled)
        double current_x{};
        double current_y{};

        // 0 means nothing selected yet
        int current_aperture{};

        // inside a multi-line %AM ... % block
        bool in_aperture_macro{ false };

        // M02 seen
        bool end_of_file{ false };

        paste_state() = default;

        bool has_aperture() const
        {
            return current_aperture != 0;
        }
    };
}    // namespace paste_lib
