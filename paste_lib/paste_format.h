//////////////////////////////////////////////////////////////////////

#pragma once

#include <string>

#include <fmt/format.h>

#include "paste_enums.h"
#include "paste_math.h"
#include "paste_util.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////
    // %FS...*% - until one is seen the scale is 1.0, which is almost certainly wrong

    struct paste_format
    {
        paste_omit_zeros omit_zeros{ omit_zeros_leading };
        paste_coordinate coordinate{ coordinate_absolute };
        int integral_part_x{};
        int decimal_part_x{};
        int integral_part_y{};
        int decimal_part_y{};
        bool specified{ false };

        paste_format() = default;

        double scale_x() const
        {
            return specified ? pow10_negative(decimal_part_x) : 1.0;
        }

        double scale_y() const
        {
            return specified ? pow10_negative(decimal_part_y) : 1.0;
        }

        std::string to_string() const
        {
            return fmt::format("FORMAT: ZEROS: {}, COORDINATES: {}, X: {}.{}, Y: {}.{}", omit_zeros, coordinate, integral_part_x, decimal_part_x,
                               integral_part_y, decimal_part_y);
        }
    };

}    // namespace paste_lib

PASTE_MAKE_FORMATTER(paste_lib::paste_format);
