#pragma once

#define _USE_MATH_DEFINES
#include <math.h>

#include <cmath>

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    static constexpr double millimeters_per_inch = 25.4;

    //////////////////////////////////////////////////////////////////////

    inline double pow10_negative(int digits)
    {
        return std::pow(10.0, -digits);
    }

}    // namespace paste_lib
