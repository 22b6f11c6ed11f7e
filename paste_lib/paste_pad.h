//////////////////////////////////////////////////////////////////////

#pragma once

#include <string>

#include "paste_2d.h"
#include "paste_enums.h"
#include "paste_error.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////
    // 150um of paste, in whatever length unit the pads are in

    static constexpr double default_thickness_mm = 0.150;

    double default_thickness(paste_unit unit);

    //////////////////////////////////////////////////////////////////////
    // created once when an aperture is flashed, never modified after that.
    // thickness overrides live in the thickness manager, not here

    struct paste_pad
    {
        int id{};
        paste_shape shape{ shape_circle };
        vec2d position{};

        // shape_circle: the disc, centred on position
        circle disc{};

        // shape_rectangle: the pad itself, for any shape: its bounding box
        rect bounds{};

        double area{};
        double default_thickness{ default_thickness_mm };

        // longest and shortest extent, both are the diameter for a circle
        double length{};
        double width{};

        int aperture_number{};
        int line_number{};

        paste_pad() = default;

        double default_volume() const
        {
            return area * default_thickness;
        }

        bool contains(vec2d const &p) const;

        std::string to_string() const
        {
            return fmt::format("PAD {}: {} AT {}, AREA {:g}, SIZE {:g}x{:g}, D{}, LINE {}", id, shape, position, area, length, width, aperture_number,
                               line_number);
        }
    };

    //////////////////////////////////////////////////////////////////////
    // both fail with error_degenerate_pad if the area would not be positive

    paste_error_code make_circle_pad(int id, vec2d const &position, double diameter, double thickness, paste_pad *pad);

    paste_error_code make_rectangle_pad(int id, vec2d const &position, double width, double height, double thickness, paste_pad *pad);

}    // namespace paste_lib

PASTE_MAKE_FORMATTER(paste_lib::paste_pad);
