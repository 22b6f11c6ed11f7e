//////////////////////////////////////////////////////////////////////

#include <algorithm>

#include "paste_math.h"
#include "paste_pad.h"

LOG_CONTEXT("pad", info);

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    double default_thickness(paste_unit unit)
    {
        if(unit == unit_inch) {
            return default_thickness_mm / millimeters_per_inch;
        }
        return default_thickness_mm;
    }

    //////////////////////////////////////////////////////////////////////

    bool paste_pad::contains(vec2d const &p) const
    {
        if(shape == shape_circle) {
            return disc.contains(p);
        }
        return bounds.contains(p);
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code make_circle_pad(int id, vec2d const &position, double diameter, double thickness, paste_pad *pad)
    {
        if(pad == nullptr) {
            return error_internal_bad_pointer;
        }
        circle disc(position, diameter / 2);
        double area = disc.area();
        if(!(diameter > 0) || !(area > 0)) {
            LOG_DEBUG("Circle pad with diameter {} has no area", diameter);
            return error_degenerate_pad;
        }
        pad->id = id;
        pad->shape = shape_circle;
        pad->position = position;
        pad->disc = disc;
        pad->bounds = disc.bounding_box();
        pad->area = area;
        pad->default_thickness = thickness;
        pad->length = diameter;
        pad->width = diameter;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code make_rectangle_pad(int id, vec2d const &position, double width, double height, double thickness, paste_pad *pad)
    {
        if(pad == nullptr) {
            return error_internal_bad_pointer;
        }
        if(!(width > 0) || !(height > 0)) {
            LOG_DEBUG("Rectangle pad {}x{} has a non-positive side", width, height);
            return error_degenerate_pad;
        }
        rect outline = rect::from_centre(position, width, height);
        double area = width * height;
        if(!(area > 0)) {
            return error_degenerate_pad;
        }
        pad->id = id;
        pad->shape = shape_rectangle;
        pad->position = position;
        pad->disc = circle{};
        pad->bounds = outline;
        pad->area = area;
        pad->default_thickness = thickness;
        pad->length = std::max(width, height);
        pad->width = std::min(width, height);
        return ok;
    }

}    // namespace paste_lib
