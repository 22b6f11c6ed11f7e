#pragma once

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include "paste_math.h"
#include "paste_util.h"

namespace paste_lib
{
    namespace paste_2d
    {
        //////////////////////////////////////////////////////////////////////

        struct vec2d
        {
            double x{};
            double y{};

            vec2d() = default;

            vec2d(double x, double y) : x(x), y(y)
            {
            }

            //////////////////////////////////////////////////////////////////////

            vec2d subtract(vec2d const &v) const
            {
                return { x - v.x, y - v.y };
            }

            //////////////////////////////////////////////////////////////////////

            double length_squared() const
            {
                return x * x + y * y;
            }

            //////////////////////////////////////////////////////////////////////

            double length() const
            {
                return sqrt(length_squared());
            }

            //////////////////////////////////////////////////////////////////////

            std::string to_string() const
            {
                return fmt::format("(X:{:g},Y:{:g})", x, y);
            }
        };
    }    // namespace paste_2d
}    // namespace paste_lib

PASTE_MAKE_FORMATTER(paste_lib::paste_2d::vec2d);

namespace paste_lib
{
    namespace paste_2d
    {
        //////////////////////////////////////////////////////////////////////
        // axis aligned, min_pos <= max_pos once normalized

        struct rect
        {
            vec2d min_pos{};
            vec2d max_pos{};

            //////////////////////////////////////////////////////////////////////

            std::string to_string() const
            {
                return fmt::format("(MIN:{} MAX:{})", min_pos, max_pos);
            }

            //////////////////////////////////////////////////////////////////////

            rect() = default;

            //////////////////////////////////////////////////////////////////////

            rect(double x1, double y1, double x2, double y2) : min_pos(x1, y1), max_pos(x2, y2)
            {
            }

            //////////////////////////////////////////////////////////////////////

            rect(vec2d const &min, vec2d const &max) : min_pos(min), max_pos(max)
            {
            }

            //////////////////////////////////////////////////////////////////////

            static rect from_centre(vec2d const &centre, double width, double height);

            //////////////////////////////////////////////////////////////////////
            // this orders min_pos, max_pos correctly

            rect normalize() const;

            //////////////////////////////////////////////////////////////////////
            // smallest rect holding both

            rect union_with(rect const &other) const;

            //////////////////////////////////////////////////////////////////////

            bool contains(vec2d const &p) const
            {
                return p.x >= min_pos.x && p.x <= max_pos.x && p.y >= min_pos.y && p.y <= max_pos.y;
            }

            //////////////////////////////////////////////////////////////////////

            double width() const
            {
                return max_pos.x - min_pos.x;
            }

            //////////////////////////////////////////////////////////////////////

            double height() const
            {
                return max_pos.y - min_pos.y;
            }

            //////////////////////////////////////////////////////////////////////

            double area() const
            {
                return width() * height();
            }

       };

        //////////////////////////////////////////////////////////////////////

        struct circle
        {
            vec2d centre{};
            double radius{};

            circle() = default;

            circle(vec2d const &c, double r) : centre(c), radius(r)
            {
            }

            double diameter() const
            {
                return radius * 2;
            }

            double area() const
            {
                return M_PI * radius * radius;
            }

            bool contains(vec2d const &p) const
            {
                return p.subtract(centre).length_squared() <= radius * radius;
            }

            rect bounding_box() const
            {
                return rect::from_centre(centre, diameter(), diameter());
            }

            std::string to_string() const
            {
                return fmt::format("(CENTRE:{} RADIUS:{:g})", centre, radius);
            }
        };

    }    // namespace paste_2d

    using paste_2d::vec2d;
    using paste_2d::rect;
    using paste_2d::circle;

}    // namespace paste_lib

PASTE_MAKE_FORMATTER(paste_lib::paste_2d::rect);
PASTE_MAKE_FORMATTER(paste_lib::paste_2d::circle);
