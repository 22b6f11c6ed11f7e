#include "paste_2d.h"

namespace paste_lib
{
    namespace paste_2d
    {
        //////////////////////////////////////////////////////////////////////

        rect rect::from_centre(vec2d const &centre, double width, double height)
        {
            double half_w = width / 2;
            double half_h = height / 2;
            return rect(centre.x - half_w, centre.y - half_h, centre.x + half_w, centre.y + half_h);
        }

        //////////////////////////////////////////////////////////////////////

        rect rect::normalize() const
        {
            return rect({ std::min(min_pos.x, max_pos.x), std::min(min_pos.y, max_pos.y) },
                        { std::max(min_pos.x, max_pos.x), std::max(min_pos.y, max_pos.y) });
        }

        //////////////////////////////////////////////////////////////////////

        rect rect::union_with(rect const &other) const
        {
            return rect({ std::min(min_pos.x, other.min_pos.x), std::min(min_pos.y, other.min_pos.y) },
                        { std::max(max_pos.x, other.max_pos.x), std::max(max_pos.y, other.max_pos.y) });
        }

    }    // namespace paste_2d

}    // namespace paste_lib
