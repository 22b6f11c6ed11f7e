//////////////////////////////////////////////////////////////////////

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "paste_enums.h"
#include "paste_error.h"
#include "paste_util.h"

namespace paste_lib
{
    // D1..D3 are operations so apertures with those numbers can be defined but never selected
    static constexpr int min_aperture_number = 1;

    //////////////////////////////////////////////////////////////////////

    struct paste_aperture
    {
        std::vector<double> parameters;
        paste_aperture_type aperture_type{ aperture_type_none };
        int aperture_number{};

        // circle: diameter, rectangle: width
        double primary_size() const
        {
            return parameters.empty() ? 0.0 : parameters[0];
        }

        // rectangle height, a rectangle with no height is square
        double secondary_size() const
        {
            if(aperture_type == aperture_type_rectangle && parameters.size() > 1) {
                return parameters[1];
            }
            return primary_size();
        }

        std::string to_string() const
        {
            return fmt::format("APERTURE D{}: TYPE: {}, PARAMETERS: {}", aperture_number, aperture_type, parameters.size());
        }

        std::string get_description(std::string const &units) const;

        paste_aperture() = default;
    };

    //////////////////////////////////////////////////////////////////////
    // parse the body of an AD command, eg "D10C,0.254" or "D11R,0.5X0.3"

    paste_error_code parse_aperture_definition(std::string_view definition, paste_aperture *aperture);

    //////////////////////////////////////////////////////////////////////
    // redefining a number overwrites the previous definition, some files rely on it

    struct paste_aperture_table
    {
        std::map<int, paste_aperture> apertures;

        // returns true if an existing definition was replaced
        bool define(paste_aperture const &aperture);

        paste_aperture const *find(int aperture_number) const;

        bool contains(int aperture_number) const
        {
            return apertures.contains(aperture_number);
        }

        size_t size() const
        {
            return apertures.size();
        }

        void clear()
        {
            apertures.clear();
        }
    };

}    // namespace paste_lib

PASTE_MAKE_FORMATTER(paste_lib::paste_aperture);
