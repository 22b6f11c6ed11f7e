//////////////////////////////////////////////////////////////////////
// volume = area x effective thickness
// effective thickness is the group override if the pad has one, else the pad default

#pragma once

#include <string>
#include <vector>

#include "paste_error.h"
#include "paste_pad.h"
#include "paste_thickness.h"
#include "paste_util.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    struct pad_summary
    {
        int id{};
        paste_shape shape{ shape_circle };
        vec2d position{};
        double area{};
        double thickness{};
        double volume{};

        // thickness comes from a group rather than the pad default
        bool is_stepped{ false };

        std::string to_string() const
        {
            return fmt::format("PAD {}: {} AT {}, AREA {:g}, THICKNESS {:g}{}, VOLUME {:g}", id, shape, position, area, thickness,
                               is_stepped ? " (stepped)" : "", volume);
        }
    };

    //////////////////////////////////////////////////////////////////////

    struct volume_report
    {
        size_t pad_count{};
        size_t stepped_count{};
        double total_area{};
        double total_volume{};

        std::string to_string() const
        {
            return fmt::format("PADS: {} ({} stepped), AREA: {:g}, VOLUME: {:g}", pad_count, stepped_count, total_area, total_volume);
        }
    };

    //////////////////////////////////////////////////////////////////////
    // zero area is fine (zero volume), negative area or thickness is an error

    paste_error_code pad_volume(paste_pad const &pad, thickness_manager const &thickness, double *volume);

    paste_error_code get_pad_summary(paste_pad const &pad, thickness_manager const &thickness, pad_summary *summary);

    paste_error_code total_volume(std::vector<paste_pad> const &pads, thickness_manager const &thickness, double *volume);

    paste_error_code get_volume_report(std::vector<paste_pad> const &pads, thickness_manager const &thickness, volume_report *report);

}    // namespace paste_lib

PASTE_MAKE_FORMATTER(paste_lib::pad_summary);
PASTE_MAKE_FORMATTER(paste_lib::volume_report);
