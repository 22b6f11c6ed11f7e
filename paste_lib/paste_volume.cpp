//////////////////////////////////////////////////////////////////////

#include "paste_volume.h"

LOG_CONTEXT("volume", info);

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    paste_error_code get_pad_summary(paste_pad const &pad, thickness_manager const &thickness, pad_summary *summary)
    {
        FAIL_IF(summary == nullptr, error_internal_bad_pointer);

        std::optional<double> override_thickness = thickness.get_override(pad.id);
        double t = override_thickness.value_or(pad.default_thickness);

        if(pad.area < 0) {
            LOG_ERROR("Pad {} has negative area {}", pad.id, pad.area);
            return error_negative_area;
        }

        if(t < 0) {
            LOG_ERROR("Pad {} has negative thickness {}", pad.id, t);
            return error_negative_thickness;
        }

        summary->id = pad.id;
        summary->shape = pad.shape;
        summary->position = pad.position;
        summary->area = pad.area;
        summary->thickness = t;
        summary->volume = pad.area * t;
        summary->is_stepped = override_thickness.has_value();
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code pad_volume(paste_pad const &pad, thickness_manager const &thickness, double *volume)
    {
        FAIL_IF(volume == nullptr, error_internal_bad_pointer);

        pad_summary summary;
        CHECK(get_pad_summary(pad, thickness, &summary));
        *volume = summary.volume;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code get_volume_report(std::vector<paste_pad> const &pads, thickness_manager const &thickness, volume_report *report)
    {
        FAIL_IF(report == nullptr, error_internal_bad_pointer);

        volume_report r;
        for(auto const &pad : pads) {
            pad_summary summary;
            CHECK(get_pad_summary(pad, thickness, &summary));
            r.pad_count += 1;
            if(summary.is_stepped) {
                r.stepped_count += 1;
            }
            r.total_area += summary.area;
            r.total_volume += summary.volume;
        }
        *report = r;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code total_volume(std::vector<paste_pad> const &pads, thickness_manager const &thickness, double *volume)
    {
        FAIL_IF(volume == nullptr, error_internal_bad_pointer);

        volume_report report;
        CHECK(get_volume_report(pads, thickness, &report));
        *volume = report.total_volume;
        return ok;
    }

}    // namespace paste_lib
