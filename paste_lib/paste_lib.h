//////////////////////////////////////////////////////////////////////
// Paste layer interpreter
// Reads the subset of RS274X needed to find flashed pads:
// format spec, unit, circle/rectangle apertures, aperture select,
// move/draw/flash with absolute coordinates.
// Anything else is skipped and counted, the parse always runs to the end

#pragma once

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "paste_aperture.h"
#include "paste_error.h"
#include "paste_format.h"
#include "paste_pad.h"
#include "paste_reader.h"
#include "paste_state.h"
#include "paste_stats.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    struct paste_file
    {
        std::string filename;

        paste_unit unit{ unit_millimeter };

        paste_format format{};
        paste_aperture_table apertures{};
        paste_state state{};
        paste_stats stats{};
        paste_reader reader{};

        std::vector<paste_pad> pads;

        // a stop was requested part way through, pads so far are kept
        bool incomplete{ false };

        void reset();

        // fails only if the stream can't be read at all
        paste_error_code parse_file(char const *file_path, std::stop_token const &stop_token = {});
        paste_error_code parse_memory(char const *data, size_t size, std::stop_token const &stop_token = {});

        paste_error_code do_parse(std::stop_token const &stop_token);

        // one step of the interpreter, the line must already be trimmed
        paste_line_type parse_line(std::string_view line);

        size_t pad_count() const
        {
            return pads.size();
        }

        size_t problem_count() const
        {
            return stats.problem_count();
        }

        // union of all pad bounds, empty rect if there are no pads
        rect extent() const;

        paste_file() = default;

        //////////////////////////////////////////////////////////////////////

        paste_line_type parse_extended(std::string_view line);
        paste_line_type parse_format_specification(std::string_view body);
        paste_line_type parse_unit(std::string_view body, char const *command);
        paste_line_type parse_aperture(std::string_view body);
        paste_line_type parse_g_code(std::string_view body);
        paste_line_type parse_d_code(std::string_view body);
        paste_line_type parse_coordinates(std::string_view body);

        paste_error_code get_coordinate(std::string_view *body, int integral_part, int decimal_part, double scale, double *value);

        void flash();

        bool warned_missing_format{ false };
    };

}    // namespace paste_lib
