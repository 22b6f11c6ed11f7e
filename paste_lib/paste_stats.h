//////////////////////////////////////////////////////////////////////

#pragma once

#include <list>
#include <string>

#include <fmt/format.h>

#include "paste_enums.h"
#include "paste_error.h"
#include "paste_reader.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    struct paste_stats
    {
        // every line which was skipped or which could not produce a pad
        std::list<paste_error> problems;

        int lines{};
        int empty_lines{};

        int format_specs{};
        int unit_commands{};
        int aperture_definitions{};
        int aperture_redefinitions{};
        int aperture_macros{};
        int aperture_selects{};
        int comments{};
        int ignored_commands{};

        int d1{};
        int d2{};
        int d3{};
        int m2{};

        int x_count{};
        int y_count{};

        int pads_created{};
        int flashes_rejected{};

        int unknown_count{};

        paste_stats() = default;

        void cleanup()
        {
            *this = paste_stats{};
        }

        size_t problem_count() const
        {
            return problems.size();
        }

        //////////////////////////////////////////////////////////////////////
        // record a recoverable problem at the reader's current line, returns the code

        template <typename... args>
        paste_error_code problem(paste_reader const &reader, paste_error_code code, char const *fmt = nullptr, args &&...arguments)
        {
            LOG_CONTEXT("problem", debug);

            std::string problem_msg{ "!" };

            if(fmt != nullptr) {
                problem_msg = fmt::vformat(fmt, fmt::make_format_args(arguments...));
            }

            std::string error_text = get_error_text(code);

            std::string problem_message = fmt::format("{} at line {}: {}", error_text, reader.line_number, problem_msg);

            problems.emplace_back(paste_error(code, problem_message, reader.filename, reader.line_number));
            LOG_WARNING("{}", problem_message);
            return code;
        }

        std::string to_string() const
        {
            return fmt::format("STATS: LINES: {}, APERTURES: {}, SELECTS: {}, D01: {}, D02: {}, D03: {}, PADS: {}, PROBLEMS: {}", lines,
                               aperture_definitions, aperture_selects, d1, d2, d3, pads_created, problem_count());
        }
    };

}    // namespace paste_lib
