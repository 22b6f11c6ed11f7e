//////////////////////////////////////////////////////////////////////

#include <cctype>
#include <charconv>
#include <optional>
#include <string>

#include "paste_error.h"
#include "paste_lib.h"
#include "paste_util.h"

LOG_CONTEXT("paste_lib", info);

//////////////////////////////////////////////////////////////////////

namespace
{
    //////////////////////////////////////////////////////////////////////

    bool all_digits(std::string_view sv)
    {
        if(sv.empty()) {
            return false;
        }
        for(auto const &c : sv) {
            if(!isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }

    //////////////////////////////////////////////////////////////////////

    std::string_view strip_star(std::string_view sv)
    {
        if(!sv.empty() && sv.back() == '*') {
            sv.remove_suffix(1);
        }
        return sv;
    }

    //////////////////////////////////////////////////////////////////////

    void add_trailing_zeros(int integer_part, int decimal_part, int length, long long *coordinate)
    {
        int omitted_value = integer_part + decimal_part - length;
        for(int x = 0; x < omitted_value; x++) {
            *coordinate *= 10;
        }
    }

}    // namespace

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    void paste_file::reset()
    {
        filename = std::string{};
        unit = unit_millimeter;
        format = paste_format{};
        apertures.clear();
        state = paste_state{};
        stats.cleanup();
        reader.close();
        pads.clear();
        incomplete = false;
        warned_missing_format = false;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code paste_file::parse_file(char const *file_path, std::stop_token const &stop_token)
    {
        reset();
        CHECK(reader.open(file_path));
        return do_parse(stop_token);
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code paste_file::parse_memory(char const *data, size_t size, std::stop_token const &stop_token)
    {
        reset();
        CHECK(reader.open(data, size));
        return do_parse(stop_token);
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code paste_file::do_parse(std::stop_token const &stop_token)
    {
        filename = reader.filename;

        paste_util::paste_timer timer;
        timer.reset();

        while(!reader.eof() && !state.end_of_file) {

            if(stop_token.stop_requested()) {
                LOG_WARNING("Parse of {} stopped at line {}, {} pads so far", filename, reader.line_number, pads.size());
                incomplete = true;
                break;
            }

            std::string_view line;
            CHECK(reader.read_line(&line));

            paste_line_type line_type = parse_line(line);
            LOG_DEBUG("{}: {} ({})", reader.line_number, line, line_type);
        }

        if(!format.specified && !pads.empty()) {
            LOG_WARNING("{} has no format specification, coordinates were not scaled", filename);
        }

        LOG_INFO("Parsed {} in {:.3f}s: {} lines, {} pads, {} problems", filename, timer.elapsed_seconds(), reader.line_number, pads.size(),
                 stats.problem_count());
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_line_type paste_file::parse_line(std::string_view line)
    {
        stats.lines += 1;

        if(line.empty()) {
            stats.empty_lines += 1;
            return line_type_empty;
        }

        // skip the body of a multi line aperture macro up to the closing %
        if(state.in_aperture_macro) {
            if(line.ends_with('%')) {
                state.in_aperture_macro = false;
            }
            return line_type_aperture_macro;
        }

        if(line[0] == '%') {
            return parse_extended(line);
        }

        std::string_view body = strip_star(line);

        if(!body.empty()) {

            switch(body[0]) {

            case 'G':
                return parse_g_code(body);

            case 'D':
                return parse_d_code(body);

            case 'X':
            case 'Y':
                return parse_coordinates(body);

            case 'M': {
                std::string_view digits = body.substr(1);
                if(all_digits(digits)) {
                    switch(paste_util::int_from_string_view(digits).value_or(-1)) {
                    case 0:
                    case 2:
                        stats.m2 += 1;
                        state.end_of_file = true;
                        LOG_VERBOSE("End of file at line {}", reader.line_number);
                        return line_type_end_of_file;
                    case 1:
                        stats.ignored_commands += 1;
                        return line_type_ignored;
                    default:
                        break;
                    }
                }
            } break;

            default:
                break;
            }
        }

        stats.unknown_count += 1;
        stats.problem(reader, error_unknown_command, "can't interpret \"{}\"", line);
        return line_type_unknown;
    }

    //////////////////////////////////////////////////////////////////////
    // %XX...*%

    paste_line_type paste_file::parse_extended(std::string_view line)
    {
        if(line.starts_with("%AM")) {
            stats.aperture_macros += 1;
            if(!line.ends_with('%')) {
                state.in_aperture_macro = true;
            }
            stats.problem(reader, error_unsupported_command, "aperture macros are not supported");
            return line_type_aperture_macro;
        }

        if(line.size() < 4 || !line.ends_with('%')) {
            stats.unknown_count += 1;
            stats.problem(reader, error_malformed_command, "expected %...*%, got \"{}\"", line);
            return line_type_unknown;
        }

        std::string_view body = strip_star(line.substr(1, line.size() - 2));

        if(body.size() < 2) {
            stats.unknown_count += 1;
            stats.problem(reader, error_malformed_command, "expected a two letter command in \"{}\"", line);
            return line_type_unknown;
        }

        std::string_view command = body.substr(0, 2);
        std::string_view parameters = body.substr(2);

        if(command == "FS") {
            return parse_format_specification(parameters);
        }

        if(command == "MO") {
            return parse_unit(parameters, "MO");
        }

        if(command == "AD") {
            return parse_aperture(parameters);
        }

        if(command == "SR") {
            stats.problem(reader, error_unsupported_command, "step and repeat is not supported");
            return line_type_unknown;
        }

        // attributes, polarity, image settings, none of which change where pads are
        static constexpr char const *inert_commands[] = { "LP", "TF", "TA", "TO", "TD", "IP", "OF", "SF", "IN", "LN", "AS", "MI", "IR" };

        for(char const *inert : inert_commands) {
            if(command == inert) {
                stats.ignored_commands += 1;
                LOG_DEBUG("Ignoring %{}% at line {}", body, reader.line_number);
                return line_type_ignored;
            }
        }

        stats.unknown_count += 1;
        stats.problem(reader, error_unknown_command, "unknown extended command \"{}\"", line);
        return line_type_unknown;
    }

    //////////////////////////////////////////////////////////////////////
    // after FS: <L|T|D><A|I>[Nn][Gn][Dn][Mn]Xid Yid

    paste_line_type paste_file::parse_format_specification(std::string_view body)
    {
        stats.format_specs += 1;

        paste_format new_format{};

        if(body.size() < 2) {
            stats.problem(reader, error_invalid_format_specification, "format specification too short: \"{}\"", body);
            return line_type_unknown;
        }

        switch(body[0]) {
        case 'L':
            new_format.omit_zeros = omit_zeros_leading;
            break;
        case 'T':
            new_format.omit_zeros = omit_zeros_trailing;
            break;
        case 'D':
            new_format.omit_zeros = omit_zeros_explicit;
            break;
        default:
            stats.problem(reader, error_invalid_format_specification, "expected [L|T|D], got {}", string_from_char(body[0]));
            return line_type_unknown;
        }

        switch(body[1]) {
        case 'A':
            new_format.coordinate = coordinate_absolute;
            break;
        case 'I':
            stats.problem(reader, error_incremental_not_supported, "incremental coordinates are not supported, format unchanged");
            return line_type_unknown;
        default:
            stats.problem(reader, error_invalid_format_specification, "expected [A|I], got {}", string_from_char(body[1]));
            return line_type_unknown;
        }

        auto read_digit = [&](size_t pos, char highest, int *value) {
            if(pos >= body.size() || body[pos] < '0' || body[pos] > highest) {
                return false;
            }
            *value = body[pos] - '0';
            return true;
        };

        bool got_x{ false };
        bool got_y{ false };
        int unused;

        size_t pos = 2;
        while(pos < body.size()) {

            char c = body[pos];
            pos += 1;

            switch(c) {

            case 'N':
            case 'G':
            case 'D':
            case 'M':
                if(!read_digit(pos, '9', &unused)) {
                    stats.problem(reader, error_invalid_format_specification, "expected digit after {}", c);
                    return line_type_unknown;
                }
                pos += 1;
                break;

            case 'X':
                if(!read_digit(pos, '6', &new_format.integral_part_x) || !read_digit(pos + 1, '6', &new_format.decimal_part_x)) {
                    stats.problem(reader, error_invalid_format_specification, "expected 2 digits 0..6 after X in \"{}\"", body);
                    return line_type_unknown;
                }
                got_x = true;
                pos += 2;
                break;

            case 'Y':
                if(!read_digit(pos, '6', &new_format.integral_part_y) || !read_digit(pos + 1, '6', &new_format.decimal_part_y)) {
                    stats.problem(reader, error_invalid_format_specification, "expected 2 digits 0..6 after Y in \"{}\"", body);
                    return line_type_unknown;
                }
                got_y = true;
                pos += 2;
                break;

            default:
                stats.problem(reader, error_invalid_format_specification, "expected [N|G|D|M|X|Y], got {}", string_from_char(c));
                return line_type_unknown;
            }
        }

        if(!got_x || !got_y) {
            stats.problem(reader, error_invalid_format_specification, "format specification needs both X and Y: \"{}\"", body);
            return line_type_unknown;
        }

        if(format.specified) {
            LOG_WARNING("Format specification repeated at line {}, replacing {}", reader.line_number, format);
        }

        new_format.specified = true;
        format = new_format;
        LOG_VERBOSE("{}", format);
        return line_type_format_specification;
    }

    //////////////////////////////////////////////////////////////////////

    paste_line_type paste_file::parse_unit(std::string_view body, char const *command)
    {
        stats.unit_commands += 1;

        if(body == "MM") {
            unit = unit_millimeter;
        } else if(body == "IN") {
            unit = unit_inch;
        } else {
            stats.problem(reader, error_invalid_unit, "expected {}MM or {}IN, got \"{}\"", command, command, body);
            return line_type_unknown;
        }
        LOG_VERBOSE("Units are {}", unit);
        return line_type_unit;
    }

    //////////////////////////////////////////////////////////////////////

    paste_line_type paste_file::parse_aperture(std::string_view body)
    {
        paste_aperture aperture;

        paste_error_code err = parse_aperture_definition(body, &aperture);
        if(err != ok) {
            stats.problem(reader, err, "skipping aperture definition \"{}\"", body);
            return line_type_unknown;
        }

        stats.aperture_definitions += 1;

        if(apertures.define(aperture)) {
            stats.aperture_redefinitions += 1;
            LOG_WARNING("Aperture D{} redefined at line {}", aperture.aperture_number, reader.line_number);
        }
        LOG_DEBUG("AD {}", aperture);
        return line_type_aperture_definition;
    }

    //////////////////////////////////////////////////////////////////////

    paste_line_type paste_file::parse_g_code(std::string_view body)
    {
        size_t length = 1;
        while(length < body.size() && isdigit(static_cast<unsigned char>(body[length]))) {
            length += 1;
        }

        std::optional<int> code = paste_util::int_from_string_view(body.substr(1, length - 1));
        if(!code.has_value()) {
            stats.problem(reader, error_malformed_command, "expected G<number>, got \"{}\"", body);
            return line_type_unknown;
        }

        std::string_view rest = body.substr(length);

        switch(code.value()) {

        // Comment
        case 4:
            stats.comments += 1;
            LOG_VERBOSE("Comment({}): {}", reader.line_number, paste_util::trim(rest));
            return line_type_comment;

        // Linear interpolation or prepare for flash, may prefix a coordinate
        case 1:
        case 55:
            if(rest.empty()) {
                stats.ignored_commands += 1;
                return line_type_ignored;
            }
            if(rest[0] == 'X' || rest[0] == 'Y') {
                return parse_coordinates(rest);
            }
            if(rest[0] == 'D') {
                return parse_d_code(rest);
            }
            break;

        // Select aperture - Deprecated.
        case 54:
            if(!rest.empty() && rest[0] == 'D') {
                return parse_d_code(rest);
            }
            break;

        // Specify inches - Deprecated.
        case 70:
            if(rest.empty()) {
                return parse_unit("IN", "G70/");
            }
            break;

        // Specify millimeters - Deprecated.
        case 71:
            if(rest.empty()) {
                return parse_unit("MM", "G71/");
            }
            break;

        // Quadrant modes and absolute mode change nothing for flashes
        case 74:
        case 75:
        case 90:
            if(rest.empty()) {
                stats.ignored_commands += 1;
                return line_type_ignored;
            }
            break;

        case 91:
            stats.problem(reader, error_incremental_not_supported, "G91 incremental coordinates are not supported");
            return line_type_unknown;

        case 2:
        case 3:
            stats.problem(reader, error_unsupported_command, "circular interpolation (G0{}) is not supported", code.value());
            return line_type_unknown;

        case 36:
        case 37:
            stats.problem(reader, error_unsupported_command, "regions (G{}) are not supported", code.value());
            return line_type_unknown;

        default:
            stats.unknown_count += 1;
            stats.problem(reader, error_unknown_command, "unknown code G{}", code.value());
            return line_type_unknown;
        }

        stats.problem(reader, error_malformed_command, "unexpected \"{}\" after G{}", rest, code.value());
        return line_type_unknown;
    }

    //////////////////////////////////////////////////////////////////////

    paste_line_type paste_file::parse_d_code(std::string_view body)
    {
        std::string_view digits = body.substr(1);

        if(!all_digits(digits)) {
            stats.problem(reader, error_malformed_command, "expected D<number>, got \"{}\"", body);
            return line_type_unknown;
        }

        std::optional<int> code = paste_util::int_from_string_view(digits);
        if(!code.has_value()) {
            stats.problem(reader, error_invalid_number, "D code out of range: \"{}\"", body);
            return line_type_unknown;
        }

        switch(code.value()) {

        // Exposure on.
        case 1:
            stats.d1 += 1;
            return line_type_operation;

        // Exposure off.
        case 2:
            stats.d2 += 1;
            return line_type_operation;

        // Flash aperture at the current position.
        case 3:
            stats.d3 += 1;
            flash();
            return line_type_operation;

        // Aperture id in use.
        default:
            if(code.value() >= min_aperture_number) {
                state.current_aperture = code.value();
                stats.aperture_selects += 1;
                if(!apertures.contains(code.value())) {
                    LOG_WARNING("Selected aperture D{} at line {} is not defined (yet)", code.value(), reader.line_number);
                }
                return line_type_aperture_select;
            }
            stats.problem(reader, error_bad_aperture_number, "D{} is not an aperture number", code.value());
            return line_type_unknown;
        }
    }

    //////////////////////////////////////////////////////////////////////
    // signed integer, scaled to real units, advances body past it

    paste_error_code paste_file::get_coordinate(std::string_view *body, int integral_part, int decimal_part, double scale, double *value)
    {
        std::string_view s = *body;

        size_t sign_length = 0;
        if(!s.empty() && (s[0] == '-' || s[0] == '+')) {
            sign_length = 1;
        }

        size_t digits = 0;
        while(sign_length + digits < s.size() && isdigit(static_cast<unsigned char>(s[sign_length + digits]))) {
            digits += 1;
        }

        if(digits == 0) {
            return error_missing_integer_value;
        }

        long long coordinate;
        char const *begin = s.data() + sign_length;
        char const *end = begin + digits;
        auto [ptr, ec] = std::from_chars(begin, end, coordinate);
        if(ec != std::errc{} || ptr != end) {
            return error_invalid_number;
        }

        if(format.omit_zeros == omit_zeros_trailing) {
            add_trailing_zeros(integral_part, decimal_part, static_cast<int>(digits), &coordinate);
        }

        if(s[0] == '-') {
            coordinate = -coordinate;
        }

        *value = static_cast<double>(coordinate) * scale;
        body->remove_prefix(sign_length + digits);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // [Xn][Yn][D01|D02|D03], only the axes present change

    paste_line_type paste_file::parse_coordinates(std::string_view body)
    {
        std::optional<double> x;
        std::optional<double> y;
        int d_code = 0;

        std::string_view s = body;

        while(!s.empty()) {

            char c = s[0];

            switch(c) {

            case 'X':
            case 'Y': {
                std::optional<double> &axis = (c == 'X') ? x : y;
                if(axis.has_value()) {
                    stats.problem(reader, error_malformed_command, "{} given twice in \"{}\"", c, body);
                    return line_type_unknown;
                }
                s.remove_prefix(1);
                double value;
                paste_error_code err;
                if(c == 'X') {
                    err = get_coordinate(&s, format.integral_part_x, format.decimal_part_x, format.scale_x(), &value);
                } else {
                    err = get_coordinate(&s, format.integral_part_y, format.decimal_part_y, format.scale_y(), &value);
                }
                if(err != ok) {
                    stats.problem(reader, err, "bad {} coordinate in \"{}\"", c, body);
                    return line_type_unknown;
                }
                axis = value;
            } break;

            case 'I':
            case 'J':
                stats.problem(reader, error_unsupported_command, "arc offsets are not supported: \"{}\"", body);
                return line_type_unknown;

            case 'D': {
                // the operation code always ends the line
                std::string_view digits = s.substr(1);
                std::optional<int> code = all_digits(digits) ? paste_util::int_from_string_view(digits) : std::nullopt;
                if(!code.has_value() || code.value() < 1 || code.value() > 3) {
                    stats.problem(reader, error_malformed_command, "expected D01, D02 or D03 in \"{}\"", body);
                    return line_type_unknown;
                }
                d_code = code.value();
                s = {};
            } break;

            default:
                stats.problem(reader, error_malformed_command, "unexpected {} in \"{}\"", string_from_char(c), body);
                return line_type_unknown;
            }
        }

        if(!format.specified && !warned_missing_format) {
            LOG_WARNING("Coordinates at line {} before any format specification, using scale 1.0", reader.line_number);
            warned_missing_format = true;
        }

        if(x.has_value()) {
            state.current_x = x.value();
            stats.x_count += 1;
        }

        if(y.has_value()) {
            state.current_y = y.value();
            stats.y_count += 1;
        }

        switch(d_code) {
        case 1:
            stats.d1 += 1;
            break;
        case 2:
            stats.d2 += 1;
            break;
        case 3:
            stats.d3 += 1;
            flash();
            break;
        default:
            break;
        }
        return line_type_coordinate;
    }

    //////////////////////////////////////////////////////////////////////
    // make a pad at the cursor with the selected aperture, no pad (and no id used) on failure

    void paste_file::flash()
    {
        vec2d position{ state.current_x, state.current_y };

        if(!state.has_aperture()) {
            stats.flashes_rejected += 1;
            stats.problem(reader, error_no_aperture_selected, "flash at {} with no aperture selected", position);
            return;
        }

        paste_aperture const *aperture = apertures.find(state.current_aperture);

        if(aperture == nullptr) {
            stats.flashes_rejected += 1;
            stats.problem(reader, error_undefined_aperture, "flash at {} with undefined aperture D{}", position, state.current_aperture);
            return;
        }

        int id = static_cast<int>(pads.size()) + 1;
        double thickness = default_thickness(unit);

        paste_pad pad;
        paste_error_code err;

        switch(aperture->aperture_type) {
        case aperture_type_circle:
            err = make_circle_pad(id, position, aperture->primary_size(), thickness, &pad);
            break;
        case aperture_type_rectangle:
            err = make_rectangle_pad(id, position, aperture->primary_size(), aperture->secondary_size(), thickness, &pad);
            break;
        default:
            err = error_unsupported_aperture_type;
            break;
        }

        if(err != ok) {
            stats.flashes_rejected += 1;
            stats.problem(reader, err, "no pad from {} at {}", *aperture, position);
            return;
        }

        pad.aperture_number = aperture->aperture_number;
        pad.line_number = reader.line_number;
        pads.push_back(pad);
        stats.pads_created += 1;
        LOG_DEBUG("Created {}", pad);
    }

    //////////////////////////////////////////////////////////////////////

    rect paste_file::extent() const
    {
        if(pads.empty()) {
            return rect{};
        }
        rect r = pads.front().bounds;
        for(auto const &pad : pads) {
            r = r.union_with(pad.bounds);
        }
        return r;
    }

}    // namespace paste_lib
