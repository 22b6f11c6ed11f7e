//////////////////////////////////////////////////////////////////////
// X(name) for each error, expanded for the enum and for get_error_text

#pragma once

#define PASTE_ERROR_CODES(X)         \
    X(invalid_parameter)             \
    X(internal_bad_pointer)          \
    X(file_not_found)                \
    X(invalid_file_attributes)       \
    X(cant_open_file)                \
    X(cant_write_file)               \
    X(end_of_file)                   \
    X(missing_integer_value)         \
    X(invalid_number)                \
    X(unknown_command)               \
    X(unsupported_command)           \
    X(malformed_command)             \
    X(invalid_format_specification)  \
    X(incremental_not_supported)     \
    X(invalid_unit)                  \
    X(invalid_aperture_definition)   \
    X(unsupported_aperture_type)     \
    X(bad_aperture_number)           \
    X(no_aperture_selected)          \
    X(undefined_aperture)            \
    X(degenerate_pad)                \
    X(empty_pad_set)                 \
    X(invalid_thickness)             \
    X(duplicate_group_name)          \
    X(group_not_found)               \
    X(pad_in_multiple_groups)        \
    X(invalid_thickness_file)        \
    X(invalid_timestamp)             \
    X(negative_area)                 \
    X(negative_thickness)
