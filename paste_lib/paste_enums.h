#pragma once

#include <map>
#include <string>

#include <stdint.h>

#include <fmt/format.h>

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////
    // shape of a pad, polygon is reserved (nothing produces it yet)

    enum paste_shape
    {
        shape_circle,
        shape_rectangle,
        shape_polygon
    };

    //////////////////////////////////////////////////////////////////////

    enum paste_aperture_type
    {
        aperture_type_none,
        aperture_type_circle,
        aperture_type_rectangle,
        aperture_type_oval,
        aperture_type_polygon,
        aperture_type_macro
    };

    //////////////////////////////////////////////////////////////////////

    enum paste_unit
    {
        unit_millimeter,
        unit_inch
    };

    //////////////////////////////////////////////////////////////////////

    enum paste_omit_zeros
    {
        omit_zeros_leading,
        omit_zeros_trailing,
        omit_zeros_explicit
    };

    //////////////////////////////////////////////////////////////////////

    enum paste_coordinate
    {
        coordinate_absolute,
        coordinate_incremental
    };

    //////////////////////////////////////////////////////////////////////
    // what the interpreter decided a line was

    enum paste_line_type
    {
        line_type_empty,
        line_type_format_specification,
        line_type_unit,
        line_type_aperture_definition,
        line_type_aperture_macro,
        line_type_aperture_select,
        line_type_operation,
        line_type_coordinate,
        line_type_comment,
        line_type_ignored,
        line_type_end_of_file,
        line_type_unknown
    };

    //////////////////////////////////////////////////////////////////////

    char const *shape_name(paste_shape shape);

}    // namespace paste_lib

// this relies on an extern std::map<ENUM_TYPE, char const *> ENUM_TYPE_names_map; in paste_lib::paste_enum_names

#define PASTE_MAKE_ENUM_FORMATTER(PASTE_ENUM)                                                                              \
    namespace paste_lib::paste_enum_names                                                                                  \
    {                                                                                                                      \
        extern std::map<PASTE_ENUM, char const *> PASTE_ENUM##_names_map;                                                  \
    }                                                                                                                      \
    template <> struct fmt::formatter<::paste_lib::PASTE_ENUM> : fmt::formatter<std::string>                               \
    {                                                                                                                      \
        auto format(::paste_lib::PASTE_ENUM const &e, fmt::format_context &ctx) const                                      \
        {                                                                                                                  \
            auto f = ::paste_lib::paste_enum_names::PASTE_ENUM##_names_map.find(e);                                        \
            if(f != ::paste_lib::paste_enum_names::PASTE_ENUM##_names_map.end()) {                                         \
                return fmt::format_to(ctx.out(), "{}", f->second);                                                         \
            }                                                                                                              \
            return fmt::format_to(ctx.out(), "@ERROR: Can't find enum value {} for {}", static_cast<int>(e), #PASTE_ENUM); \
        }                                                                                                                  \
    }

PASTE_MAKE_ENUM_FORMATTER(paste_shape);
PASTE_MAKE_ENUM_FORMATTER(paste_aperture_type);
PASTE_MAKE_ENUM_FORMATTER(paste_unit);
PASTE_MAKE_ENUM_FORMATTER(paste_omit_zeros);
PASTE_MAKE_ENUM_FORMATTER(paste_coordinate);
PASTE_MAKE_ENUM_FORMATTER(paste_line_type);
