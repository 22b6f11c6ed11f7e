#include <map>

#include "paste_enums.h"

#define ENUM_NAMES_MAP(PASTE_ENUM) std::map<PASTE_ENUM, char const *> PASTE_ENUM##_names_map

namespace paste_lib::paste_enum_names
{
    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(paste_shape) = {
        { shape_circle, "circle" },
        { shape_rectangle, "rectangle" },
        { shape_polygon, "polygon" },
    };

    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(paste_aperture_type) = {
        { aperture_type_none, "none" },
        { aperture_type_circle, "circle" },
        { aperture_type_rectangle, "rectangle" },
        { aperture_type_oval, "oval" },
        { aperture_type_polygon, "polygon" },
        { aperture_type_macro, "macro" },
    };

    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(paste_unit) = {
        { unit_millimeter, "millimeter" },
        { unit_inch, "inch" },
    };

    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(paste_omit_zeros) = {
        { omit_zeros_leading, "leading" },
        { omit_zeros_trailing, "trailing" },
        { omit_zeros_explicit, "explicit" },
    };

    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(paste_coordinate) = {
        { coordinate_absolute, "absolute" },
        { coordinate_incremental, "incremental" },
    };

    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(paste_line_type) = {
        { line_type_empty, "empty" },
        { line_type_format_specification, "format_specification" },
        { line_type_unit, "unit" },
        { line_type_aperture_definition, "aperture_definition" },
        { line_type_aperture_macro, "aperture_macro" },
        { line_type_aperture_select, "aperture_select" },
        { line_type_operation, "operation" },
        { line_type_coordinate, "coordinate" },
        { line_type_comment, "comment" },
        { line_type_ignored, "ignored" },
        { line_type_end_of_file, "end_of_file" },
        { line_type_unknown, "unknown" },
    };

}    // namespace paste_lib::paste_enum_names

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    char const *shape_name(paste_shape shape)
    {
        auto f = paste_enum_names::paste_shape_names_map.find(shape);
        if(f == paste_enum_names::paste_shape_names_map.end()) {
            return "?";
        }
        return f->second;
    }

}    // namespace paste_lib
