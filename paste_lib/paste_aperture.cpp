//////////////////////////////////////////////////////////////////////

#include <cctype>

#include "paste_aperture.h"
#include "paste_reader.h"

LOG_CONTEXT("aperture", info);

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    paste_error_code parse_aperture_definition(std::string_view definition, paste_aperture *aperture)
    {
        if(aperture == nullptr) {
            return error_internal_bad_pointer;
        }

        if(definition.empty() || definition[0] != 'D') {
            LOG_WARNING("Invalid aperture definition, expected 'D': {}", definition);
            return error_invalid_aperture_definition;
        }
        definition.remove_prefix(1);

        // number runs up to the template name
        size_t digits = 0;
        while(digits < definition.size() && isdigit(static_cast<unsigned char>(definition[digits]))) {
            digits += 1;
        }
        auto number = paste_util::int_from_string_view(definition.substr(0, digits));
        if(!number.has_value()) {
            LOG_WARNING("Missing aperture number in definition: D{}", definition);
            return error_invalid_aperture_definition;
        }
        if(number.value() < min_aperture_number) {
            LOG_WARNING("Aperture number {} out of range, must be at least {}", number.value(), min_aperture_number);
            return error_bad_aperture_number;
        }
        definition.remove_prefix(digits);

        std::vector<std::string_view> tokens;
        tokenize(definition, tokens, ",", tokenize_keep_empty);

        if(tokens.empty() || tokens[0].empty()) {
            LOG_WARNING("Bad aperture definition for D{}: missing template", number.value());
            return error_invalid_aperture_definition;
        }

        paste_aperture_type aperture_type{ aperture_type_none };

        if(tokens[0].size() == 1) {
            switch(tokens[0][0]) {
            case 'C':
                aperture_type = aperture_type_circle;
                break;
            case 'R':
                aperture_type = aperture_type_rectangle;
                break;
            case 'O':
                aperture_type = aperture_type_oval;
                break;
            case 'P':
                aperture_type = aperture_type_polygon;
                break;
            default:
                LOG_WARNING("Unknown aperture template {} for D{}", tokens[0], number.value());
                return error_invalid_aperture_definition;
            }
        } else {
            aperture_type = aperture_type_macro;
        }

        if(aperture_type != aperture_type_circle && aperture_type != aperture_type_rectangle) {
            LOG_WARNING("Aperture D{} is a {}, only circle and rectangle are supported", number.value(), aperture_type);
            return error_unsupported_aperture_type;
        }

        if(tokens.size() != 2) {
            LOG_WARNING("Aperture D{} needs exactly one parameter list, got {}", number.value(), tokens.size() - 1);
            return error_invalid_aperture_definition;
        }

        std::vector<std::string_view> parameters;
        tokenize(tokens[1], parameters, "X", tokenize_keep_empty);

        std::vector<double> values;
        for(std::string_view s : parameters) {
            auto value = paste_util::double_from_string_view(s);
            if(!value.has_value()) {
                LOG_WARNING("Invalid number in aperture D{} parameters: \"{}\"", number.value(), s);
                return error_invalid_number;
            }
            if(value.value() < 0) {
                LOG_WARNING("Negative size {} in aperture D{}", value.value(), number.value());
                return error_invalid_aperture_definition;
            }
            values.push_back(value.value());
        }

        // circle: diameter [hole], rectangle: width [height [hole]]
        size_t max_parameters = aperture_type == aperture_type_circle ? 2 : 3;
        if(values.size() > max_parameters) {
            LOG_WARNING("Too many parameters ({}) for aperture D{}", values.size(), number.value());
            return error_invalid_aperture_definition;
        }

        aperture->aperture_type = aperture_type;
        aperture->aperture_number = number.value();
        aperture->parameters = std::move(values);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    std::string paste_aperture::get_description(std::string const &units) const
    {
        switch(aperture_type) {
        case aperture_type_circle: {
            return fmt::format("Circle, diameter {:g}{}", primary_size(), units);
        } break;
        case aperture_type_rectangle: {
            return fmt::format("Rect, {:g}x{:g}{}", primary_size(), secondary_size(), units);
        } break;
        case aperture_type_none: {
            return "None";
        } break;
        default:
            return fmt::format("Unsupported {}", aperture_type);
        }
    }

    //////////////////////////////////////////////////////////////////////

    bool paste_aperture_table::define(paste_aperture const &aperture)
    {
        bool replaced = apertures.contains(aperture.aperture_number);
        if(replaced) {
            LOG_DEBUG("Aperture D{} already defined, overwriting", aperture.aperture_number);
        }
        apertures[aperture.aperture_number] = aperture;
        return replaced;
    }

    //////////////////////////////////////////////////////////////////////

    paste_aperture const *paste_aperture_table::find(int aperture_number) const
    {
        auto f = apertures.find(aperture_number);
        if(f == apertures.end()) {
            return nullptr;
        }
        return &f->second;
    }

}    // namespace paste_lib
