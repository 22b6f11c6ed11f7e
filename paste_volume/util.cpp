//////////////////////////////////////////////////////////////////////

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "paste_log.h"
#include "paste_reader.h"
#include "paste_util.h"
#include "util.h"

LOG_CONTEXT("util", info);

char const *app_name = "paste_volume";
char const *settings_filename = "settings.json";

//////////////////////////////////////////////////////////////////////

namespace
{
    std::optional<std::string> get_env_var(std::string const &key)
    {
        char const *val = std::getenv(key.c_str());
        if(val == nullptr || val[0] == '\0') {
            return std::nullopt;
        }
        return std::string(val);
    }

}    // namespace

//////////////////////////////////////////////////////////////////////

std::filesystem::path config_path(std::string const &application_name, std::string const &filename)
{
    namespace fs = std::filesystem;

    fs::path base_path;

    // Respect XDG_CONFIG_HOME, fallback to ~/.config
    auto xdg_config = get_env_var("XDG_CONFIG_HOME");
    if(xdg_config.has_value()) {
        base_path = fs::path(xdg_config.value()) / application_name;
    } else {
        auto home = get_env_var("HOME");
        base_path = home.has_value() ? (fs::path(home.value()) / ".config" / application_name) : (fs::temp_directory_path() / application_name);
    }

    std::error_code ec;
    fs::create_directories(base_path, ec);
    if(ec) {
        LOG_WARNING("Can't create {}: {}", base_path.string(), ec.message());
    }

    return base_path / filename;
}

//////////////////////////////////////////////////////////////////////

bool pad_ids_from_string(std::string const &text, std::set<int> *pad_ids)
{
    std::vector<std::string_view> parts;
    paste_lib::tokenize(text, parts, ",", paste_lib::tokenize_remove_empty);

    if(parts.empty()) {
        return false;
    }

    for(auto part : parts) {
        part = paste_util::trim(part);
        size_t dash = part.find('-', 1);
        if(dash == std::string_view::npos) {
            auto id = paste_util::int_from_string_view(part);
            if(!id.has_value() || id.value() < 1) {
                return false;
            }
            pad_ids->insert(id.value());
            continue;
        }
        auto first = paste_util::int_from_string_view(part.substr(0, dash));
        auto last = paste_util::int_from_string_view(part.substr(dash + 1));
        if(!first.has_value() || !last.has_value() || first.value() < 1 || last.value() < first.value()) {
            return false;
        }
        if(last.value() - first.value() >= max_pad_id_range) {
            LOG_ERROR("Pad range {} is longer than {}", part, max_pad_id_range);
            return false;
        }
        // last can be INT_MAX
        for(int id = first.value(); id < last.value(); ++id) {
            pad_ids->insert(id);
        }
        pad_ids->insert(last.value());
    }
    return true;
}
