//////////////////////////////////////////////////////////////////////

#include <fstream>
#include <nlohmann/json.hpp>

#include "paste_log.h"
#include "settings.h"
#include "util.h"

LOG_CONTEXT("settings", info);

//////////////////////////////////////////////////////////////////////

bool settings_t::save()
{
    nlohmann::json json;
    to_json(json);
    std::string json_str = json.dump(4);
    LOG_DEBUG("{}", json_str);
    std::filesystem::path path = config_path(app_name, settings_filename);
    std::ofstream save(path);
    if(!save.is_open()) {
        LOG_WARNING("Can't save settings to {}", path.string());
        return false;
    }
    save << json_str;
    save.close();
    return !save.fail();
}

//////////////////////////////////////////////////////////////////////
// missing or unreadable file leaves everything at the defaults

bool settings_t::load()
{
    std::filesystem::path path = config_path(app_name, settings_filename);
    std::ifstream load(path);
    if(!load.is_open()) {
        LOG_VERBOSE("No settings at {}, using defaults", path.string());
        from_json(nlohmann::json::object());
        return false;
    }
    nlohmann::json json = nlohmann::json::parse(load, nullptr, false);
    load.close();
    if(json.is_discarded() || !json.is_object()) {
        LOG_WARNING("Settings file {} is not valid, using defaults", path.string());
        from_json(nlohmann::json::object());
        return false;
    }
    from_json(json);
    return true;
}
