#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "paste_log.h"

//////////////////////////////////////////////////////////////////////
// worker_threads 0 means one per hardware thread

#define SETTINGS_FIELDS                          \
    X(std::string, log_level, "warning")         \
    X(double, default_thickness_um, 150.0)       \
    X(int, worker_threads, 0)                    \
    X(bool, show_pads, true)

struct settings_t
{
#define X(type, name, ...) type name = __VA_ARGS__;
    SETTINGS_FIELDS
#undef X

    bool save();
    bool load();

    void to_json(nlohmann::json &j) const
    {
#define X(type, name, ...) j[#name] = name;
        SETTINGS_FIELDS
#undef X
    }

    // fields which are missing or the wrong type keep their defaults
    void from_json(nlohmann::json const &j)
    {
        LOG_CONTEXT("from_json", info);
#define X(type, name, ...)                                                  \
    name = __VA_ARGS__;                                                     \
    if(j.contains(#name)) {                                                 \
        try {                                                               \
            name = j.at(#name).get<type>();                                 \
        } catch(nlohmann::json::exception const &e) {                      \
            LOG_WARNING("Setting {} ignored: {}", #name, e.what());         \
        }                                                                   \
    }
        SETTINGS_FIELDS
#undef X
    }
};
