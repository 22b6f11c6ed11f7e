#pragma once

#include <filesystem>
#include <set>
#include <string>

//////////////////////////////////////////////////////////////////////

extern char const *app_name;
extern char const *settings_filename;

//////////////////////////////////////////////////////////////////////
// $XDG_CONFIG_HOME/<application_name>/<filename>, the directory is created if needed

std::filesystem::path config_path(std::string const &application_name, std::string const &filename);

// longest range pad_ids_from_string will expand
static constexpr int max_pad_id_range = 100000;

// "1,2,7-9" -> { 1, 2, 7, 8, 9 }, false if any part is not a positive id or range
bool pad_ids_from_string(std::string const &text, std::set<int> *pad_ids);
