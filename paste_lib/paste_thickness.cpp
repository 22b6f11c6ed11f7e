//////////////////////////////////////////////////////////////////////

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>

#include <nlohmann/json.hpp>

#include "paste_error.h"
#include "paste_thickness.h"

LOG_CONTEXT("thickness", info);

namespace
{
    //////////////////////////////////////////////////////////////////////
    // fixed width run of digits, no sign

    std::optional<int> digits_field(std::string_view s, size_t pos, size_t length)
    {
        std::string_view part = s.substr(pos, length);
        if(part.size() != length) {
            return std::nullopt;
        }
        for(auto const c : part) {
            if(!isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
        return paste_util::int_from_string_view(part);
    }

    //////////////////////////////////////////////////////////////////////

    bool valid_thickness(double thickness)
    {
        return std::isfinite(thickness) && thickness > 0;
    }

}    // namespace

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    thickness_time thickness_now()
    {
        return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
    }

    //////////////////////////////////////////////////////////////////////

    std::string timestamp_to_string(thickness_time t)
    {
        auto days = std::chrono::floor<std::chrono::days>(t);
        std::chrono::year_month_day date{ days };
        std::chrono::hh_mm_ss<std::chrono::microseconds> time{ t - days };
        return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                           static_cast<unsigned>(date.day()), time.hours().count(), time.minutes().count(), time.seconds().count(),
                           time.subseconds().count());
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code timestamp_from_string(std::string const &s, thickness_time *t)
    {
        if(t == nullptr) {
            return error_internal_bad_pointer;
        }

        // YYYY-MM-DDTHH:MM:SS.ffffffZ
        if(s.size() != 27 || s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':' || s[19] != '.' || s[26] != 'Z') {
            LOG_WARNING("Bad timestamp \"{}\"", s);
            return error_invalid_timestamp;
        }

        auto year = digits_field(s, 0, 4);
        auto month = digits_field(s, 5, 2);
        auto day = digits_field(s, 8, 2);
        auto hour = digits_field(s, 11, 2);
        auto minute = digits_field(s, 14, 2);
        auto second = digits_field(s, 17, 2);
        auto microsecond = digits_field(s, 20, 6);

        if(!year || !month || !day || !hour || !minute || !second || !microsecond) {
            LOG_WARNING("Bad timestamp \"{}\"", s);
            return error_invalid_timestamp;
        }

        if(*year < 1970 || *month < 1 || *month > 12 || *day < 1 || *day > 31 || *hour > 23 || *minute > 59 || *second > 59) {
            LOG_WARNING("Timestamp out of range \"{}\"", s);
            return error_invalid_timestamp;
        }

        std::chrono::year_month_day date{ std::chrono::year{ *year }, std::chrono::month{ static_cast<unsigned>(*month) },
                                          std::chrono::day{ static_cast<unsigned>(*day) } };

        // 31st of April etc.
        if(!date.ok()) {
            LOG_WARNING("Timestamp is not a real date \"{}\"", s);
            return error_invalid_timestamp;
        }

        *t = std::chrono::sys_days{ date } + std::chrono::hours{ *hour } + std::chrono::minutes{ *minute } + std::chrono::seconds{ *second } +
             std::chrono::microseconds{ *microsecond };
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    std::string thickness_manager::next_group_name()
    {
        std::string name;
        do {
            group_counter += 1;
            name = fmt::format("group_{}", group_counter);
        } while(group_table.contains(name));
        return name;
    }

    //////////////////////////////////////////////////////////////////////

    std::map<int, thickness_prior> thickness_manager::capture(std::set<int> const &pad_ids) const
    {
        std::map<int, thickness_prior> prior;
        for(int pad_id : pad_ids) {
            thickness_prior &p = prior[pad_id];
            thickness_group const *group = get_group(pad_id);
            if(group != nullptr) {
                p.thickness = group->thickness;
                p.group_name = group->name;
                p.created_at = group->created_at;
            }
        }
        return prior;
    }

    //////////////////////////////////////////////////////////////////////
    // take pads out of whatever group they are in, groups left empty are deleted

    void thickness_manager::detach(std::set<int> const &pad_ids)
    {
        for(int pad_id : pad_ids) {
            auto found = pad_groups.find(pad_id);
            if(found == pad_groups.end()) {
                continue;
            }
            auto group = group_table.find(found->second);
            if(group != group_table.end()) {
                group->second.pad_ids.erase(pad_id);
                if(group->second.pad_ids.empty()) {
                    LOG_DEBUG("Group {} is empty, deleting it", group->first);
                    group_table.erase(group);
                }
            }
            pad_groups.erase(found);
        }
    }

    //////////////////////////////////////////////////////////////////////
    // pads must already be detached, joins the group if it exists

    void thickness_manager::attach(std::string const &name, std::set<int> const &pad_ids, double thickness, thickness_time created_at)
    {
        auto found = group_table.find(name);
        if(found == group_table.end()) {
            thickness_group group;
            group.name = name;
            group.thickness = thickness;
            group.created_at = created_at;
            found = group_table.emplace(name, std::move(group)).first;
        }
        for(int pad_id : pad_ids) {
            found->second.pad_ids.insert(pad_id);
            pad_groups[pad_id] = name;
        }
    }

    //////////////////////////////////////////////////////////////////////

    std::set<int> thickness_manager::changed_pads(std::map<int, thickness_prior> const &before) const
    {
        std::set<int> changed;
        for(auto const &[pad_id, prior] : before) {
            if(get_override(pad_id) != prior.thickness) {
                changed.insert(pad_id);
            }
        }
        return changed;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code thickness_manager::apply_new(std::string const &name, std::set<int> const &pad_ids, double thickness)
    {
        thickness_change change;
        change.pad_ids = pad_ids;
        change.prior = capture(pad_ids);
        change.new_thickness = thickness;
        change.group_name = name;

        detach(pad_ids);
        attach(name, pad_ids, thickness, thickness_now());

        undo_stack.push_back(std::move(change));
        redo_stack.clear();

        LOG_VERBOSE("{}", group_table[name]);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code thickness_manager::set_thickness(std::set<int> const &pad_ids, double thickness)
    {
        FAIL_IF(pad_ids.empty(), error_empty_pad_set);
        FAIL_IF(!valid_thickness(thickness), error_invalid_thickness);

        return apply_new(next_group_name(), pad_ids, thickness);
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code thickness_manager::create_group(std::string const &name, std::set<int> const &pad_ids, double thickness)
    {
        FAIL_IF(name.empty(), error_invalid_parameter);
        FAIL_IF(pad_ids.empty(), error_empty_pad_set);
        FAIL_IF(!valid_thickness(thickness), error_invalid_thickness);
        FAIL_IF(group_table.contains(name), error_duplicate_group_name);

        return apply_new(name, pad_ids, thickness);
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code thickness_manager::remove_group(std::string const &name)
    {
        auto found = group_table.find(name);

        FAIL_IF(found == group_table.end(), error_group_not_found);

        thickness_change change;
        change.pad_ids = found->second.pad_ids;
        change.prior = capture(change.pad_ids);
        change.group_name = name;

        detach(change.pad_ids);

        LOG_VERBOSE("Removed group {}, {} pads back to default", name, change.pad_ids.size());

        undo_stack.push_back(std::move(change));
        redo_stack.clear();
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    std::optional<double> thickness_manager::get_override(int pad_id) const
    {
        thickness_group const *group = get_group(pad_id);
        if(group == nullptr) {
            return std::nullopt;
        }
        return group->thickness;
    }

    //////////////////////////////////////////////////////////////////////

    double thickness_manager::get_thickness(int pad_id, double default_thickness) const
    {
        return get_override(pad_id).value_or(default_thickness);
    }

    //////////////////////////////////////////////////////////////////////

    thickness_group const *thickness_manager::get_group(int pad_id) const
    {
        auto found = pad_groups.find(pad_id);
        if(found == pad_groups.end()) {
            return nullptr;
        }
        auto group = group_table.find(found->second);
        if(group == group_table.end()) {
            return nullptr;
        }
        return &group->second;
    }

    //////////////////////////////////////////////////////////////////////

    std::set<int> thickness_manager::undo()
    {
        if(undo_stack.empty()) {
            return {};
        }

        thickness_change change = std::move(undo_stack.back());
        undo_stack.pop_back();

        std::map<int, thickness_prior> before = capture(change.pad_ids);

        detach(change.pad_ids);

        // put pads back by the group they came from
        std::map<std::string, std::set<int>> restore;
        for(auto const &[pad_id, prior] : change.prior) {
            if(prior.thickness.has_value()) {
                restore[prior.group_name].insert(pad_id);
            }
        }

        for(auto const &[name, pad_ids] : restore) {
            thickness_prior const &prior = change.prior.at(*pad_ids.begin());
            std::string target = name;
            auto existing = group_table.find(name);
            if(existing != group_table.end() && existing->second.thickness != prior.thickness.value()) {
                target = next_group_name();
                LOG_DEBUG("Group {} has changed since, restoring into {}", name, target);
            }
            attach(target, pad_ids, prior.thickness.value(), prior.created_at);
        }

        std::set<int> changed = changed_pads(before);

        LOG_VERBOSE("Undo: {} pads, {} changed", change.pad_ids.size(), changed.size());

        redo_stack.push_back(std::move(change));
        return changed;
    }

    //////////////////////////////////////////////////////////////////////

    std::set<int> thickness_manager::redo()
    {
        if(redo_stack.empty()) {
            return {};
        }

        thickness_change undone = std::move(redo_stack.back());
        redo_stack.pop_back();

        thickness_change change;
        change.pad_ids = undone.pad_ids;
        change.prior = capture(undone.pad_ids);
        change.new_thickness = undone.new_thickness;
        change.group_name = undone.group_name;

        detach(change.pad_ids);

        if(change.new_thickness.has_value()) {
            if(group_table.contains(change.group_name)) {
                change.group_name = next_group_name();
            }
            attach(change.group_name, change.pad_ids, change.new_thickness.value(), thickness_now());
        }

        std::set<int> changed = changed_pads(change.prior);

        LOG_VERBOSE("Redo: {} pads, {} changed", change.pad_ids.size(), changed.size());

        undo_stack.push_back(std::move(change));
        return changed;
    }

    //////////////////////////////////////////////////////////////////////

    void thickness_manager::clear()
    {
        group_table.clear();
        pad_groups.clear();
        undo_stack.clear();
        redo_stack.clear();
        group_counter = 0;
    }

    //////////////////////////////////////////////////////////////////////

    bool thickness_manager::is_consistent() const
    {
        size_t grouped = 0;
        for(auto const &[name, group] : group_table) {
            if(group.name != name || group.pad_ids.empty()) {
                return false;
            }
            for(int pad_id : group.pad_ids) {
                auto found = pad_groups.find(pad_id);
                if(found == pad_groups.end() || found->second != name) {
                    return false;
                }
            }
            grouped += group.pad_ids.size();
        }
        return grouped == pad_groups.size();
    }

    //////////////////////////////////////////////////////////////////////

    std::string thickness_manager::save_to_string() const
    {
        nlohmann::json groups_json = nlohmann::json::object();

        for(auto const &[name, group] : group_table) {
            nlohmann::json &g = groups_json[name];
            g["pad_ids"] = group.pad_ids;
            g["thickness"] = group.thickness;
            g["created_at"] = timestamp_to_string(group.created_at);
        }

        nlohmann::json json;
        json["groups"] = groups_json;
        return json.dump(4);
    }

    //////////////////////////////////////////////////////////////////////
    // everything is checked before any state is replaced

    paste_error_code thickness_manager::load_from_string(std::string const &text)
    {
        nlohmann::json json = nlohmann::json::parse(text, nullptr, false);

        FAIL_IF(json.is_discarded() || !json.is_object(), error_invalid_thickness_file);

        auto groups_json = json.find("groups");

        FAIL_IF(groups_json == json.end() || !groups_json->is_object(), error_invalid_thickness_file);

        std::map<std::string, thickness_group> new_groups;
        std::map<int, std::string> new_pad_groups;

        for(auto const &[name, value] : groups_json->items()) {

            FAIL_IF(name.empty() || !value.is_object(), error_invalid_thickness_file);

            auto pad_ids = value.find("pad_ids");
            auto thickness = value.find("thickness");
            auto created_at = value.find("created_at");

            FAIL_IF(pad_ids == value.end() || !pad_ids->is_array() || pad_ids->empty(), error_invalid_thickness_file);
            FAIL_IF(thickness == value.end() || !thickness->is_number(), error_invalid_thickness_file);
            FAIL_IF(created_at == value.end() || !created_at->is_string(), error_invalid_thickness_file);

            thickness_group group;
            group.name = name;
            group.thickness = thickness->get<double>();

            FAIL_IF(!valid_thickness(group.thickness), error_invalid_thickness);

            CHECK(timestamp_from_string(created_at->get<std::string>(), &group.created_at));

            for(auto const &id : *pad_ids) {
                // pad ids are 1 based and must fit an int
                FAIL_IF(!id.is_number_integer(), error_invalid_thickness_file);
                FAIL_IF(id.is_number_unsigned() && id.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max()),
                        error_invalid_thickness_file);
                int64_t wide_id = id.get<int64_t>();
                FAIL_IF(wide_id < 1 || wide_id > std::numeric_limits<int>::max(), error_invalid_thickness_file);
                int pad_id = static_cast<int>(wide_id);
                auto other = new_pad_groups.find(pad_id);
                FAIL_IF(other != new_pad_groups.end() && other->second != name, error_pad_in_multiple_groups);
                new_pad_groups[pad_id] = name;
                group.pad_ids.insert(pad_id);
            }
            new_groups.emplace(name, std::move(group));
        }

        group_table = std::move(new_groups);
        pad_groups = std::move(new_pad_groups);
        undo_stack.clear();
        redo_stack.clear();

        LOG_INFO("Loaded {} thickness groups covering {} pads", group_table.size(), pad_groups.size());
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code thickness_manager::save_to_file(char const *file_path) const
    {
        FAIL_IF(file_path == nullptr, error_internal_bad_pointer);

        std::ofstream out(file_path);
        if(!out.is_open()) {
            LOG_ERROR("Can't create {}", file_path);
            return error_cant_write_file;
        }
        out << save_to_string();
        out.close();
        if(out.fail()) {
            LOG_ERROR("Error writing {}", file_path);
            return error_cant_write_file;
        }
        LOG_VERBOSE("Saved {} thickness groups to {}", group_table.size(), file_path);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    paste_error_code thickness_manager::load_from_file(char const *file_path)
    {
        FAIL_IF(file_path == nullptr, error_internal_bad_pointer);

        std::error_code ec;
        if(!std::filesystem::exists(file_path, ec)) {
            LOG_ERROR("Thickness file not found: {}", file_path);
            return error_file_not_found;
        }

        std::ifstream in(file_path, std::ios::binary);
        if(!in.is_open()) {
            LOG_ERROR("Can't open {}", file_path);
            return error_cant_open_file;
        }

        std::string text{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
        return load_from_string(text);
    }

}    // namespace paste_lib
