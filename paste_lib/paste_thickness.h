//////////////////////////////////////////////////////////////////////
// Thickness overrides for sets of pads, with linear undo/redo
// A pad is in at most one group, a pad in no group uses its default thickness.
// Not locked, callers on more than one thread must serialise access

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "paste_error.h"
#include "paste_util.h"

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    using thickness_time = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

    thickness_time thickness_now();

    // "YYYY-MM-DDTHH:MM:SS.ffffffZ"
    std::string timestamp_to_string(thickness_time t);

    paste_error_code timestamp_from_string(std::string const &s, thickness_time *t);

    //////////////////////////////////////////////////////////////////////

    struct thickness_group
    {
        std::string name;
        std::set<int> pad_ids;
        double thickness{};
        thickness_time created_at{};

        std::string to_string() const
        {
            return fmt::format("GROUP {}: {} PADS, THICKNESS {:g}, CREATED {}", name, pad_ids.size(), thickness, timestamp_to_string(created_at));
        }
    };

    //////////////////////////////////////////////////////////////////////
    // where a pad was before a change, no thickness means it was ungrouped

    struct thickness_prior
    {
        std::optional<double> thickness;
        std::string group_name;
        thickness_time created_at{};
    };

    //////////////////////////////////////////////////////////////////////
    // one entry in the undo or redo stack

    struct thickness_change
    {
        std::set<int> pad_ids;
        std::map<int, thickness_prior> prior;

        // no value: the pads went back to default
        std::optional<double> new_thickness;
        std::string group_name;
    };

    //////////////////////////////////////////////////////////////////////

    struct thickness_manager
    {
        std::map<std::string, thickness_group> group_table;

        // pad id -> name of the group it is in
        std::map<int, std::string> pad_groups;

        std::vector<thickness_change> undo_stack;
        std::vector<thickness_change> redo_stack;

        int group_counter{};

        thickness_manager() = default;

        // new anonymous group holding exactly pad_ids, pads leave their old groups
        paste_error_code set_thickness(std::set<int> const &pad_ids, double thickness);

        paste_error_code create_group(std::string const &name, std::set<int> const &pad_ids, double thickness);

        // pads go back to default thickness
        paste_error_code remove_group(std::string const &name);

        double get_thickness(int pad_id, double default_thickness) const;

        std::optional<double> get_override(int pad_id) const;

        thickness_group const *get_group(int pad_id) const;

        // both return the pads whose effective thickness changed, empty if there was nothing to do
        std::set<int> undo();
        std::set<int> redo();

        // drop all groups and all history
        void clear();

        bool can_undo() const
        {
            return !undo_stack.empty();
        }

        bool can_redo() const
        {
            return !redo_stack.empty();
        }

        size_t undo_count() const
        {
            return undo_stack.size();
        }

        size_t redo_count() const
        {
            return redo_stack.size();
        }

        std::map<std::string, thickness_group> const &groups() const
        {
            return group_table;
        }

        // pad index and group table agree, no pad in two groups, no empty groups
        bool is_consistent() const;

        //////////////////////////////////////////////////////////////////////
        // persistence, history is not saved and is cleared by a load

        std::string save_to_string() const;

        paste_error_code load_from_string(std::string const &text);

        paste_error_code save_to_file(char const *file_path) const;

        paste_error_code load_from_file(char const *file_path);

        //////////////////////////////////////////////////////////////////////

        std::string next_group_name();

        std::map<int, thickness_prior> capture(std::set<int> const &pad_ids) const;

        void detach(std::set<int> const &pad_ids);

        void attach(std::string const &name, std::set<int> const &pad_ids, double thickness, thickness_time created_at);

        paste_error_code apply_new(std::string const &name, std::set<int> const &pad_ids, double thickness);

        std::set<int> changed_pads(std::map<int, thickness_prior> const &before) const;
    };

}    // namespace paste_lib

PASTE_MAKE_FORMATTER(paste_lib::thickness_group);
