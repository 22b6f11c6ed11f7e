//////////////////////////////////////////////////////////////////////
// paste_volume: how much solder paste the flashed pads on a paste layer need
//
// paste_volume [options] file...
//
// Thickness groups are in the length unit of the file they are applied to,
// -p takes micrometres and converts them.

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>

#include "load_pool.h"
#include "paste_log.h"
#include "paste_math.h"
#include "paste_thickness.h"
#include "paste_util.h"
#include "paste_volume.h"
#include "settings.h"
#include "util.h"

LOG_CONTEXT("main", info);

namespace po = boost::program_options;

namespace
{
    //////////////////////////////////////////////////////////////////////

    struct thickness_edit
    {
        std::set<int> pad_ids;
        double micrometres{};
    };

    //////////////////////////////////////////////////////////////////////
    // "<ids>:<um>"

    bool parse_thickness_edit(std::string const &text, thickness_edit *edit)
    {
        size_t colon = text.rfind(':');
        if(colon == std::string::npos) {
            return false;
        }
        auto um = paste_util::double_from_string_view(paste_util::trim(std::string_view(text).substr(colon + 1)));
        if(!um.has_value() || !(um.value() > 0)) {
            return false;
        }
        edit->micrometres = um.value();
        return pad_ids_from_string(text.substr(0, colon), &edit->pad_ids);
    }

    //////////////////////////////////////////////////////////////////////

    double from_micrometres(double um, paste_lib::paste_unit unit)
    {
        double mm = um / 1000.0;
        if(unit == paste_lib::unit_inch) {
            return mm / paste_lib::millimeters_per_inch;
        }
        return mm;
    }

    //////////////////////////////////////////////////////////////////////

    char const *unit_suffix(paste_lib::paste_unit unit)
    {
        return unit == paste_lib::unit_inch ? "in" : "mm";
    }

}    // namespace

//////////////////////////////////////////////////////////////////////

int main(int argc, char **argv)
{
    settings_t settings;

    // first run leaves a file of defaults to edit
    std::error_code ec;
    if(!std::filesystem::exists(config_path(app_name, settings_filename), ec) && !ec) {
        settings.save();
    }
    settings.load();

    po::options_description options("paste_volume options");
    // clang-format off
    options.add_options()
        ("help,h", "show this message")
        ("thickness,t", po::value<std::string>(), "thickness groups to load (JSON)")
        ("save,s", po::value<std::string>(), "save the thickness groups here after any edits")
        ("pads,p", po::value<std::vector<std::string>>(), "set thickness of some pads, <ids>:<um>, eg 1,2,5-9:120")
        ("quiet,q", po::value<bool>()->default_value(false)->implicit_value(true), "only print totals")
        ("verbose,v", po::value<bool>()->default_value(false)->implicit_value(true), "verbose logging")
        ("jobs,j", po::value<int>(), "number of files to parse at once")
        ("files", po::value<std::vector<std::string>>(), "paste layer files");
    // clang-format on

    po::positional_options_description positional;
    positional.add("files", -1);

    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc, argv).options(options).positional(positional).run(), vm);
        po::notify(vm);
    } catch(po::error const &e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    if(vm.count("help") || !vm.count("files")) {
        std::cout << "Usage: paste_volume [options] file...\n" << options << "\n";
        return vm.count("help") ? 0 : 1;
    }

    paste_lib::paste_log_level level;
    if(vm["verbose"].as<bool>()) {
        level = paste_lib::log_level_verbose;
    } else if(!paste_lib::log_level_from_name(settings.log_level, &level)) {
        LOG_WARNING("Unknown log level \"{}\" in settings", settings.log_level);
        level = paste_lib::log_level_warning;
    }
    paste_lib::log_set_level(level);

    bool quiet = vm["quiet"].as<bool>();

    std::vector<thickness_edit> edits;
    if(vm.count("pads")) {
        for(auto const &text : vm["pads"].as<std::vector<std::string>>()) {
            thickness_edit edit;
            if(!parse_thickness_edit(text, &edit)) {
                fprintf(stderr, "Error: bad pad thickness \"%s\", expected <ids>:<um>\n", text.c_str());
                return 1;
            }
            edits.push_back(edit);
        }
    }

    std::vector<std::string> files = vm["files"].as<std::vector<std::string>>();

    if(vm.count("save") && files.size() > 1) {
        fprintf(stderr, "Error: -s needs exactly one file\n");
        return 1;
    }

    paste_lib::thickness_manager loaded_thickness;

    if(vm.count("thickness")) {
        std::string thickness_file = vm["thickness"].as<std::string>();
        paste_lib::paste_error_code err = loaded_thickness.load_from_file(thickness_file.c_str());
        if(err != paste_lib::ok) {
            fprintf(stderr, "Error: can't load %s (%s)\n", thickness_file.c_str(), paste_lib::get_error_text(err));
            return 1;
        }
    }

    int thread_count = settings.worker_threads;
    if(vm.count("jobs")) {
        thread_count = vm["jobs"].as<int>();
    }
    if(thread_count <= 0) {
        thread_count = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }

    load_pool pool;
    pool.start_workers(std::min(static_cast<size_t>(thread_count), files.size()));

    for(auto const &filename : files) {
        pool.add_file(filename);
    }
    pool.wait();

    int exit_code = 0;

    for(auto const &job : pool.results()) {

        if(job->result != paste_lib::ok) {
            paste_util::print("{}: can't read ({})\n", job->filename, paste_lib::get_error_text(job->result));
            exit_code = 2;
            continue;
        }

        paste_lib::paste_file &file = job->file;

        if(settings.default_thickness_um != paste_lib::default_thickness_mm * 1000.0) {
            double thickness = from_micrometres(settings.default_thickness_um, file.unit);
            for(auto &pad : file.pads) {
                pad.default_thickness = thickness;
            }
        }

        paste_lib::thickness_manager thickness = loaded_thickness;

        for(auto const &edit : edits) {
            paste_lib::paste_error_code err = thickness.set_thickness(edit.pad_ids, from_micrometres(edit.micrometres, file.unit));
            if(err != paste_lib::ok) {
                fprintf(stderr, "Error: can't set thickness (%s)\n", paste_lib::get_error_text(err));
                return 1;
            }
        }

        char const *u = unit_suffix(file.unit);

        // pads and problems always together so a partial parse is obvious
        paste_util::print("{}: {} pads, {} problems{}\n", job->filename, file.pad_count(), file.problem_count(),
                          file.incomplete ? " (incomplete)" : "");

        if(level <= paste_lib::log_level_verbose) {
            for(auto const &problem : file.stats.problems) {
                paste_util::print("    {}\n", problem.message);
            }
            for(auto const &[number, aperture] : file.apertures.apertures) {
                paste_util::print("    D{}: {}\n", number, aperture.get_description(u));
            }
        }

        if(settings.show_pads && !quiet) {
            for(auto const &pad : file.pads) {
                paste_lib::pad_summary summary;
                if(paste_lib::get_pad_summary(pad, thickness, &summary) == paste_lib::ok) {
                    paste_util::print("    {:5} {:9} ({:9.4f},{:9.4f}) area {:10.6f} {}2 thickness {:.4f} {} volume {:10.6f} {}3{}\n", summary.id,
                                      paste_lib::shape_name(summary.shape), summary.position.x, summary.position.y, summary.area, u, summary.thickness, u, summary.volume, u,
                                      summary.is_stepped ? " *" : "");
                }
            }
        }

        paste_lib::volume_report report;
        paste_lib::paste_error_code err = paste_lib::get_volume_report(file.pads, thickness, &report);
        if(err != paste_lib::ok) {
            paste_util::print("{}: can't calculate volume ({})\n", job->filename, paste_lib::get_error_text(err));
            exit_code = 2;
            continue;
        }

        double volume_mm3 = report.total_volume;
        if(file.unit == paste_lib::unit_inch) {
            volume_mm3 *= paste_lib::millimeters_per_inch * paste_lib::millimeters_per_inch * paste_lib::millimeters_per_inch;
        }

        paste_util::print("    total: {} pads ({} stepped), area {:.6f} {}2, volume {:.6f} {}3 ({:.3f} mm3)\n", report.pad_count, report.stepped_count,
                          report.total_area, u, report.total_volume, u, volume_mm3);

        if(vm.count("save")) {
            std::string save_file = vm["save"].as<std::string>();
            err = thickness.save_to_file(save_file.c_str());
            if(err != paste_lib::ok) {
                fprintf(stderr, "Error: can't save %s (%s)\n", save_file.c_str(), paste_lib::get_error_text(err));
                return 1;
            }
        }
    }

    return exit_code;
}
