//////////////////////////////////////////////////////////////////////

#include <chrono>
#include <cstdio>

#include "paste_log.h"
#include "paste_util.h"

//////////////////////////////////////////////////////////////////////

namespace
{
    using namespace std::chrono;

    time_point<steady_clock> log_startup_timestamp{ steady_clock::now() };

    constexpr char const *log_level_names[] = { "debug", "verbose", "info", "warning", "error", "none" };

    //////////////////////////////////////////////////////////////////////

    int stderr_puts(char const *s)
    {
        int x = fputs(s, stderr);
        fputc('\n', stderr);
        return x;
    }

}    // namespace

//////////////////////////////////////////////////////////////////////

namespace paste_lib
{
    paste_log_emitter_function log_emitter_function{ stderr_puts };

    paste_log_level log_level{ log_level_warning };

    //////////////////////////////////////////////////////////////////////

    bool log_level_from_name(std::string const &name, paste_log_level *level)
    {
        std::string lower = paste_util::to_lowercase(name);
        for(size_t i = 0; i < paste_util::array_length(log_level_names); ++i) {
            if(lower == log_level_names[i]) {
                *level = static_cast<paste_log_level>(i);
                return true;
            }
        }
        return false;
    }

    //////////////////////////////////////////////////////////////////////
    // seconds.micros LEVEL context: message

    void paste_log(paste_log_level level, char const *context, char const *fmt, fmt::format_args const &fmt_args)
    {
        if(level >= log_level_none || log_emitter_function == nullptr) {
            return;
        }
        auto micros = duration_cast<microseconds>(steady_clock::now() - log_startup_timestamp).count();
        std::string message = fmt::vformat(fmt, fmt_args);
        std::string line = fmt::format("{}.{:06} {:<7} {}: {}", micros / 1000000, micros % 1000000, log_level_names[level], context, message);
        log_emitter_function(line.c_str());
    }

}    // namespace paste_lib
