//////////////////////////////////////////////////////////////////////

#pragma once

#include <string>

#include <fmt/format.h>

namespace paste_lib
{
    //////////////////////////////////////////////////////////////////////

    enum paste_log_level
    {
        log_level_debug = 0,
        log_level_verbose = 1,
        log_level_info = 2,
        log_level_warning = 3,
        log_level_error = 4,
        log_level_none = 5
    };

    //////////////////////////////////////////////////////////////////////

    struct paste_log_context
    {
        char const *context;
        paste_log_level max_level;
    };

    //////////////////////////////////////////////////////////////////////

    typedef int (*paste_log_emitter_function)(char const *);

    extern paste_log_level log_level;

    extern paste_log_emitter_function log_emitter_function;

    //////////////////////////////////////////////////////////////////////

    inline void log_set_level(paste_log_level level)
    {
        log_level = level;
    }

    inline void log_set_emitter_function(paste_log_emitter_function function)
    {
        log_emitter_function = function;
    }

    //////////////////////////////////////////////////////////////////////
    // "debug", "info" etc, returns false if the name is not a level

    bool log_level_from_name(std::string const &name, paste_log_level *level);

    //////////////////////////////////////////////////////////////////////

    void paste_log(paste_log_level level, char const *context, char const *fmt, fmt::format_args const &fmt_args);

    //////////////////////////////////////////////////////////////////////

    template <typename... args> constexpr void log(paste_log_level level, paste_log_context const &context, char const *fmt, args &&...arguments)
    {
        if(level >= log_level && level >= context.max_level) {
            paste_log(level, context.context, fmt, fmt::make_format_args(arguments...));
        }
    }

}    // namespace paste_lib

//////////////////////////////////////////////////////////////////////

#define LOG_CONTEXT(context, max_level)                            \
    static constexpr ::paste_lib::paste_log_context __log_context  \
    {                                                              \
        context, paste_lib::paste_log_level::log_level_##max_level \
    }

#define LOG_DEBUG(msg, ...) ::paste_lib::log(::paste_lib::log_level_debug, __log_context, msg, ##__VA_ARGS__)
#define LOG_VERBOSE(msg, ...) ::paste_lib::log(::paste_lib::log_level_verbose, __log_context, msg, ##__VA_ARGS__)
#define LOG_INFO(msg, ...) ::paste_lib::log(::paste_lib::log_level_info, __log_context, msg, ##__VA_ARGS__)
#define LOG_WARNING(msg, ...) ::paste_lib::log(::paste_lib::log_level_warning, __log_context, msg, ##__VA_ARGS__)
#define LOG_ERROR(msg, ...) ::paste_lib::log(::paste_lib::log_level_error, __log_context, msg, ##__VA_ARGS__)
