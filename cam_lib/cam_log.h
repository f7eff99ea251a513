//////////////////////////////////////////////////////////////////////

#pragma once

#include <string>

#include <fmt/format.h>

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    enum cam_log_level
    {
        log_level_debug = 0,
        log_level_verbose = 1,
        log_level_info = 2,
        log_level_warning = 3,
        log_level_error = 4,
        log_level_fatal = 5
    };

    //////////////////////////////////////////////////////////////////////

    struct cam_log_context
    {
        char const *context;
        cam_log_level max_level;
    };

    //////////////////////////////////////////////////////////////////////

    typedef int (*cam_log_emitter_function)(char const *);

    extern cam_log_level log_level;

    extern cam_log_emitter_function log_emitter_function;

    //////////////////////////////////////////////////////////////////////

    inline void log_set_level(cam_log_level level)
    {
        log_level = level;
    }

    //////////////////////////////////////////////////////////////////////

    inline void log_set_emitter_function(cam_log_emitter_function function)
    {
        log_emitter_function = function;
    }

    //////////////////////////////////////////////////////////////////////

    void cam_log(cam_log_level level, char const *context, char const *fmt, fmt::format_args const &fmt_args);

    //////////////////////////////////////////////////////////////////////

    template <typename... args> constexpr void log(cam_log_level level, cam_log_context const &context, char const *fmt, args &&...arguments)
    {
        if(level == log_level_fatal || (level >= log_level && level >= context.max_level)) {
            cam_log(level, context.context, fmt, fmt::make_format_args(arguments...));
        }
    }

}    // namespace cam_lib

//////////////////////////////////////////////////////////////////////

#define LOG_CONTEXT(context, max_level)                          \
    static constexpr ::cam_lib::cam_log_context __log_context    \
    {                                                            \
        context, cam_lib::cam_log_level::log_level_##max_level   \
    }

#define LOG_DEBUG(msg, ...) ::cam_lib::log(::cam_lib::log_level_debug, __log_context, msg, ##__VA_ARGS__)
#define LOG_VERBOSE(msg, ...) ::cam_lib::log(::cam_lib::log_level_verbose, __log_context, msg, ##__VA_ARGS__)
#define LOG_INFO(msg, ...) ::cam_lib::log(::cam_lib::log_level_info, __log_context, msg, ##__VA_ARGS__)
#define LOG_WARNING(msg, ...) ::cam_lib::log(::cam_lib::log_level_warning, __log_context, msg, ##__VA_ARGS__)
#define LOG_ERROR(msg, ...) ::cam_lib::log(::cam_lib::log_level_error, __log_context, msg, ##__VA_ARGS__)
#define LOG_FATAL(msg, ...) ::cam_lib::log(::cam_lib::log_level_fatal, __log_context, msg, ##__VA_ARGS__)

#define CAM_ASSERT(x)                                                                \
    do                                                                               \
        if(!(x))                                                                     \
            LOG_FATAL("ASSERT FAILED: {} at line {} of {}", #x, __LINE__, __FILE__); \
    while(false)
