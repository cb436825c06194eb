#ifndef DIAL_RESPONDER_LOGGING_HPP
#define DIAL_RESPONDER_LOGGING_HPP

#include <string_view>
#include <utility>

#include "fmt/format.h"

namespace logging
{

enum class level
{
    debug,
    info,
    warn,
    error
};

void set_level(level lvl);

level get_level();

/// Writes one line to stderr if lvl passes the current threshold
void write(level lvl, std::string_view msg);

template<typename... Args>
void debug(fmt::format_string<Args...> fmt_str, Args&&... args)
{
    if(get_level() <= level::debug)
        write(level::debug, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template<typename... Args>
void info(fmt::format_string<Args...> fmt_str, Args&&... args)
{
    if(get_level() <= level::info)
        write(level::info, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(fmt::format_string<Args...> fmt_str, Args&&... args)
{
    if(get_level() <= level::warn)
        write(level::warn, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template<typename... Args>
void error(fmt::format_string<Args...> fmt_str, Args&&... args)
{
    write(level::error, fmt::format(fmt_str, std::forward<Args>(args)...));
}

} // namespace logging

#endif
