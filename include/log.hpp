#ifndef DIALCAST_LOG_HPP
#define DIALCAST_LOG_HPP

#include <string>
#include <string_view>
#include <functional>
#include <utility>

#include "fmt/format.h"

namespace logging
{

enum class level
{
    debug,
    info,
    warning,
    error
};

using sink_type = std::function<void(level, std::string_view)>;

void set_level(level lvl);

level get_level();

// Replaces the stderr sink, e.g. to forward into the host's own log
void set_sink(sink_type sink);

void reset_sink();

std::string_view level_name(level lvl);

level level_from_string(std::string_view name);

void write(level lvl, std::string_view component, std::string_view message);

inline bool enabled(level lvl)
{
    return static_cast<int>(lvl) >= static_cast<int>(get_level());
}

template<typename... Args>
void log(level lvl, std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args)
{
    if(!enabled(lvl))
        return;
    write(lvl, component, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template<typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args)
{
    log(level::debug, component, fmt_str, std::forward<Args>(args)...);
}

template<typename... Args>
void info(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args)
{
    log(level::info, component, fmt_str, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args)
{
    log(level::warning, component, fmt_str, std::forward<Args>(args)...);
}

template<typename... Args>
void error(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args)
{
    log(level::error, component, fmt_str, std::forward<Args>(args)...);
}

} // namespace logging

#endif
