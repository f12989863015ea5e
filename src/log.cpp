#include "log.hpp"

#include <atomic>
#include <mutex>
#include <cstdio>
#include <stdexcept>

namespace logging
{

static std::atomic<int> s_level {static_cast<int>(level::info)};
static std::mutex s_sink_mutex;
static sink_type s_sink;

void set_level(level lvl)
{
    s_level.store(static_cast<int>(lvl));
}

level get_level()
{
    return static_cast<level>(s_level.load());
}

void set_sink(sink_type sink)
{
    std::lock_guard<std::mutex> lock {s_sink_mutex};
    s_sink = std::move(sink);
}

void reset_sink()
{
    std::lock_guard<std::mutex> lock {s_sink_mutex};
    s_sink = nullptr;
}

std::string_view level_name(level lvl)
{
    switch(lvl)
    {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warning:
            return "warning";
        case level::error:
            return "error";
    }
    return "info";
}

level level_from_string(std::string_view name)
{
    if(name == "debug")
        return level::debug;
    else if(name == "info")
        return level::info;
    else if(name == "warning" || name == "warn")
        return level::warning;
    else if(name == "error")
        return level::error;

    throw std::invalid_argument {fmt::format("Unknown log level '{}'", name)};
}

void write(level lvl, std::string_view component, std::string_view message)
{
    std::lock_guard<std::mutex> lock {s_sink_mutex};
    if(s_sink)
    {
        s_sink(lvl, fmt::format("{}: {}", component, message));
        return;
    }

    fmt::print(stderr, "[{}] {}: {}\n", level_name(lvl), component, message);
}

} // namespace logging
