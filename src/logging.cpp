#include "logging.hpp"

#include <atomic>
#include <mutex>
#include <cstdio>

namespace logging
{

static std::atomic<level> current_level {level::info};
static std::mutex output_mutex;

static std::string_view level_name(level lvl)
{
    switch(lvl)
    {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "unknown";
}

void set_level(level lvl)
{
    current_level.store(lvl);
}

level get_level()
{
    return current_level.load();
}

void write(level lvl, std::string_view msg)
{
    if(lvl < current_level.load())
        return;

    std::lock_guard<std::mutex> lock {output_mutex};
    fmt::print(stderr, "[{}] {}\n", level_name(lvl), msg);
    std::fflush(stderr);
}

} // namespace logging
