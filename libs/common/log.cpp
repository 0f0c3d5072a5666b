/**
 * @file log.cpp
 * @brief Process-wide log level and sink
 */

#include "linkdiff/log.hpp"

#include "linkdiff/print.hpp"

#include <atomic>
#include <cstdio>
#include <format>
#include <mutex>
#include <string>
#include <utility>

namespace linkdiff::log {

namespace {

std::atomic<Level> g_level{Level::kWarn};
std::mutex g_sink_mutex;
Sink g_sink;

void stderr_sink(Level level, std::string_view message)
{
    std::println(stderr, "{}", format_line(level, message));
}

}  // namespace

void set_level(Level level)
{
    g_level.store(level, std::memory_order_release);
}

Level level()
{
    return g_level.load(std::memory_order_acquire);
}

bool enabled(Level level)
{
    return level != Level::kOff && level >= g_level.load(std::memory_order_acquire);
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void write(Level level, std::string_view message)
{
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, message);
    } else {
        stderr_sink(level, message);
    }
}

std::string_view level_name(Level level)
{
    switch (level) {
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarn:
            return "warn";
        case Level::kError:
            return "error";
        case Level::kOff:
            return "off";
    }
    return "unknown";
}

std::string format_line(Level level, std::string_view message)
{
    return std::format("[linkdiff][{}] {}", level_name(level), message);
}

std::optional<Level> parse_level(std::string_view name)
{
    for (Level candidate : {Level::kDebug, Level::kInfo, Level::kWarn, Level::kError, Level::kOff}) {
        if (level_name(candidate) == name) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace linkdiff::log
