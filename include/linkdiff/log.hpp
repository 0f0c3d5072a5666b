#pragma once

/**
 * @file log.hpp
 * @brief Leveled diagnostics routed to a replaceable sink
 *
 * The default sink writes "[linkdiff][level] message" lines to stderr.
 * Embedders route messages elsewhere with set_sink().
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace linkdiff::log {

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class Level {
    kDebug,
    kInfo,
    kWarn,
    kError,
    kOff
};

/// Receives every message at or above the current level (no trailing newline).
using Sink = std::function<void(Level, std::string_view)>;

void set_level(Level level);
[[nodiscard]] Level level();
[[nodiscard]] bool enabled(Level level);

/// Replace the sink; an empty function restores the stderr sink.
void set_sink(Sink sink);

void write(Level level, std::string_view message);

inline void debug(std::string_view message)
{
    write(Level::kDebug, message);
}

inline void info(std::string_view message)
{
    write(Level::kInfo, message);
}

inline void warn(std::string_view message)
{
    write(Level::kWarn, message);
}

inline void error(std::string_view message)
{
    write(Level::kError, message);
}

[[nodiscard]] std::string_view level_name(Level level);

/// Line written by the stderr sink: "[linkdiff][<level>] <message>".
[[nodiscard]] std::string format_line(Level level, std::string_view message);

/// Parse "debug", "info", "warn", "error" or "off" (case-sensitive).
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);

}  // namespace linkdiff::log
