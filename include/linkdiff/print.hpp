#pragma once

/**
 * @file print.hpp
 * @brief std::print / std::println for standard libraries that ship <format> but not <print>
 *
 * Diagnostics and CLI output go through std::print. Include this header
 * instead of <print> directly.
 */

#if __has_include(<print>)
    #include <print>
#else
    #include <cstdio>
    #include <format>
    #include <string>
    #include <utility>

namespace linkdiff::detail {

/// Format and write to stream, optionally followed by a newline.
template <typename... Args>
void write_formatted(FILE* stream, bool newline, std::format_string<Args...> fmt, Args&&... args)
{
    std::string text = std::format(fmt, std::forward<Args>(args)...);
    if (newline) {
        text.push_back('\n');
    }
    std::fwrite(text.data(), 1, text.size(), stream);
}

}  // namespace linkdiff::detail

namespace std {

template <typename... Args>
void print(std::format_string<Args...> fmt, Args&&... args)
{
    linkdiff::detail::write_formatted(stdout, false, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void print(FILE* stream, std::format_string<Args...> fmt, Args&&... args)
{
    linkdiff::detail::write_formatted(stream, false, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void println(std::format_string<Args...> fmt, Args&&... args)
{
    linkdiff::detail::write_formatted(stdout, true, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void println(FILE* stream, std::format_string<Args...> fmt, Args&&... args)
{
    linkdiff::detail::write_formatted(stream, true, fmt, std::forward<Args>(args)...);
}

}  // namespace std
#endif
