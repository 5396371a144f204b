// Tools for formatting strings
#pragma once
#include <chrono>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "irbridge_utils_export.h"

namespace irbridge::format_tools
{

/**
 * @brief Formats a timestamp as local time with microsecond resolution.
 * @param timestamp The time point to format.
 * @return A string like "2026-01-31 12:00:00.123456".
 */
IRBRIDGE_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Removes leading and trailing ASCII whitespace.
 */
IRBRIDGE_UTILS_EXPORT std::string_view trim(std::string_view input) noexcept;

/**
 * @brief Lower-cases an ASCII string.
 */
IRBRIDGE_UTILS_EXPORT std::string to_lower(std::string_view input);

/**
 * @brief Returns the file name component of a path, compile-time capable.
 * @details Used with std::source_location to keep log lines short.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    const std::string_view::size_type last_separator_pos = [&]()
    {
        if (last_slash == std::string_view::npos)
        {
            return last_backslash;
        }
        if (last_backslash == std::string_view::npos)
        {
            return last_slash;
        }
        return last_slash > last_backslash ? last_slash : last_backslash;
    }();

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace irbridge::format_tools
