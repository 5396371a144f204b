// format_tools.cpp
#include "utils/format_tools.hpp"

#include <cctype>

#include <fmt/chrono.h>

namespace irbridge::format_tools
{

// Local time with a microsecond fraction. fmt's chrono support for
// sub-second fields differs across versions, so the fraction is appended by hand.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string_view trim(std::string_view input) noexcept
{
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!input.empty() && is_space(input.front()))
    {
        input.remove_prefix(1);
    }
    while (!input.empty() && is_space(input.back()))
    {
        input.remove_suffix(1);
    }
    return input;
}

std::string to_lower(std::string_view input)
{
    std::string out(input);
    for (auto &c : out)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace irbridge::format_tools
