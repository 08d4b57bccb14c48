// format_tools.cpp
#include "lcal_base.hpp"

#include <fmt/chrono.h>

namespace leapcal::format_tools
{

// --- Helper: formatted time with sub-second resolution ---
// fmt's chrono support differs between releases in how (and whether) it prints the
// fractional part, so the seconds and the microseconds are formatted separately.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
    {
        fractional_us += 1000000;
        secs -= std::chrono::seconds(1);
    }
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string_view trim(std::string_view input) noexcept
{
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    const auto first = input.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = input.find_last_not_of(kWhitespace);
    return input.substr(first, last - first + 1);
}

} // namespace leapcal::format_tools
