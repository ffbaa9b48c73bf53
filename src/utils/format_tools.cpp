#include "utils/format_tools.hpp"

#include <cctype>

#include <fmt/chrono.h>

namespace lockhub::format_tools
{

// Two-step formatting: fmt's chrono subsecond support differs between releases, so the
// microsecond fraction is computed by hand and appended.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    const std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", fmt::localtime(tt), fractional_us);
}

std::string to_lower_ascii(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (char c : input)
    {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace lockhub::format_tools
