#pragma once

#include <chrono>
#include <fmt/chrono.h>

using Clock = std::chrono::system_clock;
using Time = Clock::time_point;
using Seconds = std::chrono::seconds;
using Minutes = std::chrono::minutes;

inline auto formatted_time(const Time time) { return fmt::format("{:%Y-%m-%d %H:%M:%S}Z", fmt::gmtime(time)); }

// Renders a duration as e.g. "2 days, 3 hours, 4 minutes"; anything under a minute is "less than a minute".
std::string formatted_duration(Seconds duration);
