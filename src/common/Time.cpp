#include "Time.hpp"

#include <fmt/format.h>

#include <vector>

std::string formatted_duration(Seconds duration) {
    using namespace std::chrono;
    const auto days = duration_cast<hours>(duration).count() / 24;
    const auto hrs = duration_cast<hours>(duration).count() % 24;
    const auto mins = duration_cast<minutes>(duration).count() % 60;
    std::vector<std::string> parts;
    auto add = [&parts](long long count, std::string_view unit) {
        if (count > 0)
            parts.emplace_back(fmt::format("{} {}{}", count, unit, count == 1 ? "" : "s"));
    };
    add(days, "day");
    add(hrs, "hour");
    add(mins, "minute");
    if (parts.empty())
        return "less than a minute";
    return fmt::format("{}", fmt::join(parts, ", "));
}
