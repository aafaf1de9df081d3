#include "Direction.hpp"

#include "common/string_utils.hpp"

#include <fmt/format.h>

#include <stdexcept>

Direction reverse(Direction dir) {
    switch (dir) {
    case Direction::North: return Direction::South;
    case Direction::East: return Direction::West;
    case Direction::South: return Direction::North;
    case Direction::West: return Direction::East;
    case Direction::Up: return Direction::Down;
    case Direction::Down: return Direction::Up;
    case Direction::Northeast: return Direction::Southwest;
    case Direction::Northwest: return Direction::Southeast;
    case Direction::Southeast: return Direction::Northwest;
    case Direction::Southwest: return Direction::Northeast;
    case Direction::In: return Direction::Out;
    case Direction::Out: return Direction::In;
    }
    throw std::runtime_error(fmt::format("Bad direction {}", static_cast<int>(dir)));
}

std::string_view to_string(Direction dir) {
    using namespace std::literals;
    switch (dir) {
    case Direction::North: return "north"sv;
    case Direction::East: return "east"sv;
    case Direction::South: return "south"sv;
    case Direction::West: return "west"sv;
    case Direction::Up: return "up"sv;
    case Direction::Down: return "down"sv;
    case Direction::Northeast: return "northeast"sv;
    case Direction::Northwest: return "northwest"sv;
    case Direction::Southeast: return "southeast"sv;
    case Direction::Southwest: return "southwest"sv;
    case Direction::In: return "in"sv;
    case Direction::Out: return "out"sv;
    }
    throw std::runtime_error(fmt::format("Bad direction {}", static_cast<int>(dir)));
}

std::optional<std::string_view> abbreviation(Direction dir) {
    using namespace std::literals;
    switch (dir) {
    case Direction::North: return "n"sv;
    case Direction::East: return "e"sv;
    case Direction::South: return "s"sv;
    case Direction::West: return "w"sv;
    case Direction::Up: return "u"sv;
    case Direction::Down: return "d"sv;
    case Direction::Northeast: return "ne"sv;
    case Direction::Northwest: return "nw"sv;
    case Direction::Southeast: return "se"sv;
    case Direction::Southwest: return "sw"sv;
    case Direction::In:
    case Direction::Out: return {};
    }
    return {};
}

std::optional<Direction> try_parse_direction(std::string_view name) {
    for (auto dir : all_directions)
        if (auto abbrev = abbreviation(dir); abbrev && matches(name, *abbrev))
            return dir;
    for (auto dir : all_directions)
        if (matches_start(name, to_string(dir)))
            return dir;
    return {};
}
