#pragma once

#include <array>
#include <optional>
#include <string_view>

// Ordered for display and for prefix matching: "n" is north before northeast, "s" is south before southeast.
enum class Direction { North, East, South, West, Up, Down, Northeast, Northwest, Southeast, Southwest, In, Out };

static inline constexpr std::array<Direction, 12> all_directions = {
    {Direction::North, Direction::East, Direction::South, Direction::West, Direction::Up, Direction::Down,
     Direction::Northeast, Direction::Northwest, Direction::Southeast, Direction::Southwest, Direction::In,
     Direction::Out}};

Direction reverse(Direction dir);
std::string_view to_string(Direction dir);
// The conventional short form players type: "n", "ne", "u" and so on. In and out have none.
std::optional<std::string_view> abbreviation(Direction dir);
// Accepts full names, abbreviations or any unambiguous prefix, case insensitively.
std::optional<Direction> try_parse_direction(std::string_view name);
