/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "CommandHelpers.hpp"
#include "CommandRegistry.hpp"
#include "Mud.hpp"
#include "World.hpp"
#include "commands.hpp"
#include "common/Logger.hpp"
#include "net/Connection.hpp"

#include <fmt/format.h>

#include <memory>
#include <utility>
#include <vector>

namespace {

Logger &movement_log() {
    static Logger log = logger_for("Movement");
    return log;
}

void save_location(Mud &mud, const CharacterRecord &character, const std::string &room_id) {
    try {
        auto txn = mud.database().begin();
        auto updated = character;
        updated.room_id = room_id;
        txn->put_character(std::move(updated));
        txn->commit();
    } catch (const DatabaseError &error) {
        movement_log().error("Unable to save location of {}: {}", character.name, error.what());
    }
}

void move_character(Context &ctx, Direction direction) {
    auto character = require_character(ctx);
    if (!character)
        return;
    auto &world = ctx.mud.world();
    const auto from_id = world.location_of(character->id);
    const auto *from = from_id ? world.find(*from_id) : nullptr;
    const auto destination = from ? from->exit(direction) : std::nullopt;
    if (!destination) {
        ctx.connection.send_line(fmt::format("You can't go {} from here.", to_string(direction)));
        return;
    }
    switch (world.move(character->id, *from_id, *destination)) {
    case World::MoveResult::Moved: break;
    case World::MoveResult::NotInSource:
        ctx.connection.send_line("You can't go that way right now.");
        return;
    case World::MoveResult::NoSuchRoom:
        movement_log().error("Exit {} from {} leads to missing room {}", to_string(direction), *from_id,
                             *destination);
        ctx.connection.send_line(fmt::format("You can't go {} from here.", to_string(direction)));
        return;
    }

    ctx.mud.broadcast_to_room(*from_id, fmt::format("{} leaves {}.", character->name, to_string(direction)),
                              ctx.session.id());
    ctx.mud.broadcast_to_room(*destination, fmt::format("{} arrives.", character->name), ctx.session.id());
    ctx.connection.send_line(fmt::format("You travel {}.", to_string(direction)));
    show_current_room(ctx, character->id);
    save_location(ctx.mud, *character, *destination);
}

void do_go(Context &ctx) {
    if (ctx.args.empty()) {
        ctx.connection.send_line("Go where?");
        return;
    }
    if (auto direction = try_parse_direction(ctx.args[0]))
        move_character(ctx, *direction);
    else
        ctx.connection.send_line(fmt::format("'{}' is not a direction.", ctx.args[0]));
}

std::vector<std::string> move_command_names(Direction direction) {
    std::vector<std::string> names{std::string(to_string(direction))};
    if (auto abbrev = abbreviation(direction))
        names.emplace_back(*abbrev);
    return names;
}

}

MoveCommand::MoveCommand(Direction direction)
    : direction_(direction), names_(move_command_names(direction)),
      help_(fmt::format("{} - Walk {}", to_string(direction), to_string(direction))) {}

void MoveCommand::execute(Context &ctx) const { move_character(ctx, direction_); }

void register_movement_commands(CommandRegistry &registry) {
    for (auto direction : all_directions)
        registry.add(std::make_shared<MoveCommand>(direction));
    registry.add(
        std::make_shared<SimpleCommand>(std::vector<std::string>{"go"}, "go <direction> - Walk that way", do_go));
}
