/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "CharacterIndex.hpp"
#include "CommandHelpers.hpp"
#include "CommandRegistry.hpp"
#include "Mud.hpp"
#include "World.hpp"
#include "commands.hpp"
#include "common/Logger.hpp"
#include "common/Time.hpp"
#include "net/Connection.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace {

Logger &info_log() {
    static Logger log = logger_for("Info");
    return log;
}

void do_look(Context &ctx) {
    auto character = require_character(ctx);
    if (!character)
        return;
    if (ctx.args.empty()) {
        show_current_room(ctx, character->id);
        return;
    }
    const auto direction = try_parse_direction(ctx.args[0]);
    if (!direction) {
        ctx.connection.send_line("You don't see that here.");
        return;
    }
    auto &world = ctx.mud.world();
    const auto location = world.location_of(character->id);
    const auto *room = location ? world.find(*location) : nullptr;
    const auto destination = room ? room->exit(*direction) : std::nullopt;
    const auto *next = destination ? world.find(*destination) : nullptr;
    if (!next) {
        ctx.connection.send_line("You see nothing special in that direction.");
        return;
    }
    ctx.connection.send_line(fmt::format("Looking {}, you see |W{}|p.", to_string(*direction), next->name()));
}

void do_exits(Context &ctx) {
    auto character = require_character(ctx);
    if (!character)
        return;
    auto &world = ctx.mud.world();
    const auto location = world.location_of(character->id);
    const auto *room = location ? world.find(*location) : nullptr;
    if (!room || room->exits().empty()) {
        ctx.connection.send_line("There are no obvious exits.");
        return;
    }
    ctx.connection.send_line("Obvious exits:");
    for (auto &[direction, destination] : room->exits()) {
        const auto *next = world.find(destination);
        ctx.connection.send_line(
            fmt::format("  {:<10} - {}", to_string(direction), next ? next->name() : std::string("Somewhere")));
    }
}

void do_help(Context &ctx) {
    const auto &commands = ctx.mud.commands();
    if (!ctx.args.empty()) {
        const auto *command = commands.get(ctx.args[0]);
        if (!command) {
            ctx.connection.send_line(fmt::format("No help found for '{}'.", ctx.args[0]));
            return;
        }
        ctx.connection.send_line(std::string(command->help()));
        if (command->names().size() > 1) {
            const std::vector<std::string> aliases(command->names().begin() + 1, command->names().end());
            ctx.connection.send_line(fmt::format("Aliases: {}", fmt::join(aliases, ", ")));
        }
        return;
    }
    ctx.connection.send_line("|CAvailable commands:|p");
    std::vector<std::string_view> directions;
    for (auto &command : commands.all()) {
        if (dynamic_cast<const MoveCommand *>(command.get())) {
            directions.push_back(command->names().front());
            continue;
        }
        ctx.connection.send_line(fmt::format("  {}", command->help()));
    }
    if (!directions.empty())
        ctx.connection.send_line(fmt::format("  Directions: {}", fmt::join(directions, ", ")));
    ctx.connection.send_line("Type |Whelp <command>|p for more on a single command.");
}

void do_who(Context &ctx) {
    std::vector<std::string> names;
    for (auto &session : ctx.mud.characters().sessions())
        if (auto character_id = session->character_id())
            names.push_back(character_name(ctx.mud, *character_id));
    if (names.empty()) {
        ctx.connection.send_line("No one is playing right now.");
        return;
    }
    std::sort(names.begin(), names.end());
    ctx.connection.send_line("|CPlayers online:|p");
    for (auto &name : names)
        ctx.connection.send_line(fmt::format("  {}", name));
    ctx.connection.send_line(fmt::format("{} player{} online.", names.size(), names.size() == 1 ? "" : "s"));
}

void do_time(Context &ctx) {
    const auto now = ctx.mud.current_time();
    ctx.connection.send_line(fmt::format("The server time is {}.", formatted_time(now)));
    ctx.connection.send_line(fmt::format("Waystone has been running for {}.",
                                         formatted_duration(std::chrono::duration_cast<Seconds>(
                                             now - ctx.mud.boot_time()))));
}


void do_save(Context &ctx) {
    auto character = require_character(ctx);
    if (!character)
        return;
    if (const auto room_id = ctx.mud.world().location_of(character->id))
        character->room_id = *room_id;
    try {
        auto txn = ctx.mud.database().begin();
        txn->put_character(*character);
        txn->commit();
    } catch (const DatabaseError &error) {
        info_log().error("Unable to save {}: {}", character->name, error.what());
        ctx.connection.send_line("|RFailed to save character. Please try again.|p");
        return;
    }
    ctx.connection.send_line(fmt::format("|G{}'s data has been saved.|p", character->name));
}

}

void register_info_commands(CommandRegistry &registry) {
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"look", "l"},
                                                 "look [direction] - Look around, or at a neighbouring room",
                                                 do_look));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"exits"},
                                                 "exits - List the ways out of this room", do_exits));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"help", "?"},
                                                 "help [command] - List commands, or explain one", do_help));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"who"}, "who - List who is playing",
                                                 do_who));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"time"},
                                                 "time - Show the server time and uptime", do_time));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"save"},
                                                 "save - Save your character's current state", do_save));
}
