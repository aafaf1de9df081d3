/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "CommandHelpers.hpp"
#include "Mud.hpp"
#include "Room.hpp"
#include "World.hpp"
#include "common/string_utils.hpp"
#include "net/Connection.hpp"

#include <fmt/format.h>

#include <algorithm>

std::optional<UserRecord> require_user(Context &ctx) {
    if (const auto user_id = ctx.session.user_id()) {
        if (auto user = ctx.mud.database().begin()->find_user(*user_id))
            return user;
    }
    ctx.connection.send_line("You must be logged in to use this command.");
    return std::nullopt;
}

std::optional<CharacterRecord> require_character(Context &ctx) {
    const auto character_id = ctx.session.character_id();
    if (character_id && ctx.session.state() == SessionState::Playing) {
        if (auto character = ctx.mud.database().begin()->find_character(*character_id))
            return character;
    }
    ctx.connection.send_line("You must be playing a character to use this command.");
    return std::nullopt;
}

std::string character_name(Mud &mud, const std::string &character_id) {
    if (auto character = mud.database().begin()->find_character(character_id))
        return character->name;
    return "Someone";
}

std::string describe_room(Mud &mud, const Room &room, const std::string &viewer_id) {
    auto text = fmt::format("|W{}|p\n{}\n{}\n\n|g{}|p\n", room.name(), std::string(room.name().size(), '-'),
                            trim(room.description()), room.exits_summary());
    for (auto &occupant : room.occupants())
        if (occupant != viewer_id)
            text += fmt::format("|c{} is here.|p\n", character_name(mud, occupant));
    return text;
}

void show_current_room(Context &ctx, const std::string &character_id) {
    const auto location = ctx.mud.world().location_of(character_id);
    const auto *room = location ? ctx.mud.world().find(*location) : nullptr;
    if (!room) {
        ctx.connection.send_line("You are floating in a formless void.");
        return;
    }
    ctx.connection.send(describe_room(ctx.mud, *room, character_id));
}

std::string_view rest_after_first_arg(const Context &ctx) {
    const auto text = ctx.rest();
    return trim(text.substr(std::min(text.find_first_of(" \t"), text.size())));
}
