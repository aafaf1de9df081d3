/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "CharacterIndex.hpp"
#include "CommandHelpers.hpp"
#include "CommandRegistry.hpp"
#include "Mud.hpp"
#include "SessionRegistry.hpp"
#include "World.hpp"
#include "commands.hpp"
#include "common/Configuration.hpp"
#include "common/Logger.hpp"
#include "net/Connection.hpp"

#include <fmt/format.h>

#include <memory>
#include <regex>

namespace {

const std::regex character_name_pattern("^[A-Z][a-zA-Z]{1,29}$");
constexpr auto MaxCharactersPerUser = 3u;

Logger &character_log() {
    static Logger log = logger_for("Characters");
    return log;
}

// The user's character with the given name, or nothing (having said so).
std::optional<CharacterRecord> find_own_character(Context &ctx, Transaction &txn, const UserRecord &user,
                                                  std::string_view name) {
    auto character = txn.find_character_by_name(name);
    if (!character || character->user_id != user.id) {
        ctx.connection.send_line(fmt::format("|RYou don't have a character named '{}'.|p", name));
        return std::nullopt;
    }
    return character;
}

void do_characters(Context &ctx) {
    auto user = require_user(ctx);
    if (!user)
        return;
    const auto characters = ctx.mud.database().begin()->characters_for(user->id);
    if (characters.empty()) {
        ctx.connection.send_line("You have no characters yet. Type |Wcreate <name>|p to make one.");
        return;
    }
    ctx.connection.send_line("|CYour characters:|p");
    for (auto &character : characters) {
        const auto *room = ctx.mud.world().find(character.room_id);
        ctx.connection.send_line(
            fmt::format("  |W{:<20}|p {}", character.name, room ? room->name() : std::string("(nowhere)")));
    }
    ctx.connection.send_line("Type |Wplay <name>|p to enter the world.");
}

void do_create(Context &ctx) {
    auto user = require_user(ctx);
    if (!user)
        return;
    if (ctx.session.state() == SessionState::Playing) {
        ctx.connection.send_line("You can't create a character while playing one.");
        return;
    }
    if (ctx.args.empty()) {
        ctx.connection.send_line("|YUsage: create <name>|p");
        return;
    }
    const auto &name = ctx.args[0];
    if (!std::regex_match(name, character_name_pattern)) {
        ctx.connection.send_line("|RInvalid name. Names must be 2-30 letters and start with a capital letter.|p");
        return;
    }

    auto txn = ctx.mud.database().begin();
    if (txn->characters_for(user->id).size() >= MaxCharactersPerUser) {
        ctx.connection.send_line(
            fmt::format("|RYou already have the maximum of {} characters.|p", MaxCharactersPerUser));
        return;
    }
    if (txn->find_character_by_name(name)) {
        ctx.connection.send_line(fmt::format("|RThe name '{}' is already taken.|p", name));
        return;
    }
    txn->put_character({make_record_id(), user->id, name, ctx.mud.config().starting_room(), ctx.mud.current_time()});
    try {
        txn->commit();
    } catch (const DatabaseError &error) {
        character_log().warn("Creating {} failed: {}", name, error.what());
        ctx.connection.send_line(fmt::format("|RThe name '{}' is already taken.|p", name));
        return;
    }
    character_log().info("User {} created character {}", user->username, name);
    ctx.connection.send_line(fmt::format("|G{} has been created!|p", name));
    ctx.connection.send_line(fmt::format("To start playing, type: |Wplay {}|p", name));
}

void do_play(Context &ctx) {
    auto user = require_user(ctx);
    if (!user)
        return;
    if (ctx.session.state() == SessionState::Playing) {
        ctx.connection.send_line("You are already playing a character. Type |Wlogout|p first.");
        return;
    }
    if (ctx.args.empty()) {
        ctx.connection.send_line("|YUsage: play <name>|p");
        return;
    }
    auto txn = ctx.mud.database().begin();
    auto character = find_own_character(ctx, *txn, *user, ctx.args[0]);
    if (!character)
        return;

    auto session = ctx.mud.sessions().get_session(ctx.session.id());
    if (!session || !ctx.mud.characters().bind(character->id, session)) {
        ctx.connection.send_line(fmt::format("|R{} is already being played in another session.|p", character->name));
        return;
    }
    auto &world = ctx.mud.world();
    auto room_id = character->room_id;
    if (!world.find(room_id)) {
        character_log().warn("{} was in unknown room '{}'; moving to the start", character->name, room_id);
        room_id = ctx.mud.config().starting_room();
    }
    if (!world.place(character->id, room_id)) {
        ctx.mud.characters().unbind(character->id, ctx.session.id());
        ctx.connection.send_line("|RThere is nowhere to put you in the world right now.|p");
        return;
    }
    ctx.session.set_character(character->id);
    ctx.session.set_state(SessionState::Playing);
    character_log().info("Session {}: {} entered the world in {}", ctx.session.id(), character->name, room_id);

    ctx.mud.broadcast_to_room(room_id, fmt::format("{} arrives.", character->name), ctx.session.id());
    ctx.connection.send_line(fmt::format("|GWelcome to the world, {}!|p", character->name));
    show_current_room(ctx, character->id);
}

void do_delete(Context &ctx) {
    auto user = require_user(ctx);
    if (!user)
        return;
    if (ctx.args.empty()) {
        ctx.connection.send_line("|YUsage: delete <name>|p");
        return;
    }
    std::optional<CharacterRecord> character;
    {
        auto txn = ctx.mud.database().begin();
        character = find_own_character(ctx, *txn, *user, ctx.args[0]);
    }
    if (!character)
        return;
    if (ctx.mud.characters().find(character->id)) {
        ctx.connection.send_line("|RYou can't delete a character that is in play.|p");
        return;
    }

    ctx.connection.send_line(fmt::format("|RWARNING: This will permanently delete {}!|p", character->name));
    ctx.connection.send(fmt::format("|YType '{}' exactly to confirm deletion:|p ", character->name));
    if (ctx.connection.read_line() != character->name) {
        ctx.connection.send_line("|GDeletion cancelled.|p");
        return;
    }
    // It may have entered play while we waited.
    if (ctx.mud.characters().find(character->id)) {
        ctx.connection.send_line("|RYou can't delete a character that is in play.|p");
        return;
    }
    auto txn = ctx.mud.database().begin();
    if (!txn->erase_character(character->id)) {
        ctx.connection.send_line(fmt::format("|RYou don't have a character named '{}'.|p", character->name));
        return;
    }
    txn->commit();
    character_log().info("User {} deleted character {}", user->username, character->name);
    ctx.connection.send_line(fmt::format("|Y{} has been deleted.|p", character->name));
}

}

void register_character_commands(CommandRegistry &registry) {
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"characters", "chars"},
                                                 "characters - List your characters", do_characters));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"create"},
                                                 "create <name> - Create a new character", do_create));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"play"},
                                                 "play <name> - Enter the world as one of your characters", do_play));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"delete"},
                                                 "delete <name> - Permanently delete one of your characters",
                                                 do_delete));
}
