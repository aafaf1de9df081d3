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
#include "net/Connection.hpp"

#include <fmt/format.h>

#include <memory>

namespace {

void do_say(Context &ctx) {
    auto character = require_character(ctx);
    if (!character)
        return;
    const auto message = ctx.rest();
    if (message.empty()) {
        ctx.connection.send_line("Say what?");
        return;
    }
    ctx.connection.send_line(fmt::format("|yYou say, \"{}\"|p", message));
    if (auto room = ctx.mud.world().location_of(character->id))
        ctx.mud.broadcast_to_room(*room, fmt::format("|y{} says, \"{}\"|p", character->name, message),
                                  ctx.session.id());
}

void do_emote(Context &ctx) {
    auto character = require_character(ctx);
    if (!character)
        return;
    const auto action = ctx.rest();
    if (action.empty()) {
        ctx.connection.send_line("Emote what?");
        return;
    }
    if (auto room = ctx.mud.world().location_of(character->id))
        ctx.mud.broadcast_to_room(*room, fmt::format("{} {}", character->name, action));
}

void do_chat(Context &ctx) {
    const auto message = ctx.rest();
    if (message.empty()) {
        ctx.connection.send_line("Chat what?");
        return;
    }
    std::string who = "Anonymous";
    if (const auto character_id = ctx.session.character_id())
        who = character_name(ctx.mud, *character_id);
    else if (const auto user_id = ctx.session.user_id()) {
        if (auto user = ctx.mud.database().begin()->find_user(*user_id))
            who = user->username;
    }
    const auto line = fmt::format("|m[OOC] {}: {}|p", who, message);
    for (auto &session : ctx.mud.sessions().all())
        session->connection().send_line(line);
}

void do_tell(Context &ctx) {
    auto character = require_character(ctx);
    if (!character)
        return;
    const auto message = rest_after_first_arg(ctx);
    if (ctx.args.empty() || message.empty()) {
        ctx.connection.send_line("Tell whom what?");
        return;
    }
    auto target = ctx.mud.database().begin()->find_character_by_name(ctx.args[0]);
    if (!target || !ctx.mud.characters().find(target->id)) {
        ctx.connection.send_line("No one by that name is playing.");
        return;
    }
    if (target->id == character->id) {
        ctx.connection.send_line("You mutter to yourself.");
        return;
    }
    ctx.mud.send_to_character(target->id, fmt::format("|c{} tells you, \"{}\"|p", character->name, message));
    ctx.connection.send_line(fmt::format("|cYou tell {}, \"{}\"|p", target->name, message));
}

}

void register_communication_commands(CommandRegistry &registry) {
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"say", "'"},
                                                 "say <message> - Speak to everyone in the room", do_say));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"emote", ":"},
                                                 "emote <action> - Act something out", do_emote));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"chat", "ooc"},
                                                 "chat <message> - Talk out of character to everyone", do_chat));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"tell", "whisper", "t"},
                                                 "tell <name> <message> - Speak privately to another player",
                                                 do_tell));
}
