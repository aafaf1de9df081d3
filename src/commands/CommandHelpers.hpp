/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Command.hpp"
#include "Database.hpp"

#include <optional>
#include <string>
#include <string_view>

class Room;

// The logged in user, or nothing (having told the player they need to log in).
std::optional<UserRecord> require_user(Context &ctx);
// The character being played, or nothing (having told the player they need one).
std::optional<CharacterRecord> require_character(Context &ctx);

// The name to show for a character id, or "Someone" if it's gone.
std::string character_name(Mud &mud, const std::string &character_id);

// The full room text: name, description, exits and who else is there.
std::string describe_room(Mud &mud, const Room &room, const std::string &viewer_id);
// Sends the room the player's character is in.
void show_current_room(Context &ctx, const std::string &character_id);

// Text after the first argument, e.g. the message in "tell bob hello there".
std::string_view rest_after_first_arg(const Context &ctx);
