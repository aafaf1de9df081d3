/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Session.hpp"
#include "common/Time.hpp"

#include <optional>
#include <string>
#include <string_view>

class CharacterIndex;
class CommandRegistry;
class Configuration;
class Database;
class SessionRegistry;
class World;

// The engine as seen by commands and tick callbacks.
struct Mud {
    virtual ~Mud() = default;
    virtual const Configuration &config() const = 0;
    virtual World &world() = 0;
    virtual SessionRegistry &sessions() = 0;
    virtual CharacterIndex &characters() = 0;
    virtual Database &database() = 0;
    virtual const CommandRegistry &commands() const = 0;

    // Sends to every session playing a character in the room, except `exclude`.
    virtual void broadcast_to_room(const std::string &room_id, std::string_view message,
                                   std::optional<SessionId> exclude = std::nullopt) = 0;
    // Sends to every session playing a character.
    virtual void broadcast(std::string_view message) = 0;
    // Returns false if nobody is playing the character.
    virtual bool send_to_character(const std::string &character_id, std::string_view message) = 0;
    // Takes the session's character (if any) out of the world, telling the room and saving where it was.
    virtual void leave_world(Session &session) = 0;

    virtual Time boot_time() const = 0;
    virtual Time current_time() const = 0;
};
