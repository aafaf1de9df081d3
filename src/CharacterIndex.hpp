/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Session.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Which session is playing each character. A character is played by at most one session at a time.
class CharacterIndex {
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<Session>> sessions_;

public:
    // Returns false if another live session is already playing the character.
    bool bind(const std::string &character_id, const std::shared_ptr<Session> &session);
    // Only removes the entry if it belongs to the given session.
    bool unbind(const std::string &character_id, SessionId session_id);
    [[nodiscard]] std::shared_ptr<Session> find(const std::string &character_id) const;
    [[nodiscard]] std::vector<std::shared_ptr<Session>> sessions() const;
    [[nodiscard]] size_t size() const;
};
