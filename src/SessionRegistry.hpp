/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Session.hpp"
#include "common/Logger.hpp"
#include "common/Time.hpp"

#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

// The directory of every live session. All operations are safe to call from any thread.
class SessionRegistry {
    mutable Logger log_;
    mutable std::mutex mutex_;
    SessionId next_id_{1};
    std::unordered_map<SessionId, std::shared_ptr<Session>> sessions_;

public:
    SessionRegistry();

    // Creates a session for the connection and points the connection back at it.
    std::shared_ptr<Session> create_session(std::shared_ptr<Connection> connection);
    [[nodiscard]] std::shared_ptr<Session> get_session(SessionId id) const;
    [[nodiscard]] std::shared_ptr<Session> get_session_by_user(std::string_view user_id) const;
    // Marks the session Disconnected and forgets it. Returns false if there was no such session.
    bool destroy_session(SessionId id);
    // Disconnects and destroys every session idle for longer than timeout. Returns how many went.
    size_t cleanup_expired(Minutes timeout, Time now = Clock::now());

    [[nodiscard]] std::vector<std::shared_ptr<Session>> all() const;
    [[nodiscard]] size_t size() const;
};
