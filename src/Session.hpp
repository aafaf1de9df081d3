/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "SessionState.hpp"
#include "common/Logger.hpp"
#include "common/Time.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

class Connection;

using SessionId = uint64_t;

// The authentication and play state bound to a single connection. Fields may be read and written from any thread.
class Session {
    mutable Logger log_;
    SessionId id_;
    std::shared_ptr<Connection> connection_;
    Time created_at_;

    mutable std::mutex mutex_;
    std::optional<std::string> user_id_;
    std::optional<std::string> character_id_;
    SessionState state_{SessionState::Connected};
    Time last_activity_;

public:
    Session(SessionId id, std::shared_ptr<Connection> connection);

    Session(const Session &) = delete;
    Session(Session &&) = delete;
    Session &operator=(const Session &) = delete;
    Session &operator=(Session &&) = delete;

    [[nodiscard]] SessionId id() const noexcept { return id_; }
    [[nodiscard]] Connection &connection() const noexcept { return *connection_; }
    [[nodiscard]] Time created_at() const noexcept { return created_at_; }

    [[nodiscard]] std::optional<std::string> user_id() const;
    [[nodiscard]] std::optional<std::string> character_id() const;
    [[nodiscard]] SessionState state() const;
    [[nodiscard]] Time last_activity() const;
    void last_activity(Time time);

    void set_user(std::string user_id);
    void set_character(std::string character_id);
    void clear_character();
    // Returns false, leaving the state alone, if the transition isn't allowed.
    bool set_state(SessionState new_state);
    void touch();

    [[nodiscard]] bool is_expired(Minutes timeout, Time now = Clock::now()) const;
};
