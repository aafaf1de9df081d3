/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "Session.hpp"

#include "net/Connection.hpp"

#include <fmt/format.h>

Session::Session(SessionId id, std::shared_ptr<Connection> connection)
    : log_(logger_for(fmt::format("Session.{}", id))), id_(id), connection_(std::move(connection)),
      created_at_(Clock::now()), last_activity_(created_at_) {
    log_.debug("Created for connection {}", connection_->id());
}

std::optional<std::string> Session::user_id() const {
    std::lock_guard lock(mutex_);
    return user_id_;
}

std::optional<std::string> Session::character_id() const {
    std::lock_guard lock(mutex_);
    return character_id_;
}

SessionState Session::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

Time Session::last_activity() const {
    std::lock_guard lock(mutex_);
    return last_activity_;
}

void Session::last_activity(Time time) {
    std::lock_guard lock(mutex_);
    last_activity_ = time;
}

void Session::set_user(std::string user_id) {
    std::lock_guard lock(mutex_);
    log_.info("User set to {}", user_id);
    user_id_ = std::move(user_id);
    last_activity_ = Clock::now();
}

void Session::set_character(std::string character_id) {
    std::lock_guard lock(mutex_);
    log_.info("Character set to {}", character_id);
    character_id_ = std::move(character_id);
    last_activity_ = Clock::now();
}

void Session::clear_character() {
    std::lock_guard lock(mutex_);
    character_id_.reset();
}

bool Session::set_state(SessionState new_state) {
    std::lock_guard lock(mutex_);
    if (!is_valid_transition(state_, new_state)) {
        log_.warn("Refusing state change {} -> {}", to_string(state_), to_string(new_state));
        return false;
    }
    if (state_ != new_state)
        log_.info("State {} -> {}", to_string(state_), to_string(new_state));
    state_ = new_state;
    last_activity_ = Clock::now();
    return true;
}

void Session::touch() {
    std::lock_guard lock(mutex_);
    last_activity_ = Clock::now();
}

bool Session::is_expired(Minutes timeout, Time now) const { return now - last_activity() > timeout; }
