/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "SessionRegistry.hpp"

#include "net/Connection.hpp"

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>

SessionRegistry::SessionRegistry() : log_(logger_for("SessionRegistry")) {}

std::shared_ptr<Session> SessionRegistry::create_session(std::shared_ptr<Connection> connection) {
    auto &conn = *connection;
    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(mutex_);
        const auto id = next_id_++;
        session = std::make_shared<Session>(id, std::move(connection));
        sessions_.emplace(id, session);
    }
    conn.session(session);
    log_.info("Session {} created for connection {}", session->id(), conn.id());
    return session;
}

std::shared_ptr<Session> SessionRegistry::get_session(SessionId id) const {
    std::lock_guard lock(mutex_);
    if (auto it = sessions_.find(id); it != sessions_.end())
        return it->second;
    return {};
}

std::shared_ptr<Session> SessionRegistry::get_session_by_user(std::string_view user_id) const {
    std::lock_guard lock(mutex_);
    for (auto &[id, session] : sessions_)
        if (session->user_id() == user_id)
            return session;
    return {};
}

bool SessionRegistry::destroy_session(SessionId id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end())
            return false;
        session = std::move(it->second);
        sessions_.erase(it);
    }
    session->set_state(SessionState::Disconnected);
    log_.info("Session {} destroyed", id);
    return true;
}

size_t SessionRegistry::cleanup_expired(Minutes timeout, Time now) {
    std::vector<std::shared_ptr<Session>> expired;
    {
        std::lock_guard lock(mutex_);
        for (auto &[id, session] : sessions_)
            if (session->is_expired(timeout, now))
                expired.emplace_back(session);
    }
    size_t num_destroyed = 0;
    for (auto &session : expired) {
        session->connection().send_line("\n|RYou have been idle too long. Goodbye.|p");
        session->connection().close();
        if (destroy_session(session->id()))
            ++num_destroyed;
    }
    if (num_destroyed)
        log_.info("Expired {} idle session{}", num_destroyed, num_destroyed == 1 ? "" : "s");
    return num_destroyed;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::all() const {
    std::lock_guard lock(mutex_);
    return sessions_ | ranges::views::values | ranges::to<std::vector<std::shared_ptr<Session>>>;
}

size_t SessionRegistry::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}
