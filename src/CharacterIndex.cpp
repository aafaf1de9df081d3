/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "CharacterIndex.hpp"

bool CharacterIndex::bind(const std::string &character_id, const std::shared_ptr<Session> &session) {
    std::lock_guard lock(mutex_);
    auto &entry = sessions_[character_id];
    if (auto existing = entry.lock(); existing && existing != session)
        return false;
    entry = session;
    return true;
}

bool CharacterIndex::unbind(const std::string &character_id, SessionId session_id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(character_id);
    if (it == sessions_.end())
        return false;
    if (auto existing = it->second.lock(); existing && existing->id() != session_id)
        return false;
    sessions_.erase(it);
    return true;
}

std::shared_ptr<Session> CharacterIndex::find(const std::string &character_id) const {
    std::lock_guard lock(mutex_);
    if (auto it = sessions_.find(character_id); it != sessions_.end())
        return it->second.lock();
    return {};
}

std::vector<std::shared_ptr<Session>> CharacterIndex::sessions() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<Session>> result;
    for (auto &[character_id, weak_session] : sessions_)
        if (auto session = weak_session.lock())
            result.emplace_back(std::move(session));
    return result;
}

size_t CharacterIndex::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}
