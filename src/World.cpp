/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "World.hpp"

#include <fmt/format.h>

World::PairLock World::lock_pair(Room *a, Room *b) {
    PairLock locks;
    if (a && b && a != b && b->id() < a->id())
        std::swap(a, b);
    if (a)
        locks.first = std::unique_lock(a->mutex_);
    if (b && b != a)
        locks.second = std::unique_lock(b->mutex_);
    return locks;
}

Room &World::add_room(std::unique_ptr<Room> room) {
    auto &id = room->id();
    if (rooms_.count(id))
        throw WorldLoadError(fmt::format("Duplicate room id '{}'", id));
    auto [it, inserted] = rooms_.emplace(id, std::move(room));
    return *it->second;
}

Room *World::find(std::string_view id) const {
    if (auto it = rooms_.find(id); it != rooms_.end())
        return it->second.get();
    return nullptr;
}

bool World::place(const std::string &character_id, const std::string &room_id) {
    auto *to = find(room_id);
    if (!to)
        return false;
    for (;;) {
        const auto previous = location_of(character_id);
        auto *from = previous ? find(*previous) : nullptr;
        auto locks = lock_pair(from, to);
        std::lock_guard location_lock(location_mutex_);
        auto it = locations_.find(character_id);
        const auto current = it == locations_.end() ? std::nullopt : std::optional<std::string>(it->second);
        // Someone else moved the character between our look and our locks; try again.
        if (current != previous)
            continue;
        if (from)
            from->occupants_.erase(character_id);
        to->occupants_.insert(character_id);
        locations_[character_id] = room_id;
        return true;
    }
}

World::MoveResult World::move(const std::string &character_id, const std::string &from_id, const std::string &to_id) {
    auto *from = find(from_id);
    auto *to = find(to_id);
    if (!from || !to)
        return MoveResult::NoSuchRoom;
    auto locks = lock_pair(from, to);
    if (!from->occupants_.count(character_id))
        return MoveResult::NotInSource;
    from->occupants_.erase(character_id);
    to->occupants_.insert(character_id);
    std::lock_guard location_lock(location_mutex_);
    locations_[character_id] = to_id;
    return MoveResult::Moved;
}

std::optional<std::string> World::remove(const std::string &character_id) {
    for (;;) {
        const auto previous = location_of(character_id);
        if (!previous)
            return {};
        auto *from = find(*previous);
        auto locks = lock_pair(from, nullptr);
        std::lock_guard location_lock(location_mutex_);
        auto it = locations_.find(character_id);
        if (it == locations_.end() || it->second != *previous)
            continue;
        if (from)
            from->occupants_.erase(character_id);
        locations_.erase(it);
        return previous;
    }
}

std::optional<std::string> World::location_of(const std::string &character_id) const {
    std::lock_guard lock(location_mutex_);
    if (auto it = locations_.find(character_id); it != locations_.end())
        return it->second;
    return {};
}

std::vector<std::string> World::rooms_containing(const std::string &character_id) const {
    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(rooms_.size());
    for (auto &[id, room] : rooms_)
        locks.emplace_back(room->mutex_);
    std::vector<std::string> result;
    for (auto &[id, room] : rooms_)
        if (room->occupants_.count(character_id))
            result.emplace_back(id);
    return result;
}

std::vector<std::string> World::validate() const {
    std::vector<std::string> one_way_exits;
    for (auto &[id, room] : rooms_) {
        for (auto &[direction, destination_id] : room->exits()) {
            const auto *destination = find(destination_id);
            if (!destination)
                throw WorldLoadError(fmt::format("Room '{}' has an exit {} to unknown room '{}'", id,
                                                 to_string(direction), destination_id));
            if (destination->exit(reverse(direction)) != id)
                one_way_exits.emplace_back(
                    fmt::format("{} -> {} ({}) has no way back", id, destination_id, to_string(direction)));
        }
    }
    return one_way_exits;
}
