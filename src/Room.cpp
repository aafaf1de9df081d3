/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "Room.hpp"

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>
#include <range/v3/view/transform.hpp>

Room::Room(std::string id, std::string name, std::string area, std::string description, RoomFlags flags)
    : id_(std::move(id)), name_(std::move(name)), area_(std::move(area)), description_(std::move(description)),
      flags_(flags) {}

std::optional<std::string> Room::exit(Direction direction) const {
    if (auto it = exits_.find(direction); it != exits_.end())
        return it->second;
    return {};
}

bool Room::add_exit(Direction direction, std::string destination) {
    return exits_.emplace(direction, std::move(destination)).second;
}

bool Room::add_occupant(const std::string &character_id) {
    std::lock_guard lock(mutex_);
    return occupants_.insert(character_id).second;
}

bool Room::remove_occupant(const std::string &character_id) {
    std::lock_guard lock(mutex_);
    return occupants_.erase(character_id) > 0;
}

bool Room::has_occupant(const std::string &character_id) const {
    std::lock_guard lock(mutex_);
    return occupants_.count(character_id) > 0;
}

std::vector<std::string> Room::occupants() const {
    std::lock_guard lock(mutex_);
    return {occupants_.begin(), occupants_.end()};
}

size_t Room::occupant_count() const {
    std::lock_guard lock(mutex_);
    return occupants_.size();
}

std::string Room::exits_summary() const {
    if (exits_.empty())
        return "[Exits: none]";
    const auto names = exits_ | ranges::views::keys
                       | ranges::views::transform([](Direction dir) { return to_string(dir); })
                       | ranges::to<std::vector<std::string_view>>;
    return fmt::format("[Exits: {}]", fmt::join(names, ", "));
}
