/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Room.hpp"

#include <range/v3/view/indirect.hpp>
#include <range/v3/view/map.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class WorldLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The room table, plus where each character is. Rooms are added while loading and never removed; after that only
// occupancy changes, and it may change from any thread.
//
// Locking: room mutexes are always taken in ascending room id order, and the location mutex is only ever taken
// after any room mutexes. So any observer holding a room's lock sees each character in exactly one room.
class World {
public:
    enum class MoveResult { Moved, NotInSource, NoSuchRoom };

private:
    std::map<std::string, std::unique_ptr<Room>, std::less<>> rooms_;
    mutable std::mutex location_mutex_;
    std::unordered_map<std::string, std::string> locations_;

    struct PairLock {
        std::unique_lock<std::mutex> first;
        std::unique_lock<std::mutex> second;
    };
    [[nodiscard]] static PairLock lock_pair(Room *a, Room *b);

public:
    // Throws WorldLoadError if a room with that id already exists.
    Room &add_room(std::unique_ptr<Room> room);
    [[nodiscard]] Room *find(std::string_view id) const;
    [[nodiscard]] size_t size() const noexcept { return rooms_.size(); }
    [[nodiscard]] auto rooms() const { return rooms_ | ranges::views::values | ranges::views::indirect; }

    // Puts a character into a room, taking it out of wherever it was. False if there's no such room.
    bool place(const std::string &character_id, const std::string &room_id);
    MoveResult move(const std::string &character_id, const std::string &from_id, const std::string &to_id);
    // Takes a character out of the world, returning the room it was in.
    std::optional<std::string> remove(const std::string &character_id);
    [[nodiscard]] std::optional<std::string> location_of(const std::string &character_id) const;
    // Every room whose occupant set holds the character, observed with all rooms locked at once.
    [[nodiscard]] std::vector<std::string> rooms_containing(const std::string &character_id) const;

    // Throws WorldLoadError for an exit to a room that doesn't exist. Returns a description of each one-way exit.
    [[nodiscard]] std::vector<std::string> validate() const;
};
