/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Direction.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

struct RoomFlags {
    bool outdoor{};
    bool lit{true};
    bool safe_zone{};
};

// A location in the world. Everything but the occupant set is fixed once the world is loaded; the occupants are
// guarded by the room's own mutex.
class Room {
    std::string id_;
    std::string name_;
    std::string area_;
    std::string description_;
    std::map<Direction, std::string> exits_;
    RoomFlags flags_;
    std::optional<std::string> required_rank_;

    mutable std::mutex mutex_;
    std::set<std::string> occupants_;

    friend class World;

public:
    Room(std::string id, std::string name, std::string area, std::string description, RoomFlags flags = {});

    Room(const Room &) = delete;
    Room(Room &&) = delete;
    Room &operator=(const Room &) = delete;
    Room &operator=(Room &&) = delete;

    [[nodiscard]] const std::string &id() const noexcept { return id_; }
    [[nodiscard]] const std::string &name() const noexcept { return name_; }
    [[nodiscard]] const std::string &area() const noexcept { return area_; }
    [[nodiscard]] const std::string &description() const noexcept { return description_; }
    [[nodiscard]] const RoomFlags &flags() const noexcept { return flags_; }
    [[nodiscard]] const std::optional<std::string> &required_rank() const noexcept { return required_rank_; }
    void required_rank(std::string rank) { required_rank_ = std::move(rank); }

    [[nodiscard]] const std::map<Direction, std::string> &exits() const noexcept { return exits_; }
    [[nodiscard]] std::optional<std::string> exit(Direction direction) const;
    // Returns false if there was already an exit that way.
    bool add_exit(Direction direction, std::string destination);

    // Occupant set mutation; each returns whether the set changed.
    bool add_occupant(const std::string &character_id);
    bool remove_occupant(const std::string &character_id);
    [[nodiscard]] bool has_occupant(const std::string &character_id) const;
    [[nodiscard]] std::vector<std::string> occupants() const;
    [[nodiscard]] size_t occupant_count() const;

    // e.g. "[Exits: north, east]" or "[Exits: none]".
    [[nodiscard]] std::string exits_summary() const;
};
