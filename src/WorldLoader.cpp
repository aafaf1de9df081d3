/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "WorldLoader.hpp"

#include "DataFile.hpp"
#include "common/string_utils.hpp"

#include <fmt/format.h>

#include <optional>
#include <utility>
#include <vector>

namespace {

std::optional<Direction> exact_direction(std::string_view name) {
    for (auto dir : all_directions)
        if (matches(name, to_string(dir)))
            return dir;
    return {};
}

RoomFlags parse_flags(std::string_view file_name, std::string_view room_id, std::string_view text) {
    RoomFlags flags;
    for (auto &flag : split_words(text)) {
        const auto lower = lower_case(flag);
        if (lower == "outdoor")
            flags.outdoor = true;
        else if (lower == "dark")
            flags.lit = false;
        else if (lower == "safe")
            flags.safe_zone = true;
        else
            throw WorldLoadError(fmt::format("{}: room '{}' has unknown flag '{}'", file_name, room_id, flag));
    }
    return flags;
}

}

WorldLoader::WorldLoader() : log_(logger_for("WorldLoader")) {}

void WorldLoader::load_area_list(const std::string &area_dir, World &world) const {
    const auto list_path = area_dir + "area.lst";
    size_t num_areas = 0;
    try {
        auto list = open_data_file(list_path, "r");
        for (;;) {
            auto file_name = try_fread_word(list.get());
            if (!file_name || *file_name == "$")
                break;
            log_.debug("Loading area file {}", *file_name);
            auto area_file = open_data_file(area_dir + *file_name, "r");
            load_area(area_file.get(), *file_name, world);
            ++num_areas;
        }
    } catch (const DataFileError &error) {
        throw WorldLoadError(error.what());
    }
    if (world.size() == 0)
        throw WorldLoadError(fmt::format("No rooms were found in the areas listed in {}", list_path));
    for (auto &one_way : world.validate())
        log_.debug("One-way exit: {}", one_way);
    log_.info("Loaded {} rooms from {} areas", world.size(), num_areas);
}

void WorldLoader::load_area(FILE *fp, std::string_view file_name, World &world) const {
    // Rooms before any #AREA header are grouped under the file's name.
    std::string area(file_name);
    try {
        for (;;) {
            if (fread_letter(fp) != '#')
                throw WorldLoadError(fmt::format("{}: # not found", file_name));
            const auto section = fread_word(fp);
            if (section == "AREA")
                area = fread_string(fp);
            else if (section == "ROOM")
                load_room(fp, file_name, area, world);
            else if (section == "END")
                break;
            else
                throw WorldLoadError(fmt::format("{}: bad section name '#{}'", file_name, section));
        }
    } catch (const DataFileError &error) {
        throw WorldLoadError(fmt::format("{}: {}", file_name, error.what()));
    }
}

void WorldLoader::load_room(FILE *fp, std::string_view file_name, const std::string &area, World &world) const {
    const auto id = fread_word(fp);
    if (world.find(id))
        throw WorldLoadError(fmt::format("{}: duplicate room id '{}'", file_name, id));
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> rank;
    RoomFlags flags;
    std::vector<std::pair<Direction, std::string>> exits;
    for (;;) {
        const auto key = fread_word(fp);
        if (key == "End")
            break;
        if (key == "Name") {
            name = fread_string(fp);
        } else if (key == "Desc") {
            description = fread_string(fp);
        } else if (key == "Flags") {
            flags = parse_flags(file_name, id, fread_string(fp));
        } else if (key == "Rank") {
            rank = fread_string(fp);
        } else if (key == "Exit") {
            const auto dir_name = fread_word(fp);
            const auto direction = exact_direction(dir_name);
            if (!direction)
                throw WorldLoadError(
                    fmt::format("{}: room '{}' has an exit in unknown direction '{}'", file_name, id, dir_name));
            exits.emplace_back(*direction, fread_word(fp));
        } else if (!key.empty() && key.front() == '*') {
            fread_to_eol(fp);
        } else {
            throw WorldLoadError(fmt::format("{}: room '{}' has unknown key '{}'", file_name, id, key));
        }
    }
    if (!name || !description)
        throw WorldLoadError(
            fmt::format("{}: room '{}' is missing its {}", file_name, id, !name ? "Name" : "Desc"));

    auto room = std::make_unique<Room>(id, *name, area, *description, flags);
    if (rank)
        room->required_rank(*rank);
    for (auto &[direction, destination] : exits)
        if (!room->add_exit(direction, destination))
            throw WorldLoadError(
                fmt::format("{}: room '{}' has two exits {}", file_name, id, to_string(direction)));
    world.add_room(std::move(room));
}
