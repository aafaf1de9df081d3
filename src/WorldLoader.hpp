/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "World.hpp"
#include "common/Logger.hpp"

#include <cstdio>
#include <string>
#include <string_view>

// Builds the World from area files. The area list names one file per line and ends with "$". Each area file reads:
//
//   #AREA The University~
//   #ROOM university_main_gates
//   Name The Main Gates~
//   Desc Tall iron gates...~
//   Flags outdoor safe~
//   Rank E'lir~
//   Exit north university_courtyard
//   End
//   #END
//
// Flags may be any of outdoor, dark and safe. Any error in the content throws WorldLoadError.
class WorldLoader {
    mutable Logger log_;

    void load_room(FILE *fp, std::string_view file_name, const std::string &area, World &world) const;

public:
    WorldLoader();

    // Loads every area named in `area_dir`/area.lst, then validates the exits.
    void load_area_list(const std::string &area_dir, World &world) const;
    void load_area(FILE *fp, std::string_view file_name, World &world) const;
};
