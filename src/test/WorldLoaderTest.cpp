#include "MemFile.hpp"
#include "WorldLoader.hpp"

#include <catch2/catch.hpp>

namespace {

void load(World &world, std::string_view text) {
    test::MemFile file(text);
    WorldLoader().load_area(file.file(), "test.are", world);
}

}

TEST_CASE("Loading the sample world", "[WorldLoader]") {
    World world;
    WorldLoader().load_area_list(TEST_DATA_DIR "/area/", world);

    CHECK(world.size() == 8u);
    const auto *gates = world.find("university_main_gates");
    REQUIRE(gates);
    CHECK(gates->name() == "The Main Gates");
    CHECK(gates->area() == "The University");
    CHECK(gates->flags().outdoor);
    CHECK(gates->flags().safe_zone);
    CHECK(gates->flags().lit);
    CHECK(gates->exit(Direction::North) == "university_courtyard");
    CHECK(gates->exit(Direction::South) == "imre_main_street");
    CHECK(gates->description().find("Tall iron gates") == 0);

    CHECK(world.find("university_archives")->required_rank() == "E'lir");
    CHECK(!world.find("archives_stacks")->flags().lit);
    CHECK(world.find("imre_eolian")->area() == "Imre");
}

TEST_CASE("Loading area files", "[WorldLoader]") {
    World world;
    SECTION("a minimal room") {
        load(world, "#AREA Tests~\n#ROOM r1\nName Room One~\nDesc Plain.~\nEnd\n#END\n");
        REQUIRE(world.find("r1"));
        CHECK(world.find("r1")->area() == "Tests");
        CHECK(world.find("r1")->exits().empty());
    }
    SECTION("comments inside rooms") {
        load(world, "#ROOM r1\n* nothing to see\nName Room One~\nDesc Plain.~\nEnd\n#END\n");
        CHECK(world.find("r1"));
    }
    SECTION("missing name") {
        CHECK_THROWS_AS(load(world, "#ROOM r1\nDesc Plain.~\nEnd\n#END\n"), WorldLoadError);
    }
    SECTION("missing description") {
        CHECK_THROWS_AS(load(world, "#ROOM r1\nName Room~\nEnd\n#END\n"), WorldLoadError);
    }
    SECTION("unknown key") {
        CHECK_THROWS_AS(load(world, "#ROOM r1\nName R~\nDesc D~\nSmell Bad~\nEnd\n#END\n"), WorldLoadError);
    }
    SECTION("unknown flag") {
        CHECK_THROWS_AS(load(world, "#ROOM r1\nName R~\nDesc D~\nFlags damp~\nEnd\n#END\n"), WorldLoadError);
    }
    SECTION("unknown direction") {
        CHECK_THROWS_AS(load(world, "#ROOM r1\nName R~\nDesc D~\nExit sideways r2\nEnd\n#END\n"),
                        WorldLoadError);
    }
    SECTION("two exits the same way") {
        CHECK_THROWS_AS(load(world, "#ROOM r1\nName R~\nDesc D~\nExit north r2\nExit north r3\nEnd\n#END\n"),
                        WorldLoadError);
    }
    SECTION("duplicate rooms") {
        CHECK_THROWS_AS(load(world, "#ROOM r1\nName R~\nDesc D~\nEnd\n#ROOM r1\nName R~\nDesc D~\nEnd\n#END\n"),
                        WorldLoadError);
    }
    SECTION("truncated file") {
        CHECK_THROWS_AS(load(world, "#ROOM r1\nName R~\nDesc unterminated"), WorldLoadError);
    }
    SECTION("errors name the file and room") {
        try {
            load(world, "#ROOM r1\nName R~\nEnd\n#END\n");
            FAIL("expected an error");
        } catch (const WorldLoadError &error) {
            CHECK(std::string(error.what()).find("test.are") != std::string::npos);
            CHECK(std::string(error.what()).find("r1") != std::string::npos);
        }
    }
}

TEST_CASE("Loading a world with a broken exit", "[WorldLoader]") {
    World world;
    load(world, "#ROOM r1\nName R~\nDesc D~\nExit north r2\nEnd\n#END\n");
    CHECK_THROWS_AS(world.validate(), WorldLoadError);
}

TEST_CASE("Loading from a missing directory", "[WorldLoader]") {
    World world;
    CHECK_THROWS_AS(WorldLoader().load_area_list(TEST_DATA_DIR "/missing/", world), WorldLoadError);
}
