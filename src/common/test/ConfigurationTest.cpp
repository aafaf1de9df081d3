#include "common/Configuration.hpp"

#include <catch2/catch.hpp>

namespace {
void apply_default_settings() {
    REQUIRE(setenv(WAYSTONE_AREA_DIR_ENV, TEST_DATA_DIR "/area", 1) == 0);
    REQUIRE(setenv(WAYSTONE_DATA_DIR_ENV, TEST_DATA_DIR "/data", 1) == 0);
    REQUIRE(setenv(WAYSTONE_PORT_ENV, "9000", 1) == 0);
    for (auto env : {WAYSTONE_HOST_ENV, WAYSTONE_MAX_CONNECTIONS_PER_IP_ENV, WAYSTONE_SESSION_TIMEOUT_MINUTES_ENV,
                     WAYSTONE_READ_TIMEOUT_SECONDS_ENV, WAYSTONE_TICK_SECONDS_ENV, WAYSTONE_COMMAND_RATE_LIMIT_ENV,
                     WAYSTONE_STARTING_ROOM_ENV, WAYSTONE_LOG_LEVEL_ENV})
        REQUIRE(unsetenv(env) == 0);
}
}

TEST_CASE("Configuration initialized") {
    apply_default_settings();
    Configuration config;

    SECTION("area dir") { REQUIRE(config.area_dir() == TEST_DATA_DIR "/area/"); }
    SECTION("data dir") { REQUIRE(config.data_dir() == TEST_DATA_DIR "/data/"); }
    SECTION("area file") { REQUIRE(config.area_file() == TEST_DATA_DIR "/area/area.lst"); }
    SECTION("port") { REQUIRE(config.port() == 9000); }
    SECTION("defaults") {
        CHECK(config.host() == "0.0.0.0");
        CHECK(config.max_connections_per_ip() == 5u);
        CHECK(config.session_timeout() == Minutes(60));
        CHECK(config.read_timeout() == Seconds(300));
        CHECK(config.tick_interval() == Seconds(30));
        CHECK(config.command_rate_limit() == 10);
        CHECK(config.starting_room() == "university_main_gates");
        CHECK(config.log_level() == spdlog::level::info);
    }
}

TEST_CASE("Overridden settings") {
    apply_default_settings();
    REQUIRE(setenv(WAYSTONE_MAX_CONNECTIONS_PER_IP_ENV, "2", 1) == 0);
    REQUIRE(setenv(WAYSTONE_SESSION_TIMEOUT_MINUTES_ENV, "15", 1) == 0);
    REQUIRE(setenv(WAYSTONE_STARTING_ROOM_ENV, "imre_square", 1) == 0);
    REQUIRE(setenv(WAYSTONE_LOG_LEVEL_ENV, "debug", 1) == 0);
    Configuration config;

    CHECK(config.max_connections_per_ip() == 2u);
    CHECK(config.session_timeout() == Minutes(15));
    CHECK(config.starting_room() == "imre_square");
    CHECK(config.log_level() == spdlog::level::debug);
}

TEST_CASE("Missing directory") {

    apply_default_settings();
    REQUIRE(setenv(WAYSTONE_AREA_DIR_ENV, TEST_DATA_DIR "/missing", 1) == 0);

    SECTION("Throws exception") {
        REQUIRE_THROWS_WITH(Configuration(),
                            "An environment variable called WAYSTONE_AREA_DIR must specify a directory path");
    }
}

TEST_CASE("Missing path env var") {

    apply_default_settings();
    REQUIRE(unsetenv(WAYSTONE_DATA_DIR_ENV) == 0);

    SECTION("Throws exception") {
        REQUIRE_THROWS_WITH(Configuration(),
                            "An environment variable called WAYSTONE_DATA_DIR must specify a directory path");
    }
}

TEST_CASE("Malformed numbers") {

    apply_default_settings();
    SECTION("not a number") {
        REQUIRE(setenv(WAYSTONE_PORT_ENV, "forty", 1) == 0);
        REQUIRE_THROWS_AS(Configuration(), ConfigurationError);
    }
    SECTION("out of range port") {
        REQUIRE(setenv(WAYSTONE_PORT_ENV, "70000", 1) == 0);
        REQUIRE_THROWS_AS(Configuration(), ConfigurationError);
    }
    SECTION("below minimum") {
        REQUIRE(setenv(WAYSTONE_TICK_SECONDS_ENV, "0", 1) == 0);
        REQUIRE_THROWS_AS(Configuration(), ConfigurationError);
    }
    SECTION("unknown log level") {
        REQUIRE(setenv(WAYSTONE_LOG_LEVEL_ENV, "chatty", 1) == 0);
        REQUIRE_THROWS_AS(Configuration(), ConfigurationError);
    }
}

TEST_CASE("Default port") {

    apply_default_settings();
    REQUIRE(unsetenv(WAYSTONE_PORT_ENV) == 0);
    Configuration config;

    SECTION("default port") { REQUIRE(config.port() == 4000); }
}
