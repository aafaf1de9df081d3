#include "CharacterIndex.hpp"
#include "Engine.hpp"
#include "FileDatabase.hpp"
#include "Password.hpp"
#include "TestConnections.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <thread>

using namespace std::literals;

namespace {

Configuration test_config() {
    REQUIRE(setenv(WAYSTONE_AREA_DIR_ENV, TEST_DATA_DIR "/area", 1) == 0);
    REQUIRE(setenv(WAYSTONE_DATA_DIR_ENV, TEST_DATA_DIR "/data", 1) == 0);
    for (auto env : {WAYSTONE_HOST_ENV, WAYSTONE_PORT_ENV, WAYSTONE_MAX_CONNECTIONS_PER_IP_ENV,
                     WAYSTONE_SESSION_TIMEOUT_MINUTES_ENV, WAYSTONE_READ_TIMEOUT_SECONDS_ENV,
                     WAYSTONE_TICK_SECONDS_ENV, WAYSTONE_COMMAND_RATE_LIMIT_ENV, WAYSTONE_STARTING_ROOM_ENV,
                     WAYSTONE_LOG_LEVEL_ENV})
        REQUIRE(unsetenv(env) == 0);
    return Configuration();
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

struct Player {
    test::ClientLink link;
    std::shared_ptr<Session> session;
};

struct EngineFixture {
    test::ConnectionFactory factory;
    Engine engine{test_config(), std::make_unique<FileDatabase>()};

    EngineFixture() { engine.load_world(); }

    Player connect() {
        auto link = factory.make();
        auto session = engine.sessions().create_session(link.connection);
        return Player{std::move(link), std::move(session)};
    }

    std::string run(Player &player, std::string_view line) {
        engine.process_command(*player.session, line);
        return player.link.output();
    }

    std::string add_user(std::string name, std::string_view password) {
        auto txn = engine.database().begin();
        auto email = name + "@example.com";
        UserRecord user{make_record_id(), std::move(name), std::move(email), hash_password(password), Clock::now(),
                        {}};
        txn->put_user(user);
        txn->commit();
        return user.id;
    }

    // A logged in user with one character, playing it.
    Player player_as(std::string user_name, std::string character_name) {
        add_user(user_name, "secret1");
        auto player = connect();
        run(player, "login " + user_name + " secret1");
        run(player, "create " + character_name);
        run(player, "play " + character_name);
        REQUIRE(player.session->state() == SessionState::Playing);
        return player;
    }

    std::optional<std::string> location_of(const Player &player) {
        return engine.world().location_of(*player.session->character_id());
    }
};

}

TEST_CASE_METHOD(EngineFixture, "Dispatching commands", "[Engine]") {
    auto player = connect();

    SECTION("unknown verbs get exactly one line") {
        CHECK(run(player, "dance wildly") == "Unknown command 'dance'. Type 'help' for a list of commands.\r\n");
    }
    SECTION("blank lines do nothing") { CHECK(run(player, "   ").empty()); }
    SECTION("verbs ignore case") { CHECK(contains(run(player, "HELP"), "Available commands")); }
    SECTION("a failing command is reported and doesn't take anything down") {
        engine.command_registry().add(std::make_shared<SimpleCommand>(
            std::vector<std::string>{"explode"}, "explode - Fail loudly",
            [](Context &) { throw std::runtime_error("kaboom"); }));
        CHECK(run(player, "explode now") == "Something went wrong. Please try again.\r\n");
        CHECK(player.session->state() == SessionState::Connected);
        CHECK(contains(run(player, "help"), "Available commands"));
    }
    SECTION("a failing command leaves other sessions alone") {
        auto other = connect();
        engine.command_registry().add(std::make_shared<SimpleCommand>(
            std::vector<std::string>{"explode"}, "explode - Fail loudly",
            [](Context &) { throw std::runtime_error("kaboom"); }));
        CHECK(run(player, "explode now") == "Something went wrong. Please try again.\r\n");
        CHECK(other.link.output().empty());
        CHECK(contains(run(other, "help"), "Available commands"));
        CHECK(other.session->state() == SessionState::Connected);
        CHECK(player.link.output().empty());
    }
    SECTION("commands that need a character say so") {
        for (auto line : {"say hi", "look", "north", "tell bob hi", "'hi", "save"})
            CHECK(run(player, line) == "You must be playing a character to use this command.\r\n");
    }
    SECTION("commands that need a user say so") {
        CHECK(run(player, "characters") == "You must be logged in to use this command.\r\n");
    }
}

TEST_CASE_METHOD(EngineFixture, "Registering", "[Engine][Auth]") {
    auto player = connect();

    SECTION("creates the account and logs in") {
        CHECK(contains(run(player, "register Kvothe secret1 kvothe@example.com"),
                       "Account created successfully! Welcome, Kvothe!"));
        CHECK(player.session->state() == SessionState::Authenticating);
        CHECK(player.session->user_id());
        auto user = engine.database().begin()->find_user_by_name("kvothe");
        REQUIRE(user);
        CHECK(user->email == "kvothe@example.com");
        CHECK(check_password("secret1", user->password_hash));
    }
    SECTION("needs all the arguments") {
        CHECK(contains(run(player, "register Kvothe"), "Usage: register"));
    }
    SECTION("checks the username") { CHECK(contains(run(player, "register K1 secret1 a@b.cc"), "Invalid username")); }
    SECTION("checks the password") {
        CHECK(contains(run(player, "register Kvothe short a@b.cc"), "at least 6 characters"));
    }
    SECTION("checks the email") { CHECK(contains(run(player, "register Kvothe secret1 nope"), "Invalid email")); }
    SECTION("refuses a taken email address") {
        add_user("Kvothe", "secret1");
        CHECK(contains(run(player, "register Ambrose secret1 KVOTHE@example.com"),
                       "Email address is already registered."));
        CHECK(!player.session->user_id());
        CHECK(!engine.database().begin()->find_user_by_name("Ambrose"));
    }
    SECTION("refuses a taken name") {
        add_user("kvothe", "secret1");
        CHECK(contains(run(player, "register KVOTHE secret1 a@b.cc"), "Username 'KVOTHE' is already taken."));
        CHECK(!player.session->user_id());
    }
}

TEST_CASE_METHOD(EngineFixture, "Logging in", "[Engine][Auth]") {
    const auto user_id = add_user("Kvothe", "secret1");
    auto player = connect();

    SECTION("with the password on the line") {
        CHECK(contains(run(player, "login kvothe secret1"), "Welcome back, Kvothe!"));
        CHECK(player.session->user_id() == user_id);
        CHECK(player.session->state() == SessionState::Authenticating);
        CHECK(engine.database().begin()->find_user(user_id)->last_login);
    }
    SECTION("prompting for the password") {
        player.link.type("secret1\r\n");
        const auto output = run(player, "login Kvothe");
        CHECK(contains(output, "Password: "));
        CHECK(contains(output, "Welcome back, Kvothe!"));
        CHECK(!contains(output, "secret1"));
        CHECK(player.session->user_id() == user_id);
    }
    SECTION("with the wrong password") {
        CHECK(run(player, "login Kvothe wrong11") == "Invalid username or password.\r\n");
        CHECK(!player.session->user_id());
        CHECK(player.session->state() == SessionState::Authenticating);
        SECTION("may try again") {
            CHECK(contains(run(player, "login Kvothe secret1"), "Welcome back"));
            CHECK(player.session->user_id() == user_id);
        }
    }
    SECTION("as nobody") { CHECK(run(player, "login Ambrose secret1") == "Invalid username or password.\r\n"); }
    SECTION("twice") {
        run(player, "login Kvothe secret1");
        CHECK(run(player, "login Kvothe secret1") == "You are already logged in.\r\n");
    }
    SECTION("while logged in elsewhere") {
        auto other = connect();
        run(other, "login Kvothe secret1");
        CHECK(contains(run(player, "login Kvothe secret1"), "already logged in elsewhere"));
        CHECK(!player.session->user_id());
    }
}

TEST_CASE_METHOD(EngineFixture, "Managing characters", "[Engine][Characters]") {
    const auto user_id = add_user("Kvothe", "secret1");
    auto player = connect();
    run(player, "login Kvothe secret1");

    SECTION("none to start with") { CHECK(contains(run(player, "characters"), "You have no characters yet.")); }
    SECTION("creating") {
        CHECK(contains(run(player, "create Kote"), "Kote has been created!"));
        auto characters = engine.database().begin()->characters_for(user_id);
        REQUIRE(characters.size() == 1u);
        CHECK(characters[0].name == "Kote");
        CHECK(characters[0].room_id == "university_main_gates");
        CHECK(contains(run(player, "chars"), "Kote"));
    }
    SECTION("names must look like names") {
        CHECK(contains(run(player, "create kote"), "Invalid name"));
        CHECK(contains(run(player, "create K"), "Invalid name"));
        CHECK(contains(run(player, "create Kote2"), "Invalid name"));
    }
    SECTION("names are unique") {
        run(player, "create Kote");
        CHECK(contains(run(player, "create KOTE"), "The name 'KOTE' is already taken."));
        CHECK(contains(run(player, "create Kote"), "The name 'Kote' is already taken."));
    }
    SECTION("at most three") {
        run(player, "create Kote");
        run(player, "create Reshi");
        run(player, "create Maedre");
        CHECK(contains(run(player, "create Shadicar"), "maximum of 3 characters"));
    }
    SECTION("deleting") {
        run(player, "create Kote");
        SECTION("after confirming") {
            player.link.type("Kote\r\n");
            CHECK(contains(run(player, "delete Kote"), "Kote has been deleted."));
            CHECK(engine.database().begin()->characters_for(user_id).empty());
        }
        SECTION("cancelled") {
            player.link.type("no\r\n");
            CHECK(contains(run(player, "delete Kote"), "Deletion cancelled."));
            CHECK(engine.database().begin()->characters_for(user_id).size() == 1u);
        }
        SECTION("someone else's") {
            auto other = player_as("Denna", "Dianne");
            CHECK(contains(run(player, "delete Dianne"), "You don't have a character named 'Dianne'."));
        }
    }
}

TEST_CASE_METHOD(EngineFixture, "Entering the world", "[Engine][Characters]") {
    add_user("Kvothe", "secret1");
    auto player = connect();
    run(player, "login Kvothe secret1");
    run(player, "create Kote");

    SECTION("play") {
        const auto output = run(player, "play kote");
        CHECK(contains(output, "Welcome to the world, Kote!"));
        CHECK(contains(output, "The Main Gates"));
        CHECK(contains(output, "[Exits: north, south]"));
        CHECK(player.session->state() == SessionState::Playing);
        REQUIRE(player.session->character_id());
        CHECK(location_of(player) == "university_main_gates");
        CHECK(engine.characters().find(*player.session->character_id()) == player.session);
    }
    SECTION("is announced to the room") {
        auto other = player_as("Denna", "Dianne");
        run(player, "play Kote");
        CHECK(contains(other.link.output(), "Kote arrives."));
        CHECK(contains(run(player, "look"), "Dianne is here."));
    }
    SECTION("someone else's character") {
        auto other = player_as("Denna", "Dianne");
        CHECK(contains(run(player, "play Dianne"), "You don't have a character named 'Dianne'."));
    }
    SECTION("a character already in play") {
        run(player, "play Kote");
        auto second = connect();
        second.session->set_user(*player.session->user_id());
        second.session->set_state(SessionState::Authenticating);
        CHECK(contains(run(second, "play Kote"), "Kote is already being played in another session."));
        CHECK(second.session->state() == SessionState::Authenticating);
        SECTION("can't be deleted") {
            CHECK(contains(run(second, "delete Kote"), "You can't delete a character that is in play."));
        }
    }
}

TEST_CASE_METHOD(EngineFixture, "Moving around", "[Engine][Movement]") {
    auto kote = player_as("Kvothe", "Kote");
    auto dianne = player_as("Denna", "Dianne");
    kote.link.output();

    SECTION("walking through an exit") {
        const auto output = run(kote, "north");
        CHECK(contains(output, "You travel north."));
        CHECK(contains(output, "The Courtyard"));
        CHECK(location_of(kote) == "university_courtyard");
        CHECK(contains(dianne.link.output(), "Kote leaves north."));
        CHECK(engine.database().begin()->find_character_by_name("Kote")->room_id == "university_courtyard");
        SECTION("and back") {
            CHECK(contains(run(kote, "s"), "You travel south."));
            CHECK(contains(dianne.link.output(), "Kote arrives."));
            CHECK(location_of(kote) == "university_main_gates");
        }
    }
    SECTION("with go") {
        CHECK(contains(run(kote, "go n"), "You travel north."));
        CHECK(contains(run(kote, "go sideways"), "'sideways' is not a direction."));
        CHECK(run(kote, "go") == "Go where?\r\n");
    }
    SECTION("where there's no exit") {
        CHECK(run(kote, "up") == "You can't go up from here.\r\n");
        CHECK(location_of(kote) == "university_main_gates");
        CHECK(dianne.link.output().empty());
    }
    SECTION("the world never sees a character twice") {
        run(kote, "north");
        run(kote, "east");
        CHECK(engine.world().rooms_containing(*kote.session->character_id())
              == std::vector<std::string>{"university_archives"});
    }
}

TEST_CASE_METHOD(EngineFixture, "Looking around", "[Engine][Info]") {
    auto kote = player_as("Kvothe", "Kote");
    auto dianne = player_as("Denna", "Dianne");
    kote.link.output();

    SECTION("the room") {
        const auto output = run(kote, "look");
        CHECK(contains(output, "The Main Gates\r\n--------------\r\nTall iron gates"));
        CHECK(contains(output, "[Exits: north, south]"));
        CHECK(contains(output, "Dianne is here."));
        CHECK(!contains(output, "Kote is here."));
    }
    SECTION("through an exit") {
        CHECK(run(kote, "look north") == "Looking north, you see The Courtyard.\r\n");
        CHECK(run(kote, "l up") == "You see nothing special in that direction.\r\n");
    }
    SECTION("exits") {
        const auto output = run(kote, "exits");
        CHECK(contains(output, "Obvious exits:"));
        CHECK(contains(output, "north      - The Courtyard"));
        CHECK(contains(output, "south      - Imre Main Street"));
    }
    SECTION("who") {
        const auto output = run(kote, "who");
        CHECK(contains(output, "Dianne"));
        CHECK(contains(output, "Kote"));
        CHECK(contains(output, "2 players online."));
    }
    SECTION("help for one command") {
        const auto output = run(kote, "help tell");
        CHECK(contains(output, "tell <name> <message>"));
        CHECK(contains(output, "Aliases: whisper, t"));
        CHECK(run(kote, "help frobnicate") == "No help found for 'frobnicate'.\r\n");
    }
    SECTION("time") {
        const auto output = run(kote, "time");
        CHECK(contains(output, "The server time is"));
        CHECK(contains(output, "Waystone has been running for less than a minute."));
    }
}

TEST_CASE_METHOD(EngineFixture, "Talking", "[Engine][Communication]") {
    auto kote = player_as("Kvothe", "Kote");
    auto dianne = player_as("Denna", "Dianne");
    auto wil = player_as("Wilem", "Wil");
    run(wil, "north");
    kote.link.output();
    dianne.link.output();

    SECTION("say reaches the room only") {
        CHECK(run(kote, "say Hello there") == "You say, \"Hello there\"\r\n");
        CHECK(dianne.link.output() == "Kote says, \"Hello there\"\r\n");
        CHECK(wil.link.output().empty());
    }
    SECTION("the say shortcut") {
        CHECK(run(kote, "'Hello") == "You say, \"Hello\"\r\n");
        CHECK(run(kote, "say") == "Say what?\r\n");
    }
    SECTION("emotes include the actor") {
        CHECK(run(kote, ":plays a sad song") == "Kote plays a sad song\r\n");
        CHECK(dianne.link.output() == "Kote plays a sad song\r\n");
    }
    SECTION("tell") {
        CHECK(run(kote, "tell wil meet me at the Eolian") == "You tell Wil, \"meet me at the Eolian\"\r\n");
        CHECK(wil.link.output() == "Kote tells you, \"meet me at the Eolian\"\r\n");
        CHECK(dianne.link.output().empty());
        CHECK(run(kote, "tell Ambrose hello") == "No one by that name is playing.\r\n");
        CHECK(run(kote, "tell wil") == "Tell whom what?\r\n");
    }
    SECTION("chat reaches everyone") {
        auto lurker = connect();
        add_user("Simmon", "secret1");
        run(lurker, "login Simmon secret1");
        CHECK(run(kote, "chat anyone seen Auri?") == "[OOC] Kote: anyone seen Auri?\r\n");
        CHECK(dianne.link.output() == "[OOC] Kote: anyone seen Auri?\r\n");
        CHECK(wil.link.output() == "[OOC] Kote: anyone seen Auri?\r\n");
        CHECK(lurker.link.output() == "[OOC] Kote: anyone seen Auri?\r\n");
        SECTION("without a character uses the account name") {
            run(lurker, "ooc hi all");
            CHECK(kote.link.output() == "[OOC] Simmon: hi all\r\n");
        }
        SECTION("before logging in is anonymous") {
            auto stranger = connect();
            CHECK(run(stranger, "chat hello?") == "[OOC] Anonymous: hello?\r\n");
            CHECK(kote.link.output() == "[OOC] Anonymous: hello?\r\n");
        }
    }
}

TEST_CASE_METHOD(EngineFixture, "Broadcasting", "[Engine]") {
    auto kote = player_as("Kvothe", "Kote");
    auto dianne = player_as("Denna", "Dianne");
    auto wil = player_as("Wilem", "Wil");
    run(wil, "north");
    kote.link.output();
    dianne.link.output();

    SECTION("to a room, leaving someone out") {
        engine.broadcast_to_room("university_main_gates", "The gates creak.", kote.session->id());
        CHECK(kote.link.output().empty());
        CHECK(dianne.link.output() == "The gates creak.\r\n");
        CHECK(wil.link.output().empty());
    }
    SECTION("to a room of three, leaving one out") {
        run(wil, "south");
        kote.link.output();
        dianne.link.output();
        engine.broadcast_to_room("university_main_gates", "A bell tolls.", wil.session->id());
        CHECK(wil.link.output().empty());
        CHECK(kote.link.output() == "A bell tolls.\r\n");
        CHECK(dianne.link.output() == "A bell tolls.\r\n");
    }
    SECTION("to everyone playing") {
        engine.broadcast("The wind changes.");
        CHECK(kote.link.output() == "The wind changes.\r\n");
        CHECK(wil.link.output() == "The wind changes.\r\n");
    }
    SECTION("to one character") {
        CHECK(engine.send_to_character(*dianne.session->character_id(), "Psst."));
        CHECK(dianne.link.output() == "Psst.\r\n");
        CHECK(!engine.send_to_character("nobody", "Psst."));
    }
}

TEST_CASE_METHOD(EngineFixture, "Saving", "[Engine]") {
    auto kote = player_as("Kvothe", "Kote");
    const auto character_id = *kote.session->character_id();
    REQUIRE(engine.world().place(character_id, "imre_eolian"));

    CHECK(run(kote, "save") == "Kote's data has been saved.\r\n");
    CHECK(engine.database().begin()->find_character(character_id)->room_id == "imre_eolian");
}

TEST_CASE_METHOD(EngineFixture, "Leaving", "[Engine][Auth]") {
    auto kote = player_as("Kvothe", "Kote");
    auto dianne = player_as("Denna", "Dianne");
    const auto character_id = *kote.session->character_id();
    run(kote, "north");
    run(dianne, "north");
    kote.link.output();

    SECTION("logout") {
        CHECK(contains(run(kote, "logout"), "Goodbye, Kote!"));
        CHECK(kote.session->state() == SessionState::Disconnected);
        CHECK(!engine.sessions().get_session(kote.session->id()));
        CHECK(!engine.world().location_of(character_id));
        CHECK(!engine.characters().find(character_id));
        CHECK(!kote.link.connection->is_closed());
        CHECK(contains(dianne.link.output(), "Kote has left the realm."));
        CHECK(engine.database().begin()->find_character(character_id)->room_id == "university_courtyard");
    }
    SECTION("quit") {
        CHECK(contains(run(kote, "quit"), "Farewell, traveler."));
        CHECK(kote.link.connection->is_closed());
        CHECK(!engine.sessions().get_session(kote.session->id()));
        CHECK(!engine.world().location_of(character_id));
    }
    SECTION("leaving again does nothing") {
        run(kote, "logout");
        dianne.link.output();
        CHECK(!kote.session->character_id());
        engine.leave_world(*kote.session);
        CHECK(dianne.link.output().empty());
    }
    SECTION("a late cleanup doesn't disturb the character's new session") {
        run(kote, "quit");
        auto again = connect();
        run(again, "login Kvothe secret1");
        run(again, "play Kote");
        REQUIRE(again.session->state() == SessionState::Playing);
        const auto room = engine.world().location_of(character_id);
        REQUIRE(room);
        engine.leave_world(*kote.session);
        CHECK(engine.world().location_of(character_id) == room);
        CHECK(engine.characters().find(character_id) == again.session);
        CHECK(again.session->state() == SessionState::Playing);
    }
    SECTION("a swept session still leaves the world") {
        kote.session->last_activity(Clock::now() - 2h);
        engine.run_tick();
        REQUIRE(kote.link.connection->is_closed());
        CHECK(engine.world().location_of(character_id));
        engine.leave_world(*kote.session);
        CHECK(!engine.world().location_of(character_id));
        CHECK(!engine.characters().find(character_id));
    }
    SECTION("the character can be played again afterwards") {
        run(kote, "logout");
        auto again = connect();
        run(again, "login Kvothe secret1");
        CHECK(contains(run(again, "play Kote"), "The Courtyard"));
    }
}

TEST_CASE_METHOD(EngineFixture, "Ticks", "[Engine]") {
    SECTION("callbacks run in order, and a failure doesn't stop the rest") {
        std::vector<std::string> calls;
        engine.add_tick_callback("first", [&](Mud &) { calls.emplace_back("first"); });
        engine.add_tick_callback("broken", [&](Mud &) {
            calls.emplace_back("broken");
            throw std::runtime_error("oops");
        });
        engine.add_tick_callback("last", [&](Mud &) { calls.emplace_back("last"); });
        engine.run_tick();
        CHECK(calls == std::vector<std::string>{"first", "broken", "last"});
    }
    SECTION("idle sessions are expired") {
        auto idle = connect();
        auto busy = connect();
        idle.session->last_activity(Clock::now() - 2h);
        engine.run_tick();
        CHECK(!engine.sessions().get_session(idle.session->id()));
        CHECK(idle.link.connection->is_closed());
        CHECK(engine.sessions().get_session(busy.session->id()) == busy.session);
    }
}

TEST_CASE_METHOD(EngineFixture, "Serving a connection", "[Engine]") {
    auto link = factory.make();
    std::thread server([&, connection = link.connection] { engine.serve(connection); });

    CHECK(contains(link.output_until("(Login) > "), "Welcome to Waystone"));
    CHECK(engine.sessions().size() == 1u);

    SECTION("a whole visit") {
        link.type("dance\r\n");
        CHECK(contains(link.output_until("(Login) > "), "Unknown command 'dance'."));
        link.type("register Kvothe secret1 kvothe@example.com\r\n");
        CHECK(contains(link.output_until("(Character Select) > "), "Account created successfully!"));
        link.type("create Kote\r\n");
        CHECK(contains(link.output_until("(Character Select) > "), "Kote has been created!"));
        link.type("play Kote\r\n");
        CHECK(contains(link.output_until("\r\n> "), "The Main Gates"));

        link.type("logout\r\n");
        CHECK(contains(link.output_until("(Login) > "), "Goodbye, Kote!"));
        // The connection carries on with a fresh session.
        CHECK(engine.sessions().size() == 1u);
        CHECK(engine.sessions().all().front()->state() == SessionState::Connected);

        link.type("quit\r\n");
        CHECK(contains(link.output_until("Farewell"), "Farewell, traveler."));
        server.join();
        CHECK(engine.sessions().size() == 0u);
        CHECK(link.connection->is_closed());
    }
    SECTION("flooding") {
        std::string lines;
        for (int i = 0; i < 15; ++i)
            lines += "help\r\n";
        link.type(lines);
        CHECK(contains(link.output_until("You are sending commands too quickly."),
                       "You are sending commands too quickly."));
        link.connection->close();
        server.join();
    }
    SECTION("the client going away") {
        link.type("help\r\n");
        CHECK(contains(link.output_until("(Login) > "), "Available commands"));
        link.client.close();
        server.join();
        CHECK(engine.sessions().size() == 0u);
        CHECK(link.connection->is_closed());
    }
    SECTION("shutting down") {
        engine.stop();
        CHECK(contains(link.output_until("Goodbye!"), "Server is shutting down. Goodbye!"));
        server.join();
        CHECK(link.connection->is_closed());
    }
}
