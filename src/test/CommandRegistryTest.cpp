#include "CommandRegistry.hpp"
#include "TestConnections.hpp"
#include "MockMud.hpp"

#include <catch2/catch.hpp>

#include <memory>

namespace {

std::shared_ptr<SimpleCommand> command(std::vector<std::string> names) {
    return std::make_shared<SimpleCommand>(std::move(names), "does a thing", [](Context &) {});
}

}

TEST_CASE("Command registry", "[CommandRegistry]") {
    CommandRegistry registry;
    auto kick = command({"kick", "k"});
    auto punch = command({"punch"});
    registry.add(kick);
    registry.add(punch);

    SECTION("finds commands by any name") {
        CHECK(registry.get("kick") == kick.get());
        CHECK(registry.get("k") == kick.get());
        CHECK(registry.get("punch") == punch.get());
    }
    SECTION("ignores case") {
        CHECK(registry.get("KICK") == kick.get());
        CHECK(registry.get("Punch") == punch.get());
    }
    SECTION("only matches exactly") {
        CHECK(registry.get("kic") == nullptr);
        CHECK(registry.get("kicks") == nullptr);
        CHECK(registry.get("") == nullptr);
    }
    SECTION("lists in registration order") {
        registry.add(command({"bite"}));
        REQUIRE(registry.all().size() == 3u);
        CHECK(registry.all()[0] == kick);
        CHECK(registry.all()[1] == punch);
        CHECK(registry.all()[2]->names().front() == "bite");
    }
    SECTION("rejects duplicates") {
        CHECK_THROWS_AS(registry.add(command({"KICK"})), std::invalid_argument);
        CHECK_THROWS_AS(registry.add(command({"bite", "k"})), std::invalid_argument);
        SECTION("leaving nothing half registered") { CHECK(registry.get("bite") == nullptr); }
        CHECK_THROWS_AS(registry.add(command({"nibble", "nibble"})), std::invalid_argument);
    }
    SECTION("rejects empty names") {
        CHECK_THROWS_AS(registry.add(command({})), std::invalid_argument);
        CHECK_THROWS_AS(registry.add(command({""})), std::invalid_argument);
    }
}

TEST_CASE("Command context", "[CommandRegistry]") {
    test::ConnectionFactory factory;
    auto link = factory.make();
    Session session(1, link.connection);
    test::MockMud mud;
    auto context = [&](std::string raw) {
        return Context{session, *link.connection, mud, {}, std::move(raw)};
    };

    SECTION("rest is the text after the verb") {
        CHECK(context("say hello  there").rest() == "hello  there");
        CHECK(context("  tell bob   hi ").rest() == "bob   hi");
    }
    SECTION("rest is empty with no arguments") { CHECK(context("look").rest().empty()); }
    SECTION("shortcuts need no space") {
        CHECK(context("'hello there").rest() == "hello there");
        CHECK(context(":waves").rest() == "waves");
    }
}

TEST_CASE("Registered commands run against the mud", "[CommandRegistry]") {
    test::ConnectionFactory factory;
    auto link = factory.make();
    Session session(1, link.connection);
    test::MockMud mud;
    CommandRegistry registry;
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"shout"}, "shout to everyone",
                                                 [](Context &ctx) { ctx.mud.broadcast(ctx.rest()); }));

    REQUIRE_CALL(mud, broadcast(trompeloeil::_)).WITH(_1 == "anyone there?");
    Context ctx{session, *link.connection, mud, {"anyone", "there?"}, "SHOUT anyone there?"};
    registry.get("shout")->execute(ctx);
}
