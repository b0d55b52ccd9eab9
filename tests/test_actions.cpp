#include <doctest/doctest.h>
#include "orbcomm/actions.hpp"

using namespace orbcomm;

TEST_CASE("Every query and command token parses back to its own kind") {
    for (const auto& row : QUERY_TABLE) {
        auto k = parse_query(row.token);
        REQUIRE(k.has_value());
        CHECK(*k == row.kind);
        CHECK(token_of(*k) == row.token);
    }
    for (const auto& row : COMMAND_TABLE) {
        auto k = parse_command(row.token);
        REQUIRE(k.has_value());
        CHECK(*k == row.kind);
        CHECK(token_of(*k) == row.token);
    }
}

TEST_CASE("Token parsing is exact and case-sensitive") {
    CHECK_FALSE(parse_query("Name").has_value());
    CHECK_FALSE(parse_query("name ").has_value());
    CHECK_FALSE(parse_query("").has_value());
    CHECK_FALSE(parse_query("reboot").has_value());
    CHECK_FALSE(parse_command("name").has_value());
    CHECK_FALSE(parse_command("REBOOT").has_value());
    CHECK(token_of(QueryKind::COUNT).empty());
    CHECK(token_of(CommandKind::COUNT).empty());
}

TEST_CASE("Topics are built from the device id and the action path") {
    CHECK(topic_for("A1", QueryKind::NAME) == "orb/A1/name");
    CHECK(topic_for("A1", QueryKind::ID) == "orb/A1/id");
    CHECK(topic_for("A1", QueryKind::HARDWARE_VERSION) == "orb/A1/hardware_version");
    CHECK(topic_for("A1", CommandKind::REBOOT) == "orb/A1/command/reboot");
    CHECK(topic_for("A1", CommandKind::SHUTDOWN) == "orb/A1/command/shutdown");
    CHECK(topic_for("A1", CommandKind::RESET_GIMBAL) == "orb/A1/command/reset_gimbal");

    // deterministic
    CHECK(topic_for("orb-7", QueryKind::NAME) == topic_for("orb-7", QueryKind::NAME));
    CHECK(topic_for("X", QueryKind::COUNT).empty());
}

TEST_CASE("Disruptive and mutating flags") {
    ActionRegistry reg;
    REQUIRE(reg.valid());
    CHECK(reg.spec(CommandKind::REBOOT)->disruptive);
    CHECK(reg.spec(CommandKind::SHUTDOWN)->disruptive);
    CHECK_FALSE(reg.spec(CommandKind::RESET_GIMBAL)->disruptive);
    CHECK(reg.spec(CommandKind::RESET_GIMBAL)->mutating);
    CHECK(reg.spec(CommandKind::COUNT) == nullptr);
}

TEST_CASE("Registry resolves action paths back to kinds") {
    ActionRegistry reg;

    auto q = reg.resolve("hardware_version");
    REQUIRE(q.has_value());
    CHECK(q->type == ResolvedAction::Type::QUERY);
    CHECK(q->query == QueryKind::HARDWARE_VERSION);

    auto c = reg.resolve("command/reset_gimbal");
    REQUIRE(c.has_value());
    CHECK(c->type == ResolvedAction::Type::COMMAND);
    CHECK(c->command == CommandKind::RESET_GIMBAL);

    CHECK_FALSE(reg.resolve("reboot").has_value());          // command token outside command/
    CHECK_FALSE(reg.resolve("command/name").has_value());    // query token inside command/
    CHECK_FALSE(reg.resolve("command/").has_value());
    CHECK_FALSE(reg.resolve("firmware").has_value());
    CHECK_FALSE(reg.resolve("").has_value());
}

TEST_CASE("Registry token lists follow table order") {
    ActionRegistry reg;
    CHECK(reg.query_tokens() == "name id hardware_version");
    CHECK(reg.command_tokens() == "reboot shutdown reset_gimbal");
    CHECK(reg.find_query("id") == QueryKind::ID);
    CHECK_FALSE(reg.find_command("id").has_value());
}

TEST_CASE("Registry rejects duplicate tokens and paths") {
    SUBCASE("duplicate query token") {
        ActionRegistry reg({{QueryKind::NAME, "name", "name"}, {QueryKind::ID, "name", "id"}}, {});
        CHECK_FALSE(reg.valid());
        CHECK(reg.validation_error() == "duplicate_query_token:name");
    }
    SUBCASE("duplicate command token") {
        ActionRegistry reg({}, {{CommandKind::REBOOT, "reboot", "command/reboot", true, false},
                                {CommandKind::SHUTDOWN, "reboot", "command/shutdown", true, false}});
        CHECK_FALSE(reg.valid());
        CHECK(reg.validation_error() == "duplicate_command_token:reboot");
    }
    SUBCASE("duplicate path") {
        ActionRegistry reg({{QueryKind::NAME, "name", "name"}, {QueryKind::ID, "id", "name"}}, {});
        CHECK_FALSE(reg.valid());
        CHECK(reg.validation_error() == "duplicate_path:name");
    }
    SUBCASE("query inside command namespace") {
        ActionRegistry reg({{QueryKind::NAME, "name", "command/name"}}, {});
        CHECK_FALSE(reg.valid());
        CHECK(reg.validation_error() == "query_in_command_namespace:name");
    }
    SUBCASE("command outside command namespace") {
        ActionRegistry reg({}, {{CommandKind::REBOOT, "reboot", "reboot", true, false}});
        CHECK_FALSE(reg.valid());
        CHECK(reg.validation_error() == "command_outside_command_namespace:reboot");
    }
    SUBCASE("empty token") {
        ActionRegistry reg({{QueryKind::NAME, "", "name"}}, {});
        CHECK_FALSE(reg.valid());
        CHECK(reg.validation_error() == "empty_query_token");
    }
}
