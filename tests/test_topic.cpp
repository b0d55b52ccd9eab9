#include <doctest/doctest.h>
#include "orbcomm/topic.hpp"

#include <string>

using namespace orbcomm;

TEST_CASE("Device ids that would break the topic layout are rejected") {
    CHECK(valid_device_id("A1"));
    CHECK(valid_device_id("orb-0042_dev.1"));
    CHECK(valid_device_id(std::string(DEVICE_ID_MAX, 'x')));

    CHECK_FALSE(valid_device_id(""));
    CHECK_FALSE(valid_device_id(std::string(DEVICE_ID_MAX + 1, 'x')));
    CHECK_FALSE(valid_device_id("a/b"));
    CHECK_FALSE(valid_device_id("a*"));
    CHECK_FALSE(valid_device_id("$sys"));
    CHECK_FALSE(valid_device_id("what?"));
    CHECK_FALSE(valid_device_id("a#b"));
    CHECK_FALSE(valid_device_id("has space"));
    CHECK_FALSE(valid_device_id("tab\there"));
    CHECK_FALSE(valid_device_id(std::string("nul\x01", 4)));
}

TEST_CASE("Broadcast topic names cannot be used as device ids") {
    CHECK_FALSE(valid_device_id("discover"));
    CHECK_FALSE(valid_device_id("presence"));

    // only the exact chunk is reserved
    CHECK(valid_device_id("discover2"));
    CHECK(valid_device_id("Presence"));
    CHECK(key_expr_matches(device_wildcard("discover"), DISCOVERY_TOPIC));
}

TEST_CASE("Addressed topics split into device id and action path") {
    auto p = parse_topic("orb/A1/name");
    REQUIRE(p.has_value());
    CHECK(p->device_id == "A1");
    CHECK(p->action_path == "name");

    auto c = parse_topic("orb/A1/command/reboot");
    REQUIRE(c.has_value());
    CHECK(c->device_id == "A1");
    CHECK(c->action_path == "command/reboot");

    CHECK(device_topic(p->device_id, p->action_path) == "orb/A1/name");
}

TEST_CASE("Non-addressed or malformed topics do not parse") {
    CHECK_FALSE(parse_topic("orb/discover").has_value());
    CHECK_FALSE(parse_topic("orb/presence").has_value());
    CHECK_FALSE(parse_topic("orb/A1/").has_value());
    CHECK_FALSE(parse_topic("orb//name").has_value());
    CHECK_FALSE(parse_topic("orbs/A1/name").has_value());
    CHECK_FALSE(parse_topic("bus/A1/name").has_value());
    CHECK_FALSE(parse_topic("orb").has_value());
    CHECK_FALSE(parse_topic("").has_value());
}

TEST_CASE("Key expressions: literal, single and multi chunk wildcards") {
    CHECK(key_expr_matches("orb/discover", "orb/discover"));
    CHECK_FALSE(key_expr_matches("orb/discover", "orb/discovery"));

    CHECK(key_expr_matches("orb/A1/*", "orb/A1/name"));
    CHECK_FALSE(key_expr_matches("orb/A1/*", "orb/A1/command/reboot"));
    CHECK_FALSE(key_expr_matches("orb/A1/*", "orb/A1/"));
    CHECK_FALSE(key_expr_matches("orb/*", "orb/A1/name"));

    CHECK(key_expr_matches("orb/A1/**", "orb/A1/name"));
    CHECK(key_expr_matches("orb/A1/**", "orb/A1/command/reboot"));
    CHECK(key_expr_matches("orb/A1/**", "orb/A1"));
    CHECK_FALSE(key_expr_matches("orb/A1/**", "orb/A10/name"));
    CHECK_FALSE(key_expr_matches("orb/A1/**", "orb/B2/name"));

    CHECK(key_expr_matches(device_wildcard("A1"), "orb/A1/hardware_version"));
    CHECK(key_expr_matches("orb/**/reboot", "orb/A1/command/reboot"));
    CHECK(key_expr_matches("**", "orb/anything/at/all"));
    CHECK_FALSE(key_expr_matches("", "orb/A1"));
    CHECK_FALSE(key_expr_matches("orb/**", ""));
}
