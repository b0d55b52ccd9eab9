#include <doctest/doctest.h>
#include "orbcomm/transport/transport_udp.hpp"

#include <string>

using namespace orbcomm::transport;

TEST_CASE("Query frames keep topic, payload and query id") {
    Frame f;
    f.kind     = Frame::Kind::QUERY;
    f.topic    = "orb/A1/name";
    f.query_id = "ab12-7";

    const std::string wire = encode_frame(f);
    REQUIRE_FALSE(wire.empty());
    auto back = decode_frame(wire);
    REQUIRE(back.has_value());
    CHECK(back->kind == Frame::Kind::QUERY);
    CHECK(back->topic == "orb/A1/name");
    CHECK(back->payload.empty());
    CHECK(back->query_id == "ab12-7");
}

TEST_CASE("Frames that are not v1 orbcomm frames are dropped") {
    CHECK_FALSE(decode_frame("").has_value());
    CHECK_FALSE(decode_frame("hello").has_value());
    CHECK_FALSE(decode_frame(R"({"v":2,"k":"put","t":"orb/presence"})").has_value());
    CHECK_FALSE(decode_frame(R"({"v":1,"k":"shout","t":"orb/presence"})").has_value());
    CHECK_FALSE(decode_frame(R"({"v":1,"k":"put","t":""})").has_value());
    CHECK_FALSE(decode_frame(R"({"v":1,"k":"put","t":"x","p":3})").has_value());
    CHECK_FALSE(decode_frame(R"({"v":1,"k":"query","t":"orb/discover"})").has_value());   // no id
    CHECK_FALSE(decode_frame(R"({"v":1,"k":"reply","t":"orb/discover","q":""})").has_value());

    auto put = decode_frame(R"({"v":1,"k":"put","t":"orb/presence","p":"{}"})");
    REQUIRE(put.has_value());
    CHECK(put->kind == Frame::Kind::PUT);
}

TEST_CASE("Oversized frames are refused on both ends") {
    Frame f;
    f.kind    = Frame::Kind::PUT;
    f.topic   = "orb/presence";
    f.payload = std::string(MAX_FRAME, 'x');
    CHECK(encode_frame(f).empty());
    CHECK_FALSE(decode_frame(std::string(MAX_FRAME + 1, ' ')).has_value());
}

TEST_CASE("UDP transport refuses a non-multicast group") {
    UdpConfig cfg;
    cfg.group = "10.0.0.1";
    UdpTransport t(cfg);
    std::string err;
    CHECK_FALSE(t.open(err));
    CHECK(err.find("invalid multicast group") != std::string::npos);
    CHECK(t.query("orb/discover", "", std::chrono::milliseconds(10), 0).status == TxResult::Error);
    CHECK(t.publish("orb/presence", "{}") == TxResult::Error);
}

TEST_CASE("Frames with text that is not UTF-8 still encode") {
    Frame f;
    f.kind     = Frame::Kind::REPLY;
    f.topic    = "orb/A1/name";
    f.payload  = "lab\xff" "orb";
    f.query_id = "q-1";

    std::string wire;
    CHECK_NOTHROW(wire = encode_frame(f));
    auto back = decode_frame(wire);
    REQUIRE(back.has_value());
    CHECK(back->payload == "lab\xEF\xBF\xBD" "orb");
    CHECK(back->query_id == "q-1");
}
