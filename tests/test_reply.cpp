#include <doctest/doctest.h>
#include "orbcomm/errors.hpp"
#include "orbcomm/reply.hpp"

using namespace orbcomm;

TEST_CASE("Error tokens are stable and parse back") {
    const ErrorKind all[] = {ErrorKind::NONE, ErrorKind::UNKNOWN_ACTION, ErrorKind::NO_RESPONSE,
                             ErrorKind::EXECUTION_ERROR, ErrorKind::AMBIGUOUS_OUTCOME,
                             ErrorKind::TRANSPORT_ERROR};
    for (ErrorKind k : all) {
        auto back = error_from_token(to_token(k));
        REQUIRE(back.has_value());
        CHECK(*back == k);
    }
    CHECK(std::string(to_token(ErrorKind::AMBIGUOUS_OUTCOME)) == "ambiguous_outcome");
    CHECK_FALSE(error_from_token("Timeout").has_value());
}

TEST_CASE("CLI exit codes per error kind") {
    CHECK(exit_code_for(ErrorKind::NONE) == 0);
    CHECK(exit_code_for(ErrorKind::TRANSPORT_ERROR) == 1);
    CHECK(exit_code_for(ErrorKind::UNKNOWN_ACTION) == 2);
    CHECK(exit_code_for(ErrorKind::NO_RESPONSE) == 3);
    CHECK(exit_code_for(ErrorKind::AMBIGUOUS_OUTCOME) == 4);
    CHECK(exit_code_for(ErrorKind::EXECUTION_ERROR) == 5);
}

TEST_CASE("Reply envelope carries success and failure") {
    auto ok = decode_reply(encode_reply(Reply::success("EVT-2.3")));
    REQUIRE(ok.has_value());
    CHECK(ok->ok);
    CHECK(ok->payload == "EVT-2.3");
    CHECK(ok->error == ErrorKind::NONE);

    auto bad = decode_reply(encode_reply(Reply::failure(ErrorKind::EXECUTION_ERROR, "exit 1")));
    REQUIRE(bad.has_value());
    CHECK_FALSE(bad->ok);
    CHECK(bad->error == ErrorKind::EXECUTION_ERROR);
    CHECK(bad->message == "exit 1");
    CHECK(bad->payload.empty());
}

TEST_CASE("Inconsistent or malformed envelopes are rejected") {
    CHECK_FALSE(decode_reply("").has_value());
    CHECK_FALSE(decode_reply("not json").has_value());
    CHECK_FALSE(decode_reply("[1,2]").has_value());
    CHECK_FALSE(decode_reply(R"({"payload":"x"})").has_value());                      // no ok
    CHECK_FALSE(decode_reply(R"({"ok":"yes"})").has_value());
    CHECK_FALSE(decode_reply(R"({"ok":true,"payload":5})").has_value());
    CHECK_FALSE(decode_reply(R"({"ok":true,"error":"execution_error"})").has_value());
    CHECK_FALSE(decode_reply(R"({"ok":false,"error":"none"})").has_value());
    CHECK_FALSE(decode_reply(R"({"ok":false})").has_value());
    CHECK_FALSE(decode_reply(R"({"ok":false,"error":"meltdown"})").has_value());

    // minimal success envelope
    auto min = decode_reply(R"({"ok":true})");
    REQUIRE(min.has_value());
    CHECK(min->payload.empty());
}

TEST_CASE("Identity payload keeps optional metadata optional") {
    DeviceIdentity full{"A1", "lab-orb", "EVT-2.3"};
    auto back = decode_identity(encode_identity(full));
    REQUIRE(back.has_value());
    CHECK(*back == full);

    DeviceIdentity bare{"B2", "", ""};
    CHECK(encode_identity(bare) == R"({"id":"B2"})");
    auto b = decode_identity(R"({"id":"B2","name":7})");
    REQUIRE(b.has_value());
    CHECK(b->id == "B2");
    CHECK(b->name.empty());

    CHECK_FALSE(decode_identity(R"({"id":""})").has_value());
    CHECK_FALSE(decode_identity(R"({"name":"x"})").has_value());
    CHECK_FALSE(decode_identity("{").has_value());
}

TEST_CASE("Encoding text that is not UTF-8 substitutes instead of throwing") {
    const std::string bad = "lab\xff" "orb";

    std::string wire;
    CHECK_NOTHROW(wire = encode_reply(Reply::success(bad)));
    auto r = decode_reply(wire);
    REQUIRE(r.has_value());
    CHECK(r->payload == "lab\xEF\xBF\xBD" "orb");   // U+FFFD

    CHECK_NOTHROW(wire = encode_identity({"A1", bad, "EVT\xC0"}));
    auto id = decode_identity(wire);
    REQUIRE(id.has_value());
    CHECK(id->id == "A1");
    CHECK(id->name == "lab\xEF\xBF\xBD" "orb");
}

TEST_CASE("UTF-8 validation") {
    CHECK(valid_utf8(""));
    CHECK(valid_utf8("lab-orb"));
    CHECK(valid_utf8("caf\xC3\xA9"));                 // e acute
    CHECK(valid_utf8("\xE2\x82\xAC"));               // euro sign
    CHECK(valid_utf8("\xF0\x9F\x94\xAD"));           // 4-byte sequence

    CHECK_FALSE(valid_utf8("lab\xff" "orb"));
    CHECK_FALSE(valid_utf8("\x80"));                   // stray continuation
    CHECK_FALSE(valid_utf8("\xC3"));                   // truncated
    CHECK_FALSE(valid_utf8("\xC0\xAF"));               // overlong '/'
    CHECK_FALSE(valid_utf8("\xED\xA0\x80"));           // surrogate half
    CHECK_FALSE(valid_utf8("\xF4\x90\x80\x80"));       // above U+10FFFF
}
