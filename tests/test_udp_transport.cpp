#include <doctest/doctest.h>
#include "orbcomm/transport/transport_udp.hpp"
#include "test_support.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>

using namespace orbcomm::transport;
using namespace orbcomm::testing;
using namespace std::chrono_literals;

namespace {

// Loopback-only group so parallel runs on a shared host stay apart.
UdpConfig local_config() {
    UdpConfig cfg;
    cfg.group = "239.255.0.47";
    cfg.port  = static_cast<uint16_t>(20000 + ::getpid() % 30000);
    cfg.iface = "127.0.0.1";
    cfg.ttl   = 1;
    return cfg;
}

// Opens both ends. False (with a MESSAGE) when this host cannot join the
// group on the loopback interface; callers then skip.
bool open_pair(UdpTransport& a, UdpTransport& b) {
    std::string err;
    if (!a.open(err) || !b.open(err)) {
        MESSAGE("skipping, multicast join on 127.0.0.1 failed: " << err);
        return false;
    }
    return true;
}

// Receive thread that fails on its first poll.
class BrokenPollTransport : public UdpTransport {
public:
    using UdpTransport::UdpTransport;
    ~BrokenPollTransport() override { close(); }

protected:
    int wait_readable(pollfd*, nfds_t, int) override {
        errno = EBADF;
        return -1;
    }
};

} // namespace

TEST_CASE("UDP puts reach subscribers in the group") {
    UdpTransport orb(local_config()), controller(local_config());
    if (!open_pair(orb, controller)) return;

    auto seen = std::make_shared<RecordingChannel>();
    REQUIRE(controller.subscribe("orb/presence", [seen](const Sample& s) {
        seen->reply(s.topic, s.payload);
    }) != 0);

    REQUIRE(orb.publish("orb/presence", R"({"id":"T1"})") == TxResult::Ok);
    REQUIRE(seen->wait_for(1, 2000ms));
    CHECK(seen->payloads().front() == R"({"id":"T1"})");
}

TEST_CASE("UDP query is answered unicast by the matching queryable") {
    UdpTransport orb(local_config()), controller(local_config());
    if (!open_pair(orb, controller)) return;

    REQUIRE(orb.declare_queryable("orb/T1/**", [](const Request& r) {
        r.reply->reply(r.topic, "lab-orb");
    }) != 0);

    auto start = std::chrono::steady_clock::now();
    QueryResult res = controller.query("orb/T1/name", "", 2000ms, 1);
    CHECK(res.status == TxResult::Ok);
    REQUIRE(res.replies.size() == 1);
    CHECK(res.replies[0].topic == "orb/T1/name");
    CHECK(res.replies[0].payload == "lab-orb");
    CHECK(elapsed_ms(start) < 1500);                 // returned on the first reply

    // nobody serves T2
    QueryResult none = controller.query("orb/T2/name", "", 200ms, 1);
    CHECK(none.status == TxResult::Ok);
    CHECK(none.replies.empty());
}

TEST_CASE("UDP query stops collecting at max_replies") {
    UdpTransport orb(local_config()), controller(local_config());
    if (!open_pair(orb, controller)) return;

    REQUIRE(orb.declare_queryable("orb/T1/**", [](const Request& r) {
        r.reply->reply(r.topic, "first");
        r.reply->reply(r.topic, "second");
    }) != 0);

    QueryResult one = controller.query("orb/T1/id", "", 500ms, 1);
    REQUIRE(one.replies.size() == 1);
    CHECK(one.replies[0].payload == "first");

    // the dropped reply does not leak into the next query
    QueryResult both = controller.query("orb/T1/id", "", 500ms, 0);
    REQUIRE(both.replies.size() == 2);
    CHECK(both.replies[0].payload == "first");
    CHECK(both.replies[1].payload == "second");
}

TEST_CASE("A failed receive loop turns queries into transport errors") {
    BrokenPollTransport broken(local_config());
    std::string err;
    if (!broken.open(err)) {
        MESSAGE("skipping, multicast join on 127.0.0.1 failed: " << err);
        return;
    }

    QueryResult res = broken.query("orb/T1/name", "", 500ms, 1);
    CHECK(res.status == TxResult::Error);
    CHECK(res.error == "receive_loop_failed");
    CHECK(res.replies.empty());

    CHECK(broken.query("orb/T1/name", "", 50ms, 1).error == "receive_loop_failed");
    CHECK(broken.publish("orb/presence", "{}") == TxResult::Error);

    broken.close();
    CHECK(broken.query("orb/T1/name", "", 50ms, 1).error == "transport_closed");
}
