#pragma once
/**
 * @file transport_udp.hpp
 * @brief UDP multicast transport for orbs sharing one LAN segment.
 *
 * WIRE FORMAT
 * -----------
 * One JSON object per datagram, at most MAX_FRAME bytes:
 *
 *   {"v":1, "k":"put"|"query"|"reply", "t":"<topic>", "p":"<payload>", "q":"<query id>"}
 *
 * Puts and queries are sent to the multicast group from the transport's
 * unicast socket. Queryables answer with a "reply" frame sent unicast to
 * the query's source address, so replies never flood the group.
 *
 * THREADING
 * ---------
 * open() starts one receive thread which polls both sockets. Handlers run
 * on that thread; long work must be handed off (the Server queues it).
 * If polling fails the thread exits, pending queries end early and every
 * later publish() and query() fails with "receive_loop_failed" until the
 * transport is closed and opened again.
 */

#include <netinet/in.h>
#include <poll.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "orbcomm/transport/reply_collector.hpp"
#include "orbcomm/transport/transport_base.hpp"

namespace orbcomm::transport {

struct UdpConfig {
  std::string group = "239.255.0.47";
  uint16_t    port  = 7447;
  std::string iface = "0.0.0.0";   ///< local IPv4 address of the interface to use
  int         ttl   = 1;
};

inline constexpr std::size_t MAX_FRAME = 8192;
inline constexpr int         FRAME_VERSION = 1;

/// One decoded datagram.
struct Frame {
  enum class Kind { PUT, QUERY, REPLY };
  Kind        kind = Kind::PUT;
  std::string topic;
  std::string payload;
  std::string query_id;
};

/// Serialize a frame. Empty string if it would exceed MAX_FRAME.
std::string encode_frame(const Frame& f);

/// Parse a datagram; std::nullopt for anything that is not a valid v1 frame.
std::optional<Frame> decode_frame(const std::string& text);

class UdpTransport : public ITransport {
public:
  explicit UdpTransport(UdpConfig cfg);
  ~UdpTransport() override;

  bool open(std::string& err) override;
  void close() override;

  TxResult publish(const std::string& topic, const std::string& payload) override;

  HandleId subscribe(const std::string& key_expr, SampleHandler handler) override;
  HandleId declare_queryable(const std::string& key_expr, RequestHandler handler) override;
  void     undeclare(HandleId id) override;

  QueryResult query(const std::string& topic, const std::string& payload,
                    std::chrono::milliseconds timeout, std::size_t max_replies) override;

  const char* name() const override { return "udp"; }

  /// Shared with reply channels so they stay safe after close().
  struct Socket {
    std::mutex mu;
    int        fd = -1;
  };

protected:
  /// poll(2) over the two sockets. Returns what poll returns, errno included.
  virtual int wait_readable(pollfd* fds, nfds_t count, int timeout_ms);

private:
  void rx_loop();
  void fail_rx(const std::string& why);
  void on_group_frame(const Frame& f, const void* src, unsigned src_len);
  void on_unicast_frame(const Frame& f);
  bool send_to_group(const std::string& wire);

  UdpConfig cfg_;

  sockaddr_in             group_dest_{};
  int                     mcast_fd_ = -1;
  std::shared_ptr<Socket> ucast_;
  std::thread             rx_;
  std::atomic<bool>       running_{false};
  std::atomic<bool>       rx_failed_{false};   // receive thread gave up

  struct Entry {
    std::string    key_expr;
    SampleHandler  on_sample;
    RequestHandler on_request;
  };

  std::mutex                 mu_;
  std::map<HandleId, Entry>  entries_;
  HandleId                   next_id_ = 1;

  std::mutex                                             pending_mu_;
  std::map<std::string, std::shared_ptr<ReplyCollector>> pending_;
  std::string                                            qid_prefix_;
  std::atomic<uint64_t>                                  qid_seq_{0};
};

} // namespace orbcomm::transport
