#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal pub/sub-and-query transport interface used by orbcomm.
 *
 * The protocol layer (Server, Client) only talks to ITransport. Concrete
 * transports: LoopbackTransport (in-process bus) and UdpTransport (UDP
 * multicast on a flat LAN segment).
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace orbcomm::transport {

// Return codes kept simple, same shape for every transport.
enum class TxResult : uint8_t { Ok = 0, Error = 1 };

/// A published value or a reply to a query.
struct Sample {
  std::string topic;
  std::string payload;
};

/**
 * @brief One-shot path back to the requester of a single query.
 *
 * Thread-safe. A channel may be used from any thread, including after the
 * handler that received it has returned. Replies arriving after the
 * requester stopped collecting are dropped and reply() returns false.
 */
class ReplyChannel {
public:
  virtual ~ReplyChannel() = default;
  virtual bool reply(const std::string& topic, const std::string& payload) = 0;
};

using ReplyChannelPtr = std::shared_ptr<ReplyChannel>;

/// An incoming query as seen by a queryable.
struct Request {
  std::string     topic;
  std::string     payload;
  ReplyChannelPtr reply;
};

using SampleHandler  = std::function<void(const Sample&)>;
using RequestHandler = std::function<void(const Request&)>;

/// Declaration handle. 0 means "declaration failed".
using HandleId = uint64_t;

struct QueryResult {
  TxResult            status = TxResult::Ok;
  std::string         error;      ///< set when status != Ok
  std::vector<Sample> replies;    ///< in arrival order
};

/**
 * @brief Transport trait the protocol layer relies on.
 *
 * Contract:
 *  - open() prepares sockets/threads; returns false and fills err on failure.
 *  - close() stops delivery; handlers are not called after close() returns.
 *  - publish() is fire-and-forget to every matching subscriber.
 *  - subscribe() registers a handler for puts matching a key expression.
 *  - declare_queryable() registers a handler for queries matching a key
 *    expression; each query carries its own ReplyChannel.
 *  - query() sends one request and collects replies until `max_replies`
 *    arrived (0 = no limit) or `timeout` elapsed, whichever comes first.
 *    Zero replies is a successful, empty result.
 *  - Handlers run on transport threads and must not block for long.
 *  - name() is a short identifier for logs.
 */
class ITransport {
public:
  virtual ~ITransport() = default;

  virtual bool open(std::string& err) = 0;
  virtual void close() = 0;

  virtual TxResult publish(const std::string& topic, const std::string& payload) = 0;

  virtual HandleId subscribe(const std::string& key_expr, SampleHandler handler) = 0;
  virtual HandleId declare_queryable(const std::string& key_expr, RequestHandler handler) = 0;
  virtual void     undeclare(HandleId id) = 0;

  virtual QueryResult query(const std::string& topic, const std::string& payload,
                            std::chrono::milliseconds timeout, std::size_t max_replies) = 0;

  virtual const char* name() const = 0;
};

} // namespace orbcomm::transport
