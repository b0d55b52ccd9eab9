#pragma once
/**
 * @file transport_loopback.hpp
 * @brief In-process transport: every LoopbackTransport attached to the same
 *        LoopbackBus sees the others' publications and queries.
 *
 * Used by the tests to run N servers and a client inside one process.
 * Delivery is synchronous on the publishing/querying thread; replies are
 * gathered in a ReplyCollector so handlers may answer later from their own
 * threads.
 */

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "orbcomm/transport/reply_collector.hpp"
#include "orbcomm/transport/transport_base.hpp"

namespace orbcomm::transport {

class LoopbackBus {
public:
  HandleId add_subscriber(const std::string& key_expr, SampleHandler handler);
  HandleId add_queryable(const std::string& key_expr, RequestHandler handler);
  void     remove(HandleId id);

  /// Deliver a put to every matching subscriber. Returns the match count.
  std::size_t deliver_put(const std::string& topic, const std::string& payload);

  /// Deliver a query to every matching queryable. Returns the match count.
  std::size_t deliver_query(const std::string& topic, const std::string& payload,
                            const std::shared_ptr<ReplyCollector>& collector);

  std::size_t declaration_count() const;

private:
  struct Entry {
    std::string    key_expr;
    SampleHandler  on_sample;
    RequestHandler on_request;
  };

  mutable std::mutex        mu_;
  std::map<HandleId, Entry> entries_;
  HandleId                  next_id_ = 1;
};

class LoopbackTransport : public ITransport {
public:
  explicit LoopbackTransport(std::shared_ptr<LoopbackBus> bus);
  ~LoopbackTransport() override;

  bool open(std::string& err) override;
  void close() override;

  TxResult publish(const std::string& topic, const std::string& payload) override;

  HandleId subscribe(const std::string& key_expr, SampleHandler handler) override;
  HandleId declare_queryable(const std::string& key_expr, RequestHandler handler) override;
  void     undeclare(HandleId id) override;

  QueryResult query(const std::string& topic, const std::string& payload,
                    std::chrono::milliseconds timeout, std::size_t max_replies) override;

  const char* name() const override { return "loopback"; }

private:
  std::shared_ptr<LoopbackBus> bus_;
  std::atomic<bool>            open_{false};
  std::mutex                   mu_;
  std::set<HandleId>           handles_;
};

} // namespace orbcomm::transport
