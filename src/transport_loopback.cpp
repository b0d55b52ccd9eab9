// ============================================================================
// transport_loopback.cpp : implementation for transport_loopback.hpp
// ============================================================================

#include "orbcomm/transport/transport_loopback.hpp"
#include "orbcomm/topic.hpp"

#include <utility>
#include <vector>

namespace orbcomm::transport {

namespace {

// Reply path of one loopback query. Holds the collector weakly: once the
// querier returned, the collector is gone and replies are dropped.
class LoopbackReplyChannel : public ReplyChannel {
public:
  explicit LoopbackReplyChannel(std::weak_ptr<ReplyCollector> c) : collector_(std::move(c)) {}

  bool reply(const std::string& topic, const std::string& payload) override {
    auto c = collector_.lock();
    if (!c) return false;                  // querier already returned
    return c->add(Sample{topic, payload}); // false once full or closed
  }

private:
  std::weak_ptr<ReplyCollector> collector_;
};

} // namespace

// ---------- LoopbackBus ----------

HandleId LoopbackBus::add_subscriber(const std::string& key_expr, SampleHandler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  HandleId id = next_id_++;
  entries_[id] = Entry{key_expr, std::move(handler), nullptr};
  return id;
}

HandleId LoopbackBus::add_queryable(const std::string& key_expr, RequestHandler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  HandleId id = next_id_++;
  entries_[id] = Entry{key_expr, nullptr, std::move(handler)};
  return id;
}

void LoopbackBus::remove(HandleId id) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.erase(id);
}

std::size_t LoopbackBus::deliver_put(const std::string& topic, const std::string& payload) {
  // Snapshot handlers under the lock, call them outside it so a handler
  // may publish or declare without deadlocking.
  std::vector<SampleHandler> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : entries_)
      if (kv.second.on_sample && key_expr_matches(kv.second.key_expr, topic))
        targets.push_back(kv.second.on_sample);
  }
  const Sample s{topic, payload};
  for (auto& h : targets) h(s);
  return targets.size();
}

std::size_t LoopbackBus::deliver_query(const std::string& topic, const std::string& payload,
                                       const std::shared_ptr<ReplyCollector>& collector) {
  std::vector<RequestHandler> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : entries_)
      if (kv.second.on_request && key_expr_matches(kv.second.key_expr, topic))
        targets.push_back(kv.second.on_request);
  }
  for (auto& h : targets) {
    // every queryable gets its own channel, like every peer would on a network
    Request req{topic, payload, std::make_shared<LoopbackReplyChannel>(collector)};
    h(req);
  }
  return targets.size();
}

std::size_t LoopbackBus::declaration_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

// ---------- LoopbackTransport ----------

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackBus> bus) : bus_(std::move(bus)) {}

LoopbackTransport::~LoopbackTransport() { close(); }

bool LoopbackTransport::open(std::string& err) {
  if (!bus_) { err = "no_bus"; return false; }
  open_ = true;                            // nothing else to set up in-process
  return true;
}

void LoopbackTransport::close() {
  open_ = false;
  std::set<HandleId> handles;
  {
    std::lock_guard<std::mutex> lk(mu_);
    handles.swap(handles_);                // take ownership, release the lock
  }
  if (bus_)
    for (HandleId id : handles) bus_->remove(id);
}

TxResult LoopbackTransport::publish(const std::string& topic, const std::string& payload) {
  if (!open_) return TxResult::Error;
  bus_->deliver_put(topic, payload);
  return TxResult::Ok;
}

HandleId LoopbackTransport::subscribe(const std::string& key_expr, SampleHandler handler) {
  if (!open_ || !handler) return 0;
  HandleId id = bus_->add_subscriber(key_expr, std::move(handler));
  std::lock_guard<std::mutex> lk(mu_);
  handles_.insert(id);
  return id;
}

HandleId LoopbackTransport::declare_queryable(const std::string& key_expr, RequestHandler handler) {
  if (!open_ || !handler) return 0;
  HandleId id = bus_->add_queryable(key_expr, std::move(handler));
  std::lock_guard<std::mutex> lk(mu_);
  handles_.insert(id);
  return id;
}

void LoopbackTransport::undeclare(HandleId id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (handles_.erase(id) == 0) return;
  }
  bus_->remove(id);
}

QueryResult LoopbackTransport::query(const std::string& topic, const std::string& payload,
                                     std::chrono::milliseconds timeout, std::size_t max_replies) {
  QueryResult result;
  if (!open_) {
    result.status = TxResult::Error;
    result.error  = "transport_closed";
    return result;
  }
  auto collector = std::make_shared<ReplyCollector>(max_replies);
  bus_->deliver_query(topic, payload, collector);   // handlers may reply synchronously
  result.replies = collector->wait(timeout);
  return result;
}

} // namespace orbcomm::transport
