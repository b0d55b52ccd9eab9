// ============================================================================
// server.cpp : implementation for server.hpp
// For the request flow and state model see the header.
// ============================================================================

#include "orbcomm/server.hpp"
#include "orbcomm/log.hpp"
#include "orbcomm/topic.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace orbcomm {

static constexpr const char* COMP = "server";

const char* to_string(ServerState s) {
  switch (s) {
    case ServerState::IDLE:             return "idle";
    case ServerState::AWAITING_REQUEST: return "awaiting_request";
    case ServerState::HANDLING:         return "handling";
    case ServerState::STOPPED:          return "stopped";
  }
  return "idle";
}

Server::Server(DeviceIdentity identity,
               const ActionRegistry& registry,
               transport::ITransport& transport,
               CommandExecutor& executor,
               ServerOptions options)
  : identity_(std::move(identity)),
    registry_(registry),
    transport_(transport),
    executor_(executor),
    options_(options),
    inbox_(std::make_shared<Inbox>()) {}

Server::~Server() { stop(); }

// ---------- lifecycle ----------

bool Server::start(std::string& err) {
  if (phase_.load() != 0) { err = "server_already_started"; return false; }

  if (!registry_.valid()) { err = "invalid_registry:" + registry_.validation_error(); return false; }
  if (!valid_device_id(identity_.id)) { err = "invalid_device_id:" + identity_.id; return false; }

  {
    std::lock_guard<std::mutex> lk(inbox_->mu);
    inbox_->limit     = std::clamp<std::size_t>(options_.queue_limit, 1, QUEUE_CAP);
    inbox_->accepting = true;
    inbox_->stopping  = false;
  }

  const std::size_t n_workers = std::max<std::size_t>(1, options_.workers);
  for (std::size_t i = 0; i < n_workers; ++i)
    workers_.emplace_back([this] { worker_loop(); });

  // Callbacks hold the inbox, never `this`: a transport may still be
  // delivering into a snapshot of its handlers while we shut down.
  auto inbox = inbox_;
  auto on_request = [inbox](const transport::Request& r) { enqueue(*inbox, r); };

  const std::string topics[] = { std::string(DISCOVERY_TOPIC), device_wildcard(identity_.id) };
  for (const auto& t : topics) {
    transport::HandleId h = transport_.declare_queryable(t, on_request);
    if (h == 0) {
      err = "declare_failed:" + t;
      phase_ = 1;           // let stop() unwind workers and handles
      stop();
      return false;
    }
    handles_.push_back(h);
    log::info(COMP, "declared queryable " + t + " on " + transport_.name());
  }

  if (options_.announce_interval.count() > 0) {
    {
      std::lock_guard<std::mutex> lk(announce_mu_);
      announce_stop_ = false;
    }
    announcer_ = std::thread([this] { announce_loop(); });
  }

  phase_ = 1;
  log::info(COMP, "orb " + identity_.id + " ready with " + std::to_string(n_workers) + " worker(s)");
  return true;
}

void Server::stop() {
  if (phase_.load() == 2) return;
  if (phase_.load() == 0) { phase_ = 2; return; }

  for (auto h : handles_) transport_.undeclare(h);
  handles_.clear();

  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lk(inbox_->mu);
    inbox_->accepting = false;
    inbox_->stopping  = true;
    dropped = inbox_->queue.size();
    inbox_->queue.clear();
  }
  inbox_->cv.notify_all();

  {
    std::lock_guard<std::mutex> lk(announce_mu_);
    announce_stop_ = true;
  }
  announce_cv_.notify_all();

  for (auto& t : workers_)
    if (t.joinable()) t.join();
  workers_.clear();
  if (announcer_.joinable()) announcer_.join();

  phase_ = 2;
  if (dropped) log::warn(COMP, "abandoned " + std::to_string(dropped) + " queued request(s)");
  log::info(COMP, "orb " + identity_.id + " stopped");
}

ServerState Server::state() const {
  switch (phase_.load()) {
    case 0:  return ServerState::IDLE;
    case 2:  return ServerState::STOPPED;
    default: return in_flight_.load() > 0 ? ServerState::HANDLING : ServerState::AWAITING_REQUEST;
  }
}

// ---------- queueing ----------

bool Server::enqueue(Inbox& inbox, const transport::Request& request) {
  {
    std::lock_guard<std::mutex> lk(inbox.mu);
    if (inbox.accepting && !inbox.queue.full() && inbox.queue.size() < inbox.limit) {
      inbox.queue.push_back(request);
      inbox.cv.notify_one();
      return true;
    }
  }

  log::warn(COMP, "queue full, rejecting " + request.topic);
  if (request.reply) {
    const Reply busy = Reply::failure(ErrorKind::EXECUTION_ERROR, "server_busy");
    request.reply->reply(request.topic, encode_reply(busy));
  }
  return false;
}

bool Server::submit(const transport::Request& request) {
  return enqueue(*inbox_, request);
}

void Server::worker_loop() {
  Inbox& inbox = *inbox_;
  while (true) {
    transport::Request req;
    {
      std::unique_lock<std::mutex> lk(inbox.mu);
      inbox.cv.wait(lk, [&] { return inbox.stopping || !inbox.queue.empty(); });
      if (inbox.stopping) return;
      req = std::move(inbox.queue.front());
      inbox.queue.pop_front();
      ++in_flight_;
    }
    serve(req);
    --in_flight_;
  }
}

void Server::serve(const transport::Request& request) {
  log::debug(COMP, "handling " + request.topic);

  std::optional<CommandKind> deferred;
  Reply reply;
  try {
    reply = dispatch(request.topic, deferred);
  } catch (const std::exception& e) {
    log::error(COMP, "handler for " + request.topic + " threw: " + e.what());
    reply = Reply::failure(ErrorKind::EXECUTION_ERROR, e.what());
    deferred.reset();
  }

  if (request.reply) {
    try {
      if (!request.reply->reply(request.topic, wire_payload(request.topic, reply)))
        log::warn(COMP, "reply to " + request.topic + " was not delivered");
    } catch (const std::exception& e) {
      log::error(COMP, "reply to " + request.topic + " failed: " + e.what());   // worker keeps running
    }
  }

  // reply first, effect second: the effect may end this process
  if (deferred) run_deferred(*deferred);
}

// ---------- protocol ----------

std::string Server::wire_payload(const std::string& topic, const Reply& reply) {
  if (topic == DISCOVERY_TOPIC && reply.ok) return reply.payload;
  return encode_reply(reply);
}

Reply Server::handle(const std::string& topic) {
  std::optional<CommandKind> deferred;
  Reply reply;
  try {
    reply = dispatch(topic, deferred);
  } catch (const std::exception& e) {
    log::error(COMP, "handler for " + topic + " threw: " + e.what());
    return Reply::failure(ErrorKind::EXECUTION_ERROR, e.what());
  }
  if (deferred) run_deferred(*deferred);
  return reply;
}

Reply Server::dispatch(const std::string& topic, std::optional<CommandKind>& deferred) {
  if (topic == DISCOVERY_TOPIC) {
    log::debug(COMP, "discovery request");
    return Reply::success(encode_identity(identity_));
  }

  auto parts = parse_topic(topic);
  if (!parts)
    return Reply::failure(ErrorKind::UNKNOWN_ACTION, "unrecognized topic '" + topic + "'");
  if (parts->device_id != identity_.id)
    return Reply::failure(ErrorKind::UNKNOWN_ACTION, "topic is not addressed to orb " + identity_.id);

  auto action = registry_.resolve(parts->action_path);
  if (!action) {
    log::warn(COMP, "unknown action '" + parts->action_path + "'");
    return Reply::failure(ErrorKind::UNKNOWN_ACTION, "unknown action '" + parts->action_path + "'");
  }

  if (action->type == ResolvedAction::Type::QUERY) return resolve_query(action->query);
  return run_command(action->command, deferred);
}

Reply Server::resolve_query(QueryKind kind) const {
  switch (kind) {
    case QueryKind::NAME:             return Reply::success(identity_.name);
    case QueryKind::ID:               return Reply::success(identity_.id);
    case QueryKind::HARDWARE_VERSION: return Reply::success(identity_.hardware_version);
    case QueryKind::COUNT:            break;
  }
  return Reply::failure(ErrorKind::UNKNOWN_ACTION, "query has no value on this orb");
}

Reply Server::run_command(CommandKind kind, std::optional<CommandKind>& deferred) {
  const CommandSpec* spec = registry_.spec(kind);
  if (!spec) return Reply::failure(ErrorKind::UNKNOWN_ACTION, "command is not registered");
  const std::string tok(spec->token);

  log::info(COMP, "command " + tok + " received");

  if (spec->disruptive) {
    ExecResult pre = executor_.prepare(kind);
    if (!pre.ok) {
      log::warn(COMP, tok + " refused: " + pre.error);
      return Reply::failure(ErrorKind::EXECUTION_ERROR, pre.error);
    }
    deferred = kind;
    return Reply::success(tok + " accepted");
  }

  // A second mutating command is turned away instead of parking a worker
  // on the lock; parked workers would hold up queries behind them.
  std::unique_lock<std::mutex> lk(mutating_mu_, std::defer_lock);
  if (spec->mutating && !lk.try_lock()) {
    log::warn(COMP, tok + " rejected, another mutating command is running");
    return Reply::failure(ErrorKind::EXECUTION_ERROR, "server_busy");
  }

  ExecResult res = executor_.execute(kind);
  if (!res.ok) {
    log::warn(COMP, tok + " failed: " + res.error);
    return Reply::failure(ErrorKind::EXECUTION_ERROR, res.error);
  }
  log::info(COMP, tok + " done");
  return Reply::success(res.output.empty() ? tok + " done" : res.output);
}

void Server::run_deferred(CommandKind kind) {
  const std::string tok(token_of(kind));
  if (options_.effect_delay.count() > 0) std::this_thread::sleep_for(options_.effect_delay);

  try {
    ExecResult res = executor_.execute(kind);
    if (res.ok) log::info(COMP, tok + " initiated");
    else        log::error(COMP, tok + " failed after acknowledgement: " + res.error);
  } catch (const std::exception& e) {
    log::error(COMP, tok + " threw after acknowledgement: " + e.what());
  }
}

// ---------- presence ----------

void Server::announce_loop() {
  const std::string payload = encode_identity(identity_);   // identity never changes after start
  std::unique_lock<std::mutex> lk(announce_mu_);
  while (!announce_stop_) {
    lk.unlock();
    try {
      if (transport_.publish(std::string(PRESENCE_TOPIC), payload) != transport::TxResult::Ok)
        log::warn(COMP, "presence announcement failed");
    } catch (const std::exception& e) {
      log::error(COMP, std::string("presence announcement threw: ") + e.what());
    }
    lk.lock();
    announce_cv_.wait_for(lk, options_.announce_interval, [this] { return announce_stop_; });
  }
}

} // namespace orbcomm
