// ============================================================================
// client.cpp : implementation for client.hpp
// ============================================================================

#include "orbcomm/client.hpp"
#include "orbcomm/log.hpp"
#include "orbcomm/reply.hpp"
#include "orbcomm/topic.hpp"

#include <memory>
#include <mutex>
#include <thread>

namespace orbcomm {

static constexpr const char* COMP = "client";

// Fold one identity payload into a discovery result.
static void absorb(DiscoveryResult& out, const std::string& payload) {
  auto id = decode_identity(payload);
  if (!id || !valid_device_id(id->id)) {
    ++out.malformed;                       // counted, never fatal
    log::debug(COMP, "ignoring malformed discovery payload");
    return;
  }
  if (out.ids.insert(id->id).second)
    log::debug(COMP, "discovered orb " + id->id);
  out.devices[id->id] = *id;               // last reply wins for metadata
}

Client::Client(const ActionRegistry& registry, transport::ITransport& transport)
  : registry_(registry), transport_(transport) {}

DiscoveryResult Client::discover(std::chrono::milliseconds timeout) {
  DiscoveryResult out;
  log::debug(COMP, "querying " + std::string(DISCOVERY_TOPIC));

  // max_replies = 0: keep collecting until the window closes
  auto qr = transport_.query(std::string(DISCOVERY_TOPIC), "", timeout, 0);
  if (qr.status != transport::TxResult::Ok) {
    out.error   = ErrorKind::TRANSPORT_ERROR;
    out.message = qr.error.empty() ? "discovery query failed" : qr.error;
    return out;
  }
  for (const auto& s : qr.replies) absorb(out, s.payload);
  return out;
}

DiscoveryResult Client::listen(std::chrono::milliseconds timeout) {
  struct Shared {
    std::mutex      mu;
    DiscoveryResult result;
  };
  auto shared = std::make_shared<Shared>();

  transport::HandleId h = transport_.subscribe(std::string(PRESENCE_TOPIC),
    [shared](const transport::Sample& s) {
      std::lock_guard<std::mutex> lk(shared->mu);   // handler runs on a transport thread
      absorb(shared->result, s.payload);
    });
  if (h == 0) {
    DiscoveryResult out;
    out.error   = ErrorKind::TRANSPORT_ERROR;
    out.message = "subscribe failed for " + std::string(PRESENCE_TOPIC);
    return out;
  }

  std::this_thread::sleep_for(timeout);   // announcements are periodic, just wait them out
  transport_.undeclare(h);

  std::lock_guard<std::mutex> lk(shared->mu);
  return shared->result;
}

Outcome Client::query(const std::string& device_id, QueryKind kind, std::chrono::milliseconds timeout) {
  if (!valid_device_id(device_id))
    return Outcome::failure(ErrorKind::UNKNOWN_ACTION, "invalid device id '" + device_id + "'");
  const std::string topic = registry_.topic(device_id, kind);
  if (topic.empty())
    return Outcome::failure(ErrorKind::UNKNOWN_ACTION, "query is not registered");
  return request(topic, /*side_effecting*/ false, timeout);
}

Outcome Client::query(const std::string& device_id, std::string_view token, std::chrono::milliseconds timeout) {
  auto kind = registry_.find_query(token);
  if (!kind)
    return Outcome::failure(ErrorKind::UNKNOWN_ACTION,
                            "unknown query '" + std::string(token) + "' (expected: " + registry_.query_tokens() + ")");
  return query(device_id, *kind, timeout);
}

Outcome Client::command(const std::string& device_id, CommandKind kind, std::chrono::milliseconds timeout) {
  if (!valid_device_id(device_id))
    return Outcome::failure(ErrorKind::UNKNOWN_ACTION, "invalid device id '" + device_id + "'");
  const std::string topic = registry_.topic(device_id, kind);
  if (topic.empty())
    return Outcome::failure(ErrorKind::UNKNOWN_ACTION, "command is not registered");
  return request(topic, /*side_effecting*/ true, timeout);
}

Outcome Client::command(const std::string& device_id, std::string_view token, std::chrono::milliseconds timeout) {
  auto kind = registry_.find_command(token);
  if (!kind)
    return Outcome::failure(ErrorKind::UNKNOWN_ACTION,
                            "unknown command '" + std::string(token) + "' (expected: " + registry_.command_tokens() + ")");
  return command(device_id, *kind, timeout);
}

Outcome Client::request(const std::string& topic, bool side_effecting, std::chrono::milliseconds timeout) {
  log::debug(COMP, "request " + topic);

  // one reply expected; anything after the first is ignored by the collector
  auto qr = transport_.query(topic, "", timeout, 1);
  if (qr.status != transport::TxResult::Ok)
    return Outcome::failure(ErrorKind::TRANSPORT_ERROR, qr.error.empty() ? "request failed" : qr.error);

  if (qr.replies.empty()) {
    if (side_effecting)
      return Outcome::failure(ErrorKind::AMBIGUOUS_OUTCOME,
                              "no reply from " + topic + "; the command may have been executed");
    return Outcome::failure(ErrorKind::NO_RESPONSE, "no reply from " + topic);
  }

  auto reply = decode_reply(qr.replies.front().payload);
  if (!reply)
    return Outcome::failure(ErrorKind::TRANSPORT_ERROR, "malformed reply from " + topic);

  if (reply->ok) return Outcome::success(reply->payload);
  return Outcome::failure(reply->error, reply->message);
}

} // namespace orbcomm
