#pragma once
/**
 * @page orbcomm-client orbcomm Client Orchestrator
 * @file client.hpp
 * @brief Discovery fan-in and addressed query/command requests.
 *
 * @details
 * PURPOSE
 * -------
 * The controller side of orbcomm. It owns no device state; every call
 * builds one request, collects replies for one bounded window and returns.
 *
 * OPERATIONS
 * ----------
 * - discover(timeout): one query on orb/discover, then collect for the
 *   *whole* window (the number of orbs is unknown). Ids are deduplicated.
 *   Nobody answering is an empty result, not an error.
 * - listen(timeout): passive variant, collects orb/presence announcements.
 * - query(id, kind, timeout): one addressed request, first reply wins,
 *   NO_RESPONSE if the window closes empty.
 * - command(id, kind, timeout): same, but an empty window is
 *   AMBIGUOUS_OUTCOME: the orb may have executed the command and gone down
 *   before it could answer.
 * - Token overloads resolve the token first and fail with UNKNOWN_ACTION
 *   before anything is sent.
 *
 * Malformed replies and transport failures are TRANSPORT_ERROR; failure
 * envelopes from the orb keep the orb's error kind and message.
 */

#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>

#include "orbcomm/actions.hpp"
#include "orbcomm/errors.hpp"
#include "orbcomm/identity.hpp"
#include "orbcomm/transport/transport_base.hpp"

namespace orbcomm {

inline constexpr std::chrono::milliseconds DEFAULT_DISCOVER_TIMEOUT{3000};
inline constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{1000};

struct DiscoveryResult {
  ErrorKind                             error = ErrorKind::NONE;
  std::string                           message;
  std::set<std::string>                 ids;
  std::map<std::string, DeviceIdentity> devices;   ///< keyed by id, last reply wins
  std::size_t                           malformed = 0;

  bool ok() const { return error == ErrorKind::NONE; }
};

class Client {
public:
  Client(const ActionRegistry& registry, transport::ITransport& transport);

  DiscoveryResult discover(std::chrono::milliseconds timeout = DEFAULT_DISCOVER_TIMEOUT);
  DiscoveryResult listen(std::chrono::milliseconds timeout = DEFAULT_DISCOVER_TIMEOUT);

  Outcome query(const std::string& device_id, QueryKind kind,
                std::chrono::milliseconds timeout = DEFAULT_REQUEST_TIMEOUT);
  Outcome query(const std::string& device_id, std::string_view token,
                std::chrono::milliseconds timeout = DEFAULT_REQUEST_TIMEOUT);

  Outcome command(const std::string& device_id, CommandKind kind,
                  std::chrono::milliseconds timeout = DEFAULT_REQUEST_TIMEOUT);
  Outcome command(const std::string& device_id, std::string_view token,
                  std::chrono::milliseconds timeout = DEFAULT_REQUEST_TIMEOUT);

private:
  Outcome request(const std::string& topic, bool side_effecting,
                  std::chrono::milliseconds timeout);

  const ActionRegistry&  registry_;
  transport::ITransport& transport_;
};

} // namespace orbcomm
