#pragma once
/**
 * @page orbcomm-server orbcomm Server Dispatcher
 * @file server.hpp
 * @brief Per-orb request dispatcher: discovery, queries and commands.
 *
 * @details
 * PURPOSE
 * -------
 * One Server runs inside every orb process. It owns the orb's identity and
 * is the only thing that answers requests addressed to that orb.
 *
 * WHAT THIS DOES
 * --------------
 * - start() declares two queryables on the transport:
 *     orb/discover        every request gets the DeviceIdentity back
 *     orb/<own_id>/**     queries and commands addressed to this orb
 * - Incoming requests are pushed into a bounded queue (ETL deque, no
 *   reallocation) and served by a fixed pool of worker threads, so a slow
 *   command never holds up a query from another client. A full queue is
 *   answered at once with `execution_error` / `server_busy`.
 * - Queries are pure lookups on the identity.
 * - Commands go through the CommandExecutor:
 *     * disruptive (reboot, shutdown): prepare(), reply, *then* execute()
 *       after `effect_delay` so the acknowledgement can leave the host;
 *     * others: execute(), then reply with the outcome;
 *     * mutating commands run one at a time; one that arrives while
 *       another is running is answered `execution_error` / `server_busy`
 *       and never executed.
 *   Executor failures and exceptions become failure replies; they never
 *   take the server down.
 * - Optionally announces its identity on orb/presence every
 *   `announce_interval`.
 *
 * STATES
 * ------
 *   IDLE -> start() -> AWAITING_REQUEST <-> HANDLING -> stop() -> STOPPED
 * HANDLING means at least one request is being worked on.
 *
 * EXAMPLE
 * -------
 * @code
 *   orbcomm::ActionRegistry registry;
 *   orbcomm::ShellCommandExecutor exec(orbcomm::ShellCommandExecutor::default_lines());
 *   orbcomm::Server server({"A1", "lab-orb", "EVT-2.3"}, registry, transport, exec);
 *   std::string err;
 *   if (!server.start(err)) { std::cerr << "status=error reason=" << err << "\n"; }
 * @endcode
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "etl/deque.h"

#include "orbcomm/actions.hpp"
#include "orbcomm/command_executor.hpp"
#include "orbcomm/identity.hpp"
#include "orbcomm/reply.hpp"
#include "orbcomm/transport/transport_base.hpp"

namespace orbcomm {

enum class ServerState { IDLE, AWAITING_REQUEST, HANDLING, STOPPED };

const char* to_string(ServerState s);

struct ServerOptions {
  std::size_t               workers           = 4;
  std::size_t               queue_limit       = 64;   ///< clamped to Server::QUEUE_CAP
  std::chrono::milliseconds announce_interval{0};     ///< 0 disables presence announcements
  std::chrono::milliseconds effect_delay{250};        ///< reply-to-effect gap for disruptive commands
};

class Server {
public:
  /// Hard capacity of the request queue.
  static constexpr std::size_t QUEUE_CAP = 64;

  Server(DeviceIdentity identity,
         const ActionRegistry& registry,
         transport::ITransport& transport,
         CommandExecutor& executor,
         ServerOptions options = {});
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * @brief Declare queryables and start workers (and the announcer).
   * @return false with `err` set if the registry is invalid, the identity
   *         id cannot be used in a topic or the transport refused a
   *         declaration.
   */
  bool start(std::string& err);

  /// Undeclare, stop accepting, join threads. Queued requests are dropped.
  void stop();

  ServerState           state() const;
  const DeviceIdentity& identity() const { return identity_; }

  /**
   * @brief Push one request into the worker queue.
   *
   * This is what the transport callbacks call. Returns false (after
   * replying `server_busy` on the request's channel) when the queue is
   * full or the server is not running.
   */
  bool submit(const transport::Request& request);

  /**
   * @brief Handle one request synchronously, without a transport.
   *
   * Returns the reply that would go on the wire. For the discovery topic
   * the reply payload is the encoded identity. Deferred effects of
   * disruptive commands run before this returns, after the reply has
   * been computed.
   */
  Reply handle(const std::string& topic);

  /// Wire payload for a reply: raw identity for discovery, envelope otherwise.
  static std::string wire_payload(const std::string& topic, const Reply& reply);

private:
  struct Inbox {
    std::mutex                                  mu;
    std::condition_variable                     cv;
    bool                                        accepting = false;
    bool                                        stopping  = false;
    std::size_t                                 limit     = QUEUE_CAP;
    etl::deque<transport::Request, QUEUE_CAP>   queue;
  };

  static bool enqueue(Inbox& inbox, const transport::Request& request);

  Reply dispatch(const std::string& topic, std::optional<CommandKind>& deferred);
  Reply resolve_query(QueryKind kind) const;
  Reply run_command(CommandKind kind, std::optional<CommandKind>& deferred);
  void  run_deferred(CommandKind kind);

  void worker_loop();
  void announce_loop();
  void serve(const transport::Request& request);

  DeviceIdentity         identity_;
  const ActionRegistry&  registry_;
  transport::ITransport& transport_;
  CommandExecutor&       executor_;
  ServerOptions          options_;

  std::shared_ptr<Inbox>         inbox_;
  std::vector<std::thread>       workers_;
  std::thread                    announcer_;
  std::vector<transport::HandleId> handles_;

  std::mutex              announce_mu_;
  std::condition_variable announce_cv_;
  bool                    announce_stop_ = false;

  std::mutex       mutating_mu_;   // one mutating command at a time
  std::atomic<int> in_flight_{0};
  std::atomic<int> phase_{0};      // 0 idle, 1 running, 2 stopped
};

} // namespace orbcomm
