#pragma once
/**
 * @page orbcomm-actions orbcomm Action Registry
 * @file actions.hpp
 * @brief Closed sets of query and command kinds, their tokens and topic paths.
 *
 * @details
 * PURPOSE
 * -------
 * This is the single point of truth for "what can be asked of an orb".
 * The CLI resolves user tokens here, the client builds topics from here and
 * the server maps incoming topic paths back to kinds from here. Nothing else
 * in the code base spells a token or a topic suffix.
 *
 * WHAT THIS DOES
 * --------------
 * - Defines QueryKind (read-only lookups) and CommandKind (side effects).
 * - Holds one constexpr table row per kind: token, topic path and, for
 *   commands, the `disruptive` / `mutating` flags.
 * - Checks the tables at compile time: row order equals enum order, no row
 *   is missing, no token is used twice. A new enum value without its row
 *   fails the build.
 * - ActionRegistry wraps the tables for runtime use. It is built once at
 *   startup, re-validates whatever tables it was given and is then passed
 *   by reference to the server dispatcher and the client orchestrator.
 *
 * ADDING AN ACTION
 * ----------------
 *   1) Add the enum value before COUNT.
 *   2) Add the table row in the same position.
 *   3) For queries: return the value in Server::resolve_query().
 *      For commands: handle the kind in the CommandExecutor implementation.
 *      Mark the row `mutating` if the effect touches shared device state so
 *      the dispatcher serializes it.
 */

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orbcomm {

/// Read-only queries. COUNT is a sentinel, never a real kind.
enum class QueryKind {
  NAME,
  ID,
  HARDWARE_VERSION,
  COUNT
};

/// Side-effecting commands. COUNT is a sentinel, never a real kind.
enum class CommandKind {
  REBOOT,
  SHUTDOWN,
  RESET_GIMBAL,
  COUNT
};

struct QuerySpec {
  QueryKind        kind;
  std::string_view token;   ///< CLI token, e.g. "hardware_version"
  std::string_view path;    ///< topic suffix after "orb/<id>/"
};

struct CommandSpec {
  CommandKind      kind;
  std::string_view token;       ///< CLI token, e.g. "reset_gimbal"
  std::string_view path;        ///< topic suffix after "orb/<id>/"
  bool             disruptive;  ///< effect may end the process or the host
  bool             mutating;    ///< effect touches shared device state
};

inline constexpr std::size_t QUERY_KIND_COUNT   = static_cast<std::size_t>(QueryKind::COUNT);
inline constexpr std::size_t COMMAND_KIND_COUNT = static_cast<std::size_t>(CommandKind::COUNT);

inline constexpr std::array<QuerySpec, QUERY_KIND_COUNT> QUERY_TABLE = {{
  { QueryKind::NAME,             "name",             "name" },
  { QueryKind::ID,               "id",               "id" },
  { QueryKind::HARDWARE_VERSION, "hardware_version", "hardware_version" },
}};

inline constexpr std::array<CommandSpec, COMMAND_KIND_COUNT> COMMAND_TABLE = {{
  { CommandKind::REBOOT,       "reboot",       "command/reboot",       true,  false },
  { CommandKind::SHUTDOWN,     "shutdown",     "command/shutdown",     true,  false },
  { CommandKind::RESET_GIMBAL, "reset_gimbal", "command/reset_gimbal", false, true  },
}};

namespace detail {

// Row i must describe kind i and carry a non-empty token and path. A
// missing row is value-initialized (kind 0, empty token) and fails here.
template <typename Table>
constexpr bool table_is_dense(const Table& t) {
  for (std::size_t i = 0; i < t.size(); ++i) {
    if (static_cast<std::size_t>(t[i].kind) != i) return false;
    if (t[i].token.empty() || t[i].path.empty()) return false;
  }
  return true;
}

template <typename Table>
constexpr bool tokens_unique(const Table& t) {
  for (std::size_t i = 0; i < t.size(); ++i)
    for (std::size_t j = i + 1; j < t.size(); ++j)
      if (t[i].token == t[j].token || t[i].path == t[j].path) return false;
  return true;
}

// Query paths must never collide with the command namespace.
constexpr bool queries_outside_command_namespace() {
  for (const auto& q : QUERY_TABLE) {
    if (q.path == "command") return false;
    if (q.path.size() >= 8 && q.path.substr(0, 8) == "command/") return false;
  }
  return true;
}

} // namespace detail

static_assert(detail::table_is_dense(QUERY_TABLE),   "QUERY_TABLE must have one row per QueryKind, in enum order");
static_assert(detail::table_is_dense(COMMAND_TABLE), "COMMAND_TABLE must have one row per CommandKind, in enum order");
static_assert(detail::tokens_unique(QUERY_TABLE),    "duplicate query token or path");
static_assert(detail::tokens_unique(COMMAND_TABLE),  "duplicate command token or path");
static_assert(detail::queries_outside_command_namespace(), "query path inside command/ namespace");

/// Canonical token of a kind. COUNT yields an empty view.
std::string_view token_of(QueryKind kind);
std::string_view token_of(CommandKind kind);

/// Exact, case-sensitive token lookup against the built-in tables.
std::optional<QueryKind>   parse_query(std::string_view token);
std::optional<CommandKind> parse_command(std::string_view token);

/// "orb/<device_id>/<path>" for the given kind.
std::string topic_for(std::string_view device_id, QueryKind kind);
std::string topic_for(std::string_view device_id, CommandKind kind);

/// What an incoming action path resolved to.
struct ResolvedAction {
  enum class Type { QUERY, COMMAND };
  Type        type    = Type::QUERY;
  QueryKind   query   = QueryKind::COUNT;
  CommandKind command = CommandKind::COUNT;
};

/**
 * @class ActionRegistry
 * @brief Immutable, validated view of the action tables.
 *
 * Constructed once at startup (by default from QUERY_TABLE and
 * COMMAND_TABLE) and handed by reference to Server and Client. The
 * constructor repeats the table checks at runtime so that registries built
 * from other tables (tests, future protocol versions) get the same
 * guarantees; check valid() before use.
 *
 * Rows hold string_views: tokens and paths handed to the second
 * constructor must outlive the registry (string literals do).
 */
class ActionRegistry {
public:
  ActionRegistry();
  ActionRegistry(std::vector<QuerySpec> queries, std::vector<CommandSpec> commands);

  bool valid() const { return error_.empty(); }
  const std::string& validation_error() const { return error_; }

  const std::vector<QuerySpec>&   queries()  const { return queries_; }
  const std::vector<CommandSpec>& commands() const { return commands_; }

  std::optional<QueryKind>   find_query(std::string_view token) const;
  std::optional<CommandKind> find_command(std::string_view token) const;

  const QuerySpec*   spec(QueryKind kind) const;
  const CommandSpec* spec(CommandKind kind) const;

  std::string topic(std::string_view device_id, QueryKind kind) const;
  std::string topic(std::string_view device_id, CommandKind kind) const;

  /**
   * @brief Map an action path ("name", "command/reboot") back to a kind.
   *
   * Paths under "command/" only resolve to commands, every other path only
   * to queries. Returns std::nullopt for anything unregistered.
   */
  std::optional<ResolvedAction> resolve(std::string_view action_path) const;

  /// Space-separated token lists, for help texts and error messages.
  std::string query_tokens() const;
  std::string command_tokens() const;

private:
  void validate();

  std::vector<QuerySpec>   queries_;
  std::vector<CommandSpec> commands_;
  std::string              error_;
};

} // namespace orbcomm
