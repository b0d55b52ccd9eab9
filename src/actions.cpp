// ============================================================================
// actions.cpp : implementation for actions.hpp
// For the table layout and the rules for adding actions see the header.
// ============================================================================

#include "orbcomm/actions.hpp"
#include "orbcomm/topic.hpp"

#include <set>
#include <utility>

namespace orbcomm {

// ---------- free functions over the built-in tables ----------

std::string_view token_of(QueryKind kind) {
  const auto i = static_cast<std::size_t>(kind);
  return i < QUERY_TABLE.size() ? QUERY_TABLE[i].token : std::string_view{};
}

std::string_view token_of(CommandKind kind) {
  const auto i = static_cast<std::size_t>(kind);
  return i < COMMAND_TABLE.size() ? COMMAND_TABLE[i].token : std::string_view{};
}

std::optional<QueryKind> parse_query(std::string_view token) {
  for (const auto& row : QUERY_TABLE)
    if (row.token == token) return row.kind;
  return std::nullopt;
}

std::optional<CommandKind> parse_command(std::string_view token) {
  for (const auto& row : COMMAND_TABLE)
    if (row.token == token) return row.kind;
  return std::nullopt;
}

std::string topic_for(std::string_view device_id, QueryKind kind) {
  const auto i = static_cast<std::size_t>(kind);
  if (i >= QUERY_TABLE.size()) return {};
  return device_topic(device_id, QUERY_TABLE[i].path);
}

std::string topic_for(std::string_view device_id, CommandKind kind) {
  const auto i = static_cast<std::size_t>(kind);
  if (i >= COMMAND_TABLE.size()) return {};
  return device_topic(device_id, COMMAND_TABLE[i].path);
}

// ---------- ActionRegistry ----------

ActionRegistry::ActionRegistry()
  : queries_(QUERY_TABLE.begin(), QUERY_TABLE.end()),
    commands_(COMMAND_TABLE.begin(), COMMAND_TABLE.end()) {
  validate();
}

ActionRegistry::ActionRegistry(std::vector<QuerySpec> queries, std::vector<CommandSpec> commands)
  : queries_(std::move(queries)), commands_(std::move(commands)) {
  validate();
}

// Same rules as the static_asserts in the header, plus the cross-table check
// that no query path lives under command/ and every command path does.
void ActionRegistry::validate() {
  std::set<std::string_view> seen_tokens;
  std::set<std::string_view> seen_paths;

  for (const auto& q : queries_) {
    if (q.token.empty() || q.path.empty()) { error_ = "empty_query_token"; return; }
    if (!seen_tokens.insert(q.token).second) {
      error_ = "duplicate_query_token:" + std::string(q.token);
      return;
    }
    if (!seen_paths.insert(q.path).second) {
      error_ = "duplicate_path:" + std::string(q.path);
      return;
    }
    if (q.path == COMMAND_SEGMENT || q.path.substr(0, COMMAND_SEGMENT.size() + 1) == "command/") {
      error_ = "query_in_command_namespace:" + std::string(q.token);
      return;
    }
  }

  seen_tokens.clear();
  for (const auto& c : commands_) {
    if (c.token.empty() || c.path.empty()) { error_ = "empty_command_token"; return; }
    if (!seen_tokens.insert(c.token).second) {
      error_ = "duplicate_command_token:" + std::string(c.token);
      return;
    }
    if (!seen_paths.insert(c.path).second) {
      error_ = "duplicate_path:" + std::string(c.path);
      return;
    }
    if (c.path.substr(0, COMMAND_SEGMENT.size() + 1) != "command/") {
      error_ = "command_outside_command_namespace:" + std::string(c.token);
      return;
    }
  }
}

std::optional<QueryKind> ActionRegistry::find_query(std::string_view token) const {
  for (const auto& q : queries_)
    if (q.token == token) return q.kind;
  return std::nullopt;
}

std::optional<CommandKind> ActionRegistry::find_command(std::string_view token) const {
  for (const auto& c : commands_)
    if (c.token == token) return c.kind;
  return std::nullopt;
}

const QuerySpec* ActionRegistry::spec(QueryKind kind) const {
  for (const auto& q : queries_)
    if (q.kind == kind) return &q;
  return nullptr;
}

const CommandSpec* ActionRegistry::spec(CommandKind kind) const {
  for (const auto& c : commands_)
    if (c.kind == kind) return &c;
  return nullptr;
}

std::string ActionRegistry::topic(std::string_view device_id, QueryKind kind) const {
  const QuerySpec* s = spec(kind);
  return s ? device_topic(device_id, s->path) : std::string{};
}

std::string ActionRegistry::topic(std::string_view device_id, CommandKind kind) const {
  const CommandSpec* s = spec(kind);
  return s ? device_topic(device_id, s->path) : std::string{};
}

std::optional<ResolvedAction> ActionRegistry::resolve(std::string_view action_path) const {
  const bool in_command_ns = action_path.substr(0, COMMAND_SEGMENT.size() + 1) == "command/";

  if (in_command_ns) {
    for (const auto& c : commands_) {
      if (c.path == action_path) {
        ResolvedAction r;
        r.type    = ResolvedAction::Type::COMMAND;
        r.command = c.kind;
        return r;
      }
    }
    return std::nullopt;
  }

  for (const auto& q : queries_) {
    if (q.path == action_path) {
      ResolvedAction r;
      r.type  = ResolvedAction::Type::QUERY;
      r.query = q.kind;
      return r;
    }
  }
  return std::nullopt;
}

std::string ActionRegistry::query_tokens() const {
  std::string out;
  for (const auto& q : queries_) {
    if (!out.empty()) out += ' ';
    out.append(q.token);
  }
  return out;
}

std::string ActionRegistry::command_tokens() const {
  std::string out;
  for (const auto& c : commands_) {
    if (!out.empty()) out += ' ';
    out.append(c.token);
  }
  return out;
}

} // namespace orbcomm
