#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the orbcomm client, server and CLI tools.
 *
 * @details
 * Every failure that crosses a module boundary is reduced to one ErrorKind.
 * Each kind has a stable snake_case token which is used both on the wire
 * (inside reply envelopes) and in CLI output (`status=error reason=<token>`),
 * so scripts can act on it.
 *
 * | Kind              | Raised by | Meaning                                              |
 * |-------------------|-----------|------------------------------------------------------|
 * | UNKNOWN_ACTION    | both      | token or topic path does not name a registered action |
 * | NO_RESPONSE       | client    | addressed query got zero replies inside the timeout   |
 * | EXECUTION_ERROR   | server    | the action was understood but its effect failed       |
 * | AMBIGUOUS_OUTCOME | client    | command got no reply; it may or may not have run      |
 * | TRANSPORT_ERROR   | client    | socket failure or undecodable frame/reply             |
 */

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace orbcomm {

enum class ErrorKind {
  NONE,
  UNKNOWN_ACTION,
  NO_RESPONSE,
  EXECUTION_ERROR,
  AMBIGUOUS_OUTCOME,
  TRANSPORT_ERROR
};

/// Stable token for an error kind ("none", "unknown_action", ...).
const char* to_token(ErrorKind kind);

/// Inverse of to_token(); std::nullopt for unknown tokens.
std::optional<ErrorKind> error_from_token(std::string_view token);

/// Process exit status used by the orbcomm CLI for a kind (0 for NONE).
int exit_code_for(ErrorKind kind);

/**
 * @brief Result of a client-side addressed request.
 *
 * On success `value` holds the reply payload (query value or command
 * acknowledgement). On failure `error` names the kind and `message`
 * carries the human-readable detail.
 */
struct Outcome {
  ErrorKind   error = ErrorKind::NONE;
  std::string value;
  std::string message;

  bool ok() const { return error == ErrorKind::NONE; }

  static Outcome success(std::string value) {
    Outcome o;
    o.value = std::move(value);
    return o;
  }

  static Outcome failure(ErrorKind kind, std::string message) {
    Outcome o;
    o.error   = kind;
    o.message = std::move(message);
    return o;
  }
};

} // namespace orbcomm
