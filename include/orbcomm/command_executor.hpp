#pragma once
/**
 * @file command_executor.hpp
 * @brief Side-effect seam for orb commands.
 *
 * @details
 * The server dispatcher decides *when* a command runs and how its outcome
 * is reported; a CommandExecutor decides *what* running it means. The
 * production executor runs configured shell lines (`sudo reboot`,
 * `shutdown now`, ...); tests plug in fakes that record calls or fail on
 * demand.
 *
 * Two-phase contract for disruptive commands:
 *   1) prepare(kind) checks the command can be attempted (configured,
 *      not refused). Its failure becomes an `execution_error` reply.
 *   2) the dispatcher replies, then calls execute(kind). A failure at this
 *      point can only be logged: the requester already has its answer.
 * Non-disruptive commands skip prepare() and report execute()'s result.
 *
 * Implementations must be callable from several worker threads at once.
 */

#include <map>
#include <string>
#include <utility>

#include "orbcomm/actions.hpp"

namespace orbcomm {

struct ExecResult {
  bool        ok = true;
  std::string output;   ///< trimmed stdout or acknowledgement text
  std::string error;    ///< human-readable reason when !ok

  static ExecResult success(std::string out) { ExecResult r; r.output = std::move(out); return r; }
  static ExecResult failure(std::string why) { ExecResult r; r.ok = false; r.error = std::move(why); return r; }
};

class CommandExecutor {
public:
  virtual ~CommandExecutor() = default;
  virtual ExecResult prepare(CommandKind kind) = 0;
  virtual ExecResult execute(CommandKind kind) = 0;
};

/**
 * @brief Run `sh -c <command>` and capture its trimmed stdout.
 *
 * Fails when the shell cannot be started or the command exits non-zero;
 * the error string names the command and its exit status.
 */
ExecResult run_shell_command(const std::string& command);

/**
 * @class ShellCommandExecutor
 * @brief Executor backed by configurable shell command lines.
 *
 * An empty line for a disruptive command means "not configured" and
 * prepare() refuses it. An empty line for a non-disruptive command is an
 * in-process acknowledgement (reset_gimbal has no host-side effect on
 * development machines). In dry-run mode nothing is executed; the line
 * that would have run is logged and reported as output.
 */
class ShellCommandExecutor : public CommandExecutor {
public:
  using CommandLines = std::map<CommandKind, std::string>;

  /// `sudo reboot`, `shutdown now`, empty for reset_gimbal.
  static CommandLines default_lines();

  explicit ShellCommandExecutor(CommandLines lines, bool dry_run = false);

  ExecResult prepare(CommandKind kind) override;
  ExecResult execute(CommandKind kind) override;

private:
  const std::string* line_for(CommandKind kind) const;

  CommandLines lines_;
  bool         dry_run_;
};

} // namespace orbcomm
