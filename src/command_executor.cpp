// ============================================================================
// command_executor.cpp : implementation for command_executor.hpp
// ============================================================================

#include "orbcomm/command_executor.hpp"
#include "orbcomm/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include <sys/wait.h>

namespace orbcomm {

static std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

ExecResult run_shell_command(const std::string& command) {
  // popen() runs through /bin/sh -c
  FILE* pipe = ::popen(command.c_str(), "r");
  if (!pipe)
    return ExecResult::failure("failed to start '" + command + "': " + std::strerror(errno));

  std::string out;
  char buf[256];
  std::size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) out.append(buf, n);   // drain stdout fully

  int status = ::pclose(pipe);                 // reaps the child
  if (status == -1)
    return ExecResult::failure("failed to wait for '" + command + "': " + std::strerror(errno));
  if (WIFSIGNALED(status))
    return ExecResult::failure("'" + command + "' killed by signal " + std::to_string(WTERMSIG(status)));
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    return ExecResult::failure("'" + command + "' failed with exit status " +
                               std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
  return ExecResult::success(trim(out));
}

ShellCommandExecutor::CommandLines ShellCommandExecutor::default_lines() {
  return {
    { CommandKind::REBOOT,       "sudo reboot" },
    { CommandKind::SHUTDOWN,     "shutdown now" },
    { CommandKind::RESET_GIMBAL, "" },   // no shell line; acknowledged in process
  };
}

ShellCommandExecutor::ShellCommandExecutor(CommandLines lines, bool dry_run)
  : lines_(std::move(lines)), dry_run_(dry_run) {}

const std::string* ShellCommandExecutor::line_for(CommandKind kind) const {
  auto it = lines_.find(kind);
  return it == lines_.end() ? nullptr : &it->second;
}

ExecResult ShellCommandExecutor::prepare(CommandKind kind) {
  const std::string* line = line_for(kind);
  if (!line || line->empty())
    return ExecResult::failure(std::string(token_of(kind)) + " is not configured on this orb");
  return ExecResult::success(*line);
}

ExecResult ShellCommandExecutor::execute(CommandKind kind) {
  const std::string* line = line_for(kind);
  const std::string  tok(token_of(kind));

  if (!line || line->empty()) {
    if (kind == CommandKind::RESET_GIMBAL)
      return ExecResult::success("Reset gimbal command executed successfully");
    return ExecResult::failure(tok + " is not configured on this orb");
  }

  if (dry_run_) {
    log::info("executor", "dry-run: would run '" + *line + "' for " + tok);
    return ExecResult::success("dry-run: " + *line);
  }

  log::info("executor", "running '" + *line + "' for " + tok);
  return run_shell_command(*line);
}

} // namespace orbcomm
