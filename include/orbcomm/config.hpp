#pragma once
/**
 * @file config.hpp
 * @brief Layered configuration for the orbcommd daemon.
 *
 * @details
 * Layers, lowest first:
 *   1) built-in defaults (DaemonConfig{})
 *   2) JSON config file (--config, or default_config_path() when present)
 *   3) environment: ORB_ID
 *   4) command-line flags (applied by orbcommd itself)
 *
 * Identity fields are either a literal value or a shell command whose
 * trimmed stdout is the value. A failing or silent command falls back to
 * the field's default and logs a warning.
 *
 * Config file example:
 * @code
 *   {
 *     "id_command": "orb-id",
 *     "name": "lab-orb",
 *     "transport": { "group": "239.255.0.47", "port": 7447, "iface": "0.0.0.0" },
 *     "workers": 4,
 *     "announce_interval_ms": 1000,
 *     "commands": { "reset_gimbal": "gimbalctl reset" },
 *     "log_level": "info"
 *   }
 * @endcode
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "orbcomm/command_executor.hpp"
#include "orbcomm/identity.hpp"
#include "orbcomm/server.hpp"
#include "orbcomm/transport/transport_udp.hpp"

namespace orbcomm {

/// One identity field: literal value wins over command, command over fallback.
struct IdentitySource {
  std::string value;
  std::string command;
  std::string fallback;
};

struct DaemonConfig {
  IdentitySource id               {"", "orb-id",                             "UnknownOrb"};
  IdentitySource name             {"", "cat /usr/persistent/orb-name",        "DevOrb"};
  IdentitySource hardware_version {"", "cat /usr/persistent/hardware_version", "UnknownHWVersion"};

  transport::UdpConfig udp;

  std::size_t workers              = 4;
  std::size_t queue_limit          = Server::QUEUE_CAP;
  long        announce_interval_ms = 1000;
  long        effect_delay_ms      = 250;

  ShellCommandExecutor::CommandLines commands = ShellCommandExecutor::default_lines();
  bool        dry_run   = false;
  std::string log_level = "info";
};

/// $XDG_CONFIG_HOME/orbcomm/orbcommd.json (or ~/.config/...). Empty if neither is set.
std::string default_config_path();

/**
 * @brief Overlay a JSON document onto `cfg`.
 *
 * Keys that are present replace the current value; absent keys leave it
 * alone. Wrong types, unknown command tokens, bad log levels and
 * out-of-range numbers fail with `err` set and `cfg` partially updated.
 * Unknown top-level keys are logged and ignored.
 */
bool apply_config_text(const std::string& text, DaemonConfig& cfg, std::string& err);

/// Read `path` and apply it. A missing file is an error.
bool load_config_file(const std::string& path, DaemonConfig& cfg, std::string& err);

using EnvLookup = std::function<const char*(const char*)>;

/// Apply ORB_ID (if set and non-empty) as a literal id.
void apply_env(DaemonConfig& cfg, const EnvLookup& lookup);
void apply_env(DaemonConfig& cfg);

using CommandRunner = std::function<ExecResult(const std::string&)>;

/// Resolve one field as described above.
std::string resolve_field(const char* field, const IdentitySource& src, const CommandRunner& run);

/// Resolve all identity fields. `run` defaults to run_shell_command.
DeviceIdentity resolve_identity(const DaemonConfig& cfg, const CommandRunner& run);
DeviceIdentity resolve_identity(const DaemonConfig& cfg);

/**
 * @brief Check that a resolved identity can be served.
 * @return false with `err` naming the first field that is not valid UTF-8.
 *         The id itself is checked separately with valid_device_id().
 */
bool validate_identity(const DeviceIdentity& identity, std::string& err);

ServerOptions to_server_options(const DaemonConfig& cfg);

} // namespace orbcomm
