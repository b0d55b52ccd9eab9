// ============================================================================
// config.cpp : implementation for config.hpp
// ============================================================================

#include "orbcomm/config.hpp"
#include "orbcomm/log.hpp"
#include "orbcomm/reply.hpp"

#include "nlohmann/json.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace orbcomm {

static constexpr const char* COMP = "config";

std::string default_config_path() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base;
  if (xdg && *xdg)        base = fs::path(xdg);
  else if (home && *home) base = fs::path(home) / ".config";
  else                    return {};
  return (base / "orbcomm" / "orbcommd.json").string();
}

// --- typed readers: leave `out` alone if the key is absent ---

static bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) { err = std::string(key) + " must be a string"; return false; }
  out = it->get<std::string>();
  return true;
}

static bool read_bool(const json& j, const char* key, bool& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_boolean()) { err = std::string(key) + " must be a boolean"; return false; }
  out = it->get<bool>();
  return true;
}

template <typename T>
static bool read_number(const json& j, const char* key, T& out, long lo, long hi, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) { err = std::string(key) + " must be an integer"; return false; }
  long v = it->get<long>();
  if (v < lo || v > hi) {
    err = std::string(key) + " out of range [" + std::to_string(lo) + "," + std::to_string(hi) + "]";
    return false;
  }
  out = static_cast<T>(v);
  return true;
}

static bool read_identity(const json& j, const char* key, IdentitySource& src, std::string& err) {
  const std::string cmd_key = std::string(key) + "_command";
  return read_string(j, key, src.value, err) &&
         read_string(j, cmd_key.c_str(), src.command, err);
}

static bool read_transport(const json& j, transport::UdpConfig& udp, std::string& err) {
  auto it = j.find("transport");
  if (it == j.end()) return true;
  if (!it->is_object()) { err = "transport must be an object"; return false; }
  return read_string(*it, "group", udp.group, err) &&
         read_number(*it, "port", udp.port, 1, 65535, err) &&
         read_string(*it, "iface", udp.iface, err) &&
         read_number(*it, "ttl", udp.ttl, 1, 255, err);
}

static bool read_commands(const json& j, ShellCommandExecutor::CommandLines& lines, std::string& err) {
  auto it = j.find("commands");
  if (it == j.end()) return true;
  if (!it->is_object()) { err = "commands must be an object"; return false; }
  for (auto c = it->begin(); c != it->end(); ++c) {
    auto kind = parse_command(c.key());
    if (!kind) { err = "commands: unknown command '" + c.key() + "'"; return false; }
    if (!c.value().is_string()) { err = "commands." + c.key() + " must be a string"; return false; }
    lines[*kind] = c.value().get<std::string>();
  }
  return true;
}

bool apply_config_text(const std::string& text, DaemonConfig& cfg, std::string& err) {
  json j = json::parse(text, nullptr, /*allow_exceptions*/ false, /*ignore_comments*/ true);
  if (j.is_discarded()) { err = "config is not valid JSON"; return false; }
  if (!j.is_object())   { err = "config must be a JSON object"; return false; }

  static const std::set<std::string> KNOWN = {
    "id", "id_command", "name", "name_command",
    "hardware_version", "hardware_version_command",
    "transport", "workers", "queue_limit", "announce_interval_ms",
    "effect_delay_ms", "commands", "dry_run", "log_level"
  };
  for (auto it = j.begin(); it != j.end(); ++it)
    if (!KNOWN.count(it.key())) log::warn(COMP, "ignoring unknown key '" + it.key() + "'");

  const long max_ms = 24L * 3600 * 1000;
  if (!read_identity(j, "id", cfg.id, err)) return false;
  if (!read_identity(j, "name", cfg.name, err)) return false;
  if (!read_identity(j, "hardware_version", cfg.hardware_version, err)) return false;
  if (!read_transport(j, cfg.udp, err)) return false;
  if (!read_number(j, "workers", cfg.workers, 1, 64, err)) return false;
  if (!read_number(j, "queue_limit", cfg.queue_limit, 1, static_cast<long>(Server::QUEUE_CAP), err)) return false;
  if (!read_number(j, "announce_interval_ms", cfg.announce_interval_ms, 0, max_ms, err)) return false;
  if (!read_number(j, "effect_delay_ms", cfg.effect_delay_ms, 0, max_ms, err)) return false;
  if (!read_commands(j, cfg.commands, err)) return false;
  if (!read_bool(j, "dry_run", cfg.dry_run, err)) return false;

  std::string lvl = cfg.log_level;
  if (!read_string(j, "log_level", lvl, err)) return false;
  if (!log::parse_level(lvl)) { err = "log_level '" + lvl + "' is not a level"; return false; }
  cfg.log_level = lvl;
  return true;
}

bool load_config_file(const std::string& path, DaemonConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "cannot open " + path; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!apply_config_text(ss.str(), cfg, err)) {
    err = path + ": " + err;
    return false;
  }
  log::debug(COMP, "loaded " + path);
  return true;
}

void apply_env(DaemonConfig& cfg, const EnvLookup& lookup) {
  const char* id = lookup("ORB_ID");
  if (id && *id) cfg.id.value = id;
}

void apply_env(DaemonConfig& cfg) {
  apply_env(cfg, [](const char* k) -> const char* { return std::getenv(k); });
}

std::string resolve_field(const char* field, const IdentitySource& src, const CommandRunner& run) {
  if (!src.value.empty()) return src.value;
  if (src.command.empty()) return src.fallback;

  ExecResult r = run(src.command);
  if (r.ok && !r.output.empty()) return r.output;

  log::warn(COMP, std::string(field) + ": `" + src.command + "` " +
                  (r.ok ? std::string("printed nothing") : r.error) +
                  ", using " + src.fallback);
  return src.fallback;
}

DeviceIdentity resolve_identity(const DaemonConfig& cfg, const CommandRunner& run) {
  DeviceIdentity id;
  id.id               = resolve_field("id", cfg.id, run);
  id.name             = resolve_field("name", cfg.name, run);
  id.hardware_version = resolve_field("hardware_version", cfg.hardware_version, run);
  return id;
}

DeviceIdentity resolve_identity(const DaemonConfig& cfg) {
  return resolve_identity(cfg, run_shell_command);
}

bool validate_identity(const DeviceIdentity& identity, std::string& err) {
  const std::pair<const char*, const std::string*> fields[] = {
    {"id", &identity.id},
    {"name", &identity.name},
    {"hardware_version", &identity.hardware_version},
  };
  for (const auto& f : fields) {
    if (!valid_utf8(*f.second)) { err = std::string(f.first) + " is not valid UTF-8"; return false; }
  }
  return true;
}

ServerOptions to_server_options(const DaemonConfig& cfg) {
  ServerOptions o;
  o.workers           = cfg.workers;
  o.queue_limit       = cfg.queue_limit;
  o.announce_interval = std::chrono::milliseconds(cfg.announce_interval_ms);
  o.effect_delay      = std::chrono::milliseconds(cfg.effect_delay_ms);
  return o;
}

} // namespace orbcomm
