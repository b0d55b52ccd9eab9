// orbcommd: the per-orb daemon. Resolves the orb's identity, joins the
// multicast group and answers discovery, queries and commands until
// SIGINT/SIGTERM.

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "CLI/CLI11.hpp"

#include "orbcomm/actions.hpp"
#include "orbcomm/command_executor.hpp"
#include "orbcomm/config.hpp"
#include "orbcomm/log.hpp"
#include "orbcomm/server.hpp"
#include "orbcomm/topic.hpp"
#include "orbcomm/transport/transport_udp.hpp"

#ifndef ORBCOMM_VERSION
#define ORBCOMM_VERSION "0.0.0-dev"
#endif

using namespace orbcomm;

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

int main(int argc, char** argv) {
  CLI::App app{"orbcommd: orb discovery/query/command daemon"};
  app.set_version_flag("--version", ORBCOMM_VERSION);

  std::string config_path;
  std::string opt_id, opt_name, opt_hw;
  std::string opt_group, opt_iface, opt_log_level;
  uint16_t    opt_port = 0;
  std::size_t opt_workers = 0;
  long        opt_announce_ms = 0;
  bool        opt_dry_run = false;

  auto* o_config   = app.add_option("--config", config_path, "JSON config file (default: $XDG_CONFIG_HOME/orbcomm/orbcommd.json)");
  auto* o_id       = app.add_option("--id", opt_id, "Device id (overrides id_command and ORB_ID)");
  auto* o_name     = app.add_option("--name", opt_name, "Display name");
  auto* o_hw       = app.add_option("--hw-version", opt_hw, "Hardware version");
  auto* o_group    = app.add_option("--group", opt_group, "Multicast group");
  auto* o_port     = app.add_option("--port", opt_port, "UDP port")->check(CLI::Range(1, 65535));
  auto* o_iface    = app.add_option("--iface", opt_iface, "Local interface address");
  auto* o_workers  = app.add_option("--workers", opt_workers, "Worker threads")->check(CLI::Range(1, 64));
  auto* o_announce = app.add_option("--announce-ms", opt_announce_ms, "Presence interval in ms, 0 disables")->check(CLI::NonNegativeNumber);
  app.add_flag("--dry-run", opt_dry_run, "Log disruptive commands instead of running them");
  auto* o_level    = app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|off")
                        ->check(CLI::IsMember({"trace","debug","info","warn","error","off"}));

  CLI11_PARSE(app, argc, argv);

  // ---- layer 1+2: defaults, then config file ----
  DaemonConfig cfg;
  std::string err;
  if (o_config->count() > 0) {
    if (!load_config_file(config_path, cfg, err)) {
      std::cerr << "status=error reason=bad_config msg=\"" << err << "\"\n";
      return 2;
    }
  } else {
    std::string def = default_config_path();
    std::error_code ec;
    if (!def.empty() && std::filesystem::exists(def, ec)) {
      if (!load_config_file(def, cfg, err)) {
        std::cerr << "status=error reason=bad_config msg=\"" << err << "\"\n";
        return 2;
      }
      config_path = def;
    }
  }

  // ---- layer 3: environment ----
  apply_env(cfg);

  // ---- layer 4: flags ----
  if (o_id->count())       cfg.id.value = opt_id;
  if (o_name->count())     cfg.name.value = opt_name;
  if (o_hw->count())       cfg.hardware_version.value = opt_hw;
  if (o_group->count())    cfg.udp.group = opt_group;
  if (o_port->count())     cfg.udp.port = opt_port;
  if (o_iface->count())    cfg.udp.iface = opt_iface;
  if (o_workers->count())  cfg.workers = opt_workers;
  if (o_announce->count()) cfg.announce_interval_ms = opt_announce_ms;
  if (o_level->count())    cfg.log_level = opt_log_level;
  if (opt_dry_run)         cfg.dry_run = true;

  if (auto lvl = log::parse_level(cfg.log_level)) log::set_level(*lvl);
  log::info("main", std::string("orbcommd ") + ORBCOMM_VERSION +
                    (config_path.empty() ? "" : " config=" + config_path));

  // ---- identity ----
  DeviceIdentity identity = resolve_identity(cfg);
  if (!valid_device_id(identity.id)) {
    std::cerr << "status=error reason=invalid_device_id id=\"" << identity.id << "\"\n";
    return 2;
  }
  std::string identity_err;
  if (!validate_identity(identity, identity_err)) {
    std::cerr << "status=error reason=invalid_identity msg=\"" << identity_err << "\"\n";
    return 2;
  }
  log::info("main", "identity id=" + identity.id + " name=" + identity.name +
                    " hardware_version=" + identity.hardware_version);

  ActionRegistry registry;
  if (!registry.valid()) {
    std::cerr << "status=error reason=invalid_registry msg=\"" << registry.validation_error() << "\"\n";
    return 1;
  }

  // ---- transport + server ----
  transport::UdpTransport udp(cfg.udp);
  if (!udp.open(err)) {
    std::cerr << "status=error reason=transport_error msg=\"" << err << "\"\n";
    return 1;
  }

  ShellCommandExecutor executor(cfg.commands, cfg.dry_run);
  Server server(identity, registry, udp, executor, to_server_options(cfg));
  if (!server.start(err)) {
    std::cerr << "status=error reason=server_start msg=\"" << err << "\"\n";
    udp.close();
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::cout << "status=ok id=" << identity.id << " transport=" << udp.name()
            << " group=" << cfg.udp.group << ":" << cfg.udp.port << std::endl;

  while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  log::info("main", "shutting down");
  server.stop();
  udp.close();
  return 0;
}
