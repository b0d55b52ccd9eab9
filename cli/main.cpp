/**
 * @file main.cpp
 * @brief orbcomm: one-shot controller CLI for orbs on the local network.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): global transport/output options plus one of
 *    the subcommands `ping`, `query`, `command`.
 *  - Open the UDP multicast transport, run exactly one Client operation,
 *    print the result and map it to an exit status.
 *
 * Output formats:
 *  - pretty : human readable, colored on a TTY
 *  - json   : one JSON object on stdout
 *  - raw    : bare values (ids one per line, payload as-is)
 *
 * Exit status: 0 ok, 1 transport error, 2 usage / unknown action,
 * 3 no response, 4 ambiguous outcome, 5 execution error.
 */

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "orbcomm/actions.hpp"
#include "orbcomm/client.hpp"
#include "orbcomm/errors.hpp"
#include "orbcomm/log.hpp"
#include "orbcomm/transport/transport_udp.hpp"

#ifndef ORBCOMM_VERSION
#define ORBCOMM_VERSION "0.0.0-dev"
#endif

using json = nlohmann::json;
using namespace orbcomm;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

// Orbs report free text; bytes that are not UTF-8 print as U+FFFD.
static std::string json_line(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

struct Output {
  std::string format = "pretty";   // pretty|json|raw
  Ansi ansi;
};

// One failure line on stderr, plus the JSON object on stdout in json mode.
static int report_failure(const Output& out, ErrorKind kind, const std::string& message, json extra = json::object()) {
  if (out.format == "json") {
    extra["ok"] = false;
    extra["error"] = to_token(kind);
    extra["message"] = message;
    std::cout << json_line(extra) << "\n";
  }
  std::cerr << out.ansi.red("status=error") << " reason=" << to_token(kind)
            << " msg=" << std::quoted(message) << "\n";
  return exit_code_for(kind);
}

// ---------- subcommands ----------

static int run_ping(Client& client, const Output& out, long timeout_ms, bool passive) {
  auto timeout = std::chrono::milliseconds(timeout_ms);
  DiscoveryResult res = passive ? client.listen(timeout) : client.discover(timeout);
  if (!res.ok()) return report_failure(out, res.error, res.message);

  if (out.format == "json") {
    json j;
    j["ok"] = true;
    j["ids"] = json::array();
    j["devices"] = json::array();
    for (const auto& id : res.ids) j["ids"].push_back(id);
    for (const auto& kv : res.devices) {
      j["devices"].push_back({{"id", kv.second.id},
                              {"name", kv.second.name},
                              {"hardware_version", kv.second.hardware_version}});
    }
    std::cout << json_line(j) << "\n";
    return 0;
  }

  if (out.format == "raw") {
    for (const auto& id : res.ids) std::cout << id << "\n";
    return 0;
  }

  if (res.ids.empty()) {
    std::cout << out.ansi.dim("no orbs answered within " + std::to_string(timeout_ms) + " ms") << "\n";
    return 0;
  }
  std::cout << out.ansi.dim("found " + std::to_string(res.ids.size()) + " orb(s)") << "\n";
  for (const auto& kv : res.devices) {
    const DeviceIdentity& d = kv.second;
    std::cout << "  " << out.ansi.bold(d.id);
    if (!d.name.empty())             std::cout << "  " << d.name;
    if (!d.hardware_version.empty()) std::cout << "  " << out.ansi.dim(d.hardware_version);
    std::cout << "\n";
  }
  return 0;
}

static int print_outcome(const Output& out, const std::string& id, const std::string& action, const Outcome& o) {
  json base = {{"id", id}, {"action", action}};
  if (!o.ok()) return report_failure(out, o.error, o.message, base);

  if (out.format == "json") {
    base["ok"] = true;
    base["payload"] = o.value;
    std::cout << json_line(base) << "\n";
  } else if (out.format == "raw") {
    std::cout << o.value << "\n";
  } else {
    std::cout << out.ansi.bold(id) << " " << out.ansi.dim(action) << " "
              << out.ansi.green("ok") << " " << o.value << "\n";
  }
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  ActionRegistry registry;
  if (!registry.valid()) {
    std::cerr << "status=error reason=invalid_registry msg=" << std::quoted(registry.validation_error()) << "\n";
    return 1;
  }

  transport::UdpConfig udp;
  Output out;
  bool opt_no_color = false;
  std::string opt_log_level = "warn";

  CLI::App app{"orbcomm: discover, query and command orbs on the local network"};
  app.set_version_flag("--version", ORBCOMM_VERSION);
  app.require_subcommand(1);

  app.add_option("--group", udp.group, "Multicast group")->capture_default_str();
  app.add_option("--port", udp.port, "UDP port")->capture_default_str()->check(CLI::Range(1, 65535));
  app.add_option("--iface", udp.iface, "Local interface address")->capture_default_str();
  app.add_option("--format", out.format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|off")
     ->check(CLI::IsMember({"trace","debug","info","warn","error","off"}));

  // ping
  long ping_timeout = DEFAULT_DISCOVER_TIMEOUT.count();
  bool ping_passive = false;
  auto* ping = app.add_subcommand("ping", "Discover orbs and print their ids");
  ping->add_option("--timeout", ping_timeout, "Collection window in ms")->capture_default_str()->check(CLI::PositiveNumber);
  ping->add_flag("--passive", ping_passive, "Listen for presence announcements instead of probing");

  // query
  std::string query_id, query_token;
  long query_timeout = DEFAULT_REQUEST_TIMEOUT.count();
  auto* query = app.add_subcommand("query", "Ask one orb for a value (" + registry.query_tokens() + ")");
  query->add_option("--id", query_id, "Target device id")->required();
  query->add_option("token", query_token, "Query token")->required();
  query->add_option("--timeout", query_timeout, "Reply timeout in ms")->capture_default_str()->check(CLI::PositiveNumber);

  // command
  std::string cmd_id, cmd_token;
  long cmd_timeout = DEFAULT_REQUEST_TIMEOUT.count();
  auto* command = app.add_subcommand("command", "Send a command to one orb (" + registry.command_tokens() + ")");
  command->add_option("--id", cmd_id, "Target device id")->required();
  command->add_option("token", cmd_token, "Command token")->required();
  command->add_option("--timeout", cmd_timeout, "Reply timeout in ms")->capture_default_str()->check(CLI::PositiveNumber);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  out.ansi.enabled = !opt_no_color && is_tty_stdout() && (out.format == "pretty");
  if (auto lvl = log::parse_level(opt_log_level)) log::set_level(*lvl);

  // Reject unknown tokens before touching the network.
  if (query->parsed() && !registry.find_query(query_token))
    return report_failure(out, ErrorKind::UNKNOWN_ACTION,
                          "unknown query '" + query_token + "' (expected: " + registry.query_tokens() + ")");
  if (command->parsed() && !registry.find_command(cmd_token))
    return report_failure(out, ErrorKind::UNKNOWN_ACTION,
                          "unknown command '" + cmd_token + "' (expected: " + registry.command_tokens() + ")");

  transport::UdpTransport udp_transport(udp);
  std::string err;
  if (!udp_transport.open(err)) return report_failure(out, ErrorKind::TRANSPORT_ERROR, err);

  Client client(registry, udp_transport);
  int rc = 0;
  if (ping->parsed()) {
    rc = run_ping(client, out, ping_timeout, ping_passive);
  } else if (query->parsed()) {
    rc = print_outcome(out, query_id, query_token,
                       client.query(query_id, std::string_view(query_token), std::chrono::milliseconds(query_timeout)));
  } else {
    rc = print_outcome(out, cmd_id, cmd_token,
                       client.command(cmd_id, std::string_view(cmd_token), std::chrono::milliseconds(cmd_timeout)));
  }

  udp_transport.close();
  return rc;
}
