#include <doctest/doctest.h>
#include "orbcomm/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace orbcomm;

TEST_CASE("Defaults match a stock orb") {
    DaemonConfig cfg;
    CHECK(cfg.id.command == "orb-id");
    CHECK(cfg.id.fallback == "UnknownOrb");
    CHECK(cfg.name.fallback == "DevOrb");
    CHECK(cfg.hardware_version.command == "cat /usr/persistent/hardware_version");
    CHECK(cfg.hardware_version.fallback == "UnknownHWVersion");
    CHECK(cfg.announce_interval_ms == 1000);
    CHECK(cfg.commands.at(CommandKind::REBOOT) == "sudo reboot");
    CHECK(cfg.commands.at(CommandKind::SHUTDOWN) == "shutdown now");
    CHECK(cfg.commands.at(CommandKind::RESET_GIMBAL).empty());
    CHECK_FALSE(cfg.dry_run);
}

TEST_CASE("Config text overlays only the keys it names") {
    DaemonConfig cfg;
    std::string err;
    const char* text = R"({
        "id": "A1",
        "name_command": "hostname",
        "transport": { "group": "239.1.2.3", "port": 9000 },
        "workers": 2,
        "announce_interval_ms": 0,
        "commands": { "reset_gimbal": "gimbalctl reset" },
        "dry_run": true,
        "log_level": "debug"
    })";
    REQUIRE(apply_config_text(text, cfg, err));

    CHECK(cfg.id.value == "A1");
    CHECK(cfg.name.command == "hostname");
    CHECK(cfg.udp.group == "239.1.2.3");
    CHECK(cfg.udp.port == 9000);
    CHECK(cfg.udp.iface == "0.0.0.0");                       // untouched
    CHECK(cfg.workers == 2);
    CHECK(cfg.announce_interval_ms == 0);
    CHECK(cfg.commands.at(CommandKind::RESET_GIMBAL) == "gimbalctl reset");
    CHECK(cfg.commands.at(CommandKind::REBOOT) == "sudo reboot");   // untouched
    CHECK(cfg.dry_run);
    CHECK(cfg.log_level == "debug");

    ServerOptions o = to_server_options(cfg);
    CHECK(o.workers == 2);
    CHECK(o.announce_interval.count() == 0);
}

TEST_CASE("Bad config values are reported") {
    DaemonConfig cfg;
    std::string err;

    CHECK_FALSE(apply_config_text("{ nope", cfg, err));
    CHECK(err == "config is not valid JSON");

    CHECK_FALSE(apply_config_text("[]", cfg, err));
    CHECK(err == "config must be a JSON object");

    CHECK_FALSE(apply_config_text(R"({"id": 5})", cfg, err));
    CHECK(err == "id must be a string");

    CHECK_FALSE(apply_config_text(R"({"workers": 0})", cfg, err));
    CHECK(err.find("workers out of range") == 0);

    CHECK_FALSE(apply_config_text(R"({"transport": {"port": 70000}})", cfg, err));
    CHECK(err.find("port out of range") == 0);

    CHECK_FALSE(apply_config_text(R"({"commands": {"explode": "rm"}})", cfg, err));
    CHECK(err == "commands: unknown command 'explode'");

    CHECK_FALSE(apply_config_text(R"({"log_level": "loud"})", cfg, err));
    CHECK(err == "log_level 'loud' is not a level");

    CHECK_FALSE(apply_config_text(R"({"dry_run": "yes"})", cfg, err));
    CHECK(err == "dry_run must be a boolean");
}

TEST_CASE("Config file is read from disk") {
    namespace fs = std::filesystem;
    const fs::path p = fs::temp_directory_path() / "orbcomm-test-config.json";
    {
        std::ofstream out(p);
        out << R"({"hardware_version": "EVT-2.3", "effect_delay_ms": 50})";
    }

    DaemonConfig cfg;
    std::string err;
    REQUIRE(load_config_file(p.string(), cfg, err));
    CHECK(cfg.hardware_version.value == "EVT-2.3");
    CHECK(cfg.effect_delay_ms == 50);
    fs::remove(p);

    CHECK_FALSE(load_config_file(p.string(), cfg, err));
    CHECK(err == "cannot open " + p.string());
}

TEST_CASE("ORB_ID from the environment becomes the literal id") {
    DaemonConfig cfg;
    std::map<std::string, std::string> env{{"ORB_ID", "env-orb"}};
    apply_env(cfg, [&](const char* k) -> const char* {
        auto it = env.find(k);
        return it == env.end() ? nullptr : it->second.c_str();
    });
    CHECK(cfg.id.value == "env-orb");

    DaemonConfig untouched;
    apply_env(untouched, [](const char*) -> const char* { return ""; });
    CHECK(untouched.id.value.empty());
}

TEST_CASE("Identity fields resolve literal, then command, then fallback") {
    std::vector<std::string> ran;
    auto runner = [&](const std::string& cmd) {
        ran.push_back(cmd);
        if (cmd == "orb-id") return ExecResult::success("orb-0042");
        if (cmd == "silent") return ExecResult::success("");
        return ExecResult::failure("exit 1");
    };

    DaemonConfig cfg;
    cfg.name.value = "lab-orb";
    DeviceIdentity id = resolve_identity(cfg, runner);

    CHECK(id.id == "orb-0042");
    CHECK(id.name == "lab-orb");
    CHECK(id.hardware_version == "UnknownHWVersion");
    CHECK(ran == std::vector<std::string>{"orb-id", "cat /usr/persistent/hardware_version"});

    IdentitySource silent{"", "silent", "Fallback"};
    CHECK(resolve_field("name", silent, runner) == "Fallback");

    IdentitySource none{"", "", "OnlyFallback"};
    CHECK(resolve_field("name", none, runner) == "OnlyFallback");
}

TEST_CASE("Identity read from a command must be valid UTF-8") {
    auto runner = [](const std::string& cmd) {
        if (cmd == "cat /usr/persistent/orb-name") return ExecResult::success("lab\xff" "orb");
        return ExecResult::success("x");
    };
    DaemonConfig cfg;
    cfg.id.value = "A1";
    DeviceIdentity id = resolve_identity(cfg, runner);

    std::string err;
    CHECK_FALSE(validate_identity(id, err));
    CHECK(err == "name is not valid UTF-8");

    id.name = "lab-orb";
    err.clear();
    CHECK(validate_identity(id, err));
    CHECK(err.empty());

    id.hardware_version = "EVT\xC0";
    CHECK_FALSE(validate_identity(id, err));
    CHECK(err == "hardware_version is not valid UTF-8");
}
