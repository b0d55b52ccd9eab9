// ============================================================================
// log.cpp : implementation for log.hpp
// ============================================================================

#include "orbcomm/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace orbcomm::log {

static std::atomic<uint8_t> g_level{static_cast<uint8_t>(Level::INFO)};
static std::mutex           g_mu;
static std::ostream*        g_stream = nullptr;   // nullptr -> std::cerr

void set_level(Level level) { g_level.store(static_cast<uint8_t>(level)); }

Level level() { return static_cast<Level>(g_level.load()); }

std::optional<Level> parse_level(std::string_view name) {
  if (name == "trace") return Level::TRACE;
  if (name == "debug") return Level::DEBUG;
  if (name == "info")  return Level::INFO;
  if (name == "warn")  return Level::WARN;
  if (name == "error") return Level::ERROR;
  if (name == "off")   return Level::OFF;
  return std::nullopt;
}

const char* level_name(Level level) {
  switch (level) {
    case Level::TRACE: return "trace";
    case Level::DEBUG: return "debug";
    case Level::INFO:  return "info";
    case Level::WARN:  return "warn";
    case Level::ERROR: return "error";
    case Level::OFF:   return "off";
  }
  return "info";
}

void set_stream(std::ostream* os) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_stream = os;
}

bool enabled(Level lvl) {
  return lvl != Level::OFF && static_cast<uint8_t>(lvl) >= g_level.load();
}

// UTC timestamp with milliseconds, ISO-8601.
static std::string timestamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto ms  = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
     << std::setw(3) << std::setfill('0') << ms << 'Z';
  return os.str();
}

// Quote the message so a line stays machine-splittable on spaces.
static void append_quoted(std::string& out, std::string_view s) {
  out.push_back('"');
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n') { out += "\\n"; continue; }
    out.push_back(c);
  }
  out.push_back('"');
}

void write(Level lvl, std::string_view component, std::string_view message) {
  if (!enabled(lvl)) return;

  std::string line;
  line.reserve(64 + message.size());
  line += "ts=";
  line += timestamp();
  line += " level=";
  line += level_name(lvl);
  line += " comp=";
  line.append(component);
  line += " msg=";
  append_quoted(line, message);
  line.push_back('\n');

  std::lock_guard<std::mutex> lk(g_mu);
  std::ostream& os = g_stream ? *g_stream : std::cerr;
  os << line;
  os.flush();
}

} // namespace orbcomm::log
