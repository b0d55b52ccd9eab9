#pragma once
/**
 * @file log.hpp
 * @brief Line-oriented key=value logging to stderr.
 *
 * Output looks like:
 *   ts=2026-10-19T19:04:05.123Z level=info comp=server msg="declared orb/A1/**"
 *
 * One process-wide level, set from --log-level or the config file. Writes
 * are serialized, so handlers on different worker threads never interleave
 * within a line.
 */

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace orbcomm::log {

enum class Level : uint8_t { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4, OFF = 5 };

void  set_level(Level level);
Level level();

/// "trace|debug|info|warn|error|off" -> Level.
std::optional<Level> parse_level(std::string_view name);
const char*          level_name(Level level);

/// Redirect output (tests). Passing nullptr restores std::cerr.
void set_stream(std::ostream* os);

bool enabled(Level level);
void write(Level level, std::string_view component, std::string_view message);

inline void trace(std::string_view c, std::string_view m) { write(Level::TRACE, c, m); }
inline void debug(std::string_view c, std::string_view m) { write(Level::DEBUG, c, m); }
inline void info (std::string_view c, std::string_view m) { write(Level::INFO,  c, m); }
inline void warn (std::string_view c, std::string_view m) { write(Level::WARN,  c, m); }
inline void error(std::string_view c, std::string_view m) { write(Level::ERROR, c, m); }

} // namespace orbcomm::log
