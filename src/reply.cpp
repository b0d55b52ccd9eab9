// ============================================================================
// reply.cpp : implementation for reply.hpp
// JSON handling is nlohmann::json; parse errors are caught here and turned
// into std::nullopt so nothing above this layer sees a json exception.
// Encoding uses the replace error handler, so bad UTF-8 in a field comes
// out as U+FFFD instead of a type_error.
// ============================================================================

#include "orbcomm/reply.hpp"

#include <cstddef>
#include <cstdint>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace orbcomm {

static std::string dump_lenient(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);   // compact, never throws on text
}

bool valid_utf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto c = static_cast<unsigned char>(text[i]);
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if (c < 0x80)                { ++i; continue; }         // ASCII
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return false;                                       // stray continuation or 0xF8..0xFF
    if (i + len > text.size()) return false;                 // truncated sequence

    for (std::size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    static constexpr std::uint32_t MIN_FOR_LEN[] = { 0, 0, 0x80, 0x800, 0x10000 };
    if (cp < MIN_FOR_LEN[len]) return false;                 // overlong
    if (cp > 0x10FFFF) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;          // surrogate half
    i += len;
  }
  return true;
}

std::string encode_reply(const Reply& reply) {
  json j;
  j["ok"]      = reply.ok;
  j["payload"] = reply.payload;
  j["error"]   = to_token(reply.error);
  j["message"] = reply.message;
  return dump_lenient(j);
}

std::optional<Reply> decode_reply(const std::string& text) {
  json j = json::parse(text, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  if (!j.contains("ok") || !j["ok"].is_boolean()) return std::nullopt;

  Reply r;
  r.ok = j["ok"].get<bool>();

  if (j.contains("payload")) {
    if (!j["payload"].is_string()) return std::nullopt;
    r.payload = j["payload"].get<std::string>();
  }
  if (j.contains("message")) {
    if (!j["message"].is_string()) return std::nullopt;
    r.message = j["message"].get<std::string>();
  }
  if (j.contains("error")) {
    if (!j["error"].is_string()) return std::nullopt;
    auto kind = error_from_token(j["error"].get<std::string>());
    if (!kind) return std::nullopt;
    r.error = *kind;
  }

  // ok and error must agree
  if (r.ok && r.error != ErrorKind::NONE) return std::nullopt;
  if (!r.ok && r.error == ErrorKind::NONE) return std::nullopt;
  return r;
}

std::string encode_identity(const DeviceIdentity& identity) {
  json j;
  j["id"] = identity.id;
  if (!identity.name.empty())             j["name"] = identity.name;
  if (!identity.hardware_version.empty()) j["hardware_version"] = identity.hardware_version;
  return dump_lenient(j);
}

std::optional<DeviceIdentity> decode_identity(const std::string& text) {
  json j = json::parse(text, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  if (!j.contains("id") || !j["id"].is_string()) return std::nullopt;

  DeviceIdentity d;
  d.id = j["id"].get<std::string>();
  if (d.id.empty()) return std::nullopt;

  // metadata is optional; ignore fields of the wrong type
  if (j.contains("name") && j["name"].is_string())
    d.name = j["name"].get<std::string>();
  if (j.contains("hardware_version") && j["hardware_version"].is_string())
    d.hardware_version = j["hardware_version"].get<std::string>();
  return d;
}

} // namespace orbcomm
