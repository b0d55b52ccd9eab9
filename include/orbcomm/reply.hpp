#pragma once
/**
 * @file reply.hpp
 * @brief Reply envelope and discovery payload codecs (JSON on the wire).
 *
 * @details
 * Every query and command gets exactly one Reply from the addressed server:
 *
 *   {"ok":true,  "payload":"EVT-2.3", "error":"none", "message":""}
 *   {"ok":false, "payload":"", "error":"execution_error", "message":"exit 1"}
 *
 * Discovery replies and presence announcements carry the DeviceIdentity:
 *
 *   {"id":"A1B2", "name":"lab-orb", "hardware_version":"EVT-2.3"}
 *
 * Decoders never throw. Any JSON error, missing field or inconsistent
 * envelope (ok=true with an error kind, unknown error token) yields
 * std::nullopt so the caller can report a transport-level failure.
 *
 * Encoders never throw either: bytes that are not valid UTF-8 are written
 * as U+FFFD. Use valid_utf8() to reject such input where it enters.
 */

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "orbcomm/errors.hpp"
#include "orbcomm/identity.hpp"

namespace orbcomm {

struct Reply {
  bool        ok      = true;
  std::string payload;
  ErrorKind   error   = ErrorKind::NONE;
  std::string message;

  static Reply success(std::string payload) {
    Reply r;
    r.payload = std::move(payload);
    return r;
  }

  static Reply failure(ErrorKind kind, std::string message) {
    Reply r;
    r.ok      = false;
    r.error   = kind;
    r.message = std::move(message);
    return r;
  }
};

std::string          encode_reply(const Reply& reply);
std::optional<Reply> decode_reply(const std::string& text);

std::string                   encode_identity(const DeviceIdentity& identity);
std::optional<DeviceIdentity> decode_identity(const std::string& text);

/// True when `text` is well-formed UTF-8 (no overlongs, no surrogates).
bool valid_utf8(std::string_view text);

} // namespace orbcomm
