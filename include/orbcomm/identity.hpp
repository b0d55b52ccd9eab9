#pragma once
/**
 * @file identity.hpp
 * @brief DeviceIdentity: who an orb says it is.
 */

#include <string>

namespace orbcomm {

/**
 * @struct DeviceIdentity
 * @brief Identity record of one orb.
 *
 * Built once at server startup from configuration and never modified
 * afterwards. `id` is the address used in every topic; `name` is an
 * optional display name (empty means unset) and `hardware_version` is the
 * value reported by the `hardware_version` query.
 */
struct DeviceIdentity {
  std::string id;
  std::string name;
  std::string hardware_version;
};

inline bool operator==(const DeviceIdentity& a, const DeviceIdentity& b) {
  return a.id == b.id && a.name == b.name && a.hardware_version == b.hardware_version;
}

inline bool operator!=(const DeviceIdentity& a, const DeviceIdentity& b) { return !(a == b); }

} // namespace orbcomm
