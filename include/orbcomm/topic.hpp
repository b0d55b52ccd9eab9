#pragma once
/**
 * @file topic.hpp
 * @brief Topic naming scheme and key-expression matching for orbcomm.
 *
 * @details
 * PURPOSE
 * -------
 * Every request on the bus is addressed by a hierarchical topic string.
 * This header is the single place where those strings are composed and
 * taken apart, so client and server can never disagree about the layout.
 *
 * LAYOUT
 * ------
 *   orb/discover                          transport-wide discovery request
 *   orb/presence                          periodic presence announcements
 *   orb/<device_id>/<query_token>         addressed query
 *   orb/<device_id>/command/<token>       addressed command
 *
 * KEY EXPRESSIONS
 * ---------------
 * Subscriptions use key expressions: chunks are separated by '/', a `*`
 * chunk matches exactly one non-empty chunk and a `**` chunk matches zero
 * or more chunks. A server subscribes to `orb/<own_id>/**` to receive every
 * request addressed to it.
 *
 * All functions here are pure: same input, same output.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace orbcomm {

inline constexpr std::string_view TOPIC_ROOT      = "orb";
inline constexpr std::string_view DISCOVERY_TOPIC = "orb/discover";
inline constexpr std::string_view PRESENCE_TOPIC  = "orb/presence";
inline constexpr std::string_view COMMAND_SEGMENT = "command";

/// Longest accepted device id.
inline constexpr std::size_t DEVICE_ID_MAX = 64;

/**
 * @brief Check that a device id can be embedded in a topic.
 *
 * Accepts 1..DEVICE_ID_MAX characters, none of which is '/', '*', '$',
 * '?', '#' or whitespace. Rejected ids would either change the topic
 * hierarchy or turn the topic into a wildcard.
 *
 * "discover" and "presence" are reserved: an orb with either id would
 * declare `orb/discover/**`, which also matches every discovery request.
 */
bool valid_device_id(std::string_view id);

/// "orb/<device_id>/<action_path>"
std::string device_topic(std::string_view device_id, std::string_view action_path);

/// "orb/<device_id>/**", the subscription covering every request to a device.
std::string device_wildcard(std::string_view device_id);

/// Pieces of an addressed topic.
struct TopicParts {
  std::string device_id;
  std::string action_path;   ///< e.g. "name" or "command/reboot"
};

/**
 * @brief Split "orb/<device_id>/<action_path>" into its parts.
 *
 * Returns std::nullopt if the root is not "orb", the device id is empty
 * or the action path is empty. The discovery and presence topics are not
 * addressed topics and also yield std::nullopt.
 */
std::optional<TopicParts> parse_topic(std::string_view topic);

/**
 * @brief Match a concrete topic against a key expression.
 *
 * Examples:
 *   key_expr_matches("orb/A1/*", "orb/A1/name")            -> true
 *   key_expr_matches("orb/A1/**", "orb/A1/command/reboot")   -> true
 *   key_expr_matches("orb/A1/**", "orb/A1")                  -> true
 *   key_expr_matches("orb/*", "orb/A1/name")                 -> false
 */
bool key_expr_matches(std::string_view pattern, std::string_view topic);

} // namespace orbcomm
