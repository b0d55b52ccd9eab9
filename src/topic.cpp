// ============================================================================
// topic.cpp : implementation for topic.hpp
// ============================================================================

#include "orbcomm/topic.hpp"

#include <cctype>
#include <vector>

namespace orbcomm {

// Split on '/', keeping empty chunks so "a//b" never matches "a/b".
static std::vector<std::string_view> split_chunks(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    std::size_t slash = s.find('/', start);
    if (slash == std::string_view::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, slash - start));
    start = slash + 1;
  }
}

// Chunk names already taken under orb/ by the broadcast topics.
static constexpr std::string_view RESERVED_IDS[] = { "discover", "presence" };

bool valid_device_id(std::string_view id) {
  if (id.empty() || id.size() > DEVICE_ID_MAX) return false;
  for (char c : id) {
    if (c == '/' || c == '*' || c == '$' || c == '?' || c == '#') return false;   // hierarchy and wildcards
    if (std::isspace(static_cast<unsigned char>(c))) return false;
    if (std::iscntrl(static_cast<unsigned char>(c))) return false;
  }
  for (auto reserved : RESERVED_IDS)
    if (id == reserved) return false;
  return true;
}

std::string device_topic(std::string_view device_id, std::string_view action_path) {
  std::string t;
  t.reserve(TOPIC_ROOT.size() + device_id.size() + action_path.size() + 2);
  t.append(TOPIC_ROOT);
  t.push_back('/');
  t.append(device_id);
  t.push_back('/');
  t.append(action_path);
  return t;
}

std::string device_wildcard(std::string_view device_id) {
  return device_topic(device_id, "**");
}

std::optional<TopicParts> parse_topic(std::string_view topic) {
  // "orb/" prefix
  if (topic.size() <= TOPIC_ROOT.size() + 1) return std::nullopt;
  if (topic.substr(0, TOPIC_ROOT.size()) != TOPIC_ROOT) return std::nullopt;
  if (topic[TOPIC_ROOT.size()] != '/') return std::nullopt;

  std::string_view rest = topic.substr(TOPIC_ROOT.size() + 1);
  std::size_t slash = rest.find('/');
  if (slash == std::string_view::npos || slash == 0) return std::nullopt;

  std::string_view path = rest.substr(slash + 1);
  if (path.empty()) return std::nullopt;

  return TopicParts{std::string(rest.substr(0, slash)), std::string(path)};
}

// Recursive walk over chunk lists. Patterns are short (a handful of chunks),
// so backtracking on "**" stays cheap.
static bool match_from(const std::vector<std::string_view>& pat, std::size_t pi,
                       const std::vector<std::string_view>& top, std::size_t ti) {
  while (pi < pat.size()) {
    if (pat[pi] == "**") {
      if (pi + 1 == pat.size()) return true;        // trailing ** eats the rest
      for (std::size_t k = ti; k <= top.size(); ++k)
        if (match_from(pat, pi + 1, top, k)) return true;
      return false;
    }
    if (ti >= top.size()) return false;
    if (pat[pi] == "*") {
      if (top[ti].empty()) return false;
    } else if (pat[pi] != top[ti]) {
      return false;
    }
    ++pi;
    ++ti;
  }
  return ti == top.size();
}

bool key_expr_matches(std::string_view pattern, std::string_view topic) {
  if (pattern.empty() || topic.empty()) return false;
  const auto pat = split_chunks(pattern);
  const auto top = split_chunks(topic);
  return match_from(pat, 0, top, 0);
}

} // namespace orbcomm
