#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace topocrawl::parsing {

// ECMAScript rendition of a pattern that used named groups.
struct NamedPattern {
  std::string ecmascript;
  // (group name, 1-based capture index), in pattern order.
  std::vector<std::pair<std::string, std::size_t>> groups;
  std::size_t capture_count = 0;
};

// Rewrites `(?<name>...)` and `(?P<name>...)` as plain capture groups and
// records where each name landed. Escapes, character classes and
// non-capturing/lookahead groups are left untouched.
bool TranslateNamedGroups(std::string_view pattern, NamedPattern& out, std::string& error);

// Number of capturing groups in `pattern` (named ones included).
std::size_t CountCaptureGroups(std::string_view pattern);

} // namespace topocrawl::parsing
