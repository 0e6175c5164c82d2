#pragma once

#include <string>

namespace topocrawl::parsing {

enum class ParseMethod {
  kStructured, // state-machine template, delegated to ITemplateMatcher
  kRegex,      // regex with named groups
};

inline const char* ToString(ParseMethod method) {
  switch (method) {
  case ParseMethod::kStructured:
    return "STRUCTURED";
  case ParseMethod::kRegex:
    return "REGEX";
  }
  return "REGEX";
}

struct ParseTemplate {
  ParseMethod method = ParseMethod::kRegex;
  std::string pattern;
  int priority = 0;
  std::string name;
};

// Registry order: every STRUCTURED template before any REGEX template, then
// ascending priority. Equal keys keep insertion order.
inline bool ParsesBefore(const ParseTemplate& lhs, const ParseTemplate& rhs) {
  const int lhs_rank = lhs.method == ParseMethod::kStructured ? 0 : 1;
  const int rhs_rank = rhs.method == ParseMethod::kStructured ? 0 : 1;
  if (lhs_rank != rhs_rank) {
    return lhs_rank < rhs_rank;
  }
  return lhs.priority < rhs.priority;
}

// kFirstMatchWins trusts the first template that yields records and skips
// the rest. kAccumulateAll concatenates the records of every template that
// matches, in registry order.
enum class ParsePolicy {
  kFirstMatchWins,
  kAccumulateAll,
};

} // namespace topocrawl::parsing
