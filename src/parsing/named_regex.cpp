#include "parsing/named_regex.hpp"

#include <cctype>

namespace topocrawl::parsing {

namespace {

bool IsNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Index just past the character class that opens at `pos`.
std::size_t SkipCharacterClass(std::string_view pattern, std::size_t pos) {
  std::size_t i = pos + 1U;
  if (i < pattern.size() && pattern[i] == '^') {
    ++i;
  }
  if (i < pattern.size() && pattern[i] == ']') {
    ++i;
  }
  while (i < pattern.size() && pattern[i] != ']') {
    i += pattern[i] == '\\' ? 2U : 1U;
  }
  return i < pattern.size() ? i + 1U : pattern.size();
}

} // namespace

bool TranslateNamedGroups(std::string_view pattern, NamedPattern& out, std::string& error) {
  out = NamedPattern{};
  out.ecmascript.reserve(pattern.size());

  std::size_t i = 0;
  while (i < pattern.size()) {
    const char c = pattern[i];
    if (c == '\\') {
      out.ecmascript.append(pattern.substr(i, 2));
      i += 2U;
      continue;
    }
    if (c == '[') {
      const std::size_t end = SkipCharacterClass(pattern, i);
      out.ecmascript.append(pattern.substr(i, end - i));
      i = end;
      continue;
    }
    if (c != '(') {
      out.ecmascript.push_back(c);
      ++i;
      continue;
    }

    if (i + 1U >= pattern.size() || pattern[i + 1U] != '?') {
      ++out.capture_count;
      out.ecmascript.push_back('(');
      ++i;
      continue;
    }

    std::size_t name_start = 0;
    if (pattern.substr(i, 4) == "(?P<") {
      name_start = i + 4U;
    } else if (pattern.substr(i, 3) == "(?<" && i + 3U < pattern.size() &&
               IsNameChar(pattern[i + 3U])) {
      name_start = i + 3U;
    }
    if (name_start == 0U) {
      // (?: (?= (?! and friends
      out.ecmascript.append(pattern.substr(i, 2));
      i += 2U;
      continue;
    }

    std::size_t name_end = name_start;
    while (name_end < pattern.size() && IsNameChar(pattern[name_end])) {
      ++name_end;
    }
    if (name_end >= pattern.size() || pattern[name_end] != '>' || name_end == name_start) {
      error = "malformed named group at offset " + std::to_string(i);
      return false;
    }
    ++out.capture_count;
    out.groups.emplace_back(std::string(pattern.substr(name_start, name_end - name_start)),
                            out.capture_count);
    out.ecmascript.push_back('(');
    i = name_end + 1U;
  }
  return true;
}

std::size_t CountCaptureGroups(std::string_view pattern) {
  NamedPattern translated;
  std::string error;
  if (!TranslateNamedGroups(pattern, translated, error)) {
    return 0;
  }
  return translated.capture_count;
}

} // namespace topocrawl::parsing
