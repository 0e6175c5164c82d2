#include "parsing/text_cleanup.hpp"

#include <cctype>

namespace topocrawl::parsing {

namespace {

constexpr char kEscape = '\x1b';

// Length of an `ESC[<digits;>m|K` sequence starting at `pos`, or 0.
std::size_t AnsiSequenceLength(std::string_view text, std::size_t pos) {
  if (text[pos] != kEscape || pos + 1U >= text.size() || text[pos + 1U] != '[') {
    return 0;
  }
  std::size_t end = pos + 2U;
  while (end < text.size() &&
         (std::isdigit(static_cast<unsigned char>(text[end])) != 0 || text[end] == ';')) {
    ++end;
  }
  if (end < text.size() && (text[end] == 'm' || text[end] == 'K')) {
    return end - pos + 1U;
  }
  return 0;
}

bool IsC0Control(unsigned char c) {
  return c < 0x20U || c == 0x7fU;
}

// U+0080..U+009F encoded as 0xC2 0x80..0x9F.
bool IsUtf8C1Control(std::string_view text, std::size_t pos) {
  if (pos + 1U >= text.size()) {
    return false;
  }
  const auto lead = static_cast<unsigned char>(text[pos]);
  const auto trail = static_cast<unsigned char>(text[pos + 1U]);
  return lead == 0xc2U && trail >= 0x80U && trail <= 0x9fU;
}

} // namespace

std::string CleanText(std::string_view text) {
  std::string cleaned;
  cleaned.reserve(text.size());

  for (std::size_t i = 0; i < text.size();) {
    const char c = text[i];
    if (c == '\r') {
      cleaned.push_back('\n');
      i += (i + 1U < text.size() && text[i + 1U] == '\n') ? 2U : 1U;
      continue;
    }
    if (const std::size_t ansi = AnsiSequenceLength(text, i); ansi > 0U) {
      i += ansi;
      continue;
    }
    if (IsUtf8C1Control(text, i)) {
      i += 2U;
      continue;
    }
    const auto byte = static_cast<unsigned char>(c);
    if (IsC0Control(byte) && c != '\n' && c != '\t') {
      ++i;
      continue;
    }
    cleaned.push_back(c);
    ++i;
  }
  return cleaned;
}

std::string CleanValue(std::string_view value) {
  std::string cleaned;
  cleaned.reserve(value.size());
  for (std::size_t i = 0; i < value.size();) {
    if (IsUtf8C1Control(value, i)) {
      i += 2U;
      continue;
    }
    if (!IsC0Control(static_cast<unsigned char>(value[i]))) {
      cleaned.push_back(value[i]);
    }
    ++i;
  }

  const std::size_t begin = cleaned.find_first_not_of(' ');
  if (begin == std::string::npos) {
    return "";
  }
  const std::size_t end = cleaned.find_last_not_of(' ');
  return cleaned.substr(begin, end - begin + 1U);
}

} // namespace topocrawl::parsing
