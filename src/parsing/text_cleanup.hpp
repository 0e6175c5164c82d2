#pragma once

#include <string>
#include <string_view>

namespace topocrawl::parsing {

// Prepares raw terminal output for pattern matching: CRLF/CR become LF,
// `ESC[<digits;>m` and `ESC[<digits;>K` sequences are removed, then control
// characters other than tab and newline are dropped (C1 controls included when
// UTF-8 encoded).
std::string CleanText(std::string_view text);

// Drops every control character (tab and newline too) and trims.
std::string CleanValue(std::string_view value);

} // namespace topocrawl::parsing
