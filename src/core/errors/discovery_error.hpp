#pragma once

#include <string>
#include <string_view>

namespace topocrawl::core::errors {

// Stable classification for discovery failures.
//
// Device output and libssh messages are free text that varies by vendor and
// library version; logs, device records and the result JSON carry one of these
// grep-friendly codes instead so failures can be filtered without parsing
// details.
enum class DiscoveryErrorCode {
  kConnection,
  kPromptDetection,
  kCommandTimeout,
  kDiscoveryTimeout,
  kNoCredentials,
  kTemplateLoad,
  kParse,
};

std::string_view ToStableErrorCode(DiscoveryErrorCode code);

// Returns single-line contract text:
//   "<STABLE_CODE>: <detail>"
// The ": <detail>" suffix is omitted when detail is empty.
std::string FormatDiscoveryError(DiscoveryErrorCode code, std::string_view detail);

// True when `error_text` was produced by FormatDiscoveryError for `code`.
bool HasErrorCode(std::string_view error_text, DiscoveryErrorCode code);

} // namespace topocrawl::core::errors
