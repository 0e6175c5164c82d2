#include "core/errors/discovery_error.hpp"

namespace topocrawl::core::errors {

std::string_view ToStableErrorCode(const DiscoveryErrorCode code) {
  switch (code) {
  case DiscoveryErrorCode::kConnection:
    return "CONNECTION_ERROR";
  case DiscoveryErrorCode::kPromptDetection:
    return "PROMPT_DETECTION_ERROR";
  case DiscoveryErrorCode::kCommandTimeout:
    return "COMMAND_TIMEOUT_ERROR";
  case DiscoveryErrorCode::kDiscoveryTimeout:
    return "DISCOVERY_TIMEOUT_ERROR";
  case DiscoveryErrorCode::kNoCredentials:
    return "NO_CREDENTIALS_ERROR";
  case DiscoveryErrorCode::kTemplateLoad:
    return "TEMPLATE_LOAD_ERROR";
  case DiscoveryErrorCode::kParse:
    return "PARSE_ERROR";
  }
  return "CONNECTION_ERROR";
}

std::string FormatDiscoveryError(const DiscoveryErrorCode code, std::string_view detail) {
  std::string text(ToStableErrorCode(code));
  if (!detail.empty()) {
    text += ": ";
    text += detail;
  }
  return text;
}

bool HasErrorCode(std::string_view error_text, const DiscoveryErrorCode code) {
  const std::string_view stable = ToStableErrorCode(code);
  return error_text.substr(0, stable.size()) == stable;
}

} // namespace topocrawl::core::errors
