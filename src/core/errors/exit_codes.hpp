#pragma once

namespace topocrawl::core::errors {

// Process-exit contract for the standalone crawler:
// - 0 success (the DISCOVERY_COMPLETE sentinel was printed)
// - 1 generic failure after valid invocation
// - 2 usage/argument failure (missing seeds, bad --max-hops, unknown flag)
// - 10 credentials file missing, malformed or empty
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kCredentialsInvalid = 10,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace topocrawl::core::errors
