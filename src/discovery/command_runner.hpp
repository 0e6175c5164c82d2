#pragma once

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "discovery/discovery_options.hpp"
#include "model/device.hpp"
#include "ssh/session_client.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace topocrawl::discovery {

enum class CommandOutcome {
  kOutput,
  kCommandError,
  kProtocolDisabled,
};

// Classifies cleaned output of a neighbor command. Command errors
// ("% Invalid input", "unknown command", ...) win over disabled-protocol
// notices ("CDP is not enabled", ...).
CommandOutcome ClassifyDiscoveryOutput(std::string_view cleaned_output);

// "core-sw1(config)#" -> "core-sw1".
std::string ExtractHostnameFromPrompt(std::string_view prompt);

struct DeviceInfo {
  // Command -> cleaned output.
  std::map<std::string, std::string> outputs;
  std::optional<std::string> extracted_hostname;
};

// Fills hostname (when still empty), raw_data, and serial/model/version from
// `show version` output. Existing values are never overwritten.
void ApplyDeviceInfo(model::DiscoveredDevice& device, const DeviceInfo& info);

// Runs the per-device command sequence on one shell-ready session. Every
// command timeout is clamped to what is left of the device deadline.
class CommandRunner {
public:
  CommandRunner(ssh::SessionClient& client,
                std::string prompt,
                const DiscoveryOptions& options,
                const core::Deadline& deadline,
                core::logging::Logger& logger);

  // Tries each pagination command until one returns the prompt.
  bool DisablePagination();

  DeviceInfo RunDeviceInfoCommands();

  // Returns (command, cleaned output) for every discovery command whose
  // output is usable, in command order.
  std::vector<std::pair<std::string, std::string>> RunDiscoveryCommands();

private:
  bool Run(const std::string& command,
           std::chrono::milliseconds timeout,
           std::string& output,
           std::string& error);
  void PauseBetweenCommands();

  ssh::SessionClient& client_;
  std::string prompt_;
  const DiscoveryOptions& options_;
  const core::Deadline& deadline_;
  core::logging::Logger& logger_;
  bool first_command_ = true;
};

} // namespace topocrawl::discovery
