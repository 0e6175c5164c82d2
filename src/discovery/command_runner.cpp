#include "discovery/command_runner.hpp"

#include "core/errors/discovery_error.hpp"
#include "parsing/text_cleanup.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <thread>

namespace topocrawl::discovery {

namespace {

using core::errors::DiscoveryErrorCode;
using core::errors::FormatDiscoveryError;

constexpr std::array<std::string_view, 5> kCommandErrorMarkers = {
    "invalid input", "incomplete command", "unknown command", "% invalid", "% ambiguous command",
};

constexpr std::array<std::string_view, 4> kProtocolDisabledMarkers = {
    "not enabled", "not running", "is disabled", "not configured",
};

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::optional<std::string> FirstCapture(const std::string& text, const std::regex& pattern) {
  std::smatch match;
  if (!std::regex_search(text, match, pattern) || match.size() < 2U || !match[1].matched) {
    return std::nullopt;
  }
  return match[1].str();
}

} // namespace

CommandOutcome ClassifyDiscoveryOutput(std::string_view cleaned_output) {
  const std::string lowered = ToLower(cleaned_output);
  for (const std::string_view marker : kCommandErrorMarkers) {
    if (lowered.find(marker) != std::string::npos) {
      return CommandOutcome::kCommandError;
    }
  }
  for (const std::string_view marker : kProtocolDisabledMarkers) {
    if (lowered.find(marker) != std::string::npos) {
      return CommandOutcome::kProtocolDisabled;
    }
  }
  return CommandOutcome::kOutput;
}

std::string ExtractHostnameFromPrompt(std::string_view prompt) {
  std::string hostname;
  hostname.reserve(prompt.size());
  for (const char c : prompt) {
    if (c != '>' && c != '#') {
      hostname.push_back(c);
    }
  }
  hostname = Trim(hostname);
  if (const auto paren = hostname.find('('); paren != std::string::npos) {
    hostname.erase(paren);
  }
  return hostname;
}

void ApplyDeviceInfo(model::DiscoveredDevice& device, const DeviceInfo& info) {
  if (info.extracted_hostname.has_value() && device.hostname.empty()) {
    device.hostname = info.extracted_hostname.value();
  }
  for (const auto& [command, output] : info.outputs) {
    device.raw_data[command] = output;
  }
  if (info.extracted_hostname.has_value()) {
    device.raw_data["extracted_hostname"] = info.extracted_hostname.value();
  }

  const auto version_it = info.outputs.find("show version");
  if (version_it == info.outputs.end()) {
    return;
  }
  const std::string& version_output = version_it->second;

  static const std::regex kSerial(R"((?:Processor board ID|Serial Number)[:\s]+(\S+))",
                                  std::regex::ECMAScript | std::regex::icase);
  static const std::regex kModel(R"(Model number[:\s]+([^\n]+))",
                                 std::regex::ECMAScript | std::regex::icase);
  static const std::regex kVersion(R"(Version\s+([^,\s]+))",
                                   std::regex::ECMAScript | std::regex::icase);

  if (!device.serial_number.has_value()) {
    device.serial_number = FirstCapture(version_output, kSerial);
  }
  if (!device.model.has_value()) {
    if (auto model = FirstCapture(version_output, kModel); model.has_value()) {
      device.model = Trim(model.value());
    }
  }
  if (!device.software_version.has_value()) {
    device.software_version = FirstCapture(version_output, kVersion);
  }
}

CommandRunner::CommandRunner(ssh::SessionClient& client,
                             std::string prompt,
                             const DiscoveryOptions& options,
                             const core::Deadline& deadline,
                             core::logging::Logger& logger)
    : client_(client),
      prompt_(std::move(prompt)),
      options_(options),
      deadline_(deadline),
      logger_(logger) {}

void CommandRunner::PauseBetweenCommands() {
  if (first_command_) {
    first_command_ = false;
    return;
  }
  const auto pause = deadline_.Clamp(options_.inter_command_delay);
  if (pause.count() > 0) {
    std::this_thread::sleep_for(pause);
  }
}

bool CommandRunner::Run(const std::string& command,
                        const std::chrono::milliseconds timeout,
                        std::string& output,
                        std::string& error) {
  if (deadline_.Expired()) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kDiscoveryTimeout,
                                 "device budget exhausted before " + command);
    return false;
  }
  PauseBetweenCommands();
  return client_.ExecuteCommand(command, prompt_, deadline_.Clamp(timeout), output, error);
}

bool CommandRunner::DisablePagination() {
  for (const std::string& command : options_.pagination_commands) {
    logger_.Info("disabling pagination", {{"command", command}});
    std::string output;
    std::string error;
    if (Run(command, options_.pagination_timeout, output, error)) {
      logger_.Info("pagination disabled", {{"command", command}});
      return true;
    }
    logger_.Debug("pagination command did not return the prompt",
                  {{"command", command}, {"error", error}});
    if (client_.state() == ssh::SessionState::kDisconnected || deadline_.Expired()) {
      break;
    }
  }
  logger_.Warn("all pagination commands failed; continuing");
  return false;
}

DeviceInfo CommandRunner::RunDeviceInfoCommands() {
  DeviceInfo info;
  // Line-anchored so the echoed "... include hostname" command is skipped.
  static const std::regex kHostname(R"((?:^|\n)[ \t]*hostname[ \t]+(\S+))",
                                    std::regex::ECMAScript | std::regex::icase);

  for (const std::string& command : options_.device_info_commands) {
    logger_.Info("running device info command", {{"command", command}});
    std::string output;
    std::string error;
    if (!Run(command, options_.device_info_timeout, output, error)) {
      logger_.Debug("device info command failed", {{"command", command}, {"error", error}});
      if (client_.state() == ssh::SessionState::kDisconnected || deadline_.Expired()) {
        break;
      }
      continue;
    }
    std::string cleaned = parsing::CleanText(output);
    if (command.find("hostname") != std::string::npos) {
      if (auto hostname = FirstCapture(cleaned, kHostname); hostname.has_value()) {
        info.extracted_hostname = std::move(hostname);
      }
    }
    info.outputs[command] = std::move(cleaned);
  }
  return info;
}

std::vector<std::pair<std::string, std::string>> CommandRunner::RunDiscoveryCommands() {
  std::vector<std::pair<std::string, std::string>> outputs;
  for (const std::string& command : options_.discovery_commands) {
    logger_.Info("running discovery command", {{"command", command}});
    std::string output;
    std::string error;
    if (!Run(command, options_.discovery_command_timeout, output, error)) {
      logger_.Error("discovery command failed", {{"command", command}, {"error", error}});
      if (client_.state() == ssh::SessionState::kDisconnected || deadline_.Expired()) {
        break;
      }
      continue;
    }

    std::string cleaned = parsing::CleanText(output);
    switch (ClassifyDiscoveryOutput(cleaned)) {
    case CommandOutcome::kCommandError:
      logger_.Info("skipping command after device error", {{"command", command}});
      continue;
    case CommandOutcome::kProtocolDisabled:
      logger_.Info("protocol not enabled on device", {{"command", command}});
      continue;
    case CommandOutcome::kOutput:
      break;
    }

    logger_.Info("discovery command succeeded",
                 {{"command", command}, {"bytes", std::to_string(cleaned.size())}});
    outputs.emplace_back(command, std::move(cleaned));
  }
  return outputs;
}

} // namespace topocrawl::discovery
