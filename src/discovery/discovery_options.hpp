#pragma once

#include "parsing/parse_template.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace topocrawl::discovery {

// Tunables for one crawl. Defaults are the values the crawler was tuned with
// against real IOS/NX-OS/EOS devices; they are pragmatic rather than derived.
struct DiscoveryOptions {
  // Whole per-device workflow budget.
  std::chrono::milliseconds device_budget{60'000};
  // Share of the device budget granted to the pre-login TCP probe.
  double socket_probe_fraction = 0.25;
  // Share of the device budget granted to each credential attempt.
  double ssh_attempt_fraction = 1.0 / 3.0;

  std::chrono::milliseconds device_probe_timeout{3'000};
  std::chrono::milliseconds neighbor_probe_timeout{1'000};
  std::chrono::milliseconds poll_interval{250};

  int prompt_attempts = 3;
  std::chrono::milliseconds prompt_timeout{5'000};
  std::chrono::milliseconds pagination_timeout{10'000};
  std::chrono::milliseconds device_info_timeout{15'000};
  std::chrono::milliseconds discovery_command_timeout{30'000};
  // Pause between consecutive commands on the same session.
  std::chrono::milliseconds inter_command_delay{0};

  std::uint16_t ssh_port = 22;

  std::vector<std::string> pagination_commands = {
      "terminal length 0",
      "terminal pager 0",
      "set cli screen-length 0",
  };
  std::vector<std::string> device_info_commands;
  std::vector<std::string> discovery_commands = {
      "show cdp neighbors detail",
      "show lldp neighbors detail",
      "show lldp neighbor detail",
  };

  // Case-insensitive hostname substrings that are never crawled.
  std::vector<std::string> exclusions;

  std::filesystem::path template_dir;
  parsing::ParsePolicy parse_policy = parsing::ParsePolicy::kFirstMatchWins;

  // Snapshot destinations; empty disables snapshot writing.
  std::filesystem::path results_path;
  std::filesystem::path graph_path;
};

} // namespace topocrawl::discovery
