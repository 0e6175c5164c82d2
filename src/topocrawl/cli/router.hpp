#pragma once

#include "core/logging/logger.hpp"
#include "discovery/crawler.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::cli {

// Parsed invocation of the standalone crawler.
struct CrawlOptions {
  std::vector<discovery::SeedDevice> seeds;
  std::vector<std::string> exclusions;
  std::uint32_t max_hops = 4;
  std::filesystem::path creds_file = "creds.json";
  std::filesystem::path template_dir;
  std::filesystem::path output_dir = ".";
  std::filesystem::path log_file;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  bool show_help = false;
};

// `HOST,IP` and bare `IP` entries separated by ';'. Any entry with more than
// one comma or an empty address is rejected.
bool ParseSeedList(std::string_view raw,
                   std::vector<discovery::SeedDevice>& seeds,
                   std::string& error);

bool ParseCrawlOptions(const std::vector<std::string_view>& args,
                       CrawlOptions& options,
                       std::string& error);

// Parses flags, loads credentials and runs one crawl with the production
// transport and probe. Exit codes follow core::errors::ExitCode:
//   0 => crawl finished, summary and DISCOVERY_COMPLETE:SUCCESS printed
//   1 => crawl could not run after valid invocation
//   2 => usage error (missing/invalid seeds, bad --max-hops, unknown flag)
//   10 => credentials file missing, malformed or empty
int Dispatch(int argc, char** argv);

} // namespace topocrawl::cli
