#include "topocrawl/cli/router.hpp"

#include "artifacts/topology_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "model/credential.hpp"
#include "parsing/textfsm_matcher.hpp"
#include "reachability/network_probe.hpp"
#include "ssh/libssh_transport.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace topocrawl::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitCredentialsInvalid =
    core::errors::ToInt(core::errors::ExitCode::kCredentialsInvalid);

constexpr std::string_view kCompletionSentinel = "DISCOVERY_COMPLETE:SUCCESS";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  topocrawl --seed HOST,IP[;HOST,IP|;IP] [--exclude PATTERN[,PATTERN...]] "
         "[--max-hops N] [--creds-file PATH] [--template-dir DIR] [--out-dir DIR] "
         "[--log-level <debug|info|warn|error>] [--log-file PATH]\n"
      << "\n"
      << "  --seed          seed device(s), ';' separated; a bare IP leaves the hostname\n"
      << "                  to be learned from the device prompt\n"
      << "  --exclude       case-insensitive hostname substrings that are never crawled\n"
      << "  --max-hops      maximum hop count (default: 4)\n"
      << "  --creds-file    JSON array of credentials (default: creds.json)\n"
      << "  --template-dir  TextFSM template directory (default: $NET_TEXTFSM or\n"
      << "                  ./templates/textfsm)\n"
      << "  --out-dir       directory for network_topology*.json (default: .)\n"
      << "  --help, -h      show this message\n";
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

std::vector<std::string_view> Split(std::string_view text, const char separator) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1U;
  }
}

bool ParseMaxHops(std::string_view raw, std::uint32_t& max_hops, std::string& error) {
  std::uint32_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
    error = "invalid --max-hops value '" + std::string(raw) + "' (expected a non-negative integer)";
    return false;
  }
  max_hops = parsed;
  return true;
}

void PrintSummary(const model::DeviceTable& table, const fs::path& results_path,
                  const fs::path& graph_path) {
  const artifacts::TopologySummary summary = artifacts::SummarizeTopology(table);
  std::cout << "discovered " << summary.total_devices << " devices\n"
            << "successfully scanned: " << summary.successful << '\n'
            << "failed to scan: " << summary.failed << '\n'
            << "results saved to: " << results_path.string() << '\n'
            << "topology graph saved to: " << graph_path.string() << '\n'
            << kCompletionSentinel << '\n';
}

} // namespace

bool ParseSeedList(std::string_view raw,
                   std::vector<discovery::SeedDevice>& seeds,
                   std::string& error) {
  for (const std::string_view entry : Split(raw, ';')) {
    if (Trim(entry).empty()) {
      continue;
    }
    const std::vector<std::string_view> parts = Split(entry, ',');
    discovery::SeedDevice seed;
    if (parts.size() == 1U) {
      seed.ip_address = Trim(parts[0]);
    } else if (parts.size() == 2U) {
      seed.hostname = Trim(parts[0]);
      seed.ip_address = Trim(parts[1]);
    } else {
      error = "invalid seed format '" + std::string(entry) +
              "' (must be hostname,ip_address or just ip_address)";
      return false;
    }
    if (seed.ip_address.empty()) {
      error = "invalid seed format '" + std::string(entry) + "' (missing ip_address)";
      return false;
    }
    seeds.push_back(std::move(seed));
  }
  return true;
}

bool ParseCrawlOptions(const std::vector<std::string_view>& args,
                       CrawlOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--help" || token == "-h") {
      options.show_help = true;
      return true;
    }

    const bool takes_value = token == "--seed" || token == "--exclude" ||
                             token == "--max-hops" || token == "--creds-file" ||
                             token == "--creds" || token == "--template-dir" ||
                             token == "--out-dir" || token == "--log-level" ||
                             token == "--log-file";
    if (!takes_value) {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[++i];

    if (token == "--seed") {
      if (!ParseSeedList(value, options.seeds, error)) {
        return false;
      }
    } else if (token == "--exclude") {
      for (const std::string_view pattern : Split(value, ',')) {
        std::string trimmed = Trim(pattern);
        if (!trimmed.empty()) {
          options.exclusions.push_back(std::move(trimmed));
        }
      }
    } else if (token == "--max-hops") {
      if (!ParseMaxHops(value, options.max_hops, error)) {
        return false;
      }
    } else if (token == "--creds-file" || token == "--creds") {
      options.creds_file = fs::path(value);
    } else if (token == "--template-dir") {
      options.template_dir = fs::path(value);
    } else if (token == "--out-dir") {
      options.output_dir = fs::path(value);
    } else if (token == "--log-level") {
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
    } else {
      options.log_file = fs::path(value);
    }
  }

  if (options.seeds.empty()) {
    error = "no seed devices specified (use --seed HOST,IP or --seed IP)";
    return false;
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  CrawlOptions options;
  std::string error;
  if (!ParseCrawlOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  core::logging::Logger logger(options.log_level);
  std::ofstream log_file;
  if (!options.log_file.empty()) {
    log_file.open(options.log_file, std::ios::out | std::ios::app);
    if (!log_file) {
      std::cerr << "error: unable to open log file: " << options.log_file.string() << '\n';
      return kExitFailure;
    }
    logger.SetMirror(&log_file);
  }
  logger.SetRunId(core::MakeRunId());

  std::vector<model::Credential> credentials;
  std::vector<std::string> skipped;
  if (!model::LoadCredentialsFile(options.creds_file, credentials, skipped, error)) {
    logger.Error("credentials unavailable", {{"path", options.creds_file.string()},
                                             {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitCredentialsInvalid;
  }
  for (const std::string& reason : skipped) {
    logger.Warn("skipped credential entry", {{"reason", reason}});
  }
  logger.Info("credentials loaded", {{"path", options.creds_file.string()},
                                     {"count", std::to_string(credentials.size())}});

  std::error_code ec;
  fs::create_directories(options.output_dir, ec);
  if (ec) {
    logger.Error("unable to create output directory",
                 {{"path", options.output_dir.string()}, {"error", ec.message()}});
    std::cerr << "error: unable to create output directory: " << options.output_dir.string()
              << '\n';
    return kExitFailure;
  }

  for (const discovery::SeedDevice& seed : options.seeds) {
    logger.Info("seed device", {{"ip", seed.ip_address},
                                {"hostname", seed.hostname.empty() ? "[pending]"
                                                                   : seed.hostname}});
  }
  logger.Info("starting discovery", {{"seeds", std::to_string(options.seeds.size())},
                                     {"max_hops", std::to_string(options.max_hops)}});

  discovery::DiscoveryOptions discovery_options;
  discovery_options.exclusions = options.exclusions;
  discovery_options.template_dir = options.template_dir;
  discovery_options.results_path = options.output_dir / artifacts::kTopologyFileName;
  discovery_options.graph_path = options.output_dir / artifacts::kTopologyGraphFileName;

  reachability::SystemNetworkProbe probe;
  const parsing::TextFsmMatcher matcher;
  discovery::NetworkDiscovery crawler(std::move(credentials), discovery_options, logger, probe,
                                      ssh::MakeLibsshTransportFactory(), matcher);
  crawler.SetProgressCallback([&logger](std::string_view message) {
    logger.Debug("progress", {{"status", message}});
  });

  const model::DeviceTable& table = crawler.DiscoverSingleThreaded(options.seeds,
                                                                   options.max_hops);
  if (!crawler.SaveSnapshot()) {
    std::cerr << "error: failed to write topology files under "
              << options.output_dir.string() << '\n';
    return kExitFailure;
  }

  PrintSummary(table, discovery_options.results_path, discovery_options.graph_path);
  return kExitSuccess;
}

} // namespace topocrawl::cli
