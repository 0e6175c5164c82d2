#include "discovery/crawler.hpp"

#include "core/errors/discovery_error.hpp"
#include "discovery/command_runner.hpp"
#include "model/neighbor_fields.hpp"
#include "normalize/interface_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <sstream>

namespace topocrawl::discovery {

namespace {

using core::errors::DiscoveryErrorCode;
using core::errors::FormatDiscoveryError;

constexpr std::string_view kUnknownHostnamePrefix = "unknown-";

std::string ToUpper(std::string_view text) {
  std::string upper(text);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return upper;
}

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::vector<std::string> SplitCapabilities(std::string_view text) {
  std::vector<std::string> capabilities;
  std::istringstream in{std::string(text)};
  std::string token;
  while (in >> token) {
    capabilities.push_back(token);
  }
  return capabilities;
}

// True for names worth a forward lookup: not a placeholder, not an address.
bool IsResolvableHostname(std::string_view hostname) {
  return !hostname.empty() && hostname.rfind(kUnknownHostnamePrefix, 0) != 0 &&
         !reachability::IsLiteralAddress(hostname);
}

std::optional<std::string> FirstPresent(const model::NeighborRecord& record,
                                        std::initializer_list<std::string_view> keys) {
  for (const std::string_view key : keys) {
    const auto it = record.find(std::string(key));
    if (it != record.end() && !it->second.empty()) {
      return it->second;
    }
  }
  return std::nullopt;
}

std::optional<std::string> Normalized(const std::optional<std::string>& name) {
  if (!name.has_value()) {
    return std::nullopt;
  }
  std::string normalized = normalize::NormalizeInterfaceName(name.value());
  if (normalized.empty()) {
    return std::nullopt;
  }
  return normalized;
}

void RecordLink(model::DiscoveredDevice& device,
                const std::string& local_interface,
                const std::string& peer_ip,
                const std::string& peer_interface,
                const std::string& discovered_via) {
  device.local_interfaces.emplace(local_interface,
                                  model::LocalInterfaceLink{peer_ip, peer_interface,
                                                            discovered_via});
  model::InterfaceRecord record;
  record.name = local_interface;
  record.connected_to = peer_ip;
  record.remote_interface = peer_interface;
  record.type = model::LinkTypeFromCommand(discovered_via);
  device.AddInterface(std::move(record));
}

void RetargetLinks(model::DiscoveredDevice& device, const std::string& old_ip,
                   const std::string& new_ip) {
  for (model::InterfaceRecord& record : device.interfaces) {
    if (record.connected_to == old_ip) {
      record.connected_to = new_ip;
    }
  }
  for (auto& [name, link] : device.local_interfaces) {
    if (link.connected_to == old_ip) {
      link.connected_to = new_ip;
    }
  }
}

} // namespace

NetworkDiscovery::NetworkDiscovery(std::vector<model::Credential> credentials,
                                   DiscoveryOptions options,
                                   core::logging::Logger& logger,
                                   reachability::INetworkProbe& probe,
                                   ssh::TransportFactory transport_factory,
                                   const parsing::ITemplateMatcher& matcher)
    : options_(std::move(options)),
      logger_(logger),
      probe_(probe),
      resolver_(std::move(credentials), probe, std::move(transport_factory), logger,
                reachability::ResolverOptions{options_.ssh_port, options_.socket_probe_fraction,
                                              options_.ssh_attempt_fraction,
                                              options_.poll_interval}),
      parser_(matcher, logger, options_.parse_policy) {
  const std::filesystem::path template_dir =
      parsing::DefaultTemplateDirectory(options_.template_dir.string());
  logger_.Info("using template directory", {{"dir", template_dir.string()}});
  parser_.LoadTemplatesFromDirectory(options_.discovery_commands, template_dir);
  parser_.AddTemplate(parsing::ParseMethod::kRegex, R"(hostname\s+(?<hostname>\S+))", 100,
                      "hostname_from_config");

  if (!options_.exclusions.empty()) {
    std::string joined;
    for (const std::string& pattern : options_.exclusions) {
      joined += joined.empty() ? pattern : ", " + pattern;
    }
    logger_.Info("exclusion patterns loaded", {{"patterns", joined}});
  }
}

void NetworkDiscovery::SetProgressCallback(ProgressCallback callback) {
  progress_ = std::move(callback);
}

void NetworkDiscovery::Progress(const std::string& message) {
  if (progress_) {
    progress_(message);
  }
}

bool NetworkDiscovery::ShouldExclude(std::string_view hostname) const {
  if (hostname.empty()) {
    return false;
  }
  const std::string upper = ToUpper(hostname);
  for (const std::string& pattern : options_.exclusions) {
    if (pattern.empty()) {
      continue;
    }
    if (upper.find(ToUpper(pattern)) != std::string::npos) {
      logger_.Info("device excluded by pattern",
                   {{"hostname", hostname}, {"pattern", pattern}});
      return true;
    }
  }
  return false;
}

bool NetworkDiscovery::SaveSnapshot() {
  bool ok = true;
  std::string error;
  if (!options_.results_path.empty() &&
      !artifacts::WriteTopologyJson(table_, options_.results_path, error)) {
    logger_.Error("failed to save discovery results", {{"error", error}});
    ok = false;
  }
  if (!options_.graph_path.empty() &&
      !artifacts::WriteTopologyGraphJson(table_, options_.graph_path, error)) {
    logger_.Error("failed to save topology graph", {{"error", error}});
    ok = false;
  }
  return ok;
}

const model::DeviceTable& NetworkDiscovery::DiscoverSingleThreaded(
    const std::vector<SeedDevice>& seeds, const std::uint32_t max_hops) {
  std::vector<model::DeviceId> current;
  for (const SeedDevice& seed : seeds) {
    model::DiscoveredDevice device;
    device.hostname = seed.hostname;
    device.ip_address = seed.ip_address;
    device.hop_count = 0;
    device.discovered_at = core::NowUtcTimestamp();
    const auto id = table_.Insert(std::move(device));
    if (!id.has_value()) {
      logger_.Warn("ignoring duplicate or empty seed",
                   {{"ip", seed.ip_address}, {"hostname", seed.hostname}});
      continue;
    }
    current.push_back(id.value());
  }

  std::uint32_t hop = 0;
  while (hop <= max_hops && !current.empty()) {
    logger_.Info("processing hop", {{"hop", std::to_string(hop)},
                                    {"devices", std::to_string(current.size())}});
    Progress("processing hop " + std::to_string(hop) + " with " +
             std::to_string(current.size()) + " devices");

    std::vector<model::DeviceId> next;
    for (const model::DeviceId id : current) {
      const model::DiscoveredDevice& device = table_.Get(id);
      if (device.visited || device.failed) {
        continue;
      }
      if (!ValidateReachability(id)) {
        SaveSnapshot();
        continue;
      }

      std::vector<model::DeviceId> queued = DiscoverDevice(id, hop, max_hops);
      if (queued.empty()) {
        logger_.Info("device has no new neighbors", {{"ip", table_.Get(id).ip_address}});
      } else {
        logger_.Info("device queued new neighbors", {{"ip", table_.Get(id).ip_address},
                                                     {"count", std::to_string(queued.size())}});
        for (const model::DeviceId queued_id : queued) {
          const model::DiscoveredDevice& neighbor = table_.Get(queued_id);
          logger_.Debug("queued neighbor",
                        {{"ip", neighbor.ip_address}, {"hostname", neighbor.hostname}});
        }
        next.insert(next.end(), queued.begin(), queued.end());
      }
      SaveSnapshot();
    }

    std::size_t successful = 0;
    std::size_t failed = 0;
    std::size_t pending = 0;
    for (const model::DeviceId id : current) {
      const model::DiscoveredDevice& device = table_.Get(id);
      if (device.failed) {
        ++failed;
      } else if (device.visited) {
        ++successful;
      } else {
        ++pending;
      }
    }
    logger_.Info("hop summary", {{"hop", std::to_string(hop)},
                                 {"successful", std::to_string(successful)},
                                 {"failed", std::to_string(failed)},
                                 {"pending", std::to_string(pending)},
                                 {"next_hop_queue", std::to_string(next.size())}});

    if (next.empty()) {
      logger_.Info("no devices queued for the next hop; stopping");
      break;
    }
    ++hop;
    current = std::move(next);
  }

  PostProcess();
  LogFinalStatistics();
  SaveSnapshot();
  Progress("discovery complete");
  return table_;
}

bool NetworkDiscovery::ValidateReachability(const model::DeviceId id) {
  const model::DiscoveredDevice& device = table_.Get(id);
  const std::string ip = device.ip_address;
  const std::string hostname = IsResolvableHostname(device.hostname) ? device.hostname : "";

  std::string working_address;
  if (!reachability::ResolveWorkingAddress(probe_, logger_, ip, hostname, options_.ssh_port,
                                           options_.device_probe_timeout, working_address)) {
    table_.MarkFailed(id, "Device unreachable via TCP", model::ReachabilityStatus::kUnreachable);
    logger_.Info("device unreachable via tcp", {{"ip", ip}});
    Progress("device " + ip + " is unreachable");
    return false;
  }

  if (working_address != ip) {
    std::string error;
    if (!table_.Rekey(ip, working_address, error)) {
      logger_.Warn("cannot move device to resolved address", {{"ip", ip}, {"error", error}});
      table_.MarkFailed(id, "Device unreachable via TCP",
                        model::ReachabilityStatus::kUnreachable);
      return false;
    }
    logger_.Info("device re-keyed to resolved address",
                 {{"original_ip", ip}, {"ip", working_address}});
  }
  return true;
}

std::vector<model::DeviceId> NetworkDiscovery::DiscoverDevice(const model::DeviceId id,
                                                              const std::uint32_t hop,
                                                              const std::uint32_t max_hops) {
  std::vector<model::DeviceId> queued;
  model::DiscoveredDevice& device = table_.Get(id);
  if (device.visited || table_.IsVisitedIp(device.ip_address) ||
      table_.IsVisitedHostname(device.hostname)) {
    logger_.Info("device already visited; skipping",
                 {{"ip", device.ip_address}, {"hostname", device.hostname}});
    table_.MarkVisited(id);
    return queued;
  }

  table_.MarkVisited(id);
  device.hop_count = hop;
  logger_.Info("discovering device", {{"ip", device.ip_address},
                                      {"hostname", device.hostname},
                                      {"hop", std::to_string(hop)}});
  Progress("discovering " + device.ip_address + " at hop " + std::to_string(hop));

  const core::Deadline deadline(options_.device_budget);
  std::string error;
  const bool collect_neighbors = hop < max_hops;
  if (!collect_neighbors) {
    logger_.Info("hop limit reached; neighbor commands skipped", {{"ip", device.ip_address}});
  }

  if (!RunDeviceWorkflow(id, collect_neighbors, deadline, queued, error)) {
    model::DiscoveredDevice& failed = table_.Get(id);
    if (!failed.failed) {
      table_.MarkFailed(id, error, failed.reachability_status);
    }
    logger_.Error("device discovery failed", {{"ip", failed.ip_address}, {"error", error}});
    Progress("discovery of " + failed.ip_address + " failed");
  }

  table_.Get(id).last_update = core::NowUtcTimestamp();
  return queued;
}

bool NetworkDiscovery::RunDeviceWorkflow(const model::DeviceId id,
                                         const bool collect_neighbors,
                                         const core::Deadline& deadline,
                                         std::vector<model::DeviceId>& queued,
                                         std::string& error) {
  model::DiscoveredDevice& device = table_.Get(id);
  const std::string ip = device.ip_address;
  const auto out_of_budget = [&]() {
    if (!deadline.Expired()) {
      return false;
    }
    error = FormatDiscoveryError(DiscoveryErrorCode::kDiscoveryTimeout,
                                 "Discovery timeout for " + ip);
    return true;
  };

  reachability::ResolvedConnection connection;
  if (!resolver_.TryCredentials(ip, deadline, connection)) {
    if (out_of_budget()) {
      return false;
    }
    table_.MarkFailed(id, "No valid credentials", model::ReachabilityStatus::kUnreachable);
    logger_.Info("no credential logged in",
                 {{"ip", ip}, {"error", FormatDiscoveryError(DiscoveryErrorCode::kNoCredentials,
                                                             "no valid credentials for " + ip)}});
    error = "No valid credentials";
    return false;
  }
  ssh::SessionClient& client = *connection.client;

  device.successful_credential = model::DescribeCredential(connection.credential);
  device.reachability_status = model::ReachabilityStatus::kReachable;
  device.failed = false;
  device.error_msg.reset();

  if (out_of_budget()) {
    client.Disconnect();
    return false;
  }
  if (!client.CreateShell(error)) {
    client.Disconnect();
    return false;
  }

  std::string prompt;
  std::string prompt_error;
  if (!client.FindPrompt(options_.prompt_attempts, options_.prompt_timeout, deadline, prompt,
                         prompt_error)) {
    logger_.Warn("could not detect prompt; using '#'", {{"ip", ip}, {"error", prompt_error}});
    prompt = "#";
  }
  logger_.Info("using prompt", {{"ip", ip}, {"prompt", prompt}});

  if (device.hostname.empty()) {
    const std::string from_prompt = ExtractHostnameFromPrompt(prompt);
    if (!from_prompt.empty()) {
      device.hostname = from_prompt;
      table_.MarkVisited(id);
      logger_.Info("hostname taken from prompt", {{"ip", ip}, {"hostname", from_prompt}});
    }
  }

  if (out_of_budget()) {
    client.Disconnect();
    return false;
  }

  CommandRunner runner(client, prompt, options_, deadline, logger_);
  runner.DisablePagination();
  ApplyDeviceInfo(device, runner.RunDeviceInfoCommands());
  // Registers a hostname learned from device-info output.
  table_.MarkVisited(id);
  if (out_of_budget()) {
    client.Disconnect();
    return false;
  }

  if (collect_neighbors) {
    const auto outputs = runner.RunDiscoveryCommands();
    client.Disconnect();
    if (out_of_budget()) {
      return false;
    }
    ProcessNeighbors(id, outputs, deadline, queued);
    if (out_of_budget()) {
      return false;
    }
  }

  client.Disconnect();
  return true;
}

void NetworkDiscovery::ProcessNeighbors(
    const model::DeviceId id,
    const std::vector<std::pair<std::string, std::string>>& outputs,
    const core::Deadline& deadline,
    std::vector<model::DeviceId>& queued) {
  std::vector<model::NeighborRecord> found;
  for (const auto& [command, output] : outputs) {
    const std::string lowered = ToLower(command);
    if (lowered.find("cdp neighbor") == std::string::npos &&
        lowered.find("lldp neighbor") == std::string::npos) {
      continue;
    }
    std::vector<model::NeighborRecord> records = parser_.Parse(output);
    for (model::NeighborRecord& record : records) {
      record[std::string(model::kDiscoveredViaField)] = command;
      found.push_back(std::move(record));
    }
  }

  const std::string device_ip = table_.Get(id).ip_address;
  const std::uint32_t neighbor_hop = table_.Get(id).hop_count + 1U;
  if (found.empty()) {
    logger_.Info("no neighbors found", {{"ip", device_ip}});
    return;
  }
  logger_.Info("neighbors found", {{"ip", device_ip}, {"count", std::to_string(found.size())}});
  table_.Get(id).neighbors = found;

  for (const model::NeighborRecord& record : found) {
    const model::NeighborView view = model::ResolveNeighbor(record);
    const std::optional<std::string> neighbor_ip =
        view.ip_address.has_value() ? model::CleanIpv4Address(view.ip_address.value())
                                    : std::nullopt;
    if (!neighbor_ip.has_value()) {
      logger_.Debug("skipping neighbor without a valid address",
                    {{"ip", device_ip}, {"hostname", view.hostname.value_or("")}});
      continue;
    }
    const std::string& ip = neighbor_ip.value();
    const std::optional<std::string> local_interface = Normalized(view.local_interface);
    const std::optional<std::string> remote_interface = Normalized(view.remote_interface);

    if (local_interface.has_value()) {
      RecordLink(table_.Get(id), local_interface.value(), ip, remote_interface.value_or(""),
                 view.discovered_via);
    }

    if (!table_.IsKnownAddress(ip)) {
      const std::string hostname =
          view.hostname.value_or(std::string(kUnknownHostnamePrefix) + ip);
      if (ShouldExclude(hostname)) {
        logger_.Info("excluding neighbor", {{"hostname", hostname}, {"ip", ip}});
        continue;
      }
      if (deadline.Expired()) {
        logger_.Warn("device budget exhausted while probing neighbors", {{"ip", device_ip}});
        return;
      }

      const std::string queue_address = FindQueueAddress(ip, hostname, deadline);
      if (queue_address.empty()) {
        continue;
      }

      model::DiscoveredDevice neighbor;
      neighbor.hostname = hostname;
      neighbor.ip_address = queue_address;
      if (queue_address != ip) {
        neighbor.original_ip = ip;
        RetargetLinks(table_.Get(id), ip, queue_address);
      }
      neighbor.platform = view.platform;
      neighbor.capabilities = SplitCapabilities(view.capabilities.value_or(""));
      neighbor.management_ip = FirstPresent(record, {"mgmt_address", "management_ip",
                                                     "MGMT_ADDRESS"});
      neighbor.system_description =
          FirstPresent(record, {"system_description", "SYSTEM_DESCRIPTION"});
      neighbor.software_version = FirstPresent(record, {"software_version", "SOFTWARE_VERSION"});
      if (const auto chassis_id = FirstPresent(record, {"chassis_id", "CHASSIS_ID"})) {
        neighbor.mac_address = model::CleanMacAddress(chassis_id.value());
      }
      neighbor.parent = device_ip;
      neighbor.hop_count = neighbor_hop;
      neighbor.discovered_at = core::NowUtcTimestamp();
      if (remote_interface.has_value()) {
        RecordLink(neighbor, remote_interface.value(), device_ip, local_interface.value_or(""),
                   view.discovered_via);
      }

      const auto neighbor_id = table_.Insert(std::move(neighbor));
      if (!neighbor_id.has_value()) {
        logger_.Debug("neighbor already tracked", {{"ip", queue_address}});
        continue;
      }
      queued.push_back(neighbor_id.value());
      logger_.Info("queued neighbor for discovery",
                   {{"ip", queue_address}, {"hostname", hostname},
                    {"hop", std::to_string(neighbor_hop)}});
      continue;
    }

    const auto existing_id = table_.Resolve(ip);
    if (!existing_id.has_value() || existing_id.value() == id || !local_interface.has_value() ||
        !remote_interface.has_value()) {
      continue;
    }
    RecordLink(table_.Get(existing_id.value()), remote_interface.value(), device_ip,
               local_interface.value(), view.discovered_via);
  }
}

std::string NetworkDiscovery::FindQueueAddress(const std::string& ip,
                                               const std::string& hostname,
                                               const core::Deadline& deadline) {
  logger_.Info("checking ssh port on neighbor", {{"ip", ip}, {"hostname", hostname}});
  if (probe_.IsPortOpen(ip, options_.ssh_port, deadline.Clamp(options_.neighbor_probe_timeout))) {
    return ip;
  }
  if (!IsResolvableHostname(hostname)) {
    logger_.Info("neighbor unreachable and has no resolvable name; skipping",
                 {{"ip", ip}, {"hostname", hostname}});
    return "";
  }

  std::string address;
  std::string error;
  if (!probe_.Resolve(hostname, address, error)) {
    logger_.Info("neighbor lookup failed; skipping", {{"hostname", hostname}, {"error", error}});
    return "";
  }
  if (address == ip) {
    logger_.Info("neighbor lookup returned the same address; skipping",
                 {{"hostname", hostname}, {"ip", ip}});
    return "";
  }
  if (table_.IsKnownAddress(address)) {
    logger_.Info("neighbor resolves to a known device; skipping",
                 {{"hostname", hostname}, {"resolved", address}});
    return "";
  }
  if (!probe_.IsPortOpen(address, options_.ssh_port,
                         deadline.Clamp(options_.neighbor_probe_timeout))) {
    logger_.Info("resolved neighbor address is unreachable; skipping",
                 {{"hostname", hostname}, {"resolved", address}});
    return "";
  }
  logger_.Info("queuing neighbor under resolved address",
               {{"hostname", hostname}, {"ip", ip}, {"resolved", address}});
  return address;
}

void NetworkDiscovery::PostProcess() {
  logger_.Info("post-processing device data");
  std::map<std::string, std::string> hostname_by_ip;
  std::map<std::string, std::string> platform_by_ip;
  for (const model::DeviceId id : table_.Ids()) {
    for (const model::NeighborRecord& record : table_.Get(id).neighbors) {
      const model::NeighborView view = model::ResolveNeighbor(record);
      if (!view.ip_address.has_value()) {
        continue;
      }
      const auto ip = model::CleanIpv4Address(view.ip_address.value());
      if (!ip.has_value()) {
        continue;
      }
      if (view.hostname.has_value()) {
        hostname_by_ip[ip.value()] = view.hostname.value();
      }
      if (view.platform.has_value()) {
        platform_by_ip[ip.value()] = view.platform.value();
      }
    }
  }

  const auto backfill = [&](const std::map<std::string, std::string>& source,
                            const auto& apply) {
    for (const auto& [mentioned_ip, value] : source) {
      const auto id = table_.Resolve(mentioned_ip);
      if (id.has_value()) {
        apply(table_.Get(id.value()), value);
      }
    }
  };
  backfill(hostname_by_ip, [&](model::DiscoveredDevice& device, const std::string& value) {
    if (device.hostname.empty()) {
      device.hostname = value;
      logger_.Info("hostname backfilled from neighbor data",
                   {{"ip", device.ip_address}, {"hostname", value}});
    }
  });
  backfill(platform_by_ip, [&](model::DiscoveredDevice& device, const std::string& value) {
    if (!device.platform.has_value() || device.platform->empty()) {
      device.platform = value;
      logger_.Info("platform backfilled from neighbor data",
                   {{"ip", device.ip_address}, {"platform", value}});
    }
  });
}

void NetworkDiscovery::LogFinalStatistics() {
  const artifacts::TopologySummary summary = artifacts::SummarizeTopology(table_);
  logger_.Info("discovery complete",
               {{"total_devices", std::to_string(summary.total_devices)},
                {"successful", std::to_string(summary.successful)},
                {"unreachable", std::to_string(summary.unreachable)},
                {"other_failures", std::to_string(summary.failed - std::min(summary.failed,
                                                                            summary.unreachable))},
                {"pending", std::to_string(summary.pending)}});
  logger_.Info("protocol statistics", {{"cdp_devices", std::to_string(summary.cdp_devices)},
                                       {"lldp_devices", std::to_string(summary.lldp_devices)}});
  if (!options_.results_path.empty()) {
    logger_.Info("results saved", {{"path", options_.results_path.string()}});
  }
}

} // namespace topocrawl::discovery
