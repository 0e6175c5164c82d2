#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "artifacts/topology_writer.hpp"
#include "discovery/crawler.hpp"
#include "parsing/textfsm_matcher.hpp"
#include "reachability/testing/scripted_network_probe.hpp"
#include "ssh/testing/scripted_transport.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace std::chrono_literals;

namespace {

using topocrawl::discovery::DiscoveryOptions;
using topocrawl::discovery::NetworkDiscovery;
using topocrawl::discovery::SeedDevice;
using topocrawl::model::DeviceTable;
using topocrawl::model::DiscoveredDevice;
using topocrawl::reachability::testing::ScriptedNetworkProbe;
using topocrawl::ssh::testing::ScriptedDevice;
using topocrawl::ssh::testing::ScriptedShellNetwork;
using topocrawl::tests::common::AssertContains;
using topocrawl::tests::common::Fail;

constexpr const char* kCdpCommand = "show cdp neighbors detail";

struct CdpNeighbor {
  std::string name;
  std::string ip;
  std::string local_interface;
  std::string remote_interface;
};

std::string CdpDetail(const std::vector<CdpNeighbor>& neighbors) {
  std::string text;
  for (const CdpNeighbor& neighbor : neighbors) {
    text += "-------------------------\n";
    text += "Device ID: " + neighbor.name + "\n";
    text += "Entry address(es):\n";
    text += "  IP address: " + neighbor.ip + "\n";
    text += "Platform: cisco ISR4331,  Capabilities: Router Switch IGMP\n";
    text += "Interface: " + neighbor.local_interface +
            ",  Port ID (outgoing port): " + neighbor.remote_interface + "\n";
    text += "Holdtime : 155 sec\n\n";
  }
  return text;
}

ScriptedDevice MakeRouter(const std::string& prompt, const std::vector<CdpNeighbor>& neighbors) {
  ScriptedDevice device;
  device.prompt = prompt;
  device.username = "admin";
  device.password = "secret";
  if (!neighbors.empty()) {
    device.responses[kCdpCommand] = CdpDetail(neighbors);
  }
  return device;
}

DiscoveryOptions FastOptions() {
  DiscoveryOptions options;
  options.device_budget = 5s;
  options.device_probe_timeout = 20ms;
  options.neighbor_probe_timeout = 20ms;
  options.poll_interval = 5ms;
  options.prompt_attempts = 1;
  options.prompt_timeout = 100ms;
  options.pagination_timeout = 200ms;
  options.device_info_timeout = 200ms;
  options.discovery_command_timeout = 200ms;
  options.template_dir = std::filesystem::path(TOPOCRAWL_SOURCE_DIR) / "templates" / "textfsm";
  return options;
}

std::vector<topocrawl::model::Credential> AdminCredentials() {
  topocrawl::model::Credential credential;
  credential.username = "admin";
  credential.password = "secret";
  return {credential};
}

const DiscoveredDevice& Require(const DeviceTable& table, const std::string& ip) {
  const DiscoveredDevice* device = table.Find(ip);
  if (device == nullptr) {
    Fail("expected device at " + ip);
  }
  return *device;
}

std::size_t CountCommand(const ScriptedShellNetwork& network, const std::string& host,
                         const std::string& command) {
  const std::vector<std::string> sent = network.CommandsFor(host);
  return static_cast<std::size_t>(std::count(sent.begin(), sent.end(), command));
}

void ExpectHopMonotonicity(const DeviceTable& table) {
  for (const auto id : table.Ids()) {
    const DiscoveredDevice& device = table.Get(id);
    if (!device.parent.has_value()) {
      if (device.hop_count != 0U) {
        Fail("seed " + device.ip_address + " should sit at hop 0");
      }
      continue;
    }
    const DiscoveredDevice& parent = Require(table, device.parent.value());
    if (device.hop_count != parent.hop_count + 1U) {
      Fail("neighbor " + device.ip_address + " should be one hop past its parent");
    }
  }
}

void ExpectTwoDeviceCrawl() {
  ScriptedShellNetwork network;
  network.AddDevice("10.0.0.1",
                    MakeRouter("R1#", {{"R2.lab", "10.0.0.2", "GigabitEthernet0/1",
                                        "GigabitEthernet0/2"}}));
  network.AddDevice("10.0.0.2",
                    MakeRouter("R2#", {{"R1", "10.0.0.1", "GigabitEthernet0/2",
                                        "GigabitEthernet0/1"}}));
  ScriptedNetworkProbe probe;
  probe.SetOpen("10.0.0.1");
  probe.SetOpen("10.0.0.2");

  const std::filesystem::path out_dir = topocrawl::tests::common::CreateUniqueTempDir(
      "topocrawl-crawl-two-device");
  DiscoveryOptions options = FastOptions();
  options.results_path = out_dir / topocrawl::artifacts::kTopologyFileName;
  options.graph_path = out_dir / topocrawl::artifacts::kTopologyGraphFileName;

  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kDebug, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), options, logger, probe, network.MakeFactory(),
                           matcher);
  std::vector<std::string> progress;
  crawler.SetProgressCallback(
      [&progress](std::string_view message) { progress.emplace_back(message); });

  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"", "10.0.0.1"}}, 1);
  if (table.size() != 2U) {
    Fail("expected exactly two devices");
  }

  const DiscoveredDevice& r1 = Require(table, "10.0.0.1");
  if (r1.hostname != "R1" || r1.hop_count != 0U || !r1.visited || r1.failed) {
    Fail("seed should be visited with its prompt hostname");
  }
  if (r1.successful_credential != "admin@22") {
    Fail("seed should record the credential that logged in");
  }
  const auto link = r1.local_interfaces.find("Gi0/1");
  if (link == r1.local_interfaces.end() || link->second.connected_to != "10.0.0.2" ||
      link->second.remote_interface != "Gi0/2" || link->second.discovered_via != kCdpCommand) {
    Fail("seed should map Gi0/1 to R2 Gi0/2");
  }

  const DiscoveredDevice& r2 = Require(table, "10.0.0.2");
  if (r2.hostname != "R2.lab" || r2.hop_count != 1U || r2.parent != "10.0.0.1" || !r2.visited ||
      r2.failed) {
    Fail("neighbor should be visited at hop 1 under the seed");
  }
  if (r2.platform != "cisco ISR4331") {
    Fail("neighbor platform should come from CDP");
  }
  if (CountCommand(network, "10.0.0.2", kCdpCommand) != 0U) {
    Fail("no neighbor commands at the hop limit");
  }
  ExpectHopMonotonicity(table);

  const topocrawl::artifacts::TopologyGraph graph = topocrawl::artifacts::BuildTopologyGraph(table);
  bool saw_parent_child = false;
  bool saw_cdp = false;
  for (const auto& graph_link : graph.links) {
    if (graph_link.type == "parent-child" && graph_link.source == "10.0.0.1" &&
        graph_link.target == "10.0.0.2") {
      saw_parent_child = true;
    }
    if (graph_link.type == "cdp" && graph_link.source == "10.0.0.1" &&
        graph_link.target == "10.0.0.2" && graph_link.source_interface == "Gi0/1" &&
        graph_link.target_interface == "Gi0/2") {
      saw_cdp = true;
    }
  }
  if (!saw_parent_child || !saw_cdp) {
    Fail("graph should carry the parent-child and cdp links");
  }

  const std::string results =
      topocrawl::tests::common::ReadFileToString(options.results_path);
  AssertContains(results, "\"R2.lab\"");
  AssertContains(results, "\"total_devices\":2");
  const std::string graph_json = topocrawl::tests::common::ReadFileToString(options.graph_path);
  AssertContains(graph_json, "\"parent-child\"");

  if (progress.empty() || progress.back() != "discovery complete") {
    Fail("progress callback should report completion");
  }
  AssertContains(log.str(), "hop summary");
  topocrawl::tests::common::RemovePathBestEffort(out_dir);
}

void ExpectZeroHopsSkipsNeighborCommands() {
  ScriptedShellNetwork network;
  network.AddDevice("10.0.0.1",
                    MakeRouter("R1#", {{"R2.lab", "10.0.0.2", "GigabitEthernet0/1",
                                        "GigabitEthernet0/2"}}));
  ScriptedNetworkProbe probe;
  probe.SetOpen("10.0.0.1");
  probe.SetOpen("10.0.0.2");

  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), FastOptions(), logger, probe,
                           network.MakeFactory(), matcher);
  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"R1", "10.0.0.1"}}, 0);

  if (table.size() != 1U || !Require(table, "10.0.0.1").visited) {
    Fail("max hops 0 should visit the seed alone");
  }
  if (CountCommand(network, "10.0.0.1", kCdpCommand) != 0U) {
    Fail("max hops 0 should never send neighbor commands");
  }
  if (CountCommand(network, "10.0.0.1", "terminal length 0") != 1U) {
    Fail("pagination should still be disabled on the seed");
  }
}

void ExpectSeedRekeyedThroughDns() {
  ScriptedShellNetwork network;
  network.AddDevice("10.0.0.10", MakeRouter("core1#", {}));
  ScriptedNetworkProbe probe;
  probe.SetOpen("10.0.0.10");
  probe.AddDnsEntry("core1", "10.0.0.10");

  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), FastOptions(), logger, probe,
                           network.MakeFactory(), matcher);
  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"core1", "10.0.0.9"}}, 0);

  if (table.Find("10.0.0.9") != nullptr) {
    Fail("device should no longer be keyed by its unreachable address");
  }
  const DiscoveredDevice& core = Require(table, "10.0.0.10");
  if (core.original_ip != "10.0.0.9" || core.failed || !core.visited) {
    Fail("re-keyed seed should keep its original address and be discovered");
  }
  if (!table.Resolve("10.0.0.9").has_value()) {
    Fail("original address should still resolve to the device");
  }
  AssertContains(log.str(), "device re-keyed to resolved address");
}

void ExpectExcludedNeighborNeverProbed() {
  ScriptedShellNetwork network;
  network.AddDevice("10.0.0.1",
                    MakeRouter("R1#", {{"R2.lab", "10.0.0.2", "GigabitEthernet0/1",
                                        "GigabitEthernet0/2"},
                                       {"sw3-access", "10.0.0.3", "GigabitEthernet0/3",
                                        "GigabitEthernet1/0/48"}}));
  network.AddDevice("10.0.0.2", MakeRouter("R2#", {}));
  network.AddDevice("10.0.0.3", MakeRouter("sw3#", {}));
  ScriptedNetworkProbe probe;
  probe.SetOpen("10.0.0.1");
  probe.SetOpen("10.0.0.2");
  probe.SetOpen("10.0.0.3");

  DiscoveryOptions options = FastOptions();
  options.exclusions = {"SW3"};
  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), options, logger, probe, network.MakeFactory(),
                           matcher);
  if (!crawler.ShouldExclude("Sw3-Access") || crawler.ShouldExclude("R2.lab")) {
    Fail("exclusion should be a case-insensitive substring match");
  }

  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"R1", "10.0.0.1"}}, 2);
  if (table.Contains("10.0.0.3")) {
    Fail("excluded neighbor must not be added");
  }
  const auto& probed = probe.probed_hosts();
  if (std::find(probed.begin(), probed.end(), "10.0.0.3") != probed.end()) {
    Fail("excluded neighbor must never be probed");
  }
  if (!network.CommandsFor("10.0.0.3").empty()) {
    Fail("excluded neighbor must never be logged into");
  }
  if (!Require(table, "10.0.0.2").visited) {
    Fail("other neighbors are still crawled");
  }
}

void ExpectLoopTopologyVisitsEachDeviceOnce() {
  ScriptedShellNetwork network;
  network.AddDevice("10.0.0.1",
                    MakeRouter("R1#", {{"R2", "10.0.0.2", "Gi0/1", "Gi0/1"},
                                       {"R3", "10.0.0.3", "Gi0/2", "Gi0/1"}}));
  network.AddDevice("10.0.0.2",
                    MakeRouter("R2#", {{"R1", "10.0.0.1", "Gi0/1", "Gi0/1"},
                                       {"R3", "10.0.0.3", "Gi0/2", "Gi0/2"}}));
  network.AddDevice("10.0.0.3",
                    MakeRouter("R3#", {{"R1", "10.0.0.1", "Gi0/1", "Gi0/2"},
                                       {"R2", "10.0.0.2", "Gi0/2", "Gi0/2"}}));
  ScriptedNetworkProbe probe;
  probe.SetOpen("10.0.0.1");
  probe.SetOpen("10.0.0.2");
  probe.SetOpen("10.0.0.3");

  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), FastOptions(), logger, probe,
                           network.MakeFactory(), matcher);
  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"R1", "10.0.0.1"}}, 3);

  if (table.size() != 3U) {
    Fail("triangle should hold three devices");
  }
  for (const std::string ip : {"10.0.0.1", "10.0.0.2", "10.0.0.3"}) {
    if (CountCommand(network, ip, kCdpCommand) != 1U) {
      Fail("device " + ip + " should be crawled exactly once");
    }
  }
  if (network.connect_attempts() != 3U) {
    Fail("one login per device expected");
  }
  if (Require(table, "10.0.0.2").hop_count != 1U || Require(table, "10.0.0.3").hop_count != 1U) {
    Fail("both neighbors of the seed sit at hop 1");
  }
  if (table.visit_order().size() != 3U || table.visit_order().front() != "10.0.0.1") {
    Fail("visit order should start at the seed and hold every device once");
  }

  // R2 learns its Gi0/2 link to R3 even though R3 was already queued.
  const DiscoveredDevice& r3 = Require(table, "10.0.0.3");
  if (!r3.HasInterface("Gi0/1") || !r3.HasInterface("Gi0/2")) {
    Fail("already-known neighbor should still receive the reverse link");
  }
  ExpectHopMonotonicity(table);
}

void ExpectFailuresAreDeviceScoped() {
  ScriptedShellNetwork network;
  ScriptedDevice locked = MakeRouter("locked#", {});
  locked.username = "root";
  network.AddDevice("10.0.0.5", locked);
  network.AddDevice("10.0.0.7", MakeRouter("ok#", {}));
  ScriptedNetworkProbe probe;
  probe.SetOpen("10.0.0.5");
  probe.SetOpen("10.0.0.7");

  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), FastOptions(), logger, probe,
                           network.MakeFactory(), matcher);
  const DeviceTable& table = crawler.DiscoverSingleThreaded(
      {{"dark", "10.0.0.4"}, {"locked", "10.0.0.5"}, {"ok", "10.0.0.7"}}, 0);

  const DiscoveredDevice& dark = Require(table, "10.0.0.4");
  if (!dark.failed || dark.error_msg != "Device unreachable via TCP" ||
      dark.reachability_status != topocrawl::model::ReachabilityStatus::kUnreachable) {
    Fail("unreachable seed should fail with the tcp message");
  }
  const DiscoveredDevice& locked_device = Require(table, "10.0.0.5");
  if (!locked_device.failed || locked_device.error_msg != "No valid credentials") {
    Fail("seed without a working credential should fail with the credential message");
  }
  const DiscoveredDevice& ok = Require(table, "10.0.0.7");
  if (ok.failed || !ok.visited) {
    Fail("failures elsewhere must not affect other seeds");
  }
  if (topocrawl::artifacts::DeviceStatus(dark) != "failed" ||
      topocrawl::artifacts::DeviceStatus(ok) != "success") {
    Fail("status should follow the failed and visited flags");
  }
}

void ExpectDeviceBudgetTimeout() {
  ScriptedShellNetwork network;
  ScriptedDevice silent;
  silent.silent = true;
  network.AddDevice("10.0.0.6", silent);
  ScriptedNetworkProbe probe;
  probe.SetOpen("10.0.0.6");

  DiscoveryOptions options = FastOptions();
  options.device_budget = 150ms;
  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), options, logger, probe, network.MakeFactory(),
                           matcher);
  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"mute", "10.0.0.6"}}, 2);

  const DiscoveredDevice& mute = Require(table, "10.0.0.6");
  if (!mute.failed || !mute.error_msg.has_value()) {
    Fail("device that never answers should fail");
  }
  AssertContains(mute.error_msg.value(), "DISCOVERY_TIMEOUT_ERROR: Discovery timeout for 10.0.0.6");
  if (table.size() != 1U) {
    Fail("timed-out device should not contribute neighbors");
  }
}

void ExpectStalledLoginFailsWithinBudget() {
  ScriptedShellNetwork network;
  ScriptedDevice stalled = MakeRouter("stuck#", {});
  stalled.stalls_login = true;
  network.AddDevice("10.0.0.8", stalled);
  ScriptedNetworkProbe ports;
  ports.SetOpen("10.0.0.8");

  std::vector<topocrawl::model::Credential> credentials;
  for (int i = 0; i < 6; ++i) {
    topocrawl::model::Credential credential;
    credential.username = "user" + std::to_string(i);
    credential.password = "pw";
    credential.priority = i;
    credentials.push_back(credential);
  }
  DiscoveryOptions options = FastOptions();
  options.device_budget = 600ms;
  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(credentials, options, logger, ports, network.MakeFactory(), matcher);

  const auto started = std::chrono::steady_clock::now();
  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"stuck", "10.0.0.8"}}, 1);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (elapsed > 1000ms) {
    Fail("stalled login overran the device budget: " + std::to_string(elapsed.count()) + "ms");
  }
  const DiscoveredDevice& stuck = Require(table, "10.0.0.8");
  if (!stuck.failed || !stuck.error_msg.has_value()) {
    Fail("device whose login stalls should fail");
  }
  AssertContains(stuck.error_msg.value(),
                 "DISCOVERY_TIMEOUT_ERROR: Discovery timeout for 10.0.0.8");
}

void ExpectPromptAttemptsShareTheBudget() {
  ScriptedShellNetwork network;
  ScriptedDevice silent;
  silent.silent = true;
  network.AddDevice("10.0.0.6", silent);
  ScriptedNetworkProbe ports;
  ports.SetOpen("10.0.0.6");

  DiscoveryOptions options = FastOptions();
  options.device_budget = 300ms;
  options.prompt_attempts = 3;
  options.prompt_timeout = 1s;
  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), options, logger, ports, network.MakeFactory(),
                           matcher);

  const auto started = std::chrono::steady_clock::now();
  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"mute", "10.0.0.6"}}, 1);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (elapsed > 700ms) {
    Fail("prompt detection overran the device budget: " + std::to_string(elapsed.count()) +
         "ms");
  }
  AssertContains(Require(table, "10.0.0.6").error_msg.value_or(""), "DISCOVERY_TIMEOUT_ERROR");
}

// R1 reports R2 at an address that does not answer; R2 is queued under its
// DNS address and the CDP link still joins the two.
void ExpectResolvedNeighborKeepsItsLink() {
  ScriptedShellNetwork network;
  network.AddDevice("10.0.0.1",
                    MakeRouter("R1#", {{"R2.lab", "10.0.0.2", "GigabitEthernet0/1",
                                        "GigabitEthernet0/2"}}));
  network.AddDevice("10.0.0.20", MakeRouter("R2#", {}));
  ScriptedNetworkProbe ports;
  ports.SetOpen("10.0.0.1");
  ports.SetOpen("10.0.0.20");
  ports.AddDnsEntry("R2.lab", "10.0.0.20");

  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), FastOptions(), logger, ports,
                           network.MakeFactory(), matcher);
  const DeviceTable& table = crawler.DiscoverSingleThreaded({{"R1", "10.0.0.1"}}, 1);

  const DiscoveredDevice& r2 = Require(table, "10.0.0.20");
  if (r2.original_ip != "10.0.0.2" || !r2.visited || r2.failed) {
    Fail("neighbor should be discovered under its resolved address");
  }
  if (table.Resolve("10.0.0.2") != table.IdOf("10.0.0.20")) {
    Fail("reported neighbor address should resolve to the queued device");
  }

  const auto graph = topocrawl::artifacts::BuildTopologyGraph(table);
  bool cdp_link = false;
  for (const auto& link : graph.links) {
    if (link.type == "cdp" && link.source == "10.0.0.1" && link.target == "10.0.0.20" &&
        link.source_interface == "Gi0/1" && link.target_interface == "Gi0/2") {
      cdp_link = true;
    }
  }
  if (!cdp_link) {
    Fail("cdp link to the resolved neighbor is missing from the graph");
  }
}

// An unreachable seed is already on disk before the next device starts.
void ExpectSnapshotAfterUnreachableDevice() {
  ScriptedShellNetwork network;
  network.AddDevice("10.0.0.7", MakeRouter("ok#", {}));
  ScriptedNetworkProbe ports;
  ports.SetOpen("10.0.0.7");

  const std::filesystem::path out_dir =
      topocrawl::tests::common::CreateUniqueTempDir("topocrawl-crawl-snapshot");
  DiscoveryOptions options = FastOptions();
  options.results_path = out_dir / topocrawl::artifacts::kTopologyFileName;
  options.graph_path = out_dir / topocrawl::artifacts::kTopologyGraphFileName;

  std::ostringstream log;
  topocrawl::core::logging::Logger logger(topocrawl::core::logging::LogLevel::kInfo, log);
  const topocrawl::parsing::TextFsmMatcher matcher;
  NetworkDiscovery crawler(AdminCredentials(), options, logger, ports, network.MakeFactory(),
                           matcher);
  bool checked = false;
  crawler.SetProgressCallback([&](std::string_view message) {
    if (message.rfind("discovering 10.0.0.7", 0) != 0) {
      return;
    }
    if (!std::filesystem::exists(options.results_path)) {
      Fail("snapshot should exist once the unreachable seed is processed");
    }
    AssertContains(topocrawl::tests::common::ReadFileToString(options.results_path),
                   "Device unreachable via TCP");
    checked = true;
  });
  crawler.DiscoverSingleThreaded({{"dark", "10.0.0.4"}, {"ok", "10.0.0.7"}}, 0);

  if (!checked) {
    Fail("second seed was never discovered");
  }
  topocrawl::tests::common::RemovePathBestEffort(out_dir);
}

} // namespace

int main() {
  ExpectTwoDeviceCrawl();
  ExpectZeroHopsSkipsNeighborCommands();
  ExpectSeedRekeyedThroughDns();
  ExpectExcludedNeighborNeverProbed();
  ExpectLoopTopologyVisitsEachDeviceOnce();
  ExpectFailuresAreDeviceScoped();
  ExpectDeviceBudgetTimeout();
  ExpectStalledLoginFailsWithinBudget();
  ExpectPromptAttemptsShareTheBudget();
  ExpectResolvedNeighborKeepsItsLink();
  ExpectSnapshotAfterUnreachableDevice();
  std::cout << "crawler_scenarios_smoke: ok\n";
  return 0;
}
