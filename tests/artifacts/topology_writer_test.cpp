#include "artifacts/topology_writer.hpp"
#include "core/json_dom.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

using topocrawl::artifacts::BuildTopologyGraph;
using topocrawl::artifacts::DeviceStatus;
using topocrawl::artifacts::RenderTopologyGraphJson;
using topocrawl::artifacts::RenderTopologyJson;
using topocrawl::core::json::FindField;
using topocrawl::core::json::Value;
using topocrawl::model::DeviceTable;
using topocrawl::model::DiscoveredDevice;
using topocrawl::model::NeighborRecord;

namespace {

DiscoveredDevice MakeDevice(const std::string& hostname, const std::string& ip,
                            const std::uint32_t hop) {
  DiscoveredDevice device;
  device.hostname = hostname;
  device.ip_address = ip;
  device.hop_count = hop;
  device.discovered_at = "2026-10-18T09:00:00.000Z";
  return device;
}

NeighborRecord CdpMention(const std::string& ip, const std::string& local,
                          const std::string& remote) {
  return {{"MGMT_ADDRESS", ip},
          {"LOCAL_INTERFACE", local},
          {"NEIGHBOR_INTERFACE", remote},
          {"discovered_via", "show cdp neighbors detail"}};
}

// r1 (seed) -> r2 (hop 1); both report each other over CDP.
DeviceTable MakeTwoDeviceTable() {
  DeviceTable table;
  DiscoveredDevice r1 = MakeDevice("r1", "10.0.0.1", 0);
  r1.platform = "cisco ISR4331";
  r1.system_description = "Cisco IOS XE Software, Version 17.03.04a";
  r1.mac_address = "001a.2b3c.4d5e";
  r1.capabilities = {"Router", "Switch"};
  r1.neighbors.push_back(CdpMention("10.0.0.2", "GigabitEthernet0/1", "GigabitEthernet0/2"));
  r1.successful_credential = "admin@22";
  r1.reachability_status = topocrawl::model::ReachabilityStatus::kReachable;
  topocrawl::model::InterfaceRecord uplink;
  uplink.name = "Gi0/1";
  uplink.connected_to = "10.0.0.2";
  uplink.remote_interface = "Gi0/2";
  uplink.type = "cdp";
  r1.AddInterface(uplink);
  r1.local_interfaces["Gi0/1"] = {"10.0.0.2", "Gi0/2", "show cdp neighbors detail"};
  const auto r1_id = table.Insert(std::move(r1));

  DiscoveredDevice r2 = MakeDevice("r2", "10.0.0.2", 1);
  r2.parent = "10.0.0.1";
  r2.neighbors.push_back(CdpMention("10.0.0.1", "Gi0/2", "Gi0/1"));
  const auto r2_id = table.Insert(std::move(r2));

  table.MarkVisited(r1_id.value());
  table.MarkVisited(r2_id.value());
  return table;
}

Value ParseOrFail(const std::string& text) {
  Value root;
  std::string error;
  const bool parsed = topocrawl::core::json::Parse(text, root, error);
  INFO(error);
  REQUIRE(parsed);
  REQUIRE(root.type == Value::Type::kObject);
  return root;
}

} // namespace

TEST_CASE("Device status follows failed and visited flags", "[artifacts][topology]") {
  DiscoveredDevice device = MakeDevice("r1", "10.0.0.1", 0);
  REQUIRE(DeviceStatus(device) == "pending");
  device.visited = true;
  REQUIRE(DeviceStatus(device) == "success");
  device.MarkFailed("No valid credentials", topocrawl::model::ReachabilityStatus::kUnreachable);
  REQUIRE(DeviceStatus(device) == "failed");
}

TEST_CASE("Results document keys devices by address with metadata", "[artifacts][topology]") {
  DeviceTable table = MakeTwoDeviceTable();
  DiscoveredDevice dark = MakeDevice("dark", "10.0.0.9", 1);
  dark.parent = "10.0.0.1";
  const auto dark_id = table.Insert(std::move(dark));
  table.MarkFailed(dark_id.value(), "Device unreachable via TCP",
                   topocrawl::model::ReachabilityStatus::kUnreachable);

  const std::string json = RenderTopologyJson(table, "2026-10-18T09:05:00.000Z");
  const Value root = ParseOrFail(json);

  const Value* devices = FindField(root.object_value, "devices");
  REQUIRE(devices != nullptr);
  REQUIRE(devices->object_value.size() == 3U);
  const Value& r1 = devices->object_value.at("10.0.0.1");
  REQUIRE(FindField(r1.object_value, "hostname")->string_value == "r1");
  REQUIRE(FindField(r1.object_value, "platform")->string_value == "cisco ISR4331");
  REQUIRE(FindField(r1.object_value, "original_ip")->type == Value::Type::kNull);
  REQUIRE(FindField(r1.object_value, "system_description")->string_value ==
          "Cisco IOS XE Software, Version 17.03.04a");
  REQUIRE(FindField(r1.object_value, "mac_address")->string_value == "001a.2b3c.4d5e");
  REQUIRE(FindField(r1.object_value, "device_type") == nullptr);
  REQUIRE(FindField(r1.object_value, "capabilities")->array_value.size() == 2U);
  REQUIRE(FindField(r1.object_value, "successful_credential")->string_value == "admin@22");
  REQUIRE(FindField(r1.object_value, "reachability_status")->string_value == "reachable");
  const Value* local = FindField(r1.object_value, "local_interfaces");
  REQUIRE(local->object_value.at("Gi0/1").object_value.at("connected_to").string_value ==
          "10.0.0.2");

  const Value& failed = devices->object_value.at("10.0.0.9");
  REQUIRE(FindField(failed.object_value, "failed")->bool_value);
  REQUIRE(FindField(failed.object_value, "error_msg")->string_value ==
          "Device unreachable via TCP");
  REQUIRE(FindField(failed.object_value, "reachability_status")->string_value == "unreachable");

  const Value* metadata = FindField(root.object_value, "metadata");
  REQUIRE(metadata != nullptr);
  REQUIRE(FindField(metadata->object_value, "total_devices")->number_value == 3.0);
  REQUIRE(FindField(metadata->object_value, "successful")->number_value == 2.0);
  REQUIRE(FindField(metadata->object_value, "failed")->number_value == 1.0);
  REQUIRE(FindField(metadata->object_value, "max_hop_count")->number_value == 1.0);
  REQUIRE(FindField(metadata->object_value, "devices_with_platform")->number_value == 1.0);
  REQUIRE(FindField(metadata->object_value, "total_interfaces")->number_value == 1.0);
  REQUIRE(FindField(metadata->object_value, "discovered_at")->string_value ==
          "2026-10-18T09:05:00.000Z");

  // Insertion order, not key order.
  REQUIRE(json.find("\"10.0.0.1\":") < json.find("\"10.0.0.2\":"));
  REQUIRE(json.find("\"10.0.0.2\":") < json.find("\"10.0.0.9\":"));
}

TEST_CASE("Graph keeps one neighbor link per device pair", "[artifacts][topology]") {
  const DeviceTable table = MakeTwoDeviceTable();
  const auto graph = BuildTopologyGraph(table);

  REQUIRE(graph.nodes.size() == 2U);
  REQUIRE(graph.nodes[0].id == "10.0.0.1");
  REQUIRE(graph.nodes[0].label == "r1");
  REQUIRE(graph.nodes[0].status == "success");
  REQUIRE(graph.nodes[1].hop == 1U);

  REQUIRE(graph.links.size() == 2U);
  REQUIRE(graph.links[0].type == "parent-child");
  REQUIRE(graph.links[0].source == "10.0.0.1");
  REQUIRE(graph.links[0].target == "10.0.0.2");
  REQUIRE_FALSE(graph.links[0].source_interface.has_value());

  REQUIRE(graph.links[1].type == "cdp");
  REQUIRE(graph.links[1].source == "10.0.0.1");
  REQUIRE(graph.links[1].source_interface == "Gi0/1");
  REQUIRE(graph.links[1].target_interface == "Gi0/2");

  const Value root = ParseOrFail(RenderTopologyGraphJson(graph));
  REQUIRE(FindField(root.object_value, "nodes")->array_value.size() == 2U);
  const Value* links = FindField(root.object_value, "links");
  REQUIRE(links->array_value.size() == 2U);
  REQUIRE(FindField(links->array_value[0].object_value, "source_interface") == nullptr);
  REQUIRE(FindField(links->array_value[1].object_value, "target_interface")->string_value ==
          "Gi0/2");
}

TEST_CASE("Graph links follow re-keyed devices and skip unknown neighbors",
          "[artifacts][topology]") {
  DeviceTable table = MakeTwoDeviceTable();
  DiscoveredDevice& r1 = table.Get(0);
  r1.neighbors.push_back(CdpMention("10.0.0.50", "Gi0/5", "Gi0/1"));

  std::string error;
  REQUIRE(table.Rekey("10.0.0.2", "10.0.0.20", error));
  const auto graph = BuildTopologyGraph(table);

  REQUIRE(graph.links.size() == 2U);
  REQUIRE(graph.links[0].target == "10.0.0.20");
  REQUIRE(graph.links[1].target == "10.0.0.20");
  REQUIRE(graph.nodes[1].id == "10.0.0.20");
}

TEST_CASE("Snapshot files are replaced atomically", "[artifacts][topology]") {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::filesystem::path root = std::filesystem::temp_directory_path() /
                                     ("topocrawl-topology-writer-" + std::to_string(stamp));
  const std::filesystem::path results = root / "nested" / "network_topology.json";
  const std::filesystem::path graph = root / "nested" / "network_topology_graph.json";

  DeviceTable table = MakeTwoDeviceTable();
  std::string error;
  REQUIRE(topocrawl::artifacts::WriteTopologyJson(table, results, error));
  REQUIRE(topocrawl::artifacts::WriteTopologyGraphJson(table, graph, error));

  DiscoveredDevice r3 = MakeDevice("r3", "10.0.0.3", 1);
  table.Insert(std::move(r3));
  REQUIRE(topocrawl::artifacts::WriteTopologyJson(table, results, error));

  std::ifstream in(results);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  REQUIRE(text.find("\"total_devices\":3") != std::string::npos);
  REQUIRE(text.back() == '\n');

  std::size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(root / "nested")) {
    (void)entry;
    ++entries;
  }
  REQUIRE(entries == 2U);

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}
