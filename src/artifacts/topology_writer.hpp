#pragma once

#include "model/device.hpp"
#include "model/device_table.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::artifacts {

inline constexpr std::string_view kTopologyFileName = "network_topology.json";
inline constexpr std::string_view kTopologyGraphFileName = "network_topology_graph.json";

struct TopologySummary {
  std::size_t total_devices = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::size_t unreachable = 0;
  std::size_t pending = 0;
  std::uint32_t max_hop_count = 0;
  std::size_t devices_with_hostname = 0;
  std::size_t devices_with_platform = 0;
  std::size_t total_interfaces = 0;
  // Devices with at least one neighbor learned through CDP / LLDP.
  std::size_t cdp_devices = 0;
  std::size_t lldp_devices = 0;
};

TopologySummary SummarizeTopology(const model::DeviceTable& table);

// "success", "failed" or "pending".
std::string DeviceStatus(const model::DiscoveredDevice& device);

std::string ToJson(const model::DiscoveredDevice& device);

// `{"devices":{ip:device,...},"metadata":{...}}` in insertion order.
std::string RenderTopologyJson(const model::DeviceTable& table, std::string_view discovered_at);

struct GraphNode {
  std::string id;
  std::string label;
  std::uint32_t hop = 0;
  std::string status;
  std::optional<std::string> platform;
  std::vector<std::string> capabilities;
  std::vector<model::InterfaceRecord> interfaces;
};

struct GraphLink {
  std::string source;
  std::string target;
  // "parent-child", "cdp", "lldp" or "unknown".
  std::string type;
  std::optional<std::string> source_interface;
  std::optional<std::string> target_interface;
};

struct TopologyGraph {
  std::vector<GraphNode> nodes;
  std::vector<GraphLink> links;
};

// One node per device. Links: every parent-child pair, plus one neighbor link
// per unordered device pair (first mention wins) for neighbors present in the
// table. Neighbor mentions of a re-keyed device follow it to its new address.
TopologyGraph BuildTopologyGraph(const model::DeviceTable& table);

std::string RenderTopologyGraphJson(const TopologyGraph& graph);

// Atomic replace of `<path>`; the parent directory is created if needed.
bool WriteTopologyJson(const model::DeviceTable& table,
                       const std::filesystem::path& path,
                       std::string& error);

bool WriteTopologyGraphJson(const model::DeviceTable& table,
                            const std::filesystem::path& path,
                            std::string& error);

} // namespace topocrawl::artifacts
