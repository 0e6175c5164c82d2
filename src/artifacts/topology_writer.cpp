#include "artifacts/topology_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "model/neighbor_fields.hpp"
#include "normalize/interface_normalizer.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace topocrawl::artifacts {

namespace {

using core::JsonOptionalString;
using core::JsonString;
using core::JsonStringArray;
using core::JsonStringMap;

std::string JsonBool(const bool value) {
  return value ? "true" : "false";
}

std::string ToJson(const model::InterfaceRecord& record) {
  std::ostringstream out;
  out << "{"
      << "\"name\":" << JsonString(record.name) << ","
      << "\"connected_to\":" << JsonString(record.connected_to) << ","
      << "\"remote_interface\":" << JsonString(record.remote_interface) << ","
      << "\"status\":" << JsonString(record.status) << ","
      << "\"type\":" << JsonString(record.type) << "}";
  return out.str();
}

std::string InterfacesJson(const std::vector<model::InterfaceRecord>& interfaces) {
  std::string out = "[";
  for (std::size_t i = 0; i < interfaces.size(); ++i) {
    if (i != 0U) {
      out += ",";
    }
    out += ToJson(interfaces[i]);
  }
  out += "]";
  return out;
}

std::string NeighborsJson(const std::vector<model::NeighborRecord>& neighbors) {
  std::string out = "[";
  for (std::size_t i = 0; i < neighbors.size(); ++i) {
    if (i != 0U) {
      out += ",";
    }
    out += JsonStringMap(neighbors[i]);
  }
  out += "]";
  return out;
}

std::string LocalInterfacesJson(const std::map<std::string, model::LocalInterfaceLink>& links) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto& [name, link] : links) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << JsonString(name) << ":{"
        << "\"connected_to\":" << JsonString(link.connected_to) << ","
        << "\"remote_interface\":" << JsonString(link.remote_interface) << ","
        << "\"discovered_via\":" << JsonString(link.discovered_via) << "}";
  }
  out << "}";
  return out.str();
}

// Current address of the device a neighbor record points at. A re-keyed
// device is still mentioned under its original address by others.
std::optional<std::string> CurrentAddressOf(const model::DeviceTable& table,
                                            const std::string& mentioned_ip) {
  const auto id = table.Resolve(mentioned_ip);
  if (!id.has_value()) {
    return std::nullopt;
  }
  return table.Get(id.value()).ip_address;
}

std::optional<std::string> NormalizedOrNull(const std::optional<std::string>& name) {
  if (!name.has_value()) {
    return std::nullopt;
  }
  return normalize::NormalizeInterfaceName(name.value());
}

} // namespace

std::string DeviceStatus(const model::DiscoveredDevice& device) {
  if (device.failed) {
    return "failed";
  }
  return device.visited ? "success" : "pending";
}

TopologySummary SummarizeTopology(const model::DeviceTable& table) {
  TopologySummary summary;
  for (const model::DeviceId id : table.Ids()) {
    const model::DiscoveredDevice& device = table.Get(id);
    ++summary.total_devices;
    if (device.failed) {
      ++summary.failed;
    } else if (device.visited) {
      ++summary.successful;
    }
    if (device.reachability_status == model::ReachabilityStatus::kUnreachable) {
      ++summary.unreachable;
    }
    summary.max_hop_count = std::max(summary.max_hop_count, device.hop_count);
    if (!device.hostname.empty()) {
      ++summary.devices_with_hostname;
    }
    if (device.platform.has_value() && !device.platform->empty()) {
      ++summary.devices_with_platform;
    }
    summary.total_interfaces += device.interfaces.size();

    bool has_cdp = false;
    bool has_lldp = false;
    for (const model::NeighborRecord& neighbor : device.neighbors) {
      const auto via = neighbor.find(std::string(model::kDiscoveredViaField));
      if (via == neighbor.end()) {
        continue;
      }
      has_cdp = has_cdp || via->second.find("cdp") != std::string::npos;
      has_lldp = has_lldp || via->second.find("lldp") != std::string::npos;
    }
    summary.cdp_devices += has_cdp ? 1U : 0U;
    summary.lldp_devices += has_lldp ? 1U : 0U;
  }
  summary.pending = summary.total_devices - summary.successful - summary.failed;
  return summary;
}

std::string ToJson(const model::DiscoveredDevice& device) {
  std::ostringstream out;
  out << "{"
      << "\"hostname\":" << JsonString(device.hostname) << ","
      << "\"ip_address\":" << JsonString(device.ip_address) << ","
      << "\"original_ip\":" << JsonOptionalString(device.original_ip) << ","
      << "\"platform\":" << JsonOptionalString(device.platform) << ","
      << "\"serial_number\":" << JsonOptionalString(device.serial_number) << ","
      << "\"model\":" << JsonOptionalString(device.model) << ","
      << "\"software_version\":" << JsonOptionalString(device.software_version) << ","
      << "\"mac_address\":" << JsonOptionalString(device.mac_address) << ","
      << "\"management_ip\":" << JsonOptionalString(device.management_ip) << ","
      << "\"system_description\":" << JsonOptionalString(device.system_description) << ","
      << "\"capabilities\":" << JsonStringArray(device.capabilities) << ","
      << "\"interfaces\":" << InterfacesJson(device.interfaces) << ","
      << "\"neighbors\":" << NeighborsJson(device.neighbors) << ","
      << "\"local_interfaces\":" << LocalInterfacesJson(device.local_interfaces) << ","
      << "\"raw_data\":" << JsonStringMap(device.raw_data) << ","
      << "\"parent\":" << JsonOptionalString(device.parent) << ","
      << "\"hop_count\":" << device.hop_count << ","
      << "\"visited\":" << JsonBool(device.visited) << ","
      << "\"failed\":" << JsonBool(device.failed) << ","
      << "\"error_msg\":" << JsonOptionalString(device.error_msg) << ","
      << "\"reachability_status\":" << JsonString(model::ToString(device.reachability_status))
      << ","
      << "\"successful_credential\":" << JsonOptionalString(device.successful_credential) << ","
      << "\"discovered_at\":" << JsonString(device.discovered_at) << ","
      << "\"last_update\":" << JsonString(device.last_update) << "}";
  return out.str();
}

std::string RenderTopologyJson(const model::DeviceTable& table, std::string_view discovered_at) {
  std::ostringstream out;
  out << "{\"devices\":{";
  bool first = true;
  for (const model::DeviceId id : table.Ids()) {
    const model::DiscoveredDevice& device = table.Get(id);
    if (!first) {
      out << ",";
    }
    first = false;
    out << JsonString(device.ip_address) << ":" << ToJson(device);
  }
  out << "},";

  const TopologySummary summary = SummarizeTopology(table);
  out << "\"metadata\":{"
      << "\"total_devices\":" << summary.total_devices << ","
      << "\"discovered_at\":" << JsonString(discovered_at) << ","
      << "\"successful\":" << summary.successful << ","
      << "\"failed\":" << summary.failed << ","
      << "\"max_hop_count\":" << summary.max_hop_count << ","
      << "\"devices_with_hostname\":" << summary.devices_with_hostname << ","
      << "\"devices_with_platform\":" << summary.devices_with_platform << ","
      << "\"total_interfaces\":" << summary.total_interfaces << "}}";
  return out.str();
}

TopologyGraph BuildTopologyGraph(const model::DeviceTable& table) {
  TopologyGraph graph;
  for (const model::DeviceId id : table.Ids()) {
    const model::DiscoveredDevice& device = table.Get(id);
    GraphNode node;
    node.id = device.ip_address;
    node.label = device.hostname.empty() ? device.ip_address : device.hostname;
    node.hop = device.hop_count;
    node.status = DeviceStatus(device);
    node.platform = device.platform;
    node.capabilities = device.capabilities;
    node.interfaces = device.interfaces;
    graph.nodes.push_back(std::move(node));

    if (device.parent.has_value()) {
      GraphLink link;
      link.source = device.parent.value();
      link.target = device.ip_address;
      link.type = "parent-child";
      graph.links.push_back(std::move(link));
    }
  }

  std::set<std::pair<std::string, std::string>> linked_pairs;
  for (const model::DeviceId id : table.Ids()) {
    const model::DiscoveredDevice& device = table.Get(id);
    for (const model::NeighborRecord& record : device.neighbors) {
      const model::NeighborView view = model::ResolveNeighbor(record);
      if (!view.ip_address.has_value()) {
        continue;
      }
      const auto cleaned = model::CleanIpv4Address(view.ip_address.value());
      if (!cleaned.has_value()) {
        continue;
      }
      const auto target = CurrentAddressOf(table, cleaned.value());
      if (!target.has_value() || target.value() == device.ip_address) {
        continue;
      }

      auto key = std::minmax(device.ip_address, target.value());
      if (!linked_pairs.emplace(key.first, key.second).second) {
        continue;
      }

      GraphLink link;
      link.source = device.ip_address;
      link.target = target.value();
      link.type = view.discovered_via.empty() ? "unknown"
                                              : model::LinkTypeFromCommand(view.discovered_via);
      link.source_interface = NormalizedOrNull(view.local_interface);
      link.target_interface = NormalizedOrNull(view.remote_interface);
      graph.links.push_back(std::move(link));
    }
  }
  return graph;
}

std::string RenderTopologyGraphJson(const TopologyGraph& graph) {
  std::ostringstream out;
  out << "{\"nodes\":[";
  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    const GraphNode& node = graph.nodes[i];
    if (i != 0U) {
      out << ",";
    }
    out << "{"
        << "\"id\":" << JsonString(node.id) << ","
        << "\"label\":" << JsonString(node.label) << ","
        << "\"hop\":" << node.hop << ","
        << "\"status\":" << JsonString(node.status) << ","
        << "\"platform\":" << JsonOptionalString(node.platform) << ","
        << "\"capabilities\":" << JsonStringArray(node.capabilities) << ","
        << "\"interfaces\":" << InterfacesJson(node.interfaces) << "}";
  }
  out << "],\"links\":[";
  for (std::size_t i = 0; i < graph.links.size(); ++i) {
    const GraphLink& link = graph.links[i];
    if (i != 0U) {
      out << ",";
    }
    out << "{"
        << "\"source\":" << JsonString(link.source) << ","
        << "\"target\":" << JsonString(link.target) << ","
        << "\"type\":" << JsonString(link.type);
    if (link.source_interface.has_value()) {
      out << ",\"source_interface\":" << JsonString(link.source_interface.value());
    }
    if (link.target_interface.has_value()) {
      out << ",\"target_interface\":" << JsonString(link.target_interface.value());
    }
    out << "}";
  }
  out << "]}";
  return out.str();
}

bool WriteTopologyJson(const model::DeviceTable& table,
                       const std::filesystem::path& path,
                       std::string& error) {
  const std::string json = RenderTopologyJson(table, core::NowUtcTimestamp()) + "\n";
  if (!core::WriteTextFileAtomic(path, json, error)) {
    error = "failed while writing topology file '" + path.string() + "' (" + error + ")";
    return false;
  }
  return true;
}

bool WriteTopologyGraphJson(const model::DeviceTable& table,
                            const std::filesystem::path& path,
                            std::string& error) {
  const std::string json = RenderTopologyGraphJson(BuildTopologyGraph(table)) + "\n";
  if (!core::WriteTextFileAtomic(path, json, error)) {
    error = "failed while writing topology graph file '" + path.string() + "' (" + error + ")";
    return false;
  }
  return true;
}

} // namespace topocrawl::artifacts
