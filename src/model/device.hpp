#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::model {

// Loosely-typed field bag produced by the parsing pipeline. Vendors and
// templates disagree on field names, so consumers go through
// model::FindNeighborField instead of indexing keys directly.
using NeighborRecord = std::map<std::string, std::string>;

// Key under which the crawler stores the command that produced a record.
inline constexpr std::string_view kDiscoveredViaField = "discovered_via";

enum class ReachabilityStatus {
  kUnknown,
  kReachable,
  kUnreachable,
};

const char* ToString(ReachabilityStatus status);

// One physical port as seen from its owning device.
struct InterfaceRecord {
  std::string name;
  std::string connected_to;
  std::string remote_interface;
  std::string status = "up";
  std::string type; // "cdp" or "lldp"
};

// Value side of DiscoveredDevice::local_interfaces.
struct LocalInterfaceLink {
  std::string connected_to;
  std::string remote_interface;
  std::string discovered_via;
};

// Everything known about one network node. Created when first referenced (as
// a seed or a neighbor), mutated during its single discovery pass, never
// deleted. `visited` only ever goes false -> true.
struct DiscoveredDevice {
  std::string hostname;
  std::string ip_address;
  std::optional<std::string> original_ip;
  std::optional<std::string> platform;
  std::optional<std::string> serial_number;
  std::optional<std::string> model;
  std::optional<std::string> software_version;
  std::optional<std::string> mac_address;
  std::optional<std::string> management_ip;
  std::optional<std::string> system_description;
  std::vector<std::string> capabilities;
  std::vector<InterfaceRecord> interfaces;
  std::vector<NeighborRecord> neighbors;
  std::map<std::string, LocalInterfaceLink> local_interfaces;
  std::map<std::string, std::string> raw_data;
  std::optional<std::string> parent;
  std::uint32_t hop_count = 0;
  bool visited = false;
  bool failed = false;
  std::optional<std::string> error_msg;
  ReachabilityStatus reachability_status = ReachabilityStatus::kUnknown;
  std::optional<std::string> successful_credential;
  std::string discovered_at;
  std::string last_update;

  bool HasInterface(std::string_view name) const;

  // Appends an interface unless one with the same name already exists.
  bool AddInterface(InterfaceRecord record);

  void MarkFailed(std::string message, ReachabilityStatus status);
};

} // namespace topocrawl::model
