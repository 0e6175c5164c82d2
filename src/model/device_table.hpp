#pragma once

#include "model/device.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::model {

using DeviceId = std::size_t;

// Device arena plus a mutable `ip -> id` index.
//
// Devices live in insertion order under a stable id and are never removed, so
// references returned by Get() stay valid for the table's lifetime. The index
// is keyed by each device's *current* address; Rekey() moves a device to a new
// address by rewriting one index entry and every ip-keyed structure in the
// same call, so no caller can observe both keys mapping to the same device.
//
// Only the crawler's single control flow mutates the table; there is no
// locking.
class DeviceTable {
public:
  // Inserts a device under its `ip_address`. A set `original_ip` that no
  // device owns becomes an alias, as after Rekey(). Returns std::nullopt when
  // the address is empty or already tracked.
  std::optional<DeviceId> Insert(DiscoveredDevice device);

  bool Contains(std::string_view ip) const;
  std::optional<DeviceId> IdOf(std::string_view ip) const;

  DiscoveredDevice* Find(std::string_view ip);
  const DiscoveredDevice* Find(std::string_view ip) const;

  DiscoveredDevice& Get(DeviceId id);
  const DiscoveredDevice& Get(DeviceId id) const;

  std::size_t size() const;
  bool empty() const;

  // All ids in insertion order.
  std::vector<DeviceId> Ids() const;

  // Moves the device at `old_ip` to `new_ip`. Updates the index, the device's
  // address (recording `original_ip`), `visited_ips`, `failed_ips` and every
  // parent/interface reference that pointed at `old_ip`.
  // Fails without changing anything when `old_ip` is unknown or `new_ip` is
  // already owned by another device.
  bool Rekey(std::string_view old_ip, std::string_view new_ip, std::string& error);

  // Records that the per-device workflow started for this device.
  void MarkVisited(DeviceId id);

  void MarkFailed(DeviceId id, std::string message, ReachabilityStatus status);

  bool IsVisitedIp(std::string_view ip) const;
  bool IsFailedIp(std::string_view ip) const;
  bool IsVisitedHostname(std::string_view hostname) const;

  // Id of the device currently or formerly (before a re-key) known by `ip`.
  std::optional<DeviceId> Resolve(std::string_view ip) const;

  // True when `ip` is tracked in the table, was re-keyed away from, or is in
  // either tracking set.
  bool IsKnownAddress(std::string_view ip) const;

  const std::set<std::string, std::less<>>& visited_ips() const;
  const std::set<std::string, std::less<>>& failed_ips() const;
  const std::set<std::string, std::less<>>& visited_hostnames() const;

  // Addresses in the order the workflow visited them (current keys).
  const std::vector<std::string>& visit_order() const;

private:
  std::deque<DiscoveredDevice> devices_;
  std::map<std::string, DeviceId, std::less<>> by_ip_;
  // Former addresses of re-keyed devices.
  std::map<std::string, DeviceId, std::less<>> aliases_;
  std::set<std::string, std::less<>> visited_ips_;
  std::set<std::string, std::less<>> failed_ips_;
  std::set<std::string, std::less<>> visited_hostnames_;
  std::vector<std::string> visit_order_;
};

} // namespace topocrawl::model
