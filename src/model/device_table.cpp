#include "model/device_table.hpp"

#include <algorithm>
#include <utility>

namespace topocrawl::model {

namespace {

void ReplaceAddress(std::string& field, std::string_view old_ip, std::string_view new_ip) {
  if (field == old_ip) {
    field = std::string(new_ip);
  }
}

} // namespace

std::optional<DeviceId> DeviceTable::Insert(DiscoveredDevice device) {
  if (device.ip_address.empty() || by_ip_.find(device.ip_address) != by_ip_.end()) {
    return std::nullopt;
  }
  const DeviceId id = devices_.size();
  by_ip_.emplace(device.ip_address, id);
  if (device.original_ip.has_value() && device.original_ip.value() != device.ip_address &&
      by_ip_.find(device.original_ip.value()) == by_ip_.end()) {
    aliases_.emplace(device.original_ip.value(), id);
  }
  devices_.push_back(std::move(device));
  return id;
}

bool DeviceTable::Contains(std::string_view ip) const {
  return by_ip_.find(ip) != by_ip_.end();
}

std::optional<DeviceId> DeviceTable::IdOf(std::string_view ip) const {
  const auto it = by_ip_.find(ip);
  if (it == by_ip_.end()) {
    return std::nullopt;
  }
  return it->second;
}

DiscoveredDevice* DeviceTable::Find(std::string_view ip) {
  const auto id = IdOf(ip);
  return id.has_value() ? &devices_[id.value()] : nullptr;
}

const DiscoveredDevice* DeviceTable::Find(std::string_view ip) const {
  const auto id = IdOf(ip);
  return id.has_value() ? &devices_[id.value()] : nullptr;
}

DiscoveredDevice& DeviceTable::Get(const DeviceId id) {
  return devices_.at(id);
}

const DiscoveredDevice& DeviceTable::Get(const DeviceId id) const {
  return devices_.at(id);
}

std::size_t DeviceTable::size() const {
  return devices_.size();
}

bool DeviceTable::empty() const {
  return devices_.empty();
}

std::vector<DeviceId> DeviceTable::Ids() const {
  std::vector<DeviceId> ids(devices_.size());
  for (DeviceId id = 0; id < ids.size(); ++id) {
    ids[id] = id;
  }
  return ids;
}

bool DeviceTable::Rekey(std::string_view old_ip, std::string_view new_ip, std::string& error) {
  if (old_ip == new_ip) {
    error = "re-key target equals current address " + std::string(old_ip);
    return false;
  }
  const auto old_it = by_ip_.find(old_ip);
  if (old_it == by_ip_.end()) {
    error = "cannot re-key unknown address " + std::string(old_ip);
    return false;
  }
  if (by_ip_.find(new_ip) != by_ip_.end()) {
    error = "cannot re-key " + std::string(old_ip) + " to " + std::string(new_ip) +
            ": address already tracked";
    return false;
  }

  const DeviceId id = old_it->second;
  by_ip_.erase(old_it);
  by_ip_.emplace(std::string(new_ip), id);
  aliases_.erase(std::string(new_ip));
  aliases_[std::string(old_ip)] = id;

  DiscoveredDevice& device = devices_[id];
  if (!device.original_ip.has_value()) {
    device.original_ip = device.ip_address;
  }
  device.ip_address = std::string(new_ip);

  if (const auto it = visited_ips_.find(old_ip); it != visited_ips_.end()) {
    visited_ips_.erase(it);
    visited_ips_.emplace(new_ip);
  }
  if (const auto it = failed_ips_.find(old_ip); it != failed_ips_.end()) {
    failed_ips_.erase(it);
    if (device.failed) {
      failed_ips_.emplace(new_ip);
    }
  }
  std::replace(visit_order_.begin(), visit_order_.end(), std::string(old_ip), std::string(new_ip));

  // Neighbor references recorded by other devices follow the device.
  for (DiscoveredDevice& other : devices_) {
    if (other.parent.has_value()) {
      ReplaceAddress(other.parent.value(), old_ip, new_ip);
    }
    for (InterfaceRecord& record : other.interfaces) {
      ReplaceAddress(record.connected_to, old_ip, new_ip);
    }
    for (auto& [name, link] : other.local_interfaces) {
      ReplaceAddress(link.connected_to, old_ip, new_ip);
    }
  }

  error.clear();
  return true;
}

void DeviceTable::MarkVisited(const DeviceId id) {
  DiscoveredDevice& device = devices_.at(id);
  device.visited = true;
  if (visited_ips_.emplace(device.ip_address).second) {
    visit_order_.push_back(device.ip_address);
  }
  if (!device.hostname.empty()) {
    visited_hostnames_.emplace(device.hostname);
  }
}

void DeviceTable::MarkFailed(const DeviceId id, std::string message,
                             const ReachabilityStatus status) {
  DiscoveredDevice& device = devices_.at(id);
  device.MarkFailed(std::move(message), status);
  failed_ips_.emplace(device.ip_address);
}

bool DeviceTable::IsVisitedIp(std::string_view ip) const {
  return visited_ips_.find(ip) != visited_ips_.end();
}

bool DeviceTable::IsFailedIp(std::string_view ip) const {
  return failed_ips_.find(ip) != failed_ips_.end();
}

bool DeviceTable::IsVisitedHostname(std::string_view hostname) const {
  return !hostname.empty() && visited_hostnames_.find(hostname) != visited_hostnames_.end();
}

std::optional<DeviceId> DeviceTable::Resolve(std::string_view ip) const {
  if (const auto id = IdOf(ip); id.has_value()) {
    return id;
  }
  const auto it = aliases_.find(ip);
  if (it == aliases_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool DeviceTable::IsKnownAddress(std::string_view ip) const {
  return Resolve(ip).has_value() || IsVisitedIp(ip) || IsFailedIp(ip);
}

const std::set<std::string, std::less<>>& DeviceTable::visited_ips() const {
  return visited_ips_;
}

const std::set<std::string, std::less<>>& DeviceTable::failed_ips() const {
  return failed_ips_;
}

const std::set<std::string, std::less<>>& DeviceTable::visited_hostnames() const {
  return visited_hostnames_;
}

const std::vector<std::string>& DeviceTable::visit_order() const {
  return visit_order_;
}

} // namespace topocrawl::model
