#include "model/device.hpp"

#include <algorithm>
#include <utility>

namespace topocrawl::model {

const char* ToString(const ReachabilityStatus status) {
  switch (status) {
  case ReachabilityStatus::kReachable:
    return "reachable";
  case ReachabilityStatus::kUnreachable:
    return "unreachable";
  case ReachabilityStatus::kUnknown:
    return "unknown";
  }
  return "unknown";
}

bool DiscoveredDevice::HasInterface(std::string_view name) const {
  return std::any_of(interfaces.begin(), interfaces.end(),
                     [&](const InterfaceRecord& record) { return record.name == name; });
}

bool DiscoveredDevice::AddInterface(InterfaceRecord record) {
  if (record.name.empty() || HasInterface(record.name)) {
    return false;
  }
  interfaces.push_back(std::move(record));
  return true;
}

void DiscoveredDevice::MarkFailed(std::string message, const ReachabilityStatus status) {
  failed = true;
  error_msg = std::move(message);
  if (status != ReachabilityStatus::kUnknown) {
    reachability_status = status;
  }
}

} // namespace topocrawl::model
