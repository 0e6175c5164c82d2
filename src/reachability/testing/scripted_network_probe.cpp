#include "reachability/testing/scripted_network_probe.hpp"

namespace topocrawl::reachability::testing {

bool ScriptedNetworkProbe::IsPortOpen(const std::string& host, std::uint16_t /*port*/,
                                      std::chrono::milliseconds /*timeout*/) {
  probed_hosts_.push_back(host);
  return open_hosts_.count(host) != 0U;
}

bool ScriptedNetworkProbe::Resolve(const std::string& host, std::string& address,
                                   std::string& error) {
  resolved_names_.push_back(host);
  const auto it = dns_.find(host);
  if (it == dns_.end()) {
    error = "lookup of " + host + " failed: name not known";
    return false;
  }
  address = it->second;
  return true;
}

} // namespace topocrawl::reachability::testing
