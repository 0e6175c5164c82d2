#include "model/neighbor_fields.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace topocrawl::model {

namespace {

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

} // namespace

const std::vector<std::string_view>& FieldAliases(const NeighborField field) {
  static const std::vector<std::string_view> kIp = {
      "mgmt_address", "management_ip", "ip_address",  "neighbor_ip",
      "MGMT_ADDRESS", "IP_ADDRESS",    "NEIGHBOR_IP",
  };
  static const std::vector<std::string_view> kHostname = {
      "neighbor_name", "device_id", "hostname", "neighbor",
      "system_name",   "NEIGHBOR_NAME", "DEVICE_ID", "HOSTNAME",
  };
  static const std::vector<std::string_view> kLocalInterface = {
      "local_interface", "local_intf", "interface", "port", "local_port", "LOCAL_INTERFACE",
  };
  static const std::vector<std::string_view> kRemoteInterface = {
      "remote_interface", "remote_intf", "neighbor_interface",
      "port_id",          "remote_port", "NEIGHBOR_INTERFACE",
  };
  static const std::vector<std::string_view> kPlatform = {"platform", "PLATFORM"};
  static const std::vector<std::string_view> kCapabilities = {"capabilities", "CAPABILITIES"};

  switch (field) {
  case NeighborField::kIpAddress:
    return kIp;
  case NeighborField::kHostname:
    return kHostname;
  case NeighborField::kLocalInterface:
    return kLocalInterface;
  case NeighborField::kRemoteInterface:
    return kRemoteInterface;
  case NeighborField::kPlatform:
    return kPlatform;
  case NeighborField::kCapabilities:
    return kCapabilities;
  }
  return kIp;
}

std::optional<std::string> FindNeighborField(const NeighborRecord& record,
                                             const NeighborField field) {
  for (const std::string_view alias : FieldAliases(field)) {
    const auto it = record.find(std::string(alias));
    if (it == record.end()) {
      continue;
    }
    std::string value = Trim(it->second);
    if (!value.empty()) {
      return value;
    }
  }
  return std::nullopt;
}

NeighborView ResolveNeighbor(const NeighborRecord& record) {
  NeighborView view;
  view.ip_address = FindNeighborField(record, NeighborField::kIpAddress);
  view.hostname = FindNeighborField(record, NeighborField::kHostname);
  view.local_interface = FindNeighborField(record, NeighborField::kLocalInterface);
  view.remote_interface = FindNeighborField(record, NeighborField::kRemoteInterface);
  view.platform = FindNeighborField(record, NeighborField::kPlatform);
  view.capabilities = FindNeighborField(record, NeighborField::kCapabilities);
  if (const auto it = record.find(std::string(kDiscoveredViaField)); it != record.end()) {
    view.discovered_via = it->second;
  }
  return view;
}

std::string LinkTypeFromCommand(std::string_view command) {
  return command.find("cdp") != std::string_view::npos ? "cdp" : "lldp";
}

std::optional<std::string> CleanIpv4Address(std::string_view raw) {
  std::string cleaned;
  cleaned.reserve(raw.size());
  for (const char c : raw) {
    if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.') {
      cleaned.push_back(c);
    }
  }
  if (cleaned.empty()) {
    return std::nullopt;
  }

  in_addr parsed{};
  if (inet_pton(AF_INET, cleaned.c_str(), &parsed) != 1) {
    return std::nullopt;
  }
  return cleaned;
}

std::optional<std::string> CleanMacAddress(std::string_view raw) {
  static const std::regex kMac(
      R"(^(?:[0-9a-f]{2}([:-])[0-9a-f]{2}(?:\1[0-9a-f]{2}){4}|[0-9a-f]{4}\.[0-9a-f]{4}\.[0-9a-f]{4})$)",
      std::regex::ECMAScript | std::regex::icase);
  std::string mac = Trim(raw);
  if (!std::regex_match(mac, kMac)) {
    return std::nullopt;
  }
  std::transform(mac.begin(), mac.end(), mac.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return mac;
}

} // namespace topocrawl::model
