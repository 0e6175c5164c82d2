#pragma once

#include "model/device.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::model {

// Logical attributes the crawler needs from a neighbor record.
enum class NeighborField {
  kIpAddress,
  kHostname,
  kLocalInterface,
  kRemoteInterface,
  kPlatform,
  kCapabilities,
};

// Ordered synonym keys for one logical field. Device output is inconsistent
// across vendors and template sets; the lists and their order are a
// compatibility contract and must not be reordered or trimmed.
const std::vector<std::string_view>& FieldAliases(NeighborField field);

// Returns the trimmed value of the first alias present with a non-blank
// value, or std::nullopt.
std::optional<std::string> FindNeighborField(const NeighborRecord& record, NeighborField field);

// Derived view of one neighbor record after alias resolution.
struct NeighborView {
  std::optional<std::string> ip_address;
  std::optional<std::string> hostname;
  std::optional<std::string> local_interface;
  std::optional<std::string> remote_interface;
  std::optional<std::string> platform;
  std::optional<std::string> capabilities;
  std::string discovered_via;
};

NeighborView ResolveNeighbor(const NeighborRecord& record);

// "cdp" or "lldp" depending on the discovering command.
std::string LinkTypeFromCommand(std::string_view command);

// Cleans and validates an IPv4 literal. Stray non-digit/non-dot characters
// (trailing commas, brackets) are dropped before validation; the cleaned form
// is returned on success.
std::optional<std::string> CleanIpv4Address(std::string_view raw);

// Accepts "00:1a:2b:3c:4d:5e", "00-1a-2b-3c-4d-5e" or "001a.2b3c.4d5e" and
// returns it lowercased. Chassis ids that are not MACs yield std::nullopt.
std::optional<std::string> CleanMacAddress(std::string_view raw);

} // namespace topocrawl::model
