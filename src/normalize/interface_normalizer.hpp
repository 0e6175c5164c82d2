#pragma once

#include <string>
#include <string_view>

namespace topocrawl::normalize {

enum class InterfaceNameForm {
  kShort, // Gi0/1
  kLong,  // GigabitEthernet0/1
};

// Maps a vendor-specific interface name to a canonical form.
//
// Steps: trim, keep the last whitespace-separated token, drop a leading
// `<device>-` prefix when the token as a whole is not a known interface name,
// lowercase, then rewrite management synonyms and the first matching
// interface family prefix. Unrecognized names come back lowercased.
//
// Applying the function to its own output returns the same string.
std::string NormalizeInterfaceName(std::string_view name,
                                   InterfaceNameForm form = InterfaceNameForm::kShort);

// Coarse platform family from a platform description string.
// Returns "CISCO_IOS", "CISCO_NXOS", "ARISTA" or "UNKNOWN".
std::string DetectPlatform(std::string_view platform_text);

} // namespace topocrawl::normalize
