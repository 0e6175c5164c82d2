#include "normalize/interface_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

namespace topocrawl::normalize {

namespace {

struct InterfaceFamily {
  std::regex pattern;
  const char* long_name;
  const char* short_name;
};

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

// Order matters: the first family whose prefix matches wins. Only the matched
// prefix and number are rewritten and every short and long name is itself an
// alias of its family, so normalizing a result again changes nothing.
const std::vector<InterfaceFamily>& Families() {
  static const std::vector<InterfaceFamily> kFamilies = {
      {std::regex(R"(^(?:eth|et|ethernet)(\d+(?:/\d+)*(?:\.\d+)?))", kIcase), "Ethernet$1",
       "Eth$1"},
      {std::regex(R"(^(?:gi|gige|gigabiteth|gigabitethernet|gigabit)(\d+(?:/\d+)*(?:\.\d+)?))",
                  kIcase),
       "GigabitEthernet$1", "Gi$1"},
      {std::regex(R"(^(?:te|tengig|tengige|tengigabitethernet|tengigabit)(\d+(?:/\d+)*(?:\.\d+)?))",
                  kIcase),
       "TenGigabitEthernet$1", "Te$1"},
      {std::regex(
           R"(^(?:twe|twentyfivegig|twentyfivegige|twentyfivegigabitethernet)(\d+(?:/\d+)*(?:\.\d+)?))",
           kIcase),
       "TwentyFiveGigE$1", "Twe$1"},
      {std::regex(R"(^(?:fo|fortygig|fortygige|fortygigabitethernet)(\d+(?:/\d+)*(?:\.\d+)?))",
                  kIcase),
       "FortyGigabitEthernet$1", "Fo$1"},
      {std::regex(
           R"(^(?:hu|hun|hundredgig|hundredgige|hundredgigabitethernet|100gig)(\d+(?:/\d+)*(?:\.\d+)?))",
           kIcase),
       "HundredGigabitEthernet$1", "Hu$1"},
      {std::regex(R"(^(?:po|portchannel|port-channel|port_channel)(\d+))", kIcase), "Port-Channel$1",
       "Po$1"},
      // Management synonyms.
      {std::regex(R"(^(?:ma|mgmt|management|oob_management|oob|wan)(\d+(?:/\d+)*(?:\.\d+)?))",
                  kIcase),
       "Management$1", "Ma$1"},
      {std::regex(R"(^(?:ma|mgmt|management|oob_management|oob|wan)$)", kIcase), "Management",
       "Ma"},
      {std::regex(R"(^(?:vl|vlan)(\d+))", kIcase), "Vlan$1", "Vl$1"},
      {std::regex(R"(^(?:lo|loopback)(\d+))", kIcase), "Loopback$1", "Lo$1"},
      {std::regex(R"(^(?:fa|fast|fastethernet)(\d+(?:/\d+)*))", kIcase), "FastEthernet$1",
       "Fa$1"},
  };
  return kFamilies;
}

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool IsKnownInterfaceForm(const std::string& token) {
  return std::any_of(Families().begin(), Families().end(), [&](const InterfaceFamily& family) {
    return std::regex_search(token, family.pattern);
  });
}

// "core-sw1-Gi0/1" -> "Gi0/1". Names such as "Port-Channel1" are left alone.
std::string StripDevicePrefix(std::string token) {
  const std::size_t last_hyphen = token.rfind('-');
  if (last_hyphen == std::string::npos || IsKnownInterfaceForm(token)) {
    return token;
  }
  static const std::regex kInterfaceLike(R"(^[a-zA-Z]+\d)");
  const std::string tail = token.substr(last_hyphen + 1U);
  if (std::regex_search(tail, kInterfaceLike)) {
    return tail;
  }
  return token;
}

} // namespace

std::string NormalizeInterfaceName(std::string_view name, const InterfaceNameForm form) {
  std::string_view trimmed = TrimView(name);
  if (trimmed.empty()) {
    return "";
  }

  const std::size_t last_space = trimmed.find_last_of(" \t");
  if (last_space != std::string_view::npos) {
    trimmed = trimmed.substr(last_space + 1U);
  }

  const std::string token = ToLower(StripDevicePrefix(std::string(trimmed)));
  const bool use_short = form == InterfaceNameForm::kShort;

  for (const InterfaceFamily& family : Families()) {
    if (std::regex_search(token, family.pattern)) {
      return std::regex_replace(token, family.pattern,
                                use_short ? family.short_name : family.long_name,
                                std::regex_constants::format_first_only);
    }
  }

  return token;
}

std::string DetectPlatform(std::string_view platform_text) {
  if (platform_text.empty()) {
    return "UNKNOWN";
  }

  const std::string lowered = ToLower(platform_text);
  if (lowered.find("cisco ios") != std::string::npos) {
    return "CISCO_IOS";
  }
  if (lowered.find("nexus") != std::string::npos || lowered.find("nxos") != std::string::npos) {
    return "CISCO_NXOS";
  }
  if (lowered.find("arista") != std::string::npos) {
    return "ARISTA";
  }
  return "UNKNOWN";
}

} // namespace topocrawl::normalize
