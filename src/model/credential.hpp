#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::model {

// One login identity. Credentials are attempted in ascending `priority`;
// ties keep file order.
struct Credential {
  std::string username;
  std::string password;
  std::optional<std::string> key_file;
  std::optional<std::string> key_passphrase;
  std::uint16_t port = 22;
  std::optional<std::string> enable_password;
  int priority = 0;
};

// Parses a JSON array of credential objects. Field names accept snake_case
// and camelCase spellings (`key_file`/`keyFile`, `priority`/`authPriority`,
// ...). Entries that are not objects or lack a username are skipped and
// reported through `skipped`.
//
// Fails when the text is not a JSON array or no entry is usable.
bool ParseCredentialsJson(std::string_view text,
                          std::vector<Credential>& credentials,
                          std::vector<std::string>& skipped,
                          std::string& error);

bool LoadCredentialsFile(const std::filesystem::path& path,
                         std::vector<Credential>& credentials,
                         std::vector<std::string>& skipped,
                         std::string& error);

// Stable sort by ascending priority.
void SortByPriority(std::vector<Credential>& credentials);

// Identity string stored on a device after a successful login, e.g.
// "admin@22". Secrets are never included.
std::string DescribeCredential(const Credential& credential);

} // namespace topocrawl::model
