#include "model/credential.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <cmath>

namespace topocrawl::model {

namespace {

namespace json = core::json;

bool ReadOptionalString(const json::Value::Object& object,
                        std::initializer_list<std::string_view> keys,
                        std::optional<std::string>& out) {
  const json::Value* field = json::FindFirstField(object, keys);
  if (field == nullptr) {
    return true;
  }
  if (field->type != json::Value::Type::kString) {
    return false;
  }
  if (!field->string_value.empty()) {
    out = field->string_value;
  }
  return true;
}

bool ReadCredential(const json::Value& entry, Credential& credential, std::string& reason) {
  if (entry.type != json::Value::Type::kObject) {
    reason = "entry is not an object";
    return false;
  }
  const json::Value::Object& object = entry.object_value;

  const json::Value* username = json::FindFirstField(object, {"username", "user"});
  if (username == nullptr || username->type != json::Value::Type::kString ||
      username->string_value.empty()) {
    reason = "missing username";
    return false;
  }
  credential.username = username->string_value;

  std::optional<std::string> password;
  if (!ReadOptionalString(object, {"password"}, password)) {
    reason = "password must be a string";
    return false;
  }
  credential.password = password.value_or("");

  if (!ReadOptionalString(object, {"key_file", "keyFile"}, credential.key_file) ||
      !ReadOptionalString(object, {"key_passphrase", "keyPassphrase"},
                          credential.key_passphrase) ||
      !ReadOptionalString(object, {"enable_password", "enablePassword"},
                          credential.enable_password)) {
    reason = "key and enable fields must be strings";
    return false;
  }

  if (const json::Value* port = json::FindFirstField(object, {"port"}); port != nullptr) {
    if (port->type != json::Value::Type::kNumber || port->number_value < 1.0 ||
        port->number_value > 65535.0 || std::floor(port->number_value) != port->number_value) {
      reason = "port must be an integer in [1,65535]";
      return false;
    }
    credential.port = static_cast<std::uint16_t>(port->number_value);
  }

  if (const json::Value* priority = json::FindFirstField(object, {"priority", "authPriority"});
      priority != nullptr) {
    if (priority->type != json::Value::Type::kNumber) {
      reason = "priority must be a number";
      return false;
    }
    credential.priority = static_cast<int>(priority->number_value);
  }
  return true;
}

} // namespace

bool ParseCredentialsJson(std::string_view text,
                          std::vector<Credential>& credentials,
                          std::vector<std::string>& skipped,
                          std::string& error) {
  credentials.clear();
  skipped.clear();

  json::Value root;
  std::string parse_error;
  if (!json::Parse(text, root, parse_error)) {
    error = "invalid credentials JSON: " + parse_error;
    return false;
  }
  if (root.type != json::Value::Type::kArray) {
    error = "credentials file must contain an array of credential objects";
    return false;
  }

  for (std::size_t i = 0; i < root.array_value.size(); ++i) {
    Credential credential;
    std::string reason;
    if (!ReadCredential(root.array_value[i], credential, reason)) {
      skipped.push_back("credential[" + std::to_string(i) + "]: " + reason);
      continue;
    }
    credentials.push_back(std::move(credential));
  }

  if (credentials.empty()) {
    error = "no valid credentials found";
    return false;
  }
  SortByPriority(credentials);
  return true;
}

bool LoadCredentialsFile(const std::filesystem::path& path,
                         std::vector<Credential>& credentials,
                         std::vector<std::string>& skipped,
                         std::string& error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    error = "credentials file not found: " + path.string();
    return false;
  }

  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseCredentialsJson(text, credentials, skipped, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

void SortByPriority(std::vector<Credential>& credentials) {
  std::stable_sort(credentials.begin(), credentials.end(),
                   [](const Credential& lhs, const Credential& rhs) {
                     return lhs.priority < rhs.priority;
                   });
}

std::string DescribeCredential(const Credential& credential) {
  return credential.username + "@" + std::to_string(credential.port);
}

} // namespace topocrawl::model
