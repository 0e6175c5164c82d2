#include "ssh/shell_transport.hpp"

namespace topocrawl::ssh {

const AlgorithmPreferences& DefaultAlgorithmPreferences() {
  static const AlgorithmPreferences kDefaults = {
      .kex =
          {
              "curve25519-sha256",
              "curve25519-sha256@libssh.org",
              "ecdh-sha2-nistp256",
              "ecdh-sha2-nistp384",
              "ecdh-sha2-nistp521",
              "diffie-hellman-group-exchange-sha256",
              "diffie-hellman-group14-sha256",
              "diffie-hellman-group16-sha512",
              "diffie-hellman-group14-sha1",
              "diffie-hellman-group1-sha1",
              "diffie-hellman-group-exchange-sha1",
          },
      .ciphers =
          {
              "aes128-gcm@openssh.com",
              "aes256-gcm@openssh.com",
              "aes128-ctr",
              "aes192-ctr",
              "aes256-ctr",
              "aes128-cbc",
              "aes192-cbc",
              "aes256-cbc",
              "3des-cbc",
          },
      .host_keys =
          {
              "rsa-sha2-512",
              "rsa-sha2-256",
              "ssh-rsa",
              "ecdsa-sha2-nistp256",
              "ssh-ed25519",
          },
      .macs =
          {
              "hmac-sha2-256-etm@openssh.com",
              "hmac-sha2-512-etm@openssh.com",
              "hmac-sha2-256",
              "hmac-sha2-512",
              "hmac-sha1",
              "hmac-md5",
          },
      .compression = {"none", "zlib@openssh.com", "zlib"},
  };
  return kDefaults;
}

std::string JoinAlgorithms(const std::vector<std::string>& algorithms) {
  std::string joined;
  for (const std::string& algorithm : algorithms) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined += algorithm;
  }
  return joined;
}

} // namespace topocrawl::ssh
