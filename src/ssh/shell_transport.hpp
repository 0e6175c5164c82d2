#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace topocrawl::ssh {

// Ordered algorithm offers sent during key exchange. Strong algorithms come
// first; legacy ones stay at the end so decade-old firmware can still agree on
// a suite.
struct AlgorithmPreferences {
  std::vector<std::string> kex;
  std::vector<std::string> ciphers;
  std::vector<std::string> host_keys;
  std::vector<std::string> macs;
  std::vector<std::string> compression;
};

const AlgorithmPreferences& DefaultAlgorithmPreferences();

// "a,b,c" form used by libssh option setters and diagnostics.
std::string JoinAlgorithms(const std::vector<std::string>& algorithms);

// Suite agreed with the server, recorded for diagnostics.
struct NegotiatedAlgorithms {
  std::string kex;
  std::string host_key;
  std::string cipher_client_to_server;
  std::string cipher_server_to_client;
  std::string mac_client_to_server;
  std::string mac_server_to_client;
};

struct ConnectOptions {
  std::string host;
  std::uint16_t port = 22;
  std::string username;
  // Used for password auth and for every keyboard-interactive prompt.
  std::string password;
  std::optional<std::string> key_file;
  std::optional<std::string> key_passphrase;
  std::chrono::milliseconds timeout{15000};
  AlgorithmPreferences algorithms = DefaultAlgorithmPreferences();
};

// Byte-stream shell channel over an authenticated transport.
//
// Contract:
// - Connect() negotiates and authenticates; OpenShell() allocates a vt100
//   80x24 pty and starts an interactive shell on it
// - Read() waits at most `timeout` and returns whatever arrived; an empty
//   chunk means nothing arrived in time, false means the channel is gone
// - Close() is idempotent
class IShellTransport {
public:
  virtual ~IShellTransport() = default;

  virtual bool Connect(const ConnectOptions& options,
                       NegotiatedAlgorithms& negotiated,
                       std::string& error) = 0;

  virtual bool OpenShell(std::string& error) = 0;

  virtual bool Write(std::string_view data, std::string& error) = 0;

  virtual bool Read(std::chrono::milliseconds timeout, std::string& chunk, std::string& error) = 0;

  virtual void Close() = 0;
};

// Creates one fresh, unconnected transport per session attempt.
using TransportFactory = std::function<std::unique_ptr<IShellTransport>()>;

} // namespace topocrawl::ssh
