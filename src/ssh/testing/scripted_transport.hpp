#pragma once

#include "ssh/shell_transport.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace topocrawl::ssh::testing {

// Canned device behavior for one host.
struct ScriptedDevice {
  std::string banner;
  std::string prompt = "router#";
  // Accepted login; std::nullopt accepts anything.
  std::optional<std::string> username;
  std::optional<std::string> password;
  // Command text -> output body. Unknown commands get an IOS-style
  // "% Invalid input" reply.
  std::map<std::string, std::string> responses;
  // Never writes anything back after login.
  bool silent = false;
  // Accepts the TCP connection but never finishes authentication: Connect()
  // waits out its timeout and fails.
  bool stalls_login = false;
};

// In-process stand-in for a set of SSH-reachable devices. Every transport the
// factory creates shares this network, so tests can inspect which commands
// were sent to which host. The network must outlive its transports.
class ScriptedShellNetwork {
public:
  void AddDevice(std::string host, ScriptedDevice device);

  TransportFactory MakeFactory();

  const std::vector<std::pair<std::string, std::string>>& commands() const {
    return commands_;
  }

  std::vector<std::string> CommandsFor(const std::string& host) const;

  std::size_t connect_attempts() const {
    return connect_attempts_;
  }

private:
  friend class ScriptedTransport;

  std::map<std::string, ScriptedDevice> devices_;
  std::vector<std::pair<std::string, std::string>> commands_;
  std::size_t connect_attempts_ = 0;
};

class ScriptedTransport final : public IShellTransport {
public:
  explicit ScriptedTransport(ScriptedShellNetwork& network) : network_(network) {}

  bool Connect(const ConnectOptions& options,
               NegotiatedAlgorithms& negotiated,
               std::string& error) override;
  bool OpenShell(std::string& error) override;
  bool Write(std::string_view data, std::string& error) override;
  bool Read(std::chrono::milliseconds timeout, std::string& chunk, std::string& error) override;
  void Close() override;

private:
  void Respond(const std::string& command);

  ScriptedShellNetwork& network_;
  const ScriptedDevice* device_ = nullptr;
  std::string host_;
  bool shell_open_ = false;
  std::string partial_input_;
  std::deque<std::string> pending_;
};

} // namespace topocrawl::ssh::testing
