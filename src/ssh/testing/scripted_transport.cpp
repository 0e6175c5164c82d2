#include "ssh/testing/scripted_transport.hpp"

#include <memory>
#include <thread>

namespace topocrawl::ssh::testing {

namespace {

std::string FirstOrEmpty(const std::vector<std::string>& values) {
  return values.empty() ? std::string() : values.front();
}

} // namespace

void ScriptedShellNetwork::AddDevice(std::string host, ScriptedDevice device) {
  devices_[std::move(host)] = std::move(device);
}

TransportFactory ScriptedShellNetwork::MakeFactory() {
  return [this]() -> std::unique_ptr<IShellTransport> {
    return std::make_unique<ScriptedTransport>(*this);
  };
}

std::vector<std::string> ScriptedShellNetwork::CommandsFor(const std::string& host) const {
  std::vector<std::string> sent;
  for (const auto& [command_host, command] : commands_) {
    if (command_host == host) {
      sent.push_back(command);
    }
  }
  return sent;
}

bool ScriptedTransport::Connect(const ConnectOptions& options,
                                NegotiatedAlgorithms& negotiated,
                                std::string& error) {
  ++network_.connect_attempts_;
  const auto it = network_.devices_.find(options.host);
  if (it == network_.devices_.end()) {
    error = "connect to " + options.host + " failed: connection refused";
    return false;
  }
  const ScriptedDevice& device = it->second;
  if (device.stalls_login) {
    std::this_thread::sleep_for(options.timeout);
    error = "timed out waiting for authentication from " + options.host;
    return false;
  }
  if ((device.username.has_value() && device.username.value() != options.username) ||
      (device.password.has_value() && device.password.value() != options.password)) {
    error = "authentication failed for " + options.username + "@" + options.host;
    return false;
  }

  device_ = &device;
  host_ = options.host;
  negotiated.kex = FirstOrEmpty(options.algorithms.kex);
  negotiated.host_key = FirstOrEmpty(options.algorithms.host_keys);
  negotiated.cipher_client_to_server = FirstOrEmpty(options.algorithms.ciphers);
  negotiated.cipher_server_to_client = negotiated.cipher_client_to_server;
  negotiated.mac_client_to_server = FirstOrEmpty(options.algorithms.macs);
  negotiated.mac_server_to_client = negotiated.mac_client_to_server;
  return true;
}

bool ScriptedTransport::OpenShell(std::string& error) {
  if (device_ == nullptr) {
    error = "not connected";
    return false;
  }
  shell_open_ = true;
  if (!device_->silent) {
    pending_.push_back(device_->banner + "\r\n" + device_->prompt);
  }
  return true;
}

bool ScriptedTransport::Write(std::string_view data, std::string& error) {
  if (!shell_open_) {
    error = "shell channel is not open";
    return false;
  }
  partial_input_.append(data);
  std::size_t newline = partial_input_.find('\n');
  while (newline != std::string::npos) {
    std::string command = partial_input_.substr(0, newline);
    partial_input_.erase(0, newline + 1U);
    network_.commands_.emplace_back(host_, command);
    Respond(command);
    newline = partial_input_.find('\n');
  }
  return true;
}

// The echo and body arrive as one chunk and the prompt as a second one, the
// way a real device flushes its pager.
void ScriptedTransport::Respond(const std::string& command) {
  if (device_->silent) {
    return;
  }
  if (command.empty()) {
    pending_.push_back("\r\n" + device_->prompt);
    return;
  }

  const auto it = device_->responses.find(command);
  const std::string body = it != device_->responses.end()
                               ? it->second
                               : "% Invalid input detected at '^' marker.";
  pending_.push_back(command + "\r\n" + body + "\r\n");
  pending_.push_back(device_->prompt);
}

bool ScriptedTransport::Read(std::chrono::milliseconds timeout, std::string& chunk,
                             std::string& error) {
  chunk.clear();
  if (!shell_open_) {
    error = "shell channel is not open";
    return false;
  }
  if (pending_.empty()) {
    if (timeout.count() > 0) {
      std::this_thread::sleep_for(timeout);
    }
    return true;
  }
  chunk = std::move(pending_.front());
  pending_.pop_front();
  return true;
}

void ScriptedTransport::Close() {
  shell_open_ = false;
  device_ = nullptr;
  pending_.clear();
  partial_input_.clear();
}

} // namespace topocrawl::ssh::testing
