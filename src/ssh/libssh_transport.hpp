#pragma once

#include "ssh/shell_transport.hpp"

#include <libssh/libssh.h>

namespace topocrawl::ssh {

// libssh-backed shell transport.
//
// Host keys are not verified: devices are addressed by management IP and
// commonly re-keyed on upgrade, and the crawler only reads neighbor tables.
class LibsshTransport final : public IShellTransport {
public:
  LibsshTransport() = default;
  ~LibsshTransport() override;

  LibsshTransport(const LibsshTransport&) = delete;
  LibsshTransport& operator=(const LibsshTransport&) = delete;

  bool Connect(const ConnectOptions& options,
               NegotiatedAlgorithms& negotiated,
               std::string& error) override;
  bool OpenShell(std::string& error) override;
  bool Write(std::string_view data, std::string& error) override;
  bool Read(std::chrono::milliseconds timeout, std::string& chunk, std::string& error) override;
  void Close() override;

private:
  bool ApplyOptions(const ConnectOptions& options, std::string& error);
  bool Authenticate(const ConnectOptions& options, std::string& error);
  bool AuthenticatePublicKey(const ConnectOptions& options, std::string& error);
  bool AuthenticateKeyboardInteractive(const ConnectOptions& options);
  void CaptureNegotiated(NegotiatedAlgorithms& negotiated) const;
  std::string LastError() const;

  ssh_session session_ = nullptr;
  ssh_channel channel_ = nullptr;
};

// Factory for production sessions.
TransportFactory MakeLibsshTransportFactory();

} // namespace topocrawl::ssh
