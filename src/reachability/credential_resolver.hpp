#pragma once

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "model/credential.hpp"
#include "reachability/network_probe.hpp"
#include "ssh/session_client.hpp"
#include "ssh/shell_transport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace topocrawl::reachability {

struct ResolverOptions {
  std::uint16_t probe_port = 22;
  double socket_probe_fraction = 0.25;
  double ssh_attempt_fraction = 1.0 / 3.0;
  std::chrono::milliseconds poll_interval{250};
};

// Outcome of a successful login: the connected (not yet shell-ready)
// session and the credential that opened it.
struct ResolvedConnection {
  model::Credential credential;
  std::unique_ptr<ssh::SessionClient> client;
  std::string connected_ip;
};

// Finds the first credential that logs into a host.
class CredentialResolver {
public:
  CredentialResolver(std::vector<model::Credential> credentials,
                     INetworkProbe& probe,
                     ssh::TransportFactory transport_factory,
                     core::logging::Logger& logger,
                     ResolverOptions options = {});

  // Probes the SSH port with a quarter of the time left on `deadline`. When
  // the port answers, or `host` is a literal address (probe is advisory
  // then), each credential is tried in priority order with a connect timeout
  // of a third of that time, clamped to what is still left. Stops once the
  // deadline expires. Returns false when no credential works; that is an
  // ordinary outcome, not an error. Callers tell a timeout apart by checking
  // `deadline.Expired()`.
  bool TryCredentials(const std::string& host,
                      const core::Deadline& deadline,
                      ResolvedConnection& resolved);

  const std::vector<model::Credential>& credentials() const {
    return credentials_;
  }

private:
  std::vector<model::Credential> credentials_;
  INetworkProbe& probe_;
  ssh::TransportFactory transport_factory_;
  core::logging::Logger& logger_;
  ResolverOptions options_;
};

// Finds an address on which the device answers `port`. Tries `ip` first;
// when it does not answer and `hostname` is known, resolves the hostname and
// accepts the resolved address if it differs from `ip` and answers.
// Returns false when neither works.
bool ResolveWorkingAddress(INetworkProbe& probe,
                           core::logging::Logger& logger,
                           const std::string& ip,
                           const std::string& hostname,
                           std::uint16_t port,
                           std::chrono::milliseconds timeout,
                           std::string& working_address);

} // namespace topocrawl::reachability
