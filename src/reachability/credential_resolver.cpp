#include "reachability/credential_resolver.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace topocrawl::reachability {

namespace {

std::chrono::milliseconds Fraction(const std::chrono::milliseconds budget, const double share) {
  return std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(static_cast<double>(budget.count()) * share));
}

} // namespace

CredentialResolver::CredentialResolver(std::vector<model::Credential> credentials,
                                       INetworkProbe& probe,
                                       ssh::TransportFactory transport_factory,
                                       core::logging::Logger& logger,
                                       ResolverOptions options)
    : credentials_(std::move(credentials)),
      probe_(probe),
      transport_factory_(std::move(transport_factory)),
      logger_(logger),
      options_(options) {
  model::SortByPriority(credentials_);
}

bool CredentialResolver::TryCredentials(const std::string& host,
                                        const core::Deadline& deadline,
                                        ResolvedConnection& resolved) {
  const auto budget = deadline.Remaining();
  const auto socket_timeout = Fraction(budget, options_.socket_probe_fraction);
  const auto ssh_timeout = Fraction(budget, options_.ssh_attempt_fraction);

  logger_.Debug("probing ssh port before login",
                {{"host", host},
                 {"port", std::to_string(options_.probe_port)},
                 {"timeout_ms", std::to_string(socket_timeout.count())}});
  const bool socket_reachable = probe_.IsPortOpen(host, options_.probe_port, socket_timeout);
  if (!socket_reachable && !IsLiteralAddress(host)) {
    logger_.Debug("ssh port closed and host is not a literal address", {{"host", host}});
    return false;
  }

  std::size_t tried = 0;
  for (const model::Credential& credential : credentials_) {
    if (deadline.Expired()) {
      logger_.Info("login budget exhausted",
                   {{"host", host},
                    {"tried", std::to_string(tried)},
                    {"of", std::to_string(credentials_.size())}});
      return false;
    }
    ++tried;
    ssh::SessionOptions session_options;
    session_options.connect.host = host;
    session_options.connect.port = credential.port;
    session_options.connect.username = credential.username;
    session_options.connect.password = credential.password;
    session_options.connect.key_file = credential.key_file;
    session_options.connect.key_passphrase = credential.key_passphrase;
    session_options.connect.timeout = deadline.Clamp(ssh_timeout);
    session_options.poll_interval = options_.poll_interval;

    auto client = std::make_unique<ssh::SessionClient>(transport_factory_(),
                                                       std::move(session_options), logger_);
    std::string error;
    if (!client->Connect(error)) {
      logger_.Debug("credential rejected",
                    {{"host", host}, {"credential", model::DescribeCredential(credential)},
                     {"error", error}});
      continue;
    }

    logger_.Info("logged in", {{"host", host},
                               {"credential", model::DescribeCredential(credential)}});
    resolved.credential = credential;
    resolved.client = std::move(client);
    resolved.connected_ip = host;
    return true;
  }

  logger_.Debug("all credentials failed", {{"host", host},
                                           {"tried", std::to_string(tried)}});
  return false;
}

bool ResolveWorkingAddress(INetworkProbe& probe,
                           core::logging::Logger& logger,
                           const std::string& ip,
                           const std::string& hostname,
                           const std::uint16_t port,
                           const std::chrono::milliseconds timeout,
                           std::string& working_address) {
  logger.Debug("checking tcp reachability", {{"ip", ip}, {"port", std::to_string(port)}});
  if (probe.IsPortOpen(ip, port, timeout)) {
    working_address = ip;
    return true;
  }
  if (hostname.empty()) {
    logger.Info("address unreachable and no hostname to resolve", {{"ip", ip}});
    return false;
  }

  std::string address;
  std::string error;
  if (!probe.Resolve(hostname, address, error)) {
    logger.Info("forward lookup failed", {{"hostname", hostname}, {"error", error}});
    return false;
  }
  if (address == ip) {
    logger.Info("forward lookup returned the same address", {{"hostname", hostname}, {"ip", ip}});
    return false;
  }
  if (!probe.IsPortOpen(address, port, timeout)) {
    logger.Info("resolved address is also unreachable",
                {{"hostname", hostname}, {"resolved", address}});
    return false;
  }

  logger.Info("resolved address is reachable",
              {{"hostname", hostname}, {"ip", ip}, {"resolved", address}, {"method", "dns"}});
  working_address = address;
  return true;
}

} // namespace topocrawl::reachability
