#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace topocrawl::reachability {

// Transport-layer reachability and name resolution seam. Probe failures are
// signal, not errors: IsPortOpen() simply reports false.
class INetworkProbe {
public:
  virtual ~INetworkProbe() = default;

  virtual bool IsPortOpen(const std::string& host,
                          std::uint16_t port,
                          std::chrono::milliseconds timeout) = 0;

  // Resolves `host` to one IPv4 address in dotted form.
  virtual bool Resolve(const std::string& host, std::string& address, std::string& error) = 0;
};

// Non-blocking connect() bounded by poll(), getaddrinfo() for names.
class SystemNetworkProbe final : public INetworkProbe {
public:
  bool IsPortOpen(const std::string& host,
                  std::uint16_t port,
                  std::chrono::milliseconds timeout) override;
  bool Resolve(const std::string& host, std::string& address, std::string& error) override;
};

// True for IPv4 or IPv6 literals.
bool IsLiteralAddress(std::string_view host);

struct ReachabilityResult {
  bool reachable = false;
  // Set when the TCP probe failed and `host` resolved by name.
  std::optional<std::string> resolved_address;
  // "tcp" for a successful connect, "dns" when only resolution succeeded.
  std::string method;
  std::string error;
};

// TCP connect to host:port. On failure, a non-literal host is resolved and
// the address reported (method "dns") without being tested.
ReachabilityResult CheckReachability(INetworkProbe& probe,
                                     const std::string& host,
                                     std::uint16_t port,
                                     std::chrono::milliseconds timeout);

} // namespace topocrawl::reachability
