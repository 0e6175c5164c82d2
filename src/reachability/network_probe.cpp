#include "reachability/network_probe.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>

namespace topocrawl::reachability {

namespace {

// Owns one socket descriptor.
class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

private:
  int fd_ = -1;
};

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    if (info != nullptr) {
      freeaddrinfo(info);
    }
  }
};

bool ConnectWithTimeout(const addrinfo& candidate, std::chrono::milliseconds timeout) {
  ScopedFd fd(::socket(candidate.ai_family, candidate.ai_socktype, candidate.ai_protocol));
  if (fd.get() < 0) {
    return false;
  }

  const int flags = ::fcntl(fd.get(), F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
    return false;
  }

  if (::connect(fd.get(), candidate.ai_addr, candidate.ai_addrlen) == 0) {
    return true;
  }
  if (errno != EINPROGRESS) {
    return false;
  }

  pollfd pfd{};
  pfd.fd = fd.get();
  pfd.events = POLLOUT;
  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready <= 0) {
    return false;
  }

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
    return false;
  }
  return so_error == 0;
}

} // namespace

bool IsLiteralAddress(std::string_view host) {
  const std::string text(host);
  in_addr v4{};
  in6_addr v6{};
  return inet_pton(AF_INET, text.c_str(), &v4) == 1 || inet_pton(AF_INET6, text.c_str(), &v6) == 1;
}

bool SystemNetworkProbe::IsPortOpen(const std::string& host,
                                    const std::uint16_t port,
                                    const std::chrono::milliseconds timeout) {
  if (host.empty() || timeout.count() <= 0) {
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* raw = nullptr;
  const std::string service = std::to_string(port);
  if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw) != 0) {
    return false;
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> results(raw);

  for (const addrinfo* it = results.get(); it != nullptr; it = it->ai_next) {
    if (ConnectWithTimeout(*it, timeout)) {
      return true;
    }
  }
  return false;
}

bool SystemNetworkProbe::Resolve(const std::string& host, std::string& address,
                                 std::string& error) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* raw = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw);
  if (rc != 0) {
    error = "lookup of " + host + " failed: " + gai_strerror(rc);
    return false;
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> results(raw);

  for (const addrinfo* it = results.get(); it != nullptr; it = it->ai_next) {
    if (it->ai_family != AF_INET) {
      continue;
    }
    char buffer[INET_ADDRSTRLEN] = {};
    const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ai_addr);
    if (inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer)) != nullptr) {
      address = buffer;
      return true;
    }
  }
  error = "lookup of " + host + " returned no IPv4 address";
  return false;
}

ReachabilityResult CheckReachability(INetworkProbe& probe,
                                     const std::string& host,
                                     const std::uint16_t port,
                                     const std::chrono::milliseconds timeout) {
  ReachabilityResult result;
  if (probe.IsPortOpen(host, port, timeout)) {
    result.reachable = true;
    result.method = "tcp";
    return result;
  }
  result.error = "tcp connect to " + host + ":" + std::to_string(port) + " failed";
  if (IsLiteralAddress(host)) {
    return result;
  }

  std::string address;
  std::string resolve_error;
  if (probe.Resolve(host, address, resolve_error)) {
    result.resolved_address = address;
    result.method = "dns";
  } else {
    result.error += "; " + resolve_error;
  }
  return result;
}

} // namespace topocrawl::reachability
