#pragma once

#include "artifacts/topology_writer.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "discovery/discovery_options.hpp"
#include "model/credential.hpp"
#include "model/device_table.hpp"
#include "parsing/extensible_parser.hpp"
#include "parsing/template_matcher.hpp"
#include "reachability/credential_resolver.hpp"
#include "reachability/network_probe.hpp"
#include "ssh/shell_transport.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace topocrawl::discovery {

// User-supplied entry point. `hostname` may be empty.
struct SeedDevice {
  std::string hostname;
  std::string ip_address;
};

using ProgressCallback = std::function<void(std::string_view)>;

// Hop-bounded breadth-first topology crawler.
//
// One control flow owns the device table: devices are processed one at a
// time, in insertion order within a hop, and hops strictly in sequence. Every
// per-device workflow runs against its own Deadline; running out of budget
// fails that device and the crawl moves on. Only the caller's startup checks
// (credentials present) are fatal; everything here is device-scoped.
class NetworkDiscovery {
public:
  NetworkDiscovery(std::vector<model::Credential> credentials,
                   DiscoveryOptions options,
                   core::logging::Logger& logger,
                   reachability::INetworkProbe& probe,
                   ssh::TransportFactory transport_factory,
                   const parsing::ITemplateMatcher& matcher);

  // Human-readable status lines ("discovering 10.0.0.1 at hop 0", ...).
  void SetProgressCallback(ProgressCallback callback);

  // Seeds start at hop 0, unvisited. Neighbor commands are issued only on
  // devices below `max_hops`, so with `max_hops == 0` the result holds the
  // seeds alone. Snapshots are written after each device and at the end.
  const model::DeviceTable& DiscoverSingleThreaded(const std::vector<SeedDevice>& seeds,
                                                   std::uint32_t max_hops);

  const model::DeviceTable& devices() const {
    return table_;
  }

  parsing::ExtensibleParser& parser() {
    return parser_;
  }

  // Case-insensitive substring match against the exclusion patterns.
  bool ShouldExclude(std::string_view hostname) const;

  // Writes both snapshot documents. Failures are logged and reported, never
  // fatal to the crawl.
  bool SaveSnapshot();

private:
  // DNS fallback + re-key. Marks the device failed when no address answers.
  bool ValidateReachability(model::DeviceId id);

  // Per-device workflow. Returns ids of newly queued neighbors.
  std::vector<model::DeviceId> DiscoverDevice(model::DeviceId id,
                                              std::uint32_t hop,
                                              std::uint32_t max_hops);

  bool RunDeviceWorkflow(model::DeviceId id,
                         bool collect_neighbors,
                         const core::Deadline& deadline,
                         std::vector<model::DeviceId>& queued,
                         std::string& error);

  void ProcessNeighbors(model::DeviceId id,
                        const std::vector<std::pair<std::string, std::string>>& outputs,
                        const core::Deadline& deadline,
                        std::vector<model::DeviceId>& queued);

  // Address under which a not-yet-known neighbor should be queued: its own
  // when SSH answers there, otherwise its DNS name's address when that one
  // answers. Empty when the neighbor should be skipped.
  std::string FindQueueAddress(const std::string& ip,
                               const std::string& hostname,
                               const core::Deadline& deadline);

  void PostProcess();
  void LogFinalStatistics();
  void Progress(const std::string& message);

  DiscoveryOptions options_;
  core::logging::Logger& logger_;
  reachability::INetworkProbe& probe_;
  reachability::CredentialResolver resolver_;
  parsing::ExtensibleParser parser_;
  model::DeviceTable table_;
  ProgressCallback progress_;
};

} // namespace topocrawl::discovery
