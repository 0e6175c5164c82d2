#pragma once

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "ssh/shell_transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace topocrawl::ssh {

enum class SessionState {
  kDisconnected,
  kConnected,
  kShellReady,
  kCommandInFlight,
};

const char* ToString(SessionState state);

struct SessionOptions {
  ConnectOptions connect;
  // Re-check cadence while waiting for command completion.
  std::chrono::milliseconds poll_interval{250};
  // Called once per completed output line, and once more for a trailing
  // partial line on Disconnect().
  std::function<void(std::string_view)> output_callback;
};

struct ConnectionInfo {
  std::string host;
  std::uint16_t port = 22;
  bool connected = false;
  NegotiatedAlgorithms negotiated;
};

struct ExpectMatch {
  std::size_t index = 0;
  std::string pattern;
  std::string buffer;
};

// One interactive shell session on top of an IShellTransport.
//
// State machine:
//   DISCONNECTED -> CONNECTED -> SHELL_READY -> (COMMAND_IN_FLIGHT <-> SHELL_READY)*
//   any state -> DISCONNECTED via Disconnect()
//
// Incoming bytes are appended to a full-session buffer (pattern search), a
// line buffer (per-line output callback), and published to scoped
// subscribers. All waiting is done by one poll loop that reads the transport
// with a timeout bounded by the poll interval, so data arrival and the
// periodic re-check share the same completion test.
class SessionClient {
public:
  using DataHandler = std::function<void(std::string_view)>;

  // Receives published chunks until destroyed or Reset().
  class Subscription {
  public:
    Subscription() = default;
    Subscription(SessionClient* client, std::uint64_t id) : client_(client), id_(id) {}
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void Reset();

  private:
    SessionClient* client_ = nullptr;
    std::uint64_t id_ = 0;
  };

  SessionClient(std::unique_ptr<IShellTransport> transport,
                SessionOptions options,
                core::logging::Logger& logger);
  ~SessionClient();

  SessionClient(const SessionClient&) = delete;
  SessionClient& operator=(const SessionClient&) = delete;

  // Fails with CONNECTION_ERROR on negotiation/auth failure or timeout.
  bool Connect(std::string& error);

  // Requires CONNECTED.
  bool CreateShell(std::string& error);

  // Infers the device prompt. Existing output is matched first; otherwise an
  // empty line is sent up to `attempts` times, each waiting `timeout` for a
  // prompt shape. Fails with PROMPT_DETECTION_ERROR.
  bool FindPrompt(int attempts, std::chrono::milliseconds timeout, std::string& prompt,
                  std::string& error);

  // Same, with every attempt clamped to what is left of `deadline`; stops
  // early once it has expired.
  bool FindPrompt(int attempts,
                  std::chrono::milliseconds timeout,
                  const core::Deadline& deadline,
                  std::string& prompt,
                  std::string& error);

  // Writes `text` followed by a newline.
  bool SendCommand(std::string_view text, std::string& error);

  // Clears the session buffer, sends `command` and waits for `prompt`. On
  // timeout, output whose last line ends with '#', '>' or '$' is accepted;
  // otherwise fails with COMMAND_TIMEOUT_ERROR.
  bool ExecuteCommand(std::string_view command,
                      std::string_view prompt,
                      std::chrono::milliseconds timeout,
                      std::string& output,
                      std::string& error);

  // Waits until newly arrived output contains `pattern`.
  bool WaitFor(std::string_view pattern,
               std::chrono::milliseconds timeout,
               std::string& output,
               std::string& error);

  // Waits until newly arrived output contains any of `patterns`; reports the
  // first one in list order.
  bool Expect(const std::vector<std::string>& patterns,
              std::chrono::milliseconds timeout,
              ExpectMatch& match,
              std::string& error);

  // Flushes the partial line, closes shell and transport. Safe to call
  // repeatedly, including from failure paths.
  void Disconnect();

  Subscription Subscribe(DataHandler handler);

  // Reads the transport once (waiting at most `timeout`) and dispatches any
  // data. Fails with CONNECTION_ERROR when the channel is gone.
  bool Pump(std::chrono::milliseconds timeout, std::string& error);

  bool GetConnectionInfo(ConnectionInfo& info, std::string& error) const;

  SessionState state() const {
    return state_;
  }

  const std::string& output_buffer() const {
    return output_buffer_;
  }

private:
  void Unsubscribe(std::uint64_t id);
  void OnData(std::string_view chunk);
  bool RequireShell(std::string& error) const;
  bool FindPromptWithin(int attempts,
                        std::chrono::milliseconds timeout,
                        const core::Deadline* deadline,
                        std::string& prompt,
                        std::string& error);

  // Collects new output until `done` holds. Returns false with `timed_out`
  // set when the deadline passes first, or with `error` set when the
  // transport fails.
  bool WaitUntil(const std::function<bool(const std::string&)>& done,
                 std::chrono::milliseconds timeout,
                 std::string& collected,
                 bool& timed_out,
                 std::string& error);

  std::unique_ptr<IShellTransport> transport_;
  SessionOptions options_;
  core::logging::Logger& logger_;
  SessionState state_ = SessionState::kDisconnected;
  NegotiatedAlgorithms negotiated_;
  std::string output_buffer_;
  std::string line_buffer_;
  std::vector<std::pair<std::uint64_t, DataHandler>> subscribers_;
  std::uint64_t next_subscription_id_ = 1;
};

// Common prompt shapes (`router#`, `switch>`, `user@host$`, ...), tried in
// order.
bool MatchPromptShape(std::string_view text, std::string& prompt);

} // namespace topocrawl::ssh
