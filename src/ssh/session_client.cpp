#include "ssh/session_client.hpp"

#include "core/errors/discovery_error.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace topocrawl::ssh {

namespace {

using core::errors::DiscoveryErrorCode;
using core::errors::FormatDiscoveryError;

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

// Trimmed last line ends with a typical prompt terminator.
bool LastLineLooksLikePrompt(std::string_view output) {
  const std::size_t newline = output.rfind('\n');
  std::string_view last = newline == std::string_view::npos ? output : output.substr(newline + 1U);
  while (!last.empty() && std::isspace(static_cast<unsigned char>(last.back())) != 0) {
    last.remove_suffix(1);
  }
  if (last.empty()) {
    return false;
  }
  const char tail = last.back();
  return tail == '#' || tail == '>' || tail == '$';
}

const std::vector<std::regex>& PromptPatterns() {
  static const std::vector<std::regex> kPatterns = {
      std::regex(R"((\S+)[#>]\s*$)"),
      std::regex(R"((\S+)[$#>%]\s*$)"),
      std::regex(R"(^\s*(\S+[@:]\S+)[#$>]\s*$)", std::regex::ECMAScript | std::regex::multiline),
      std::regex(R"(^([A-Za-z0-9_\-]+\s*[#>:])\s*$)",
                 std::regex::ECMAScript | std::regex::multiline),
      std::regex(R"(^\s*([A-Za-z0-9_\-.]+(?:@[A-Za-z0-9_\-.]+)?[#$>%])\s*$)",
                 std::regex::ECMAScript | std::regex::multiline),
  };
  return kPatterns;
}

} // namespace

const char* ToString(const SessionState state) {
  switch (state) {
  case SessionState::kDisconnected:
    return "DISCONNECTED";
  case SessionState::kConnected:
    return "CONNECTED";
  case SessionState::kShellReady:
    return "SHELL_READY";
  case SessionState::kCommandInFlight:
    return "COMMAND_IN_FLIGHT";
  }
  return "DISCONNECTED";
}

bool MatchPromptShape(std::string_view text, std::string& prompt) {
  if (text.empty()) {
    return false;
  }
  const std::string haystack(text);
  for (const std::regex& pattern : PromptPatterns()) {
    std::smatch match;
    if (std::regex_search(haystack, match, pattern)) {
      prompt = match.str(0);
      return true;
    }
  }
  return false;
}

SessionClient::Subscription::~Subscription() {
  Reset();
}

SessionClient::Subscription::Subscription(Subscription&& other) noexcept
    : client_(std::exchange(other.client_, nullptr)), id_(std::exchange(other.id_, 0)) {}

SessionClient::Subscription& SessionClient::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Reset();
    client_ = std::exchange(other.client_, nullptr);
    id_ = std::exchange(other.id_, 0);
  }
  return *this;
}

void SessionClient::Subscription::Reset() {
  if (client_ != nullptr) {
    client_->Unsubscribe(id_);
    client_ = nullptr;
  }
}

SessionClient::SessionClient(std::unique_ptr<IShellTransport> transport,
                             SessionOptions options,
                             core::logging::Logger& logger)
    : transport_(std::move(transport)), options_(std::move(options)), logger_(logger) {}

SessionClient::~SessionClient() {
  Disconnect();
}

bool SessionClient::Connect(std::string& error) {
  if (state_ != SessionState::kDisconnected) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kConnection, "session already connected");
    return false;
  }
  if (transport_ == nullptr) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kConnection, "no transport");
    return false;
  }

  const ConnectOptions& connect = options_.connect;
  std::string transport_error;
  if (!transport_->Connect(connect, negotiated_, transport_error)) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kConnection, transport_error);
    logger_.Debug("ssh connect failed", {{"host", connect.host},
                                         {"user", connect.username},
                                         {"error", transport_error}});
    return false;
  }

  state_ = SessionState::kConnected;
  logger_.Debug("ssh connected", {{"host", connect.host},
                                  {"port", std::to_string(connect.port)},
                                  {"kex", negotiated_.kex},
                                  {"cipher", negotiated_.cipher_client_to_server},
                                  {"mac", negotiated_.mac_client_to_server}});
  return true;
}

bool SessionClient::CreateShell(std::string& error) {
  if (state_ != SessionState::kConnected) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kConnection,
                                 std::string("cannot open shell in state ") + ToString(state_));
    return false;
  }

  std::string transport_error;
  if (!transport_->OpenShell(transport_error)) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kConnection, transport_error);
    return false;
  }
  output_buffer_.clear();
  line_buffer_.clear();
  state_ = SessionState::kShellReady;
  return true;
}

bool SessionClient::RequireShell(std::string& error) const {
  if (state_ == SessionState::kShellReady) {
    return true;
  }
  error = std::string("shell not ready (state ") + ToString(state_) + ")";
  return false;
}

SessionClient::Subscription SessionClient::Subscribe(DataHandler handler) {
  const std::uint64_t id = next_subscription_id_++;
  subscribers_.emplace_back(id, std::move(handler));
  return Subscription(this, id);
}

void SessionClient::Unsubscribe(const std::uint64_t id) {
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     subscribers_.end());
}

void SessionClient::OnData(std::string_view chunk) {
  output_buffer_.append(chunk);
  line_buffer_.append(chunk);

  std::size_t newline = line_buffer_.find('\n');
  while (newline != std::string::npos) {
    std::string line = line_buffer_.substr(0, newline);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (options_.output_callback) {
      options_.output_callback(line);
    }
    line_buffer_.erase(0, newline + 1U);
    newline = line_buffer_.find('\n');
  }

  for (const auto& [id, handler] : subscribers_) {
    handler(chunk);
  }
}

bool SessionClient::Pump(std::chrono::milliseconds timeout, std::string& error) {
  if (state_ == SessionState::kDisconnected || transport_ == nullptr) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kConnection, "session is disconnected");
    return false;
  }

  std::string chunk;
  std::string transport_error;
  if (!transport_->Read(timeout, chunk, transport_error)) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kConnection, transport_error);
    logger_.Warn("ssh channel read failed",
                 {{"host", options_.connect.host}, {"error", transport_error}});
    Disconnect();
    return false;
  }
  if (!chunk.empty()) {
    OnData(chunk);
  }
  return true;
}

bool SessionClient::WaitUntil(const std::function<bool(const std::string&)>& done,
                              std::chrono::milliseconds timeout,
                              std::string& collected,
                              bool& timed_out,
                              std::string& error) {
  timed_out = false;
  Subscription subscription =
      Subscribe([&collected](std::string_view chunk) { collected.append(chunk); });

  const core::Deadline deadline(timeout);
  while (true) {
    if (done(collected)) {
      return true;
    }
    if (deadline.Expired()) {
      timed_out = true;
      return false;
    }
    if (!Pump(deadline.Clamp(options_.poll_interval), error)) {
      return false;
    }
  }
}

bool SessionClient::FindPrompt(const int attempts,
                               std::chrono::milliseconds timeout,
                               std::string& prompt,
                               std::string& error) {
  return FindPromptWithin(attempts, timeout, nullptr, prompt, error);
}

bool SessionClient::FindPrompt(const int attempts,
                               std::chrono::milliseconds timeout,
                               const core::Deadline& deadline,
                               std::string& prompt,
                               std::string& error) {
  return FindPromptWithin(attempts, timeout, &deadline, prompt, error);
}

bool SessionClient::FindPromptWithin(const int attempts,
                                     const std::chrono::milliseconds timeout,
                                     const core::Deadline* deadline,
                                     std::string& prompt,
                                     std::string& error) {
  if (!RequireShell(error)) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kPromptDetection, error);
    return false;
  }

  // Take whatever the device already sent (banner, MOTD, first prompt).
  if (!Pump(std::chrono::milliseconds(0), error)) {
    return false;
  }
  if (MatchPromptShape(output_buffer_, prompt)) {
    logger_.Debug("prompt detected from initial output", {{"prompt", prompt}});
    return true;
  }

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (deadline != nullptr && deadline->Expired()) {
      logger_.Debug("prompt detection stopped; budget exhausted",
                    {{"attempt", std::to_string(attempt)}});
      break;
    }
    const auto attempt_timeout = deadline != nullptr ? deadline->Clamp(timeout) : timeout;
    logger_.Debug("sending empty line to trigger prompt",
                  {{"attempt", std::to_string(attempt)}, {"of", std::to_string(attempts)}});
    if (!SendCommand("", error)) {
      return false;
    }

    std::string collected;
    std::string detected;
    bool timed_out = false;
    const auto prompt_seen = [&detected](const std::string& buffer) {
      return MatchPromptShape(buffer, detected);
    };
    if (WaitUntil(prompt_seen, attempt_timeout, collected, timed_out, error)) {
      prompt = detected;
      logger_.Debug("prompt detected", {{"prompt", prompt}});
      return true;
    }
    if (!timed_out) {
      return false;
    }
    logger_.Debug("prompt detection attempt timed out", {{"attempt", std::to_string(attempt)}});
  }

  error = FormatDiscoveryError(DiscoveryErrorCode::kPromptDetection,
                               "failed to auto-detect command prompt pattern");
  return false;
}

bool SessionClient::SendCommand(std::string_view text, std::string& error) {
  if (state_ != SessionState::kShellReady && state_ != SessionState::kCommandInFlight) {
    error = std::string("shell not ready (state ") + ToString(state_) + ")";
    return false;
  }

  std::string line(text);
  line.push_back('\n');
  std::string transport_error;
  if (!transport_->Write(line, transport_error)) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kConnection, transport_error);
    return false;
  }
  return true;
}

bool SessionClient::ExecuteCommand(std::string_view command,
                                   std::string_view prompt,
                                   std::chrono::milliseconds timeout,
                                   std::string& output,
                                   std::string& error) {
  output.clear();
  if (!RequireShell(error)) {
    return false;
  }
  if (prompt.empty()) {
    error = "no prompt pattern defined for command: " + std::string(command);
    return false;
  }

  std::string clean_prompt(prompt);
  while (!clean_prompt.empty() && (clean_prompt.back() == '\n' || clean_prompt.back() == '\r')) {
    clean_prompt.pop_back();
  }
  if (clean_prompt.empty()) {
    clean_prompt = std::string(prompt);
  }

  output_buffer_.clear();
  state_ = SessionState::kCommandInFlight;
  logger_.Debug("executing command", {{"host", options_.connect.host}, {"command", command}});
  if (!SendCommand(command, error)) {
    state_ = SessionState::kShellReady;
    return false;
  }

  const auto prompt_seen = [&](const std::string& buffer) {
    return buffer.find(prompt) != std::string::npos ||
           buffer.find(clean_prompt) != std::string::npos || EndsWith(buffer, clean_prompt) ||
           EndsWith(buffer, clean_prompt + " ");
  };
  bool timed_out = false;
  const bool completed = WaitUntil(prompt_seen, timeout, output, timed_out, error);
  if (state_ == SessionState::kCommandInFlight) {
    state_ = SessionState::kShellReady;
  }
  if (completed) {
    return true;
  }
  if (!timed_out) {
    return false;
  }

  if (!output.empty() && LastLineLooksLikePrompt(output)) {
    logger_.Debug("command timed out but output ends like a prompt; accepting",
                  {{"command", command}});
    return true;
  }
  error = FormatDiscoveryError(DiscoveryErrorCode::kCommandTimeout,
                               (output.empty() ? "timeout with no output for command: "
                                               : "timeout waiting for prompt after command: ") +
                                   std::string(command));
  return false;
}

bool SessionClient::WaitFor(std::string_view pattern,
                            std::chrono::milliseconds timeout,
                            std::string& output,
                            std::string& error) {
  output.clear();
  if (!RequireShell(error)) {
    return false;
  }
  bool timed_out = false;
  const auto found = [pattern](const std::string& buffer) {
    return buffer.find(pattern) != std::string::npos;
  };
  if (WaitUntil(found, timeout, output, timed_out, error)) {
    return true;
  }
  if (timed_out) {
    error = FormatDiscoveryError(DiscoveryErrorCode::kCommandTimeout,
                                 "timeout waiting for pattern: " + std::string(pattern));
  }
  return false;
}

bool SessionClient::Expect(const std::vector<std::string>& patterns,
                           std::chrono::milliseconds timeout,
                           ExpectMatch& match,
                           std::string& error) {
  if (!RequireShell(error)) {
    return false;
  }
  if (patterns.empty()) {
    error = "expect requires at least one pattern";
    return false;
  }

  std::string collected;
  bool timed_out = false;
  const auto any_found = [&](const std::string& buffer) {
    for (std::size_t i = 0; i < patterns.size(); ++i) {
      if (buffer.find(patterns[i]) != std::string::npos) {
        match.index = i;
        match.pattern = patterns[i];
        return true;
      }
    }
    return false;
  };
  if (WaitUntil(any_found, timeout, collected, timed_out, error)) {
    match.buffer = std::move(collected);
    return true;
  }
  if (timed_out) {
    std::string joined;
    for (const std::string& pattern : patterns) {
      joined += joined.empty() ? pattern : ", " + pattern;
    }
    error = FormatDiscoveryError(DiscoveryErrorCode::kCommandTimeout,
                                 "timeout waiting for patterns: " + joined);
  }
  return false;
}

void SessionClient::Disconnect() {
  if (!line_buffer_.empty()) {
    if (options_.output_callback) {
      options_.output_callback(line_buffer_);
    }
    line_buffer_.clear();
  }
  if (state_ == SessionState::kDisconnected) {
    return;
  }

  logger_.Debug("disconnecting", {{"host", options_.connect.host}});
  if (transport_ != nullptr) {
    transport_->Close();
  }
  state_ = SessionState::kDisconnected;
}

bool SessionClient::GetConnectionInfo(ConnectionInfo& info, std::string& error) const {
  if (state_ == SessionState::kDisconnected) {
    error = "not connected to SSH server";
    return false;
  }
  info.host = options_.connect.host;
  info.port = options_.connect.port;
  info.connected = true;
  info.negotiated = negotiated_;
  return true;
}

} // namespace topocrawl::ssh
