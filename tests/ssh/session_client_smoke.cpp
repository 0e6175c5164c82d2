#include "../common/assertions.hpp"
#include "ssh/session_client.hpp"
#include "ssh/testing/scripted_transport.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

using topocrawl::core::logging::LogLevel;
using topocrawl::core::logging::Logger;
using topocrawl::ssh::ConnectionInfo;
using topocrawl::ssh::ExpectMatch;
using topocrawl::ssh::SessionClient;
using topocrawl::ssh::SessionOptions;
using topocrawl::ssh::SessionState;
using topocrawl::ssh::testing::ScriptedDevice;
using topocrawl::ssh::testing::ScriptedShellNetwork;
using topocrawl::tests::common::AssertContains;
using topocrawl::tests::common::AssertNotContains;
using topocrawl::tests::common::Fail;

SessionOptions MakeOptions(const std::string& host, const std::string& password) {
  SessionOptions options;
  options.connect.host = host;
  options.connect.username = "admin";
  options.connect.password = password;
  options.connect.timeout = 200ms;
  options.poll_interval = 5ms;
  return options;
}

void ExpectRejectedLogin(ScriptedShellNetwork& network, Logger& logger) {
  SessionClient client(network.MakeFactory()(), MakeOptions("10.0.0.1", "wrong"), logger);
  std::string error;
  if (client.Connect(error)) {
    Fail("login with a wrong password should fail");
  }
  AssertContains(error, "CONNECTION_ERROR");
  AssertContains(error, "authentication failed for admin@10.0.0.1");
  if (client.state() != SessionState::kDisconnected) {
    Fail("rejected login must leave the session disconnected");
  }

  SessionClient unknown(network.MakeFactory()(), MakeOptions("10.9.9.9", "secret"), logger);
  if (unknown.Connect(error)) {
    Fail("connect to an unknown host should fail");
  }
  AssertContains(error, "CONNECTION_ERROR: connect to 10.9.9.9 failed");
}

void ExpectInteractiveSession(ScriptedShellNetwork& network, Logger& logger) {
  std::vector<std::string> lines;
  SessionOptions options = MakeOptions("10.0.0.1", "secret");
  options.output_callback = [&lines](std::string_view line) { lines.emplace_back(line); };
  SessionClient client(network.MakeFactory()(), std::move(options), logger);

  std::string error;
  std::string output;
  if (client.ExecuteCommand("show clock", "r1#", 200ms, output, error)) {
    Fail("command before login should fail");
  }
  AssertContains(error, "shell not ready");

  if (!client.Connect(error)) {
    Fail("connect failed: " + error);
  }
  ConnectionInfo info;
  if (!client.GetConnectionInfo(info, error)) {
    Fail("connection info unavailable after connect: " + error);
  }
  if (info.host != "10.0.0.1" || info.port != 22 || !info.connected) {
    Fail("unexpected connection info");
  }
  if (info.negotiated.kex != topocrawl::ssh::DefaultAlgorithmPreferences().kex.front()) {
    Fail("negotiated kex should be the first offered algorithm");
  }

  if (!client.CreateShell(error)) {
    Fail("shell failed: " + error);
  }
  std::string prompt;
  if (!client.FindPrompt(3, 200ms, prompt, error)) {
    Fail("prompt detection failed: " + error);
  }
  if (prompt != "r1#") {
    Fail("unexpected prompt: " + prompt);
  }

  std::string published;
  SessionClient::Subscription subscription =
      client.Subscribe([&published](std::string_view chunk) { published.append(chunk); });

  if (!client.ExecuteCommand("show clock", prompt, 200ms, output, error)) {
    Fail("show clock failed: " + error);
  }
  AssertContains(output, "12:00:00.000 UTC");
  AssertContains(output, "r1#");
  AssertContains(published, "12:00:00.000 UTC");

  subscription.Reset();
  if (!client.ExecuteCommand("show bogus", prompt, 200ms, output, error)) {
    Fail("unknown command should still complete at the prompt: " + error);
  }
  AssertContains(output, "% Invalid input detected");
  AssertNotContains(published, "Invalid input");

  if (!client.SendCommand("show clock", error)) {
    Fail("send failed: " + error);
  }
  if (!client.WaitFor("UTC", 200ms, output, error)) {
    Fail("wait for UTC failed: " + error);
  }
  ExpectMatch match;
  if (!client.Expect({"Password:", "r1#"}, 200ms, match, error)) {
    Fail("expect failed: " + error);
  }
  if (match.index != 1U || match.pattern != "r1#") {
    Fail("expect should report the prompt pattern");
  }
  if (client.Expect({"never shown"}, 20ms, match, error)) {
    Fail("expect on absent text should time out");
  }
  AssertContains(error, "COMMAND_TIMEOUT_ERROR");

  client.Disconnect();
  client.Disconnect();
  if (client.state() != SessionState::kDisconnected) {
    Fail("session should be disconnected");
  }
  if (client.GetConnectionInfo(info, error)) {
    Fail("connection info should be unavailable after disconnect");
  }
  AssertContains(error, "not connected to SSH server");

  bool saw_echo = false;
  bool saw_body = false;
  for (const std::string& line : lines) {
    saw_echo = saw_echo || line == "r1#show clock";
    saw_body = saw_body || line.find("12:00:00.000 UTC") != std::string::npos;
  }
  if (!saw_echo || !saw_body) {
    Fail("output callback should receive whole lines without carriage returns");
  }
  if (lines.empty() || lines.back() != "r1#") {
    Fail("trailing partial line should be flushed on disconnect");
  }

  const std::vector<std::string> sent = network.CommandsFor("10.0.0.1");
  if (sent.size() != 3U || sent[0] != "show clock" || sent[1] != "show bogus") {
    Fail("unexpected command log for 10.0.0.1");
  }
}

void ExpectSilentDeviceFailures(ScriptedShellNetwork& network, Logger& logger) {
  SessionClient client(network.MakeFactory()(), MakeOptions("10.0.0.2", "secret"), logger);
  std::string error;
  if (!client.Connect(error) || !client.CreateShell(error)) {
    Fail("silent device should still accept login: " + error);
  }

  std::string prompt;
  if (client.FindPrompt(2, 20ms, prompt, error)) {
    Fail("prompt detection on a silent device should fail");
  }
  AssertContains(error, "PROMPT_DETECTION_ERROR");

  std::string output;
  if (client.ExecuteCommand("show version", "sw#", 20ms, output, error)) {
    Fail("command on a silent device should time out");
  }
  AssertContains(error, "COMMAND_TIMEOUT_ERROR: timeout with no output for command: show version");
  if (client.state() != SessionState::kShellReady) {
    Fail("timed-out command should return the session to SHELL_READY");
  }

  // Empty-line nudges are sent once per attempt.
  const std::vector<std::string> sent = network.CommandsFor("10.0.0.2");
  if (sent.size() != 3U || !sent[0].empty() || !sent[1].empty() || sent[2] != "show version") {
    Fail("unexpected command log for silent device");
  }
}

void ExpectPromptShapes() {
  std::string prompt;
  if (!topocrawl::ssh::MatchPromptShape("banner\r\ncore-sw1#", prompt) || prompt != "core-sw1#") {
    Fail("privileged prompt not matched");
  }
  if (!topocrawl::ssh::MatchPromptShape("edge>", prompt) || prompt != "edge>") {
    Fail("user-mode prompt not matched");
  }
  if (!topocrawl::ssh::MatchPromptShape("admin@fw1$ ", prompt)) {
    Fail("shell prompt not matched");
  }
  AssertContains(prompt, "admin@fw1$");
  if (topocrawl::ssh::MatchPromptShape("", prompt)) {
    Fail("empty output has no prompt");
  }
}

} // namespace

int main() {
  ScriptedShellNetwork network;

  ScriptedDevice router;
  router.banner = "Authorized access only";
  router.prompt = "r1#";
  router.username = "admin";
  router.password = "secret";
  router.responses["show clock"] = "12:00:00.000 UTC Thu Oct 1 2026";
  network.AddDevice("10.0.0.1", router);

  ScriptedDevice silent;
  silent.silent = true;
  network.AddDevice("10.0.0.2", silent);

  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);

  ExpectRejectedLogin(network, logger);
  ExpectInteractiveSession(network, logger);
  ExpectSilentDeviceFailures(network, logger);
  ExpectPromptShapes();

  AssertContains(log.str(), "ssh connected");
  std::cout << "session_client_smoke: ok\n";
  return 0;
}
