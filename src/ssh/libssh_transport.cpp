#include "ssh/libssh_transport.hpp"

#include <array>

namespace topocrawl::ssh {

namespace {

const char* OrEmpty(const char* text) {
  return text == nullptr ? "" : text;
}

} // namespace

LibsshTransport::~LibsshTransport() {
  Close();
}

std::string LibsshTransport::LastError() const {
  if (session_ == nullptr) {
    return "no ssh session";
  }
  return OrEmpty(ssh_get_error(session_));
}

bool LibsshTransport::ApplyOptions(const ConnectOptions& options, std::string& error) {
  const unsigned int port = options.port;
  const long timeout_sec = static_cast<long>(options.timeout.count() / 1000);
  const long timeout_usec = static_cast<long>((options.timeout.count() % 1000) * 1000);
  const int no_host_key_check = 0;
  const bool process_config = false;
  const std::string kex = JoinAlgorithms(options.algorithms.kex);
  const std::string ciphers = JoinAlgorithms(options.algorithms.ciphers);
  const std::string host_keys = JoinAlgorithms(options.algorithms.host_keys);
  const std::string macs = JoinAlgorithms(options.algorithms.macs);
  const std::string compression = JoinAlgorithms(options.algorithms.compression);

  struct OptionStep {
    ssh_options_e option;
    const void* value;
    const char* label;
  };
  const std::array<OptionStep, 15> steps = {{
      {SSH_OPTIONS_PROCESS_CONFIG, &process_config, "process_config"},
      {SSH_OPTIONS_HOST, options.host.c_str(), "host"},
      {SSH_OPTIONS_PORT, &port, "port"},
      {SSH_OPTIONS_USER, options.username.c_str(), "user"},
      {SSH_OPTIONS_TIMEOUT, &timeout_sec, "timeout"},
      {SSH_OPTIONS_TIMEOUT_USEC, &timeout_usec, "timeout_usec"},
      {SSH_OPTIONS_STRICTHOSTKEYCHECK, &no_host_key_check, "stricthostkeycheck"},
      {SSH_OPTIONS_KEY_EXCHANGE, kex.c_str(), "kex"},
      {SSH_OPTIONS_HOSTKEYS, host_keys.c_str(), "hostkeys"},
      {SSH_OPTIONS_CIPHERS_C_S, ciphers.c_str(), "ciphers_c_s"},
      {SSH_OPTIONS_CIPHERS_S_C, ciphers.c_str(), "ciphers_s_c"},
      {SSH_OPTIONS_HMAC_C_S, macs.c_str(), "hmac_c_s"},
      {SSH_OPTIONS_HMAC_S_C, macs.c_str(), "hmac_s_c"},
      {SSH_OPTIONS_COMPRESSION_C_S, compression.c_str(), "compression_c_s"},
      {SSH_OPTIONS_COMPRESSION_S_C, compression.c_str(), "compression_s_c"},
  }};

  for (const OptionStep& step : steps) {
    if (ssh_options_set(session_, step.option, step.value) != SSH_OK) {
      error = std::string("failed to set ssh option ") + step.label + ": " + LastError();
      return false;
    }
  }
  return true;
}

bool LibsshTransport::Connect(const ConnectOptions& options,
                              NegotiatedAlgorithms& negotiated,
                              std::string& error) {
  Close();

  session_ = ssh_new();
  if (session_ == nullptr) {
    error = "failed to allocate ssh session";
    return false;
  }
  if (!ApplyOptions(options, error)) {
    Close();
    return false;
  }

  if (ssh_connect(session_) != SSH_OK) {
    error = "connect to " + options.host + ":" + std::to_string(options.port) +
            " failed: " + LastError();
    Close();
    return false;
  }
  CaptureNegotiated(negotiated);

  if (!Authenticate(options, error)) {
    Close();
    return false;
  }
  return true;
}

bool LibsshTransport::AuthenticatePublicKey(const ConnectOptions& options, std::string& error) {
  ssh_key key = nullptr;
  const char* passphrase =
      options.key_passphrase.has_value() ? options.key_passphrase->c_str() : nullptr;
  if (ssh_pki_import_privkey_file(options.key_file->c_str(), passphrase, nullptr, nullptr, &key) !=
      SSH_OK) {
    error = "unable to load private key " + options.key_file.value();
    return false;
  }
  const int rc = ssh_userauth_publickey(session_, nullptr, key);
  ssh_key_free(key);
  return rc == SSH_AUTH_SUCCESS;
}

// The server may send several rounds of prompts; each prompt is answered with
// the password.
bool LibsshTransport::AuthenticateKeyboardInteractive(const ConnectOptions& options) {
  int rc = ssh_userauth_kbdint(session_, nullptr, nullptr);
  while (rc == SSH_AUTH_INFO) {
    const int prompts = ssh_userauth_kbdint_getnprompts(session_);
    for (int i = 0; i < prompts; ++i) {
      if (ssh_userauth_kbdint_setanswer(session_, static_cast<unsigned int>(i),
                                        options.password.c_str()) < 0) {
        return false;
      }
    }
    rc = ssh_userauth_kbdint(session_, nullptr, nullptr);
  }
  return rc == SSH_AUTH_SUCCESS;
}

bool LibsshTransport::Authenticate(const ConnectOptions& options, std::string& error) {
  if (ssh_userauth_none(session_, nullptr) == SSH_AUTH_SUCCESS) {
    return true;
  }
  const int methods = ssh_userauth_list(session_, nullptr);

  std::string key_error;
  if (options.key_file.has_value() && (methods & SSH_AUTH_METHOD_PUBLICKEY) != 0 &&
      AuthenticatePublicKey(options, key_error)) {
    return true;
  }
  if ((methods & SSH_AUTH_METHOD_PASSWORD) != 0 &&
      ssh_userauth_password(session_, nullptr, options.password.c_str()) == SSH_AUTH_SUCCESS) {
    return true;
  }
  if ((methods & SSH_AUTH_METHOD_INTERACTIVE) != 0 && AuthenticateKeyboardInteractive(options)) {
    return true;
  }

  error = "authentication failed for " + options.username + "@" + options.host;
  if (!key_error.empty()) {
    error += " (" + key_error + ")";
  }
  return false;
}

void LibsshTransport::CaptureNegotiated(NegotiatedAlgorithms& negotiated) const {
  negotiated.kex = OrEmpty(ssh_get_kex_algo(session_));
  negotiated.cipher_client_to_server = OrEmpty(ssh_get_cipher_out(session_));
  negotiated.cipher_server_to_client = OrEmpty(ssh_get_cipher_in(session_));
  negotiated.mac_client_to_server = OrEmpty(ssh_get_hmac_out(session_));
  negotiated.mac_server_to_client = OrEmpty(ssh_get_hmac_in(session_));

  ssh_key server_key = nullptr;
  if (ssh_get_server_publickey(session_, &server_key) == SSH_OK) {
    negotiated.host_key = OrEmpty(ssh_key_type_to_char(ssh_key_type(server_key)));
    ssh_key_free(server_key);
  }
}

bool LibsshTransport::OpenShell(std::string& error) {
  if (session_ == nullptr) {
    error = "not connected";
    return false;
  }
  channel_ = ssh_channel_new(session_);
  if (channel_ == nullptr) {
    error = "failed to allocate channel: " + LastError();
    return false;
  }
  if (ssh_channel_open_session(channel_) != SSH_OK) {
    error = "failed to open session channel: " + LastError();
    ssh_channel_free(channel_);
    channel_ = nullptr;
    return false;
  }
  if (ssh_channel_request_pty_size(channel_, "vt100", 80, 24) != SSH_OK ||
      ssh_channel_request_shell(channel_) != SSH_OK) {
    error = "failed to start interactive shell: " + LastError();
    (void)ssh_channel_close(channel_);
    ssh_channel_free(channel_);
    channel_ = nullptr;
    return false;
  }
  return true;
}

bool LibsshTransport::Write(std::string_view data, std::string& error) {
  if (channel_ == nullptr) {
    error = "shell channel is not open";
    return false;
  }
  std::size_t offset = 0;
  while (offset < data.size()) {
    const int written = ssh_channel_write(channel_, data.data() + offset,
                                          static_cast<std::uint32_t>(data.size() - offset));
    if (written == SSH_ERROR) {
      error = "channel write failed: " + LastError();
      return false;
    }
    offset += static_cast<std::size_t>(written);
  }
  return true;
}

bool LibsshTransport::Read(std::chrono::milliseconds timeout, std::string& chunk,
                           std::string& error) {
  chunk.clear();
  if (channel_ == nullptr) {
    error = "shell channel is not open";
    return false;
  }

  std::array<char, 4096> buffer{};
  const auto capacity = static_cast<std::uint32_t>(buffer.size());
  int rc = 0;
  if (timeout.count() <= 0) {
    rc = ssh_channel_read_nonblocking(channel_, buffer.data(), capacity, 0);
  } else {
    rc = ssh_channel_read_timeout(channel_, buffer.data(), capacity, 0,
                                  static_cast<int>(timeout.count()));
  }

  if (rc == SSH_ERROR) {
    error = "channel read failed: " + LastError();
    return false;
  }
  if (rc > 0) {
    chunk.assign(buffer.data(), static_cast<std::size_t>(rc));
    return true;
  }
  if (ssh_channel_is_eof(channel_) != 0) {
    error = "channel closed by remote";
    return false;
  }
  return true;
}

void LibsshTransport::Close() {
  if (channel_ != nullptr) {
    if (ssh_channel_is_open(channel_) != 0) {
      (void)ssh_channel_close(channel_);
    }
    ssh_channel_free(channel_);
    channel_ = nullptr;
  }
  if (session_ != nullptr) {
    if (ssh_is_connected(session_) != 0) {
      ssh_disconnect(session_);
    }
    ssh_free(session_);
    session_ = nullptr;
  }
}

TransportFactory MakeLibsshTransportFactory() {
  return []() -> std::unique_ptr<IShellTransport> { return std::make_unique<LibsshTransport>(); };
}

} // namespace topocrawl::ssh
