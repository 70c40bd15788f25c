#include "device-inspector/transport/SshShellStream.hpp"
#include "device-inspector/errors.hpp"

#include <algorithm>
#include <cctype>

namespace devinspect {
namespace transport {

namespace {
constexpr size_t READ_CHUNK = 4096;
// Wide pty so long lines are not wrapped by the device
constexpr int PTY_COLUMNS = 511;
constexpr int PTY_ROWS = 1000;

bool mentions_timeout(const std::string &message) {
  std::string lower = message;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower.find("timeout") != std::string::npos ||
         lower.find("timed out") != std::string::npos;
}

// Password authentication with a keyboard-interactive fallback
int authenticate(ssh_session session, const std::string &password) {
  int rc = ssh_userauth_password(session, nullptr, password.c_str());
  if (rc != SSH_AUTH_DENIED)
    return rc;

  rc = ssh_userauth_kbdint(session, nullptr, nullptr);
  while (rc == SSH_AUTH_INFO) {
    int prompts = ssh_userauth_kbdint_getnprompts(session);
    for (int i = 0; i < prompts; ++i) {
      ssh_userauth_kbdint_setanswer(session, static_cast<unsigned int>(i),
                                    password.c_str());
    }
    rc = ssh_userauth_kbdint(session, nullptr, nullptr);
  }
  return rc;
}
} // namespace

std::unique_ptr<SshShellStream>
SshShellStream::open(const DeviceDescriptor &descriptor) {
  ssh_session session = ssh_new();
  if (session == nullptr) {
    throw ConnectionFailure("Failed to allocate SSH session");
  }

  unsigned int port = static_cast<unsigned int>(descriptor.port);
  long timeout = descriptor.timeout_seconds;
  ssh_options_set(session, SSH_OPTIONS_HOST, descriptor.host.c_str());
  ssh_options_set(session, SSH_OPTIONS_PORT, &port);
  ssh_options_set(session, SSH_OPTIONS_TIMEOUT, &timeout);
  if (descriptor.username) {
    ssh_options_set(session, SSH_OPTIONS_USER, descriptor.username->c_str());
  }

  if (ssh_connect(session) != SSH_OK) {
    std::string message = ssh_get_error(session);
    ssh_free(session);
    if (mentions_timeout(message)) {
      throw TimeoutError("SSH connection to " + descriptor.host +
                         " timed out: " + message);
    }
    throw ConnectionFailure("SSH connection to " + descriptor.host +
                            " failed: " + message);
  }

  // Host keys are not verified: inventory devices are reached by address
  // and rotate keys on reimage.
  int auth = authenticate(session, descriptor.password);
  if (auth != SSH_AUTH_SUCCESS) {
    std::string message = ssh_get_error(session);
    ssh_disconnect(session);
    ssh_free(session);
    if (auth == SSH_AUTH_ERROR) {
      throw ConnectionFailure("SSH authentication error on " +
                              descriptor.host + ": " + message);
    }
    throw AuthenticationError("SSH authentication rejected by " +
                              descriptor.host);
  }

  ssh_channel channel = ssh_channel_new(session);
  if (channel == nullptr || ssh_channel_open_session(channel) != SSH_OK ||
      ssh_channel_request_pty_size(channel, "vt100", PTY_COLUMNS,
                                   PTY_ROWS) != SSH_OK ||
      ssh_channel_request_shell(channel) != SSH_OK) {
    std::string message = ssh_get_error(session);
    if (channel != nullptr)
      ssh_channel_free(channel);
    ssh_disconnect(session);
    ssh_free(session);
    throw ConnectionFailure("Failed to open SSH shell on " +
                            descriptor.host + ": " + message);
  }

  return std::unique_ptr<SshShellStream>(new SshShellStream(session, channel));
}

SshShellStream::SshShellStream(ssh_session session, ssh_channel channel)
    : session_(session), channel_(channel) {}

SshShellStream::~SshShellStream() { close(); }

void SshShellStream::close() {
  if (channel_ != nullptr) {
    if (ssh_channel_is_open(channel_)) {
      ssh_channel_send_eof(channel_);
      ssh_channel_close(channel_);
    }
    ssh_channel_free(channel_);
    channel_ = nullptr;
  }
  if (session_ != nullptr) {
    ssh_disconnect(session_);
    ssh_free(session_);
    session_ = nullptr;
  }
}

void SshShellStream::write(const std::string &data) {
  if (channel_ == nullptr)
    throw StreamClosedError("SSH channel is closed");
  size_t sent = 0;
  while (sent < data.size()) {
    int w = ssh_channel_write(channel_, data.data() + sent,
                              static_cast<uint32_t>(data.size() - sent));
    if (w == SSH_ERROR) {
      throw StreamClosedError(std::string("SSH write failed: ") +
                              ssh_get_error(session_));
    }
    sent += static_cast<size_t>(w);
  }
}

std::string SshShellStream::read_some(std::chrono::milliseconds timeout) {
  if (channel_ == nullptr)
    throw StreamClosedError("SSH channel is closed");
  if (ssh_channel_is_eof(channel_))
    throw StreamClosedError("SSH channel closed by peer");

  char buf[READ_CHUNK];
  int r = ssh_channel_read_timeout(channel_, buf, sizeof(buf), 0,
                                   static_cast<int>(timeout.count()));
  if (r == SSH_ERROR) {
    throw StreamClosedError(std::string("SSH read failed: ") +
                            ssh_get_error(session_));
  }
  if (r == 0) {
    if (ssh_channel_is_eof(channel_))
      throw StreamClosedError("SSH channel closed by peer");
    return std::string();
  }
  return std::string(buf, static_cast<size_t>(r));
}

} // namespace transport
} // namespace devinspect
