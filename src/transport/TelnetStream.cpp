#include "device-inspector/transport/TelnetStream.hpp"
#include "device-inspector/errors.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace devinspect {
namespace transport {

namespace {
constexpr uint8_t IAC = 255;
constexpr uint8_t DONT = 254;
constexpr uint8_t DO = 253;
constexpr uint8_t WONT = 252;
constexpr uint8_t WILL = 251;
constexpr uint8_t SB = 250;
constexpr uint8_t SE = 240;

constexpr size_t READ_CHUNK = 4096;

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Non-blocking connect bounded by `timeout`; returns the connected socket.
int connect_with_timeout(const addrinfo *ai, const std::string &host,
                         std::chrono::milliseconds timeout) {
  int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
  if (fd < 0) {
    throw ConnectionFailure("socket() failed for " + host + ": " +
                            std::strerror(errno));
  }

  int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
  if (rc < 0 && errno != EINPROGRESS) {
    int err = errno;
    ::close(fd);
    throw ConnectionFailure("Connection to " + host + " failed: " +
                            std::strerror(err));
  }

  if (rc < 0) {
    pollfd pfd{fd, POLLOUT, 0};
    int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
      ::close(fd);
      throw TimeoutError("Connection to " + host + " timed out");
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (ready < 0 ||
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
        so_error != 0) {
      int err = ready < 0 ? errno : so_error;
      ::close(fd);
      if (err == ETIMEDOUT) {
        throw TimeoutError("Connection to " + host + " timed out");
      }
      throw ConnectionFailure("Connection to " + host + " failed: " +
                              std::strerror(err));
    }
  }

  fcntl(fd, F_SETFL, flags);
  return fd;
}
} // namespace

std::unique_ptr<TelnetStream>
TelnetStream::connect(const std::string &host, int port,
                      std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *result = nullptr;
  std::string service = std::to_string(port);
  int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw ConnectionFailure("Cannot resolve " + host + ": " +
                            gai_strerror(rc));
  }

  std::string last_error = "no address";
  bool timed_out = false;
  for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
    try {
      int fd = connect_with_timeout(ai, host, timeout);
      freeaddrinfo(result);
      return std::make_unique<TelnetStream>(fd);
    } catch (const TimeoutError &ex) {
      timed_out = true;
      last_error = ex.what();
    } catch (const ConnectionFailure &ex) {
      last_error = ex.what();
    }
  }
  freeaddrinfo(result);

  if (timed_out)
    throw TimeoutError(last_error);
  throw ConnectionFailure(last_error);
}

TelnetStream::TelnetStream(int fd) : fd_(fd) {}

TelnetStream::~TelnetStream() { close(); }

void TelnetStream::close() {
  if (fd_ >= 0) {
    shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
}

void TelnetStream::send_all(const std::string &bytes) {
  if (fd_ < 0)
    throw StreamClosedError("Telnet stream is closed");
  size_t sent = 0;
  while (sent < bytes.size()) {
    ssize_t w = send(fd_, bytes.data() + sent, bytes.size() - sent,
                     MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR)
      continue;
    if (w <= 0) {
      throw StreamClosedError(std::string("Telnet send failed: ") +
                              std::strerror(errno));
    }
    sent += static_cast<size_t>(w);
  }
}

void TelnetStream::flush_replies() {
  if (replies_.empty())
    return;
  std::string out;
  out.swap(replies_);
  send_all(out);
}

void TelnetStream::write(const std::string &data) {
  std::string escaped;
  escaped.reserve(data.size());
  for (char c : data) {
    escaped += c;
    if (static_cast<uint8_t>(c) == IAC)
      escaped += static_cast<char>(IAC);
  }
  send_all(escaped);
}

std::string TelnetStream::read_some(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[READ_CHUNK];
  while (true) {
    if (fd_ < 0)
      throw StreamClosedError("Telnet stream is closed");

    pollfd pfd{fd_, POLLIN, 0};
    int ready = poll(&pfd, 1, remaining_ms(deadline));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      throw StreamClosedError(std::string("Telnet poll failed: ") +
                              std::strerror(errno));
    }
    if (ready == 0)
      return std::string();

    ssize_t r = recv(fd_, buf, sizeof(buf), 0);
    if (r < 0 && errno == EINTR)
      continue;
    if (r == 0)
      throw StreamClosedError("Connection closed by peer");
    if (r < 0) {
      throw StreamClosedError(std::string("Telnet recv failed: ") +
                              std::strerror(errno));
    }

    std::string data = filter(std::string(buf, static_cast<size_t>(r)));
    flush_replies();
    if (!data.empty())
      return data;
    // Only negotiation bytes arrived; keep waiting within the deadline
    if (remaining_ms(deadline) == 0)
      return std::string();
  }
}

std::string TelnetStream::filter(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (char ch : raw) {
    uint8_t c = static_cast<uint8_t>(ch);
    switch (state_) {
    case IacState::DATA:
      if (c == IAC) {
        state_ = IacState::IAC;
      } else if (c != 0) {
        out += ch;
      }
      break;
    case IacState::IAC:
      if (c == IAC) {
        out += ch; // escaped 0xFF
        state_ = IacState::DATA;
      } else if (c == DO || c == DONT || c == WILL || c == WONT) {
        verb_ = c;
        state_ = IacState::OPTION;
      } else if (c == SB) {
        state_ = IacState::SUB;
      } else {
        state_ = IacState::DATA; // two-byte command, ignored
      }
      break;
    case IacState::OPTION:
      replies_ += static_cast<char>(IAC);
      replies_ +=
          static_cast<char>((verb_ == DO || verb_ == DONT) ? WONT : DONT);
      replies_ += ch;
      state_ = IacState::DATA;
      break;
    case IacState::SUB:
      if (c == IAC)
        state_ = IacState::SUB_IAC;
      break;
    case IacState::SUB_IAC:
      state_ = (c == SE) ? IacState::DATA : IacState::SUB;
      break;
    }
  }
  return out;
}

} // namespace transport
} // namespace devinspect
