#include "bench-io/transport/ScpiSocketTransport.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace benchio {

namespace {

inline void close_socket(int fd) { ::close(fd); }

// Non-blocking connect bounded by timeout_ms; returns 0 or an errno value
int connect_with_timeout(int fd, const sockaddr *addr, socklen_t len,
                         int timeout_ms) {
  int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  int result = 0;
  if (::connect(fd, addr, len) < 0) {
    if (errno != EINPROGRESS) {
      result = errno;
    } else {
      pollfd pfd{fd, POLLOUT, 0};
      int pr = ::poll(&pfd, 1, timeout_ms);
      if (pr == 0) {
        result = ETIMEDOUT;
      } else if (pr < 0) {
        result = errno;
      } else {
        socklen_t optlen = sizeof(result);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &result, &optlen);
      }
    }
  }

  fcntl(fd, F_SETFL, flags);
  return result;
}

} // namespace

ScpiSocketTransport::ScpiSocketTransport(ScpiSocketDescriptor descriptor)
    : descriptor_(std::move(descriptor)) {}

ScpiSocketTransport::~ScpiSocketTransport() { close(); }

std::string ScpiSocketTransport::describe() const {
  return benchio::describe(TransportDescriptor{descriptor_});
}

void ScpiSocketTransport::open() {
  if (fd_ >= 0)
    return;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo *res = nullptr;
  std::string port = std::to_string(descriptor_.port);
  int gai = getaddrinfo(descriptor_.host.c_str(), port.c_str(), &hints, &res);
  if (gai != 0) {
    throw TransportError(ErrorKind::TransportOpenError,
                         fmt::format("Cannot resolve {}: {}", descriptor_.host,
                                     gai_strerror(gai)));
  }

  int last_error = 0;
  for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_error = errno;
      continue;
    }
    int err = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen,
                                   CONNECT_TIMEOUT_MS);
    if (err == 0) {
      fd_ = fd;
      break;
    }
    last_error = err;
    close_socket(fd);
  }
  freeaddrinfo(res);

  if (fd_ < 0) {
    throw TransportError(ErrorKind::TransportOpenError,
                         fmt::format("Failed to connect to {}: {}", describe(),
                                     strerror(last_error)));
  }

  // SCPI lines are small; send them immediately
  int one = 1;
  setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  rx_.clear();
  LOG_DEBUG("SCPI", describe(), "Connected (fd={})", fd_);
}

void ScpiSocketTransport::close() noexcept {
  if (fd_ < 0)
    return;
  close_socket(fd_);
  fd_ = -1;
  rx_.clear();
  LOG_DEBUG("SCPI", describe(), "Disconnected");
}

void ScpiSocketTransport::write(const Frame &frame) {
  if (fd_ < 0) {
    throw TransportError(ErrorKind::TransportIoError,
                         describe() + " is not open");
  }

  LOG_TRACE("SCPI", describe(), "TX: {}", to_hex(frame.bytes));
  size_t sent = 0;
  while (sent < frame.size()) {
    ssize_t n = ::send(fd_, frame.bytes.data() + sent, frame.size() - sent,
                       MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw TransportError(ErrorKind::TransportIoError,
                           fmt::format("send to {} failed: {}", describe(),
                                       strerror(errno)));
    }
    sent += static_cast<size_t>(n);
  }
}

Frame ScpiSocketTransport::take_line(size_t eol) {
  std::vector<uint8_t> line(rx_.begin(), rx_.begin() + eol + 1);
  rx_.erase(rx_.begin(), rx_.begin() + eol + 1);
  LOG_TRACE("SCPI", describe(), "RX: {}", to_hex(line));
  return Frame::inbound(std::move(line), TransferKind::Stream);
}

Frame ScpiSocketTransport::read(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    throw TransportError(ErrorKind::TransportIoError,
                         describe() + " is not open");
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  uint8_t buf[RECV_CHUNK];

  while (true) {
    auto eol = std::find(rx_.begin(), rx_.end(), '\n');
    if (eol != rx_.end())
      return take_line(static_cast<size_t>(eol - rx_.begin()));

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw TransportError(ErrorKind::IoTimeout,
                           fmt::format("No complete line from {} within {} ms",
                                       describe(), timeout.count()));
    }

    pollfd pfd{fd_, POLLIN, 0};
    int wait_ms = static_cast<int>(std::min<long long>(
        remaining.count(), std::numeric_limits<int>::max()));
    int pr = ::poll(&pfd, 1, wait_ms);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      throw TransportError(ErrorKind::TransportIoError,
                           fmt::format("poll on {} failed: {}", describe(),
                                       strerror(errno)));
    }
    if (pr == 0)
      continue;

    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      throw TransportError(ErrorKind::TransportIoError,
                           fmt::format("recv from {} failed: {}", describe(),
                                       strerror(errno)));
    }
    if (n == 0) {
      throw TransportError(ErrorKind::TransportIoError,
                           fmt::format("{} closed the connection",
                                       describe()));
    }
    rx_.insert(rx_.end(), buf, buf + n);
  }
}

} // namespace benchio
