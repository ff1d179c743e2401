#include "bench-io/transport/HidTransport.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <poll.h>
#include <unistd.h>

namespace benchio {

HidTransport::HidTransport(HidDescriptor descriptor)
    : descriptor_(std::move(descriptor)) {}

HidTransport::~HidTransport() { close(); }

std::string HidTransport::describe() const {
  return benchio::describe(TransportDescriptor{descriptor_});
}

void HidTransport::open() {
  if (fd_ >= 0)
    return;

  fd_ = ::open(descriptor_.path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
  if (fd_ < 0) {
    throw TransportError(ErrorKind::TransportOpenError,
                         fmt::format("Failed to open {}: {}", descriptor_.path,
                                     strerror(errno)));
  }
  LOG_DEBUG("HID", descriptor_.path, "Opened (fd={})", fd_);
}

void HidTransport::close() noexcept {
  if (fd_ < 0)
    return;
  ::close(fd_);
  fd_ = -1;
  LOG_DEBUG("HID", descriptor_.path, "Closed");
}

void HidTransport::write(const Frame &frame) {
  if (fd_ < 0) {
    throw TransportError(ErrorKind::TransportIoError,
                         descriptor_.path + " is not open");
  }

  auto send_report = [&](uint8_t report_id, const uint8_t *data, size_t len) {
    std::vector<uint8_t> report;
    report.reserve(len + 1);
    report.push_back(report_id);
    report.insert(report.end(), data, data + len);

    LOG_TRACE("HID", descriptor_.path, "TX report {}: {}", report_id,
              to_hex(report));
    ssize_t n = ::write(fd_, report.data(), report.size());
    if (n < 0) {
      throw TransportError(ErrorKind::TransportIoError,
                           fmt::format("Write to {} failed: {}",
                                       descriptor_.path, strerror(errno)));
    }
    if (static_cast<size_t>(n) != report.size()) {
      throw TransportError(
          ErrorKind::TransportIoError,
          fmt::format("Short write to {}: {} of {} bytes", descriptor_.path,
                      n, report.size()));
    }
  };

  if (descriptor_.report_id) {
    send_report(*descriptor_.report_id,
                frame.bytes.data(), frame.bytes.size());
    return;
  }

  size_t offset = 0;
  do {
    size_t chunk = std::min<size_t>(MAX_DATA_REPORT, frame.size() - offset);
    send_report(static_cast<uint8_t>(chunk), frame.bytes.data() + offset,
                chunk);
    offset += chunk;
  } while (offset < frame.size());
}

bool HidTransport::accepts(uint8_t report_id, size_t payload_size) const {
  if (descriptor_.report_id)
    return report_id == *descriptor_.report_id;
  return report_id >= 1 && report_id <= MAX_DATA_REPORT &&
         report_id <= payload_size;
}

Frame HidTransport::read(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    throw TransportError(ErrorKind::TransportIoError,
                         descriptor_.path + " is not open");
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  uint8_t buf[REPORT_SIZE];

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw TransportError(ErrorKind::IoTimeout,
                           fmt::format("No report from {} within {} ms",
                                       descriptor_.path, timeout.count()));
    }

    pollfd pfd{fd_, POLLIN, 0};
    int wait_ms = static_cast<int>(std::min<long long>(
        remaining.count(), std::numeric_limits<int>::max()));
    int pr = ::poll(&pfd, 1, wait_ms);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      throw TransportError(ErrorKind::TransportIoError,
                           fmt::format("poll on {} failed: {}",
                                       descriptor_.path, strerror(errno)));
    }
    if (pr == 0)
      continue;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      throw TransportError(ErrorKind::TransportIoError,
                           fmt::format("{} disconnected", descriptor_.path));
    }

    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR)
        continue;
      throw TransportError(ErrorKind::TransportIoError,
                           fmt::format("Read from {} failed: {}",
                                       descriptor_.path, strerror(errno)));
    }
    if (n == 0)
      continue;

    uint8_t report_id = buf[0];
    size_t payload_size = static_cast<size_t>(n) - 1;
    if (!accepts(report_id, payload_size)) {
      LOG_TRACE("HID", descriptor_.path, "Discarding report {} ({} bytes)",
                report_id, n);
      continue;
    }

    size_t len = descriptor_.report_id ? payload_size : report_id;
    std::vector<uint8_t> payload(buf + 1, buf + 1 + len);
    LOG_TRACE("HID", descriptor_.path, "RX report {}: {}", report_id,
              to_hex(payload));
    return Frame::inbound(std::move(payload), TransferKind::HidReport,
                          report_id);
  }
}

} // namespace benchio
