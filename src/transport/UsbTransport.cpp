#include "bench-io/transport/UsbTransport.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <linux/usbdevice_fs.h>
#include <optional>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace benchio {

namespace {

std::string read_attribute(const fs::path &dir, const char *name) {
  std::ifstream in(dir / name);
  std::string value;
  std::getline(in, value);
  return value;
}

// sysfs numbers; nullopt for empty or malformed text
std::optional<unsigned long> parse_attribute(const std::string &text,
                                             int base) {
  if (text.empty())
    return std::nullopt;
  char *end = nullptr;
  unsigned long v = std::strtoul(text.c_str(), &end, base);
  if (end == text.c_str() ||
      (*end != '\0' && !std::isspace(static_cast<unsigned char>(*end))))
    return std::nullopt;
  return v;
}

} // namespace

UsbTransport::UsbTransport(UsbDescriptor descriptor)
    : descriptor_(descriptor) {}

UsbTransport::~UsbTransport() { close(); }

std::string UsbTransport::describe() const {
  return benchio::describe(TransportDescriptor{descriptor_});
}

void UsbTransport::fail(ErrorKind kind, const std::string &what) const {
  throw TransportError(kind, fmt::format("{} on {}: {}", what, describe(),
                                         strerror(errno)));
}

std::string UsbTransport::find_device_node(uint16_t vendor_id,
                                           uint16_t product_id,
                                           const std::string &sysfs_root) {
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(sysfs_root, ec)) {
    const fs::path &dir = entry.path();
    auto vid = parse_attribute(read_attribute(dir, "idVendor"), 16);
    auto pid = parse_attribute(read_attribute(dir, "idProduct"), 16);
    if (!vid || !pid || *vid != vendor_id || *pid != product_id)
      continue;

    auto bus = parse_attribute(read_attribute(dir, "busnum"), 10);
    auto dev = parse_attribute(read_attribute(dir, "devnum"), 10);
    if (!bus || !dev)
      continue;
    return fmt::format("/dev/bus/usb/{:03}/{:03}", *bus, *dev);
  }
  return "";
}

UsbControlRequest UsbTransport::control_request(const Frame &frame) {
  if (frame.empty() && !frame.channel) {
    throw TransportError(ErrorKind::TransportIoError,
                         "Control frame without request code");
  }
  UsbControlRequest setup;
  setup.request = frame.channel ? *frame.channel : frame.bytes[0];
  if (!frame.empty())
    setup.data.assign(frame.bytes.begin() + 1, frame.bytes.end());
  return setup;
}

void UsbTransport::open() {
  if (fd_ >= 0)
    return;

  node_ = find_device_node(descriptor_.vendor_id, descriptor_.product_id);
  if (node_.empty()) {
    throw TransportError(ErrorKind::TransportOpenError,
                         fmt::format("No USB device matches {}", describe()));
  }

  fd_ = ::open(node_.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0) {
    fail(ErrorKind::TransportOpenError, "Failed to open " + node_);
  }

  unsigned int iface = descriptor_.interface;
  int rc = ioctl(fd_, USBDEVFS_CLAIMINTERFACE, &iface);
  if (rc < 0 && errno == EBUSY) {
    usbdevfs_ioctl detach{};
    detach.ifno = static_cast<int>(iface);
    detach.ioctl_code = USBDEVFS_DISCONNECT;
    detach.data = nullptr;
    if (ioctl(fd_, USBDEVFS_IOCTL, &detach) == 0) {
      LOG_INFO("USB", describe(), "Detached kernel driver from interface {}",
               iface);
    }
    rc = ioctl(fd_, USBDEVFS_CLAIMINTERFACE, &iface);
  }
  if (rc < 0) {
    int saved = errno;
    ::close(fd_);
    fd_ = -1;
    errno = saved;
    fail(ErrorKind::TransportOpenError,
         fmt::format("Failed to claim interface {}", iface));
  }

  LOG_DEBUG("USB", describe(), "Opened {} interface {}", node_, iface);
}

void UsbTransport::close() noexcept {
  if (fd_ < 0)
    return;
  unsigned int iface = descriptor_.interface;
  ioctl(fd_, USBDEVFS_RELEASEINTERFACE, &iface);
  ::close(fd_);
  fd_ = -1;
  LOG_DEBUG("USB", node_, "Closed");
}

void UsbTransport::write(const Frame &frame) {
  if (fd_ < 0) {
    throw TransportError(ErrorKind::TransportIoError,
                         describe() + " is not open");
  }

  if (frame.transfer == TransferKind::Control) {
    UsbControlRequest setup = control_request(frame);
    uint8_t request = setup.request;
    std::vector<uint8_t> &data = setup.data;

    usbdevfs_ctrltransfer ctrl{};
    ctrl.bRequestType = VENDOR_OUT_REQUEST_TYPE;
    ctrl.bRequest = request;
    ctrl.wValue = 0;
    ctrl.wIndex = descriptor_.interface;
    ctrl.wLength = static_cast<uint16_t>(data.size());
    ctrl.timeout = WRITE_TIMEOUT_MS;
    ctrl.data = data.empty() ? nullptr : data.data();

    LOG_TRACE("USB", describe(), "TX control 0x{:02X}: {}", request,
              to_hex(data));
    if (ioctl(fd_, USBDEVFS_CONTROL, &ctrl) < 0) {
      fail(errno == ETIMEDOUT ? ErrorKind::IoTimeout
                              : ErrorKind::TransportIoError,
           "Control transfer failed");
    }
    return;
  }

  std::vector<uint8_t> data = frame.bytes;
  usbdevfs_bulktransfer bulk{};
  bulk.ep = frame.channel.value_or(descriptor_.bulk_out);
  bulk.len = static_cast<unsigned int>(data.size());
  bulk.timeout = WRITE_TIMEOUT_MS;
  bulk.data = data.data();

  LOG_TRACE("USB", describe(), "TX bulk 0x{:02X}: {}", bulk.ep,
            to_hex(data));
  int n = ioctl(fd_, USBDEVFS_BULK, &bulk);
  if (n < 0) {
    fail(errno == ETIMEDOUT ? ErrorKind::IoTimeout
                            : ErrorKind::TransportIoError,
         "Bulk OUT failed");
  }
  if (static_cast<size_t>(n) != data.size()) {
    throw TransportError(ErrorKind::TransportIoError,
                         fmt::format("Short bulk write on {}: {} of {} bytes",
                                     describe(), n, data.size()));
  }
}

Frame UsbTransport::read(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    throw TransportError(ErrorKind::TransportIoError,
                         describe() + " is not open");
  }

  std::vector<uint8_t> buf(READ_CHUNK);
  usbdevfs_bulktransfer bulk{};
  bulk.ep = descriptor_.bulk_in;
  bulk.len = static_cast<unsigned int>(buf.size());
  bulk.timeout = static_cast<unsigned int>(std::max<long long>(
      1, static_cast<long long>(timeout.count())));
  bulk.data = buf.data();

  int n = ioctl(fd_, USBDEVFS_BULK, &bulk);
  if (n < 0) {
    if (errno == ETIMEDOUT) {
      throw TransportError(ErrorKind::IoTimeout,
                           fmt::format("No data from {} within {} ms",
                                       describe(), timeout.count()));
    }
    fail(ErrorKind::TransportIoError, "Bulk IN failed");
  }

  buf.resize(static_cast<size_t>(n));
  LOG_TRACE("USB", describe(), "RX bulk 0x{:02X}: {}", descriptor_.bulk_in,
            to_hex(buf));
  return Frame::inbound(std::move(buf), TransferKind::Bulk,
                        descriptor_.bulk_in);
}

} // namespace benchio
