#pragma once
#include "bench-io/Errors.hpp"
#include "bench-io/transport/Transport.hpp"
#include <string>
#include <vector>

namespace benchio {

struct UsbControlRequest {
  uint8_t request{0};
  std::vector<uint8_t> data;
};

/// Linux usbdevfs backend. The device is located by vendor/product id under
/// /sys/bus/usb/devices and driven through /dev/bus/usb/BBB/DDD.
class UsbTransport : public Transport {
public:
  static constexpr uint8_t VENDOR_OUT_REQUEST_TYPE = 0x40;
  static constexpr size_t READ_CHUNK = 512;
  static constexpr unsigned WRITE_TIMEOUT_MS = 1000;

  explicit UsbTransport(UsbDescriptor descriptor);
  ~UsbTransport() override;

  UsbTransport(const UsbTransport &) = delete;
  UsbTransport &operator=(const UsbTransport &) = delete;

  /// Claims the interface, detaching a kernel driver if one is bound
  void open() override;
  void close() noexcept override;
  bool is_open() const override { return fd_ >= 0; }

  /// Control frames: vendor request bRequest = channel (or first byte),
  /// data = remaining bytes. Other frames: bulk OUT.
  void write(const Frame &frame) override;

  /// Bulk IN from the descriptor's endpoint
  Frame read(std::chrono::milliseconds timeout) override;

  TransportKind kind() const override { return TransportKind::UsbDevice; }
  std::string describe() const override;

  const UsbDescriptor &descriptor() const { return descriptor_; }

  /// bRequest and data stage of a Control frame. Throws TransportError
  /// (TransportIoError) when the frame carries no request code.
  static UsbControlRequest control_request(const Frame &frame);

  /// "/dev/bus/usb/001/004", empty when no device matches
  static std::string find_device_node(uint16_t vendor_id, uint16_t product_id,
                                      const std::string &sysfs_root =
                                          "/sys/bus/usb/devices");

private:
  [[noreturn]] void fail(ErrorKind kind, const std::string &what) const;

  UsbDescriptor descriptor_;
  std::string node_;
  int fd_{-1};
};

} // namespace benchio
