#pragma once
#include "bench-io/Frame.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace benchio {

enum class TransportKind { Hid, UsbDevice, ScpiSocket };

/// hidraw node. Without a report id, the CP2110 convention applies: data
/// reports 1..63 whose id is the payload length.
struct HidDescriptor {
  std::string path;
  std::optional<uint8_t> report_id;
};

struct UsbDescriptor {
  uint16_t vendor_id{0};
  uint16_t product_id{0};
  uint8_t interface{0};
  uint8_t bulk_in{0x81};
  uint8_t bulk_out{0x01};
};

struct ScpiSocketDescriptor {
  std::string host;
  uint16_t port{5025};
};

using TransportDescriptor =
    std::variant<HidDescriptor, UsbDescriptor, ScpiSocketDescriptor>;

TransportKind descriptor_kind(const TransportDescriptor &descriptor);
const char *transport_kind_name(TransportKind kind);

/// "hid:/dev/hidraw0", "usb:2e8a:000a", "scpi:10.0.0.5:5025"
std::string describe(const TransportDescriptor &descriptor);

/// "<vendor>:<product>" in hex ("2e8a:000a", "0x2e8a:0x000a").
/// Throws ParseError (ArgParseError).
UsbDescriptor parse_usb_address(const std::string &text);

/// "host[:port]", "[v6addr]:port". Throws ParseError (ArgParseError).
ScpiSocketDescriptor parse_socket_address(const std::string &text);

/// Byte pipe to one physical instrument, exclusively owned by a Device.
///
/// open() and every I/O call throw TransportError. read() blocks at most
/// `timeout` and throws IoTimeout when nothing arrived.
class Transport {
public:
  virtual ~Transport() = default;

  virtual void open() = 0;
  virtual void close() noexcept = 0;
  virtual bool is_open() const = 0;

  virtual void write(const Frame &frame) = 0;
  virtual Frame read(std::chrono::milliseconds timeout) = 0;

  virtual TransportKind kind() const = 0;
  virtual std::string describe() const = 0;
};

} // namespace benchio
