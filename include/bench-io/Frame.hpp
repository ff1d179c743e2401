#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace benchio {

enum class Direction { Outbound, Inbound };

/// How a frame travels on the wire. Transports use it to pick the endpoint.
enum class TransferKind {
  HidReport, // one HID report, channel is the report id
  Control,   // USB vendor control transfer, channel is bRequest
  Bulk,      // USB bulk transfer, channel is the endpoint address
  Stream     // byte stream (socket), no channel
};

/// One opaque unit of raw bytes exchanged with a device
struct Frame {
  Direction direction{Direction::Outbound};
  TransferKind transfer{TransferKind::Stream};
  std::optional<uint8_t> channel;
  std::vector<uint8_t> bytes;

  bool empty() const { return bytes.empty(); }
  size_t size() const { return bytes.size(); }

  static Frame inbound(std::vector<uint8_t> data,
                       TransferKind kind = TransferKind::Stream,
                       std::optional<uint8_t> channel = std::nullopt) {
    Frame f;
    f.direction = Direction::Inbound;
    f.transfer = kind;
    f.channel = channel;
    f.bytes = std::move(data);
    return f;
  }

  static Frame outbound(std::vector<uint8_t> data,
                        TransferKind kind = TransferKind::Stream,
                        std::optional<uint8_t> channel = std::nullopt) {
    Frame f;
    f.direction = Direction::Outbound;
    f.transfer = kind;
    f.channel = channel;
    f.bytes = std::move(data);
    return f;
  }
};

/// Hex dump used in trace logs ("AB CD 03 5E 01 D9")
std::string to_hex(const std::vector<uint8_t> &bytes, size_t max_bytes = 64);

const char *transfer_kind_name(TransferKind kind);

} // namespace benchio
