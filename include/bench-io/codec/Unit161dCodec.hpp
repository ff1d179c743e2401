#pragma once
#include "bench-io/Command.hpp"
#include "bench-io/codec/DecodedUnit.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace benchio {

/// UNI-T UT161D multimeter behind a CP2110 HID-UART bridge.
///
/// Request (6 bytes, sent as one HID data report):
///   AB CD 03 <op> <sum_hi> <sum_lo>      sum = AB + CD + 03 + op
/// Response stream:
///   AB CD <len> <payload...> <sum_hi> <sum_lo>
///   len counts payload + checksum, sum covers sync, len and payload.
/// Reading payload (14 bytes):
///   [0] function index  [1] range digit  [2..8] display text
///   [9..10] bar graph   [11..13] annunciator bits
class Unit161dCodec {
public:
  static constexpr uint8_t SYNC_1 = 0xAB;
  static constexpr uint8_t SYNC_2 = 0xCD;
  static constexpr uint8_t REQUEST_TAG = 0x03;
  static constexpr size_t READING_LENGTH = 14;
  static constexpr size_t MAX_FRAME_LENGTH = 64;

  static constexpr uint8_t OP_MEASURE = 0x5E;
  static constexpr uint8_t OP_MINMAX = 0x41;
  static constexpr uint8_t OP_NOT_MINMAX = 0x42;

  /// No parameter limits beyond the capability set
  void validate(const Command &) const {}

  EncodedRequest encode(const Command &cmd);

  /// Append the frame to the receive buffer and decode the next complete
  /// frame. Throws ProtocolError after discarding the malformed frame's
  /// sync bytes, or the whole stalled frame when its length overruns a
  /// complete frame behind it; call again with an empty frame to continue.
  DecodedUnit decode(const Frame &frame);

  bool has_queued() const { return false; }

  /// Drop buffered bytes (new session)
  void reset();

  size_t buffered() const { return rx_.size(); }

  /// Decode one of our own requests back to a command
  static std::optional<Command> parse_request(const Frame &frame);

  /// Decode a checksum-verified reading payload
  static Measurement parse_reading(const std::vector<uint8_t> &payload,
                                   AcquisitionMode mode);

  /// Build an inbound frame as the meter would send it (fixtures, replay)
  static std::vector<uint8_t> wrap_response(const std::vector<uint8_t> &payload);

private:
  DecodedUnit interpret(const std::vector<uint8_t> &payload) const;

  std::vector<uint8_t> rx_;
  bool expect_reading_{false};
  AcquisitionMode pending_mode_{AcquisitionMode::Measure};
};

} // namespace benchio
