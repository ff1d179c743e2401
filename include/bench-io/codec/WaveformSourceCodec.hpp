#pragma once
#include "bench-io/Command.hpp"
#include "bench-io/codec/DecodedUnit.hpp"
#include <cstdint>
#include <optional>

namespace benchio {

/// PeakTech 4055MV binary command set over USB.
///
/// Apply (bulk OUT, 11 bytes):
///   0x10 <mask> <wave> <freq u32 BE, 0.01 Hz> <amp u16 BE, mVpp>
///   <offset i16 BE, mV>
///   mask bit 0 frequency, bit 1 amplitude, bit 2 offset present
/// Reset (vendor control transfer): single opcode 0x7F
///
/// The instrument sends no replies; a completed write is the acknowledgement.
class WaveformSourceCodec {
public:
  static constexpr uint8_t OP_APPLY = 0x10;
  static constexpr uint8_t OP_RESET = 0x7F;
  static constexpr size_t APPLY_LENGTH = 11;

  static constexpr uint8_t FIELD_FREQUENCY = 0x01;
  static constexpr uint8_t FIELD_AMPLITUDE = 0x02;
  static constexpr uint8_t FIELD_OFFSET = 0x04;

  static constexpr double MAX_FREQUENCY_HZ = 5e6;
  static constexpr double MAX_AMPLITUDE_VPP = 20.0;
  static constexpr double MAX_OFFSET_V = 10.0;

  /// Throws CapabilityError when an Apply field is outside device limits
  void validate(const Command &cmd) const;

  /// Never fails: fields saturate to their width
  EncodedRequest encode(const Command &cmd);

  /// Any inbound bytes are treated as a status acknowledgement
  DecodedUnit decode(const Frame &frame);

  bool has_queued() const { return false; }
  void reset() {}

  static std::optional<Command> parse_request(const Frame &frame);
};

} // namespace benchio
