#pragma once
#include "bench-io/Command.hpp"
#include "bench-io/codec/DecodedUnit.hpp"
#include <deque>
#include <optional>
#include <string>

namespace benchio {

enum class ScpiDialect {
  Standard, // APPL:SIN 10000,3,0.4
  PeakTech  // Apply:Sin 10kHz, 3, 0.4
};

/// Line-oriented SCPI text protocol. Requests are one '\n'-terminated line;
/// responses are one line of comma-separated fields.
class ScpiCodec {
public:
  /// Bulk packets shorter than this end a USB transfer
  static constexpr size_t BULK_PACKET_SIZE = 512;

  /// SCPI "9.9E37" overload marker
  static constexpr double OVERLOAD_THRESHOLD = 9.9e37;

  explicit ScpiCodec(ScpiDialect dialect = ScpiDialect::Standard,
                     TransferKind transfer = TransferKind::Stream)
      : dialect_(dialect), transfer_(transfer) {}

  void validate(const Command &) const {}

  EncodedRequest encode(const Command &cmd);

  /// Numeric fields become Measurements (extra fields are queued and
  /// returned by later calls). A non-numeric reply to a free-form query is
  /// an Acknowledgement carrying the text.
  DecodedUnit decode(const Frame &frame);

  /// True when fields of the last line are still waiting to be returned
  bool has_queued() const { return !queued_.empty(); }

  void reset();

  ScpiDialect dialect() const { return dialect_; }

  std::optional<Command> parse_request(const Frame &frame) const;

  /// Request line without terminator, e.g. "READ?"
  std::string request_text(const Command &cmd) const;

private:
  DecodedUnit decode_line(const std::string &line);

  ScpiDialect dialect_;
  TransferKind transfer_;
  std::string rx_;
  std::deque<Measurement> queued_;
  AcquisitionMode pending_mode_{AcquisitionMode::Measure};
};

} // namespace benchio
