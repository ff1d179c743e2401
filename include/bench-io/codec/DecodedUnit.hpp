#pragma once
#include "bench-io/Frame.hpp"
#include "bench-io/Measurement.hpp"
#include <string>
#include <variant>

namespace benchio {

/// The device confirmed a control command (or a write needing no reply
/// completed). Carries the reply bytes when there were any.
struct Acknowledgement {
  std::string detail;
};

/// The buffered bytes do not yet form a complete frame
struct PartialAwaitingMore {};

using DecodedUnit =
    std::variant<Measurement, Acknowledgement, PartialAwaitingMore>;

/// Encoded command ready for a Transport
struct EncodedRequest {
  Frame frame;
  bool expects_reply{true};
  AcquisitionMode mode{AcquisitionMode::Measure};
};

inline bool is_partial(const DecodedUnit &unit) {
  return std::holds_alternative<PartialAwaitingMore>(unit);
}

} // namespace benchio
