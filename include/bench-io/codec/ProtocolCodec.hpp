#pragma once
#include "bench-io/codec/ScpiCodec.hpp"
#include "bench-io/codec/Unit161dCodec.hpp"
#include "bench-io/codec/WaveformSourceCodec.hpp"
#include <optional>
#include <variant>

namespace benchio {

/// Per-instrument wire protocol. The concrete codec is fixed when the
/// Device is constructed; every call forwards to it.
class ProtocolCodec {
public:
  using Impl = std::variant<Unit161dCodec, WaveformSourceCodec, ScpiCodec>;

  ProtocolCodec(Impl impl) : impl_(std::move(impl)) {}

  /// Device-specific parameter checks for non-Raw commands
  void validate(const Command &cmd) const {
    std::visit([&](const auto &codec) { codec.validate(cmd); }, impl_);
  }

  EncodedRequest encode(const Command &cmd) {
    return std::visit([&](auto &codec) { return codec.encode(cmd); }, impl_);
  }

  /// Throws ProtocolError for a malformed frame, after discarding it
  DecodedUnit decode(const Frame &frame) {
    return std::visit([&](auto &codec) { return codec.decode(frame); },
                      impl_);
  }

  bool has_queued() const {
    return std::visit([](const auto &codec) { return codec.has_queued(); },
                      impl_);
  }

  void reset() {
    std::visit([](auto &codec) { codec.reset(); }, impl_);
  }

  std::optional<Command> parse_request(const Frame &frame) const {
    return std::visit(
        [&](const auto &codec) { return codec.parse_request(frame); }, impl_);
  }

  const char *name() const;

  template <typename T> T *get() { return std::get_if<T>(&impl_); }
  template <typename T> const T *get() const { return std::get_if<T>(&impl_); }

private:
  Impl impl_;
};

} // namespace benchio
