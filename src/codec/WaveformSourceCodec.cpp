#include "bench-io/codec/WaveformSourceCodec.hpp"
#include "bench-io/CommandParser.hpp"
#include "bench-io/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>

namespace benchio {

namespace {

template <typename T> T saturate(double scaled) {
  if (std::isnan(scaled))
    return 0;
  double lo = static_cast<double>(std::numeric_limits<T>::min());
  double hi = static_cast<double>(std::numeric_limits<T>::max());
  return static_cast<T>(std::clamp(std::round(scaled), lo, hi));
}

void put_u32(std::vector<uint8_t> &out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v >> 24));
  out.push_back(static_cast<uint8_t>(v >> 16));
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v));
}

void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v));
}

uint32_t get_u32(const std::vector<uint8_t> &b, size_t at) {
  return (static_cast<uint32_t>(b[at]) << 24) |
         (static_cast<uint32_t>(b[at + 1]) << 16) |
         (static_cast<uint32_t>(b[at + 2]) << 8) | b[at + 3];
}

uint16_t get_u16(const std::vector<uint8_t> &b, size_t at) {
  return static_cast<uint16_t>((b[at] << 8) | b[at + 1]);
}

constexpr uint8_t WAVEFORM_COUNT = static_cast<uint8_t>(Waveform::Quake) + 1;

std::vector<uint8_t> apply_packet(const ApplyCmd &apply) {
  uint8_t mask = 0;
  if (apply.frequency)
    mask |= WaveformSourceCodec::FIELD_FREQUENCY;
  if (apply.amplitude)
    mask |= WaveformSourceCodec::FIELD_AMPLITUDE;
  if (apply.offset)
    mask |= WaveformSourceCodec::FIELD_OFFSET;

  std::vector<uint8_t> out;
  out.reserve(WaveformSourceCodec::APPLY_LENGTH);
  out.push_back(WaveformSourceCodec::OP_APPLY);
  out.push_back(mask);
  out.push_back(static_cast<uint8_t>(apply.waveform));
  put_u32(out, saturate<uint32_t>(apply.frequency.value_or(0.0) * 100.0));
  put_u16(out, saturate<uint16_t>(apply.amplitude.value_or(0.0) * 1000.0));
  put_u16(out, static_cast<uint16_t>(
                   saturate<int16_t>(apply.offset.value_or(0.0) * 1000.0)));
  return out;
}

} // namespace

void WaveformSourceCodec::validate(const Command &cmd) const {
  const auto *apply = std::get_if<ApplyCmd>(&cmd);
  if (!apply)
    return;

  if (apply->frequency &&
      (*apply->frequency < 0.0 || *apply->frequency > MAX_FREQUENCY_HZ)) {
    throw CapabilityError(fmt::format(
        "Frequency {} Hz outside 0..{} Hz", *apply->frequency,
        MAX_FREQUENCY_HZ));
  }
  if (apply->amplitude &&
      (*apply->amplitude < 0.0 || *apply->amplitude > MAX_AMPLITUDE_VPP)) {
    throw CapabilityError(fmt::format("Amplitude {} Vpp outside 0..{} Vpp",
                                      *apply->amplitude, MAX_AMPLITUDE_VPP));
  }
  if (apply->offset && std::fabs(*apply->offset) > MAX_OFFSET_V) {
    throw CapabilityError(fmt::format("Offset {} V outside +/-{} V",
                                      *apply->offset, MAX_OFFSET_V));
  }
}

EncodedRequest WaveformSourceCodec::encode(const Command &cmd) {
  const Command &inner = unwrap_raw(cmd);
  EncodedRequest req;
  req.expects_reply = false;

  if (const auto *apply = std::get_if<ApplyCmd>(&inner)) {
    req.frame = Frame::outbound(apply_packet(*apply), TransferKind::Bulk);
  } else if (std::holds_alternative<ResetCmd>(inner)) {
    req.frame =
        Frame::outbound({OP_RESET}, TransferKind::Control, OP_RESET);
  } else {
    std::string text = to_string(inner);
    req.frame = Frame::outbound(std::vector<uint8_t>(text.begin(), text.end()),
                                TransferKind::Bulk);
  }
  return req;
}

DecodedUnit WaveformSourceCodec::decode(const Frame &frame) {
  if (frame.empty())
    return PartialAwaitingMore{};
  return Acknowledgement{to_hex(frame.bytes)};
}

std::optional<Command> WaveformSourceCodec::parse_request(const Frame &frame) {
  const auto &b = frame.bytes;
  if (b.size() == 1 && b[0] == OP_RESET)
    return ResetCmd{};

  if (b.size() == APPLY_LENGTH && b[0] == OP_APPLY && b[2] < WAVEFORM_COUNT) {
    ApplyCmd apply;
    apply.waveform = static_cast<Waveform>(b[2]);
    if (b[1] & FIELD_FREQUENCY)
      apply.frequency = get_u32(b, 3) / 100.0;
    if (b[1] & FIELD_AMPLITUDE)
      apply.amplitude = get_u16(b, 7) / 1000.0;
    if (b[1] & FIELD_OFFSET)
      apply.offset = static_cast<int16_t>(get_u16(b, 9)) / 1000.0;
    return apply;
  }

  try {
    return CommandParser::parse(std::string(b.begin(), b.end()));
  } catch (const ParseError &) {
    return std::nullopt;
  }
}

} // namespace benchio
