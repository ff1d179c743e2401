#include "bench-io/codec/Unit161dCodec.hpp"
#include "bench-io/CommandParser.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/Logger.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <fmt/format.h>
#include <limits>

namespace benchio {

namespace {

// Function index reported in payload[0]
constexpr std::array<const char *, 31> FUNCTIONS = {
    "ACV",  "ACmV",  "DCV",  "DCmV",  "Hz",   "%",      "OHM",   "CONT",
    "DIDOE", "CAP",  "°C",   "°F",    "DCuA", "ACuA",   "DCmA",  "ACmA",
    "DCA",  "ACA",   "HFE",  "Live",  "NCV",  "LozV",   "ACA",   "DCA",
    "LPF",  "AC/DC", "LPF",  "AC+DC", "LPF",  "AC+DC2", "INRUSH"};

constexpr std::array<const char *, 8> OVERLOAD = {
    ".OL", "O.L", "OL.", "OL", "-.OL", "-O.L", "-OL.", "-OL"};

// Display patterns for non-contact voltage detection levels
constexpr std::array<const char *, 6> NCV_LEVELS = {"EF",  "-",    "--",
                                                    "---", "----", "-----"};

struct UnitRange {
  const char *function;
  int min_range;
  int max_range;
  Unit unit;
  double scale;
};

constexpr std::array<UnitRange, 32> UNIT_TABLE = {{
    {"%", 0, 0, Unit::Percent, 1.0},
    {"AC+DC", 1, 1, Unit::Amp, 1.0},
    {"AC+DC2", 1, 1, Unit::Amp, 1.0},
    {"AC/DC", 0, 3, Unit::Volt, 1.0},
    {"ACA", 1, 1, Unit::Amp, 1.0},
    {"ACV", 0, 3, Unit::Volt, 1.0},
    {"ACmA", 0, 1, Unit::Amp, 1e-3},
    {"ACmV", 0, 0, Unit::Volt, 1e-3},
    {"ACuA", 0, 1, Unit::Amp, 1e-6},
    {"CAP", 0, 1, Unit::Farad, 1e-9},
    {"CAP", 2, 4, Unit::Farad, 1e-6},
    {"CAP", 5, 7, Unit::Farad, 1e-3},
    {"CONT", 0, 0, Unit::Ohm, 1.0},
    {"DCA", 1, 1, Unit::Amp, 1.0},
    {"DCV", 0, 3, Unit::Volt, 1.0},
    {"DCmA", 0, 1, Unit::Amp, 1e-3},
    {"DCmV", 0, 0, Unit::Volt, 1e-3},
    {"DCuA", 0, 1, Unit::Amp, 1e-6},
    {"DIDOE", 0, 0, Unit::Volt, 1.0},
    {"Hz", 0, 1, Unit::Hertz, 1.0},
    {"Hz", 2, 4, Unit::Hertz, 1e3},
    {"Hz", 5, 7, Unit::Hertz, 1e6},
    {"LPF", 0, 3, Unit::Volt, 1.0},
    {"LozV", 0, 3, Unit::Volt, 1.0},
    {"OHM", 0, 0, Unit::Ohm, 1.0},
    {"OHM", 1, 3, Unit::Ohm, 1e3},
    {"OHM", 4, 6, Unit::Ohm, 1e6},
    {"°C", 0, 1, Unit::Celsius, 1.0},
    {"°F", 0, 1, Unit::Fahrenheit, 1.0},
    {"HFE", 0, 0, Unit::Ratio, 1.0},
    {"NCV", 0, 0, Unit::None, 1.0},
    {"Live", 0, 0, Unit::None, 1.0},
}};

struct KeyOpcode {
  MeterKey key;
  uint8_t opcode;
};

constexpr std::array<KeyOpcode, 10> KEY_OPCODES = {{
    {MeterKey::NotMinMax, 0x42},
    {MeterKey::Range, 0x46},
    {MeterKey::Auto, 0x47},
    {MeterKey::Rel, 0x48},
    {MeterKey::Select2, 0x49},
    {MeterKey::Hold, 0x4A},
    {MeterKey::Lamp, 0x4B},
    {MeterKey::Select1, 0x4C},
    {MeterKey::PMinMax, 0x4D},
    {MeterKey::NotPeak, 0x4E},
}};

template <size_t N>
bool contains(const std::array<const char *, N> &list, const std::string &s) {
  return std::any_of(list.begin(), list.end(),
                     [&](const char *item) { return s == item; });
}

// Range arrives as an ASCII digit; raw 0..9 values are accepted too
int range_digit(uint8_t b) {
  if (b >= '0' && b <= '9')
    return b - '0';
  if (b <= 9)
    return b;
  return -1;
}

std::string display_text(const std::vector<uint8_t> &payload) {
  std::string text(payload.begin() + 2, payload.begin() + 9);
  size_t begin = text.find_first_not_of(std::string(" \0", 2));
  if (begin == std::string::npos)
    return "";
  size_t end = text.find_last_not_of(std::string(" \0", 2));
  return text.substr(begin, end - begin + 1);
}

uint16_t checksum(const std::vector<uint8_t> &buf, size_t pos, size_t total) {
  uint32_t sum = 0;
  for (size_t i = pos; i < pos + total - 2; ++i) {
    sum += buf[i];
  }
  return static_cast<uint16_t>(sum);
}

uint16_t received_checksum(const std::vector<uint8_t> &buf, size_t pos,
                           size_t total) {
  return static_cast<uint16_t>((buf[pos + total - 2] << 8) |
                               buf[pos + total - 1]);
}

// True when a whole frame with a valid checksum starts at pos
bool complete_frame_at(const std::vector<uint8_t> &buf, size_t pos) {
  if (pos + 3 > buf.size() || buf[pos] != Unit161dCodec::SYNC_1 ||
      buf[pos + 1] != Unit161dCodec::SYNC_2)
    return false;
  size_t len = buf[pos + 2];
  if (len < 2 || len > Unit161dCodec::MAX_FRAME_LENGTH)
    return false;
  size_t total = 3 + len;
  if (pos + total > buf.size())
    return false;
  return checksum(buf, pos, total) == received_checksum(buf, pos, total);
}

std::vector<uint8_t> request_bytes(uint8_t opcode) {
  uint16_t sum = Unit161dCodec::SYNC_1 + Unit161dCodec::SYNC_2 +
                 Unit161dCodec::REQUEST_TAG + opcode;
  return {Unit161dCodec::SYNC_1,
          Unit161dCodec::SYNC_2,
          Unit161dCodec::REQUEST_TAG,
          opcode,
          static_cast<uint8_t>(sum >> 8),
          static_cast<uint8_t>(sum & 0xFF)};
}

std::optional<uint8_t> opcode_for(const Command &cmd) {
  if (std::holds_alternative<MeasureCmd>(cmd))
    return Unit161dCodec::OP_MEASURE;
  if (std::holds_alternative<MinMaxCmd>(cmd))
    return Unit161dCodec::OP_MINMAX;
  // The meter has no reset key: leaving MIN/MAX mode is the closest state
  if (std::holds_alternative<ResetCmd>(cmd))
    return Unit161dCodec::OP_NOT_MINMAX;
  if (const auto *key = std::get_if<KeyCmd>(&cmd)) {
    for (const auto &k : KEY_OPCODES) {
      if (k.key == key->key)
        return k.opcode;
    }
  }
  return std::nullopt;
}

} // namespace

EncodedRequest Unit161dCodec::encode(const Command &cmd) {
  const Command &inner = unwrap_raw(cmd);
  EncodedRequest req;

  auto opcode = opcode_for(inner);
  if (!opcode) {
    // Only reachable through Raw: send the text form unchanged
    std::string text = to_string(inner);
    req.frame = Frame::outbound(std::vector<uint8_t>(text.begin(), text.end()),
                                TransferKind::HidReport);
    req.expects_reply = false;
    expect_reading_ = false;
    return req;
  }

  req.frame = Frame::outbound(request_bytes(*opcode), TransferKind::HidReport);
  req.frame.channel = static_cast<uint8_t>(req.frame.bytes.size());
  req.expects_reply = true;
  req.mode = std::holds_alternative<MinMaxCmd>(inner)
                 ? AcquisitionMode::MinMax
                 : AcquisitionMode::Measure;

  expect_reading_ = std::holds_alternative<MeasureCmd>(inner);
  pending_mode_ = req.mode;
  return req;
}

void Unit161dCodec::reset() {
  rx_.clear();
  expect_reading_ = false;
  pending_mode_ = AcquisitionMode::Measure;
}

DecodedUnit Unit161dCodec::decode(const Frame &frame) {
  rx_.insert(rx_.end(), frame.bytes.begin(), frame.bytes.end());

  // Locate the next AB CD sync pair
  size_t start = 0;
  while (start + 1 < rx_.size() &&
         !(rx_[start] == SYNC_1 && rx_[start + 1] == SYNC_2)) {
    ++start;
  }
  if (start + 1 >= rx_.size()) {
    // Keep a trailing AB that may be the first half of a sync pair
    bool keep_last = !rx_.empty() && rx_.back() == SYNC_1;
    size_t discard = rx_.size() - (keep_last ? 1 : 0);
    if (discard > 0) {
      LOG_TRACE("UNIT161D", "DECODE", "Discarding {} bytes without sync",
                discard);
      rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(discard));
    }
    return PartialAwaitingMore{};
  }
  if (start > 0) {
    LOG_TRACE("UNIT161D", "DECODE", "Skipping {} bytes before sync", start);
    rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(start));
  }

  if (rx_.size() < 3) {
    return PartialAwaitingMore{};
  }

  size_t len = rx_[2];
  if (len < 2 || len > MAX_FRAME_LENGTH) {
    rx_.erase(rx_.begin(), rx_.begin() + 2);
    throw ProtocolError(
        fmt::format("Malformed frame length {} (expected 2..{})", len,
                    MAX_FRAME_LENGTH));
  }

  size_t total = 3 + len;
  if (rx_.size() < total) {
    // A corrupted length can claim bytes that never arrive: give up on it
    // once a complete frame is already waiting behind it
    for (size_t pos = 2; pos + 1 < rx_.size(); ++pos) {
      if (complete_frame_at(rx_, pos)) {
        std::vector<uint8_t> stalled(
            rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(pos));
        rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(pos));
        throw ProtocolError(fmt::format(
            "Frame length {} exceeds available data, resynchronized past {}",
            len, to_hex(stalled)));
      }
    }
    return PartialAwaitingMore{};
  }

  uint16_t sum = checksum(rx_, 0, total);
  uint16_t received = received_checksum(rx_, 0, total);
  if (sum != received) {
    std::vector<uint8_t> bad(rx_.begin(), rx_.begin() + total);
    rx_.erase(rx_.begin(), rx_.begin() + 2);
    throw ProtocolError(fmt::format(
        "Checksum mismatch: computed 0x{:04X}, received 0x{:04X} in frame {}",
        sum, received, to_hex(bad)));
  }

  std::vector<uint8_t> payload(rx_.begin() + 3, rx_.begin() + total - 2);
  rx_.erase(rx_.begin(), rx_.begin() + total);

  return interpret(payload);
}

DecodedUnit Unit161dCodec::interpret(const std::vector<uint8_t> &payload) const {
  if (payload.size() >= READING_LENGTH) {
    return parse_reading(payload, pending_mode_);
  }
  if (expect_reading_) {
    throw ProtocolError(
        fmt::format("Reading payload too short: {} bytes, expected {}",
                    payload.size(), READING_LENGTH));
  }
  return Acknowledgement{to_hex(payload)};
}

Measurement Unit161dCodec::parse_reading(const std::vector<uint8_t> &payload,
                                         AcquisitionMode mode) {
  if (payload.size() < READING_LENGTH) {
    throw ProtocolError(fmt::format("Reading payload too short: {} bytes",
                                    payload.size()));
  }
  if (payload[0] >= FUNCTIONS.size()) {
    throw ProtocolError(
        fmt::format("Unknown function index {}", payload[0]));
  }

  Measurement m;
  m.mode = mode;
  m.timestamp = std::chrono::system_clock::now();
  m.function = FUNCTIONS[payload[0]];
  m.display = display_text(payload);

  int range = range_digit(payload[1]);
  double scale = 1.0;
  for (const auto &row : UNIT_TABLE) {
    if (m.function == row.function && range >= row.min_range &&
        range <= row.max_range) {
      m.unit = row.unit;
      scale = row.scale;
      break;
    }
  }

  if (contains(OVERLOAD, m.display)) {
    m.overload = true;
    m.value = m.display.front() == '-'
                  ? -std::numeric_limits<double>::infinity()
                  : std::numeric_limits<double>::infinity();
  } else if (contains(NCV_LEVELS, m.display)) {
    m.ncv = true;
    m.value = std::numeric_limits<double>::quiet_NaN();
  } else {
    const char *begin = m.display.c_str();
    char *end = nullptr;
    double v = std::strtod(begin, &end);
    if (m.display.empty() || end == begin || *end != '\0') {
      throw ProtocolError(
          fmt::format("Unparseable display '{}'", m.display));
    }
    m.value = v * scale;
  }

  m.bar_graph = static_cast<uint16_t>(payload[9] * 10 + payload[10]);

  MeterFlags flags;
  flags.max = payload[11] & 0x08;
  flags.min = payload[11] & 0x04;
  flags.hold = payload[11] & 0x02;
  flags.rel = payload[11] & 0x01;
  flags.auto_range = payload[12] & 0x04;
  flags.low_battery = payload[12] & 0x02;
  flags.hv_warning = payload[12] & 0x01;
  flags.dc = payload[13] & 0x08;
  flags.peak_max = payload[13] & 0x04;
  flags.peak_min = payload[13] & 0x02;
  flags.bar_polarity = payload[13] & 0x01;
  m.flags = flags;

  return m;
}

std::optional<Command> Unit161dCodec::parse_request(const Frame &frame) {
  const auto &b = frame.bytes;
  if (b.size() == 6 && b[0] == SYNC_1 && b[1] == SYNC_2 &&
      b[2] == REQUEST_TAG) {
    if (request_bytes(b[3]) != b)
      return std::nullopt;
    if (b[3] == OP_MEASURE)
      return MeasureCmd{};
    if (b[3] == OP_MINMAX)
      return MinMaxCmd{};
    if (b[3] == OP_NOT_MINMAX)
      return ResetCmd{};
    for (const auto &k : KEY_OPCODES) {
      if (k.opcode == b[3])
        return KeyCmd{k.key};
    }
    return std::nullopt;
  }

  // Raw pass-through text
  try {
    return CommandParser::parse(std::string(b.begin(), b.end()));
  } catch (const ParseError &) {
    return std::nullopt;
  }
}

std::vector<uint8_t>
Unit161dCodec::wrap_response(const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> out{SYNC_1, SYNC_2,
                           static_cast<uint8_t>(payload.size() + 2)};
  out.insert(out.end(), payload.begin(), payload.end());
  uint32_t sum = 0;
  for (uint8_t b : out) {
    sum += b;
  }
  out.push_back(static_cast<uint8_t>((sum >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(sum & 0xFF));
  return out;
}

} // namespace benchio
