#include "bench-io/codec/ScpiCodec.hpp"
#include "bench-io/CommandParser.hpp"
#include "bench-io/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>

namespace benchio {

namespace {

std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

const char *standard_mnemonic(Waveform waveform) {
  switch (waveform) {
  case Waveform::Sin:
    return "SIN";
  case Waveform::Squ:
    return "SQU";
  case Waveform::Ramp:
    return "RAMP";
  case Waveform::Noise:
    return "NOIS";
  case Waveform::PPulse:
  case Waveform::NPulse:
    return "PULS";
  default:
    return nullptr;
  }
}

// 10000 -> "10kHz", 2500000 -> "2.5MHz"
std::string engineering_frequency(double hz) {
  if (std::fabs(hz) >= 1e6)
    return fmt::format("{}MHz", hz / 1e6);
  if (std::fabs(hz) >= 1e3)
    return fmt::format("{}kHz", hz / 1e3);
  return fmt::format("{}Hz", hz);
}

std::string standard_apply(const ApplyCmd &apply) {
  const char *mnemonic = standard_mnemonic(apply.waveform);
  std::string text =
      "APPL:" + (mnemonic ? std::string(mnemonic)
                          : upper(waveform_name(apply.waveform)));
  std::vector<std::string> args;
  if (apply.frequency)
    args.push_back(fmt::format("{}", *apply.frequency));
  if (apply.amplitude)
    args.push_back(fmt::format("{}", *apply.amplitude));
  if (apply.offset)
    args.push_back(fmt::format("{}", *apply.offset));
  if (!args.empty())
    text += " " + fmt::format("{}", fmt::join(args, ","));
  return text;
}

std::string peaktech_apply(const ApplyCmd &apply) {
  std::string text = fmt::format("Apply:{}", waveform_name(apply.waveform));
  std::vector<std::string> args;
  if (apply.frequency)
    args.push_back(engineering_frequency(*apply.frequency));
  if (apply.amplitude)
    args.push_back(fmt::format("{}", *apply.amplitude));
  if (apply.offset)
    args.push_back(fmt::format("{}", *apply.offset));
  if (!args.empty())
    text += " " + fmt::format("{}", fmt::join(args, ", "));
  return text;
}

} // namespace

std::string ScpiCodec::request_text(const Command &cmd) const {
  const Command &inner = unwrap_raw(cmd);
  if (std::holds_alternative<MeasureCmd>(inner))
    return "READ?";
  if (std::holds_alternative<ResetCmd>(inner))
    return "*RST";
  if (const auto *apply = std::get_if<ApplyCmd>(&inner)) {
    return dialect_ == ScpiDialect::PeakTech ? peaktech_apply(*apply)
                                             : standard_apply(*apply);
  }
  if (const auto *scpi = std::get_if<ScpiCmd>(&inner))
    return trim(scpi->text);
  return to_string(inner);
}

EncodedRequest ScpiCodec::encode(const Command &cmd) {
  const Command &inner = unwrap_raw(cmd);
  std::string line = request_text(inner) + "\n";

  EncodedRequest req;
  req.frame = Frame::outbound(std::vector<uint8_t>(line.begin(), line.end()),
                              transfer_);
  if (std::holds_alternative<MeasureCmd>(inner)) {
    req.expects_reply = true;
    req.mode = AcquisitionMode::Measure;
  } else if (const auto *scpi = std::get_if<ScpiCmd>(&inner)) {
    req.expects_reply = scpi->is_query();
    req.mode = AcquisitionMode::Query;
  } else {
    req.expects_reply = false;
  }

  // A new request supersedes whatever is left of the previous reply
  queued_.clear();
  pending_mode_ = req.mode;
  return req;
}

void ScpiCodec::reset() {
  rx_.clear();
  queued_.clear();
  pending_mode_ = AcquisitionMode::Measure;
}

DecodedUnit ScpiCodec::decode(const Frame &frame) {
  if (!queued_.empty()) {
    rx_.append(frame.bytes.begin(), frame.bytes.end());
    Measurement next = queued_.front();
    queued_.pop_front();
    return next;
  }

  rx_.append(frame.bytes.begin(), frame.bytes.end());

  size_t eol = rx_.find('\n');
  if (eol == std::string::npos) {
    // A short bulk packet ends the transfer even without a terminator
    bool transfer_done = frame.transfer == TransferKind::Bulk &&
                         !frame.empty() && frame.size() < BULK_PACKET_SIZE;
    if (!transfer_done)
      return PartialAwaitingMore{};
    eol = rx_.size();
  }

  std::string line = trim(rx_.substr(0, eol));
  rx_.erase(0, std::min(eol + 1, rx_.size()));
  return decode_line(line);
}

DecodedUnit ScpiCodec::decode_line(const std::string &line) {
  if (line.empty()) {
    throw ProtocolError("Empty response line");
  }

  std::vector<Measurement> fields;
  size_t start = 0;
  while (start <= line.size()) {
    size_t comma = line.find(',', start);
    if (comma == std::string::npos)
      comma = line.size();
    std::string field = trim(line.substr(start, comma - start));
    start = comma + 1;

    const char *begin = field.c_str();
    char *end = nullptr;
    double v = std::strtod(begin, &end);
    if (field.empty() || end == begin || *end != '\0') {
      if (pending_mode_ == AcquisitionMode::Query) {
        // *IDN? and friends answer with text
        return Acknowledgement{line};
      }
      throw ProtocolError(fmt::format("Unparseable field '{}' in '{}'",
                                      field, line));
    }

    Measurement m;
    m.mode = pending_mode_;
    m.timestamp = std::chrono::system_clock::now();
    m.display = field;
    if (std::fabs(v) >= OVERLOAD_THRESHOLD) {
      m.overload = true;
      m.value = v > 0 ? std::numeric_limits<double>::infinity()
                      : -std::numeric_limits<double>::infinity();
    } else {
      m.value = v;
    }
    fields.push_back(m);
  }

  queued_.assign(fields.begin() + 1, fields.end());
  return fields.front();
}

std::optional<Command> ScpiCodec::parse_request(const Frame &frame) const {
  std::string line =
      trim(std::string(frame.bytes.begin(), frame.bytes.end()));
  if (line == "READ?")
    return MeasureCmd{};
  if (line == "*RST")
    return ResetCmd{};

  if (dialect_ == ScpiDialect::PeakTech && line.rfind("Apply:", 0) == 0) {
    try {
      return CommandParser::parse(line);
    } catch (const ParseError &) {
      return std::nullopt;
    }
  }

  if (dialect_ == ScpiDialect::Standard && line.rfind("APPL:", 0) == 0) {
    std::string rest = line.substr(5);
    size_t space = rest.find(' ');
    std::string wave = rest.substr(0, space);
    ApplyCmd apply;
    bool found = false;
    for (int i = 0; i <= static_cast<int>(Waveform::Quake); ++i) {
      auto w = static_cast<Waveform>(i);
      const char *mnemonic = standard_mnemonic(w);
      if (wave == (mnemonic ? std::string(mnemonic) : upper(waveform_name(w)))) {
        apply.waveform = w;
        found = true;
        break;
      }
    }
    if (!found)
      return std::nullopt;
    if (space != std::string::npos) {
      std::vector<double> values;
      std::string args = rest.substr(space + 1);
      size_t pos = 0;
      while (pos <= args.size()) {
        size_t comma = args.find(',', pos);
        if (comma == std::string::npos)
          comma = args.size();
        std::string field = trim(args.substr(pos, comma - pos));
        char *end = nullptr;
        double v = std::strtod(field.c_str(), &end);
        if (field.empty() || *end != '\0')
          return std::nullopt;
        values.push_back(v);
        pos = comma + 1;
      }
      if (values.size() > 0)
        apply.frequency = values[0];
      if (values.size() > 1)
        apply.amplitude = values[1];
      if (values.size() > 2)
        apply.offset = values[2];
    }
    return apply;
  }

  return ScpiCmd{line};
}

} // namespace benchio
