#include "bench-io/Command.hpp"
#include <array>
#include <fmt/format.h>
#include <utility>

namespace benchio {

namespace {

struct WaveformName {
  Waveform waveform;
  const char *name;
};

constexpr std::array<WaveformName, 16> WAVEFORMS = {{
    {Waveform::Sin, "Sin"},
    {Waveform::Squ, "Squ"},
    {Waveform::Ramp, "Ramp"},
    {Waveform::Noise, "Noise"},
    {Waveform::PPulse, "PPulse"},
    {Waveform::NPulse, "NPulse"},
    {Waveform::Stair, "Stair"},
    {Waveform::HSine, "HSine"},
    {Waveform::LSine, "LSine"},
    {Waveform::Rexp, "Rexp"},
    {Waveform::RLog, "RLog"},
    {Waveform::Tang, "Tang"},
    {Waveform::Sinc, "Sinc"},
    {Waveform::Round, "Round"},
    {Waveform::Card, "Card"},
    {Waveform::Quake, "Quake"},
}};

struct KeyName {
  MeterKey key;
  const char *name;
};

constexpr std::array<KeyName, 10> KEYS = {{
    {MeterKey::NotMinMax, "NotMinMax"},
    {MeterKey::Range, "Range"},
    {MeterKey::Auto, "Auto"},
    {MeterKey::Rel, "Rel"},
    {MeterKey::Select2, "Select2"},
    {MeterKey::Hold, "Hold"},
    {MeterKey::Lamp, "Lamp"},
    {MeterKey::Select1, "Select1"},
    {MeterKey::PMinMax, "PMinMax"},
    {MeterKey::NotPeak, "NotPeak"},
}};

// Shortest decimal text that reads back to the same double
std::string format_number(double v) { return fmt::format("{}", v); }

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

bool same_optional(const std::optional<double> &a,
                   const std::optional<double> &b) {
  if (a.has_value() != b.has_value())
    return false;
  return !a || *a == *b;
}

} // namespace

Command make_raw(Command inner) {
  return RawCmd{std::make_shared<const Command>(std::move(inner))};
}

CommandKind command_kind(const Command &cmd) {
  return std::visit(overloaded{
                        [](const MeasureCmd &) { return CommandKind::Measure; },
                        [](const MinMaxCmd &) { return CommandKind::MinMax; },
                        [](const ResetCmd &) { return CommandKind::Reset; },
                        [](const ApplyCmd &) { return CommandKind::Apply; },
                        [](const KeyCmd &) { return CommandKind::Key; },
                        [](const ScpiCmd &) { return CommandKind::Scpi; },
                        [](const RawCmd &) { return CommandKind::Raw; },
                    },
                    cmd);
}

const Command &unwrap_raw(const Command &cmd) {
  const Command *current = &cmd;
  while (const auto *raw = std::get_if<RawCmd>(current)) {
    if (!raw->inner)
      break;
    current = raw->inner.get();
  }
  return *current;
}

CommandKind effective_kind(const Command &cmd) {
  return command_kind(unwrap_raw(cmd));
}

bool is_raw(const Command &cmd) { return std::holds_alternative<RawCmd>(cmd); }

std::string to_string(const Command &cmd) {
  return std::visit(
      overloaded{
          [](const MeasureCmd &) -> std::string { return "Measure"; },
          [](const MinMaxCmd &) -> std::string { return "MinMax"; },
          [](const ResetCmd &) -> std::string { return "Reset"; },
          [](const ApplyCmd &a) -> std::string {
            std::string out =
                fmt::format("Apply:{}", waveform_name(a.waveform));
            if (a.frequency)
              out += fmt::format(", {}Hz", format_number(*a.frequency));
            if (a.amplitude)
              out += fmt::format(", {}", format_number(*a.amplitude));
            if (a.offset)
              out += fmt::format(", {}", format_number(*a.offset));
            return out;
          },
          [](const KeyCmd &k) -> std::string { return meter_key_name(k.key); },
          [](const ScpiCmd &s) -> std::string { return "Scpi:" + s.text; },
          [](const RawCmd &r) -> std::string {
            return r.inner ? "Raw:" + to_string(*r.inner) : "Raw:";
          },
      },
      cmd);
}

const char *command_kind_name(CommandKind kind) {
  switch (kind) {
  case CommandKind::Measure:
    return "Measure";
  case CommandKind::MinMax:
    return "MinMax";
  case CommandKind::Reset:
    return "Reset";
  case CommandKind::Apply:
    return "Apply";
  case CommandKind::Key:
    return "Key";
  case CommandKind::Scpi:
    return "Scpi";
  case CommandKind::Raw:
    return "Raw";
  }
  return "Unknown";
}

const char *waveform_name(Waveform waveform) {
  for (const auto &w : WAVEFORMS) {
    if (w.waveform == waveform)
      return w.name;
  }
  return "Unknown";
}

const char *meter_key_name(MeterKey key) {
  for (const auto &k : KEYS) {
    if (k.key == key)
      return k.name;
  }
  return "Unknown";
}

std::optional<Waveform> waveform_from_name(const std::string &name) {
  if (name == "Sine")
    return Waveform::Sin;
  if (name == "Square")
    return Waveform::Squ;
  for (const auto &w : WAVEFORMS) {
    if (name == w.name)
      return w.waveform;
  }
  return std::nullopt;
}

std::optional<MeterKey> meter_key_from_name(const std::string &name) {
  for (const auto &k : KEYS) {
    if (name == k.name)
      return k.key;
  }
  return std::nullopt;
}

bool same_command(const Command &a, const Command &b) {
  if (a.index() != b.index())
    return false;
  return std::visit(
      overloaded{
          [&](const ApplyCmd &x) {
            const auto &y = std::get<ApplyCmd>(b);
            return x.waveform == y.waveform &&
                   same_optional(x.frequency, y.frequency) &&
                   same_optional(x.amplitude, y.amplitude) &&
                   same_optional(x.offset, y.offset);
          },
          [&](const KeyCmd &x) { return x.key == std::get<KeyCmd>(b).key; },
          [&](const ScpiCmd &x) {
            return x.text == std::get<ScpiCmd>(b).text;
          },
          [&](const RawCmd &x) {
            const auto &y = std::get<RawCmd>(b);
            if (!x.inner || !y.inner)
              return x.inner == y.inner;
            return same_command(*x.inner, *y.inner);
          },
          [](const auto &) { return true; },
      },
      a);
}

} // namespace benchio
