#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace benchio {

enum class Waveform {
  Sin,
  Squ,
  Ramp,
  Noise,
  PPulse,
  NPulse,
  Stair,
  HSine,
  LSine,
  Rexp,
  RLog,
  Tang,
  Sinc,
  Round,
  Card,
  Quake
};

/// Multimeter front-panel keys
enum class MeterKey {
  NotMinMax,
  Range,
  Auto,
  Rel,
  Select2,
  Hold,
  Lamp,
  Select1,
  PMinMax,
  NotPeak
};

/// Discriminator of Command, also the unit of a capability set
enum class CommandKind { Measure, MinMax, Reset, Apply, Key, Scpi, Raw };

struct MeasureCmd {};
struct MinMaxCmd {};
struct ResetCmd {};

/// Frequency in Hz, amplitude in Vpp, offset in V. Trailing fields may be
/// omitted; the instrument keeps its current setting for them.
struct ApplyCmd {
  Waveform waveform{Waveform::Sin};
  std::optional<double> frequency;
  std::optional<double> amplitude;
  std::optional<double> offset;
};

struct KeyCmd {
  MeterKey key{MeterKey::Hold};
};

/// Free-form SCPI line, a query when it contains '?'
struct ScpiCmd {
  std::string text;

  bool is_query() const { return text.find('?') != std::string::npos; }
};

struct RawCmd;

using Command = std::variant<MeasureCmd, MinMaxCmd, ResetCmd, ApplyCmd,
                             KeyCmd, ScpiCmd, RawCmd>;

/// Wraps another command: transmitted without capability or range checks
struct RawCmd {
  std::shared_ptr<const Command> inner;
};

Command make_raw(Command inner);

CommandKind command_kind(const Command &cmd);

/// Kind of the command after unwrapping any Raw layers
CommandKind effective_kind(const Command &cmd);

/// The command with all Raw layers removed
const Command &unwrap_raw(const Command &cmd);

bool is_raw(const Command &cmd);

/// Canonical text form, parseable by CommandParser
/// (e.g. "Apply:Sin, 10000Hz, 3, 0.4")
std::string to_string(const Command &cmd);

const char *command_kind_name(CommandKind kind);
const char *waveform_name(Waveform waveform);
const char *meter_key_name(MeterKey key);

std::optional<Waveform> waveform_from_name(const std::string &name);
std::optional<MeterKey> meter_key_from_name(const std::string &name);

/// Semantic equality (Raw compares its inner command)
bool same_command(const Command &a, const Command &b);

} // namespace benchio
