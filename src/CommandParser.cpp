#include "bench-io/CommandParser.hpp"
#include "bench-io/Errors.hpp"
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

namespace benchio {

namespace {

std::string trim(const std::string &s) {
  size_t begin = 0;
  while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_args(const std::string &rest) {
  std::vector<std::string> args;
  if (trim(rest).empty())
    return args;
  size_t start = 0;
  while (true) {
    size_t comma = rest.find(',', start);
    args.push_back(trim(rest.substr(start, comma - start)));
    if (comma == std::string::npos)
      break;
    start = comma + 1;
  }
  return args;
}

// Longest words first so "Vpp" is not cut as "V"
constexpr std::array<const char *, 5> QUANTITY_WORDS = {"Vrms", "Vpp", "Vdc",
                                                        "Hz", "V"};

struct Multiplier {
  char suffix;
  double factor;
};

constexpr std::array<Multiplier, 4> MULTIPLIERS = {{
    {'M', 1e6},
    {'k', 1e3},
    {'m', 1e-3},
    {'u', 1e-6},
}};

void expect_no_args(const std::string &name,
                    const std::vector<std::string> &args) {
  if (!args.empty()) {
    throw ParseError(ErrorKind::ArgCountMismatch,
                     fmt::format("'{}' takes no arguments, got {}", name,
                                 args.size()));
  }
}

Command parse_apply(const std::vector<std::string> &raw_args) {
  std::vector<std::string> args = raw_args;

  // "Sin 10kHz, 3, 0.4" is accepted as well as "Sin, 10kHz, 3, 0.4"
  if (!args.empty()) {
    size_t space = args[0].find_first_of(" \t");
    if (space != std::string::npos) {
      std::string wave = trim(args[0].substr(0, space));
      std::string freq = trim(args[0].substr(space));
      args[0] = wave;
      args.insert(args.begin() + 1, freq);
    }
  }

  if (args.empty() || args.size() > 4) {
    throw ParseError(ErrorKind::ArgCountMismatch,
                     fmt::format("'Apply' takes 1 to 4 arguments "
                                 "(waveform[, frequency[, amplitude[, "
                                 "offset]]]), got {}",
                                 args.size()));
  }

  ApplyCmd apply;
  auto waveform = waveform_from_name(args[0]);
  if (!waveform) {
    throw ParseError(ErrorKind::ArgParseError,
                     fmt::format("Unknown waveform: '{}'", args[0]));
  }
  apply.waveform = *waveform;

  if (args.size() > 1)
    apply.frequency = CommandParser::parse_quantity(args[1]);
  if (args.size() > 2)
    apply.amplitude = CommandParser::parse_quantity(args[2]);
  if (args.size() > 3)
    apply.offset = CommandParser::parse_quantity(args[3]);

  return apply;
}

} // namespace

bool CommandParser::is_command_name(const std::string &name) {
  return name == "Measure" || name == "MinMax" || name == "Reset" ||
         name == "Apply" || name == "Raw" || name == "Scpi" ||
         meter_key_from_name(name).has_value();
}

double CommandParser::parse_quantity(const std::string &arg) {
  std::string text = trim(arg);
  if (text.empty()) {
    throw ParseError(ErrorKind::ArgParseError, "Empty argument");
  }

  for (const char *word : QUANTITY_WORDS) {
    if (ends_with(text, word)) {
      text.erase(text.size() - std::char_traits<char>::length(word));
      break;
    }
  }

  double factor = 1.0;
  if (!text.empty()) {
    for (const auto &m : MULTIPLIERS) {
      if (text.back() == m.suffix) {
        factor = m.factor;
        text.pop_back();
        break;
      }
    }
  }

  text = trim(text);
  if (text.empty()) {
    throw ParseError(ErrorKind::ArgParseError,
                     fmt::format("Missing numeric value in '{}'", arg));
  }

  const char *begin = text.c_str();
  char *end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || !std::isfinite(value)) {
    throw ParseError(ErrorKind::ArgParseError,
                     fmt::format("Malformed numeric argument '{}'", arg));
  }
  return value * factor;
}

Command CommandParser::parse(const std::string &text) {
  std::string expr = trim(text);
  if (expr.empty()) {
    throw ParseError(ErrorKind::UnknownCommand, "Empty command");
  }

  size_t colon = expr.find(':');
  std::string name = trim(expr.substr(0, colon));
  std::string rest =
      colon == std::string::npos ? std::string() : expr.substr(colon + 1);

  if (name == "Raw") {
    if (trim(rest).empty()) {
      throw ParseError(ErrorKind::ArgCountMismatch,
                       "'Raw' must wrap a command");
    }
    Command inner = parse(rest);
    // Raw:Raw:X is the same as Raw:X
    if (is_raw(inner))
      return inner;
    return make_raw(std::move(inner));
  }

  if (name == "Scpi") {
    std::string line = trim(rest);
    if (line.empty()) {
      throw ParseError(ErrorKind::ArgCountMismatch,
                       "'Scpi' requires a command line");
    }
    return ScpiCmd{line};
  }

  std::vector<std::string> args = split_args(rest);

  if (name == "Measure") {
    expect_no_args(name, args);
    return MeasureCmd{};
  }
  if (name == "MinMax") {
    expect_no_args(name, args);
    return MinMaxCmd{};
  }
  if (name == "Reset") {
    expect_no_args(name, args);
    return ResetCmd{};
  }
  if (name == "Apply") {
    return parse_apply(args);
  }
  if (auto key = meter_key_from_name(name)) {
    expect_no_args(name, args);
    return KeyCmd{*key};
  }

  throw ParseError(ErrorKind::UnknownCommand,
                   fmt::format("Unknown command: '{}'", name));
}

std::vector<std::string> CommandParser::split_list(const std::string &text) {
  std::vector<std::string> exprs;
  if (trim(text).empty())
    return exprs;

  size_t start = 0;
  while (true) {
    size_t comma = text.find(',', start);
    std::string segment = text.substr(start, comma - start);
    std::string head = trim(segment.substr(0, segment.find(':')));

    bool continues = !exprs.empty() && !is_command_name(head) &&
                     exprs.back().find(':') != std::string::npos;
    if (continues) {
      exprs.back() += "," + segment;
    } else {
      exprs.push_back(trim(segment));
    }

    if (comma == std::string::npos)
      break;
    start = comma + 1;
  }
  return exprs;
}

std::vector<Command> CommandParser::parse_list(const std::string &text) {
  std::vector<Command> commands;
  for (const auto &expr : split_list(text)) {
    commands.push_back(parse(expr));
  }
  return commands;
}

} // namespace benchio
