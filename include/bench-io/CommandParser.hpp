#pragma once
#include "bench-io/Command.hpp"
#include <string>
#include <vector>

namespace benchio {

/// Parses textual command expressions:
///
///   Name[:Arg[,Arg]*]       e.g. "Measure", "Apply:Sin, 10kHz, 3, 0.4"
///   Raw:<expression>        transmit without device-side checks
///   Scpi:<verbatim text>    free-form SCPI line
///
/// Parsing is pure and does not know which device will run the result.
/// Throws ParseError (UnknownCommand, ArgCountMismatch, ArgParseError).
class CommandParser {
public:
  static Command parse(const std::string &text);

  /// Split a comma-separated list of expressions. A segment continues the
  /// previous expression's arguments unless it starts with a command name.
  static std::vector<std::string> split_list(const std::string &text);

  /// split_list() followed by parse() of every expression
  static std::vector<Command> parse_list(const std::string &text);

  /// Number with optional multiplier and quantity word: "10kHz", "0.4",
  /// "5.2Vpp", "-200mVdc"
  static double parse_quantity(const std::string &arg);

  static bool is_command_name(const std::string &name);
};

} // namespace benchio
