#pragma once
#include "bench-io/Errors.hpp"
#include "bench-io/pipeline/MeasurementPipeline.hpp"
#include "bench-io/transport/Transport.hpp"
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace benchio {

/// Process exit status of bench-io
namespace exit_code {
constexpr int OK = 0;
constexpr int USAGE = 1;
constexpr int PARSE = 2;
constexpr int RESOLUTION = 3;
constexpr int TRANSPORT = 4;
constexpr int COMMAND_FAILED = 5;
constexpr int INTERRUPTED = 130;
} // namespace exit_code

/// Malformed command line
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CliOptions {
  std::optional<std::string> device;
  std::optional<std::string> hid;
  std::optional<std::string> usb;
  std::optional<std::string> scpi;
  std::optional<std::string> commands;
  std::optional<std::string> config;
  std::optional<std::string> log_level;
  std::optional<std::string> format;
  std::optional<long> timeout_ms;
  bool list_devices{false};
  bool help{false};

  /// Accepts "--name=value" and "--name value". Throws UsageError.
  static CliOptions parse(int argc, const char *const *argv);

  /// Exactly one of --hid/--usb/--scpi. Throws UsageError.
  TransportDescriptor descriptor() const;
};

int exit_code_for(ErrorKind kind);
int exit_code_for(const RunSummary &summary);

/// Print "Error: <kind>: <message>" to `err` whatever the log level, and
/// return the matching exit code
int report_error(std::ostream &err, const BenchError &error);

} // namespace benchio
