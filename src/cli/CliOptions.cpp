#include "bench-io/cli/CliOptions.hpp"
#include "bench-io/Logger.hpp"
#include <cstdlib>
#include <fmt/format.h>
#include <map>

namespace benchio {

CliOptions CliOptions::parse(int argc, const char *const *argv) {
  CliOptions opts;

  const std::map<std::string, std::optional<std::string> CliOptions::*>
      string_flags = {
          {"--device", &CliOptions::device},
          {"--hid", &CliOptions::hid},
          {"--usb", &CliOptions::usb},
          {"--scpi", &CliOptions::scpi},
          {"--commands", &CliOptions::commands},
          {"--config", &CliOptions::config},
          {"--log-level", &CliOptions::log_level},
          {"--format", &CliOptions::format},
      };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      opts.help = true;
      continue;
    }
    if (arg == "--list-devices") {
      opts.list_devices = true;
      continue;
    }

    std::string name = arg;
    std::optional<std::string> value;
    size_t eq = arg.find('=');
    if (eq != std::string::npos) {
      name = arg.substr(0, eq);
      value = arg.substr(eq + 1);
    }

    bool is_timeout = name == "--timeout-ms";
    auto it = string_flags.find(name);
    if (it == string_flags.end() && !is_timeout) {
      throw UsageError("Unknown option: " + arg);
    }

    if (!value) {
      if (i + 1 >= argc) {
        throw UsageError("Missing value for " + name);
      }
      value = argv[++i];
    }

    if (is_timeout) {
      char *end = nullptr;
      long ms = std::strtol(value->c_str(), &end, 10);
      if (value->empty() || *end != '\0' || ms <= 0) {
        throw UsageError("Invalid --timeout-ms: " + *value);
      }
      if (ms > RetryPolicy::MAX_TIMEOUT_MS) {
        throw UsageError(fmt::format("--timeout-ms must be at most {}",
                                     RetryPolicy::MAX_TIMEOUT_MS));
      }
      opts.timeout_ms = ms;
      continue;
    }

    if (value->empty()) {
      throw UsageError("Empty value for " + name);
    }
    opts.*(it->second) = *value;
  }

  return opts;
}

TransportDescriptor CliOptions::descriptor() const {
  int given = (hid ? 1 : 0) + (usb ? 1 : 0) + (scpi ? 1 : 0);
  if (given != 1) {
    throw UsageError("Exactly one of --hid, --usb or --scpi is required");
  }

  try {
    if (hid)
      return HidDescriptor{*hid, std::nullopt};
    if (usb)
      return parse_usb_address(*usb);
    return parse_socket_address(*scpi);
  } catch (const ParseError &e) {
    throw UsageError(e.what());
  }
}

int exit_code_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnknownCommand:
  case ErrorKind::ArgCountMismatch:
  case ErrorKind::ArgParseError:
    return exit_code::PARSE;
  case ErrorKind::UnknownDevice:
  case ErrorKind::UnsupportedTransport:
    return exit_code::RESOLUTION;
  case ErrorKind::TransportOpenError:
  case ErrorKind::TransportIoError:
  case ErrorKind::IoTimeout:
    return exit_code::TRANSPORT;
  case ErrorKind::ProtocolDecodeError:
  case ErrorKind::CapabilityMismatch:
    return exit_code::COMMAND_FAILED;
  case ErrorKind::ConfigError:
    return exit_code::USAGE;
  }
  return exit_code::USAGE;
}

int report_error(std::ostream &err, const BenchError &error) {
  std::string line =
      fmt::format("{}: {}", error_kind_name(error.kind()), error.what());
  LOG_DEBUG("CLI", "ERROR", "{}", line);
  err << "Error: " << line << "\n";
  return exit_code_for(error.kind());
}

int exit_code_for(const RunSummary &summary) {
  if (summary.interrupted)
    return exit_code::INTERRUPTED;
  if (summary.fatal_error)
    return exit_code_for(*summary.fatal_error);
  if (summary.command_failures > 0 || summary.decode_errors > 0)
    return exit_code::COMMAND_FAILED;
  return exit_code::OK;
}

} // namespace benchio
