#include "bench-io/CommandParser.hpp"
#include "bench-io/Config.hpp"
#include "bench-io/Logger.hpp"
#include "bench-io/cli/CliOptions.hpp"
#include "bench-io/device/DeviceRegistry.hpp"
#include "bench-io/pipeline/MeasurementPipeline.hpp"
#include "bench-io/pipeline/MeasurementSink.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace benchio;

static std::atomic<bool> g_interrupted{false};

void signal_handler(int sig) {
  (void)sig;
  g_interrupted = true;
}

void print_usage() {
  std::cout << "Usage: bench-io --device=<id> (--hid=<path> | --usb=<vid>:<pid> "
               "| --scpi=<host[:port]>)\n";
  std::cout << "                --commands=<expr>[,<expr>...] [options]\n";
  std::cout << "       bench-io --list-devices\n";
  std::cout << "\nTransports:\n";
  std::cout << "  --hid=<path>          hidraw node, e.g. /dev/hidraw0\n";
  std::cout << "  --usb=<vid>:<pid>     USB ids in hex, e.g. 2e8a:000a\n";
  std::cout << "  --scpi=<host[:port]>  SCPI socket, port defaults to 5025\n";
  std::cout << "\nCommands:\n";
  std::cout << "  Measure, MinMax, Reset\n";
  std::cout << "  Apply:<wave>[, <freq>[, <amp>[, <offset>]]]   e.g. "
               "Apply:Sin, 10kHz, 3, 0.4\n";
  std::cout << "  Hold, Rel, Range, Auto, Lamp, Select1, Select2, NotMinMax, "
               "PMinMax, NotPeak\n";
  std::cout << "  Scpi:<line>           free-form SCPI, e.g. Scpi:*IDN?\n";
  std::cout << "  Raw:<command>         send without device checks\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config=<yaml>       configuration file\n";
  std::cout << "  --log-level=<level>   trace|debug|info|warn|error "
               "(default: info)\n";
  std::cout << "  --format=<fmt>        text|json|csv (default: text)\n";
  std::cout << "  --timeout-ms=<n>      read timeout per attempt\n";
  std::cout << "  --list-devices        list supported devices and exit\n";
  std::cout << "  --help                show this help\n";
  std::cout << "\nExit codes: 0 ok, 1 usage/config, 2 command parse, "
               "3 device resolution,\n";
  std::cout << "            4 transport, 5 command failed, 130 interrupted\n";
}

void print_devices() {
  for (const auto &info : DeviceRegistry::instance().list_devices()) {
    std::string caps;
    for (CommandKind kind : info.capabilities) {
      caps += (caps.empty() ? "" : ",") + std::string(command_kind_name(kind));
    }
    std::string transports;
    for (TransportKind kind : info.transports) {
      transports += (transports.empty() ? "" : ",") +
                    std::string(transport_kind_name(kind));
    }
    std::cout << fmt::format("{:<22}{:<12}{:<36}{}\n", info.id, transports,
                             caps, info.description);
  }
}

int main(int argc, char **argv) {
  CliOptions opts;
  try {
    opts = CliOptions::parse(argc, argv);
  } catch (const UsageError &e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    print_usage();
    return exit_code::USAGE;
  }

  if (opts.help) {
    print_usage();
    return exit_code::OK;
  }

  BenchConfig config;
  try {
    if (opts.config) {
      config = BenchConfig::load(*opts.config);
    }
  } catch (const ConfigError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return exit_code::USAGE;
  }

  std::string level = opts.log_level.value_or(config.logging.level);
  BenchLogger::instance().init(config.logging.file, parse_log_level(level));
  BenchLogger::instance().set_console_level(parse_log_level(level));

  if (opts.list_devices) {
    print_devices();
    return exit_code::OK;
  }

  if (opts.format) {
    auto format = parse_output_format(*opts.format);
    if (!format) {
      std::cerr << "Error: --format must be text, json or csv\n";
      return exit_code::USAGE;
    }
    config.format = *format;
  }
  if (opts.timeout_ms) {
    config.io.read_timeout = std::chrono::milliseconds(*opts.timeout_ms);
  }

  if (!opts.device || !opts.commands) {
    std::cerr << "Error: --device and --commands are required\n\n";
    print_usage();
    return exit_code::USAGE;
  }

  TransportDescriptor descriptor;
  try {
    descriptor = opts.descriptor();
  } catch (const UsageError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return exit_code::USAGE;
  }

  // All commands are parsed before any I/O
  std::vector<Command> commands;
  try {
    commands = CommandParser::parse_list(*opts.commands);
  } catch (const ParseError &e) {
    return report_error(std::cerr, e);
  }

  std::unique_ptr<Device> device;
  try {
    device = DeviceRegistry::instance().resolve(*opts.device, descriptor);
  } catch (const ResolutionError &e) {
    return report_error(std::cerr, e);
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  LOG_INFO("CLI", device->id(), "Running {} commands on {}", commands.size(),
           describe(descriptor));

  ConsoleSink sink(config.format);
  MeasurementPipeline pipeline(config.io, &g_interrupted);
  RunSummary summary = pipeline.run(*device, commands, sink);

  BenchLogger::instance().shutdown();
  return exit_code_for(summary);
}
