#pragma once
#include "bench-io/pipeline/MeasurementPipeline.hpp"
#include "bench-io/pipeline/MeasurementSink.hpp"
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace benchio {

struct ValidationError {
  std::string path;
  std::string message;
  int line;
  int column;
};

struct ValidationResult {
  bool valid{true};
  std::vector<ValidationError> errors;
  std::vector<std::string> warnings;

  /// "path: message" lines joined for error reporting
  std::string summary() const;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file{"bench_io.log"};
};

/// Settings from the optional YAML file; CLI flags override them.
///
///   logging: {level, file}
///   io:      {read_timeout_ms, max_io_retries, max_timeouts,
///             backoff_initial_ms, backoff_max_ms}
///   output:  {format}
struct BenchConfig {
  LoggingConfig logging;
  RetryPolicy io;
  OutputFormat format{OutputFormat::Text};

  /// Check types and ranges; unknown keys are warnings
  static ValidationResult validate(const YAML::Node &doc);

  /// Throws ConfigError when validation fails
  static BenchConfig from_yaml(const YAML::Node &doc);
  static BenchConfig parse(const std::string &yaml_text);
  static BenchConfig load(const std::string &path);
};

} // namespace benchio
