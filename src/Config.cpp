#include "bench-io/Config.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/Logger.hpp"
#include <set>

namespace benchio {

namespace {

const std::set<std::string> LOG_LEVELS = {"trace", "debug", "info",
                                          "warn",  "error", "off"};

void add_error(ValidationResult &result, const std::string &path,
               const YAML::Node &node, const std::string &msg) {
  result.valid = false;
  const YAML::Mark mark = node.Mark();
  result.errors.push_back({path, msg, mark.line + 1, mark.column + 1});
}

void check_keys(ValidationResult &result, const YAML::Node &map,
                const std::string &path, const std::set<std::string> &known) {
  for (const auto &kv : map) {
    std::string key = kv.first.as<std::string>();
    if (known.count(key) == 0) {
      result.warnings.push_back("Unknown key " + path + "/" + key);
    }
  }
}

bool check_map(ValidationResult &result, const YAML::Node &node,
               const std::string &path) {
  if (!node.IsDefined() || node.IsNull())
    return false;
  if (!node.IsMap()) {
    add_error(result, path, node, "expected a mapping");
    return false;
  }
  return true;
}

void check_integer(ValidationResult &result, const YAML::Node &parent,
                   const std::string &key, const std::string &path,
                   long long min_value, long long max_value) {
  const YAML::Node node = parent[key];
  if (!node.IsDefined())
    return;
  std::string full = path + "/" + key;
  if (!node.IsScalar()) {
    add_error(result, full, node, "expected an integer");
    return;
  }
  try {
    long long v = node.as<long long>();
    if (v < min_value || v > max_value) {
      add_error(result, full, node,
                fmt::format("must be between {} and {}", min_value,
                            max_value));
    }
  } catch (const YAML::BadConversion &) {
    add_error(result, full, node, "expected an integer");
  }
}

void check_choice(ValidationResult &result, const YAML::Node &parent,
                  const std::string &key, const std::string &path,
                  const std::set<std::string> &choices) {
  const YAML::Node node = parent[key];
  if (!node.IsDefined())
    return;
  std::string full = path + "/" + key;
  if (!node.IsScalar() || choices.count(node.as<std::string>()) == 0) {
    std::string allowed;
    for (const auto &c : choices) {
      allowed += (allowed.empty() ? "" : "|") + c;
    }
    add_error(result, full, node, "expected one of " + allowed);
  }
}

// Present and a mapping; a missing key yields an invalid node on const
// lookups, which throws from IsMap()
bool is_section(const YAML::Node &node) {
  return node.IsDefined() && node.IsMap();
}

} // namespace

std::string ValidationResult::summary() const {
  std::string out;
  for (const auto &e : errors) {
    if (!out.empty())
      out += "\n";
    out += fmt::format("{}: {} (line {}, column {})", e.path, e.message,
                       e.line, e.column);
  }
  return out;
}

ValidationResult BenchConfig::validate(const YAML::Node &doc) {
  ValidationResult result;
  if (!doc.IsDefined() || doc.IsNull())
    return result;
  if (!doc.IsMap()) {
    add_error(result, "", doc, "configuration root must be a mapping");
    return result;
  }

  check_keys(result, doc, "", {"logging", "io", "output"});

  const YAML::Node logging = doc["logging"];
  if (check_map(result, logging, "/logging")) {
    check_keys(result, logging, "/logging", {"level", "file"});
    check_choice(result, logging, "level", "/logging", LOG_LEVELS);
    const YAML::Node file = logging["file"];
    if (file.IsDefined() && !file.IsScalar() && !file.IsNull()) {
      add_error(result, "/logging/file", file, "expected a file name");
    }
  }

  const YAML::Node io = doc["io"];
  if (check_map(result, io, "/io")) {
    check_keys(result, io, "/io",
               {"read_timeout_ms", "max_io_retries", "max_timeouts",
                "backoff_initial_ms", "backoff_max_ms"});
    const long long max_ms = RetryPolicy::MAX_TIMEOUT_MS;
    const long long max_retries = RetryPolicy::MAX_RETRIES;
    check_integer(result, io, "read_timeout_ms", "/io", 1, max_ms);
    check_integer(result, io, "max_io_retries", "/io", 0, max_retries);
    check_integer(result, io, "max_timeouts", "/io", 0, max_retries);
    check_integer(result, io, "backoff_initial_ms", "/io", 0, max_ms);
    check_integer(result, io, "backoff_max_ms", "/io", 0, max_ms);
  }

  const YAML::Node output = doc["output"];
  if (check_map(result, output, "/output")) {
    check_keys(result, output, "/output", {"format"});
    check_choice(result, output, "format", "/output",
                 {"text", "json", "csv"});
  }

  return result;
}

BenchConfig BenchConfig::from_yaml(const YAML::Node &doc) {
  ValidationResult result = validate(doc);
  for (const auto &w : result.warnings) {
    LOG_WARN("CONFIG", "VALIDATE", "{}", w);
  }
  if (!result.valid) {
    throw ConfigError("Invalid configuration:\n" + result.summary());
  }

  BenchConfig config;
  if (!doc.IsDefined() || doc.IsNull())
    return config;

  if (const YAML::Node logging = doc["logging"]; is_section(logging)) {
    if (logging["level"])
      config.logging.level = logging["level"].as<std::string>();
    if (logging["file"]) {
      config.logging.file =
          logging["file"].IsNull() ? "" : logging["file"].as<std::string>();
    }
  }

  if (const YAML::Node io = doc["io"]; is_section(io)) {
    auto ms = [&](const char *key, std::chrono::milliseconds &out) {
      if (io[key])
        out = std::chrono::milliseconds(io[key].as<long long>());
    };
    ms("read_timeout_ms", config.io.read_timeout);
    ms("backoff_initial_ms", config.io.backoff_initial);
    ms("backoff_max_ms", config.io.backoff_max);
    if (io["max_io_retries"])
      config.io.max_io_retries = io["max_io_retries"].as<int>();
    if (io["max_timeouts"])
      config.io.max_timeouts = io["max_timeouts"].as<int>();
  }

  if (const YAML::Node output = doc["output"]; is_section(output)) {
    if (output["format"])
      config.format = *parse_output_format(output["format"].as<std::string>());
  }

  return config;
}

BenchConfig BenchConfig::parse(const std::string &yaml_text) {
  try {
    return from_yaml(YAML::Load(yaml_text));
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("YAML parse error: ") + e.what());
  }
}

BenchConfig BenchConfig::load(const std::string &path) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    throw ConfigError("Cannot read configuration file " + path);
  } catch (const YAML::Exception &e) {
    throw ConfigError(path + ": YAML parse error: " + e.what());
  }
  LOG_DEBUG("CONFIG", path, "Loaded");
  try {
    return from_yaml(doc);
  } catch (const YAML::Exception &e) {
    throw ConfigError(path + ": " + e.what());
  }
}

} // namespace benchio
