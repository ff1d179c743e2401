#pragma once
#include "bench-io/Errors.hpp"
#include "bench-io/Measurement.hpp"
#include <cstdio>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace benchio {

enum class EventKind { Measurement, Acknowledgement, Diagnostic, Fatal };

const char *event_kind_name(EventKind kind);

/// One pipeline outcome, delivered to the sink in command order
struct PipelineEvent {
  EventKind kind{EventKind::Measurement};
  std::string device_id;
  std::string command; // canonical text of the originating command
  std::chrono::system_clock::time_point timestamp;

  std::optional<Measurement> measurement;
  std::optional<double> running_min; // set while MinMax tracking
  std::optional<double> running_max;

  std::optional<ErrorKind> error; // Diagnostic and Fatal
  std::string message;            // error text or acknowledgement detail

  nlohmann::json to_json() const;
};

class MeasurementSink {
public:
  virtual ~MeasurementSink() = default;
  virtual void on_event(const PipelineEvent &event) = 0;
  virtual void flush() {}
};

enum class OutputFormat { Text, Json, Csv };

/// "text", "json" or "csv"; nullopt otherwise
std::optional<OutputFormat> parse_output_format(const std::string &name);
const char *output_format_name(OutputFormat format);

/// Prints one line per event: human-readable text, a JSON object, or a CSV
/// row. CSV output starts with a header; events other than measurements
/// become "# " comment lines.
class ConsoleSink : public MeasurementSink {
public:
  static constexpr const char *CSV_HEADER =
      "timestamp,device,command,mode,function,display,value,unit,overload,"
      "ncv,bar_graph,max,min,hold,rel,auto,battery,hv_warning,dc,peak_max,"
      "peak_min,bar_polarity";

  explicit ConsoleSink(OutputFormat format = OutputFormat::Text,
                       std::FILE *out = stdout)
      : format_(format), out_(out) {}

  void on_event(const PipelineEvent &event) override;
  void flush() override { std::fflush(out_); }

  /// The line on_event() would print, without newline
  std::string render(const PipelineEvent &event) const;

private:
  std::string render_text(const PipelineEvent &event) const;
  std::string render_csv(const PipelineEvent &event) const;

  OutputFormat format_;
  std::FILE *out_;
  bool header_written_{false};
};

/// Keeps every event in memory
class CollectingSink : public MeasurementSink {
public:
  void on_event(const PipelineEvent &event) override;

  std::vector<PipelineEvent> events() const;
  std::vector<Measurement> measurements() const;
  std::vector<PipelineEvent> of_kind(EventKind kind) const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<PipelineEvent> events_;
};

} // namespace benchio
