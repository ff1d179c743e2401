#include "bench-io/pipeline/MeasurementSink.hpp"
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <vector>

namespace benchio {

namespace {

std::string format_value(const Measurement &m) {
  if (m.ncv)
    return fmt::format("NCV {}", m.display);
  if (m.overload)
    return m.value < 0 ? "-OL" : "OL";
  std::string symbol = unit_symbol(m.unit);
  if (symbol.empty())
    return fmt::format("{}", m.value);
  return fmt::format("{} {}", m.value, symbol);
}

// RFC 4180: quote fields holding a separator, quote or line break
std::string csv_field(const std::string &text) {
  if (text.find_first_of(",\"\r\n") == std::string::npos)
    return text;
  std::string out = "\"";
  for (char c : text) {
    if (c == '"')
      out += '"';
    out += c;
  }
  return out + "\"";
}

const char *csv_bool(bool b) { return b ? "true" : "false"; }

} // namespace

const char *event_kind_name(EventKind kind) {
  switch (kind) {
  case EventKind::Measurement:
    return "measurement";
  case EventKind::Acknowledgement:
    return "ack";
  case EventKind::Diagnostic:
    return "diagnostic";
  case EventKind::Fatal:
    return "fatal";
  }
  return "unknown";
}

nlohmann::json PipelineEvent::to_json() const {
  nlohmann::json j;
  j["event"] = event_kind_name(kind);
  j["device"] = device_id;
  j["timestamp"] = format_timestamp(timestamp);
  if (!command.empty()) {
    j["command"] = command;
  }
  if (measurement) {
    j["measurement"] = measurement->to_json();
  }
  if (running_min && running_max) {
    j["running_min"] = *running_min;
    j["running_max"] = *running_max;
  }
  if (error) {
    j["error"] = error_kind_name(*error);
  }
  if (!message.empty()) {
    j["message"] = message;
  }
  return j;
}

std::optional<OutputFormat> parse_output_format(const std::string &name) {
  if (name == "text")
    return OutputFormat::Text;
  if (name == "json")
    return OutputFormat::Json;
  if (name == "csv")
    return OutputFormat::Csv;
  return std::nullopt;
}

const char *output_format_name(OutputFormat format) {
  switch (format) {
  case OutputFormat::Text:
    return "text";
  case OutputFormat::Json:
    return "json";
  case OutputFormat::Csv:
    return "csv";
  }
  return "text";
}

std::string ConsoleSink::render(const PipelineEvent &event) const {
  switch (format_) {
  case OutputFormat::Json:
    return event.to_json().dump();
  case OutputFormat::Csv:
    return render_csv(event);
  case OutputFormat::Text:
    break;
  }
  return render_text(event);
}

std::string ConsoleSink::render_csv(const PipelineEvent &event) const {
  if (event.kind != EventKind::Measurement || !event.measurement) {
    return "# " + render_text(event);
  }

  const Measurement &m = *event.measurement;
  std::vector<std::string> fields = {
      format_timestamp(m.timestamp),
      csv_field(event.device_id),
      csv_field(event.command),
      acquisition_mode_name(m.mode),
      csv_field(m.function),
      csv_field(m.display),
      std::isfinite(m.value) ? fmt::format("{}", m.value) : "",
      unit_symbol(m.unit),
      csv_bool(m.overload),
      csv_bool(m.ncv)};

  if (m.flags) {
    const MeterFlags &f = *m.flags;
    fields.push_back(std::to_string(m.bar_graph));
    for (bool b : {f.max, f.min, f.hold, f.rel, f.auto_range, f.low_battery,
                   f.hv_warning, f.dc, f.peak_max, f.peak_min,
                   f.bar_polarity}) {
      fields.push_back(csv_bool(b));
    }
  } else {
    // Instruments without annunciators leave the meter columns empty
    fields.resize(fields.size() + 12);
  }

  return fmt::format("{}", fmt::join(fields, ","));
}

std::string ConsoleSink::render_text(const PipelineEvent &event) const {
  switch (event.kind) {
  case EventKind::Measurement: {
    const Measurement &m = *event.measurement;
    std::string line = fmt::format("{} {}: {}", event.device_id,
                                   acquisition_mode_name(m.mode),
                                   format_value(m));
    if (!m.function.empty())
      line += fmt::format(" [{}]", m.function);
    if (event.running_min && event.running_max) {
      line += fmt::format(" (min {} max {})", *event.running_min,
                          *event.running_max);
    }
    return line;
  }
  case EventKind::Acknowledgement:
    return fmt::format("{} {}: OK", event.device_id, event.command);
  case EventKind::Diagnostic:
    return fmt::format("{} {}: {}: {}", event.device_id, event.command,
                       event.error ? error_kind_name(*event.error) : "Error",
                       event.message);
  case EventKind::Fatal:
    return fmt::format("{}: FATAL {}: {}", event.device_id,
                       event.error ? error_kind_name(*event.error) : "Error",
                       event.message);
  }
  return "";
}

void ConsoleSink::on_event(const PipelineEvent &event) {
  if (format_ == OutputFormat::Csv && !header_written_) {
    fmt::print(out_, "{}\n", CSV_HEADER);
    header_written_ = true;
  }
  fmt::print(out_, "{}\n", render(event));
}

void CollectingSink::on_event(const PipelineEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<PipelineEvent> CollectingSink::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<Measurement> CollectingSink::measurements() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Measurement> result;
  for (const auto &e : events_) {
    if (e.measurement)
      result.push_back(*e.measurement);
  }
  return result;
}

std::vector<PipelineEvent> CollectingSink::of_kind(EventKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PipelineEvent> result;
  for (const auto &e : events_) {
    if (e.kind == kind)
      result.push_back(e);
  }
  return result;
}

void CollectingSink::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

} // namespace benchio
