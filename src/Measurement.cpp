#include "bench-io/Measurement.hpp"
#include <cmath>
#include <ctime>
#include <fmt/format.h>

namespace benchio {

const char *unit_symbol(Unit unit) {
  switch (unit) {
  case Unit::None:
    return "";
  case Unit::Volt:
    return "V";
  case Unit::Amp:
    return "A";
  case Unit::Ohm:
    return "Ohm";
  case Unit::Hertz:
    return "Hz";
  case Unit::Farad:
    return "F";
  case Unit::Percent:
    return "%";
  case Unit::Celsius:
    return "degC";
  case Unit::Fahrenheit:
    return "degF";
  case Unit::Ratio:
    return "hFE";
  }
  return "";
}

const char *acquisition_mode_name(AcquisitionMode mode) {
  switch (mode) {
  case AcquisitionMode::Measure:
    return "Measure";
  case AcquisitionMode::MinMax:
    return "MinMax";
  case AcquisitionMode::Query:
    return "Query";
  }
  return "Unknown";
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count();
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm utc{};
  gmtime_r(&secs, &utc);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                     utc.tm_hour, utc.tm_min, utc.tm_sec, ms % 1000);
}

nlohmann::json Measurement::to_json() const {
  nlohmann::json j;

  // JSON has no inf/NaN: overload and NCV readings carry a null value
  if (std::isfinite(value)) {
    j["value"] = value;
  } else {
    j["value"] = nullptr;
  }
  j["unit"] = unit_symbol(unit);
  j["mode"] = acquisition_mode_name(mode);
  j["timestamp"] = format_timestamp(timestamp);

  if (!function.empty()) {
    j["function"] = function;
  }
  if (!display.empty()) {
    j["display"] = display;
  }
  if (overload) {
    j["overload"] = true;
  }
  if (ncv) {
    j["ncv"] = true;
  }

  if (flags) {
    j["bar_graph"] = bar_graph;
    j["flags"] = {{"max", flags->max},
                  {"min", flags->min},
                  {"hold", flags->hold},
                  {"rel", flags->rel},
                  {"auto", flags->auto_range},
                  {"battery", flags->low_battery},
                  {"hv_warning", flags->hv_warning},
                  {"dc", flags->dc},
                  {"peak_max", flags->peak_max},
                  {"peak_min", flags->peak_min},
                  {"bar_polarity", flags->bar_polarity}};
  }

  return j;
}

} // namespace benchio
