#pragma once
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace benchio {

enum class Unit {
  None,
  Volt,
  Amp,
  Ohm,
  Hertz,
  Farad,
  Percent,
  Celsius,
  Fahrenheit,
  Ratio
};

/// Acquisition mode a measurement originated from
enum class AcquisitionMode { Measure, MinMax, Query };

/// Multimeter annunciators decoded alongside a reading
struct MeterFlags {
  bool max{false};
  bool min{false};
  bool hold{false};
  bool rel{false};
  bool auto_range{false};
  bool low_battery{false};
  bool hv_warning{false};
  bool dc{false};
  bool peak_max{false};
  bool peak_min{false};
  bool bar_polarity{false};
};

/// A decoded measurement value, normalized to the base unit (a 350 mV
/// reading is stored as 0.35 V). Produced only by codecs.
struct Measurement {
  double value{0.0};
  Unit unit{Unit::None};
  AcquisitionMode mode{AcquisitionMode::Measure};
  std::chrono::system_clock::time_point timestamp;

  // Instrument context, empty when the instrument does not report it
  std::string function; // "DCV", "OHM", ...
  std::string display;  // display text as shown on the instrument
  bool overload{false}; // value is +inf
  bool ncv{false};      // non-contact voltage indication, value is NaN
  uint16_t bar_graph{0};
  std::optional<MeterFlags> flags;

  nlohmann::json to_json() const;
};

const char *unit_symbol(Unit unit);
const char *acquisition_mode_name(AcquisitionMode mode);

/// ISO-8601 UTC with milliseconds
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace benchio
