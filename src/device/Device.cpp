#include "bench-io/device/Device.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace benchio {

const char *device_mode_name(DeviceMode mode) {
  switch (mode) {
  case DeviceMode::Idle:
    return "Idle";
  case DeviceMode::Measuring:
    return "Measuring";
  case DeviceMode::MinMaxTracking:
    return "MinMaxTracking";
  }
  return "Unknown";
}

bool DeviceInfo::supports(TransportKind kind) const {
  return std::find(transports.begin(), transports.end(), kind) !=
         transports.end();
}

Device::Device(DeviceInfo info, ProtocolCodec codec,
               std::unique_ptr<Transport> transport)
    : info_(std::move(info)), codec_(std::move(codec)),
      transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("Device requires a transport");
  }
}

EncodedRequest Device::prepare(const Command &cmd) {
  if (!is_raw(cmd)) {
    CommandKind kind = command_kind(cmd);
    if (!supports(kind)) {
      throw CapabilityError(fmt::format("{} does not support {}", id(),
                                        command_kind_name(kind)));
    }
    codec_.validate(cmd);
  }

  EncodedRequest req = codec_.encode(cmd);
  LOG_DEBUG("DEVICE", id(), "{} -> {} {} bytes", to_string(cmd),
            transfer_kind_name(req.frame.transfer), req.frame.size());
  return req;
}

void Device::on_executed(const Command &cmd) {
  DeviceMode before = state_.mode;
  const Command &inner = unwrap_raw(cmd);

  if (std::holds_alternative<MeasureCmd>(inner)) {
    if (state_.mode == DeviceMode::Idle)
      state_.mode = DeviceMode::Measuring;
  } else if (std::holds_alternative<MinMaxCmd>(inner)) {
    if (state_.mode != DeviceMode::MinMaxTracking) {
      state_.running_min.reset();
      state_.running_max.reset();
    }
    state_.mode = DeviceMode::MinMaxTracking;
  } else if (std::holds_alternative<ResetCmd>(inner)) {
    state_.clear();
  } else if (const auto *key = std::get_if<KeyCmd>(&inner)) {
    if (key->key == MeterKey::NotMinMax &&
        state_.mode == DeviceMode::MinMaxTracking)
      state_.mode = DeviceMode::Measuring;
  }

  if (state_.mode != before) {
    LOG_DEBUG("DEVICE", id(), "{} -> {}", device_mode_name(before),
              device_mode_name(state_.mode));
  }
}

void Device::record(const Measurement &m) {
  ++state_.samples;
  if (state_.mode != DeviceMode::MinMaxTracking || !std::isfinite(m.value))
    return;

  if (!state_.running_min || m.value < *state_.running_min)
    state_.running_min = m.value;
  if (!state_.running_max || m.value > *state_.running_max)
    state_.running_max = m.value;
}

void Device::stop() {
  if (state_.mode != DeviceMode::Idle) {
    LOG_DEBUG("DEVICE", id(), "{} -> Idle", device_mode_name(state_.mode));
  }
  state_.mode = DeviceMode::Idle;
}

void Device::rebind(std::unique_ptr<Transport> transport) {
  if (!transport) {
    throw std::invalid_argument("Device requires a transport");
  }
  if (transport_->is_open()) {
    throw std::logic_error(
        fmt::format("{}: close {} before rebinding", id(),
                    transport_->describe()));
  }
  transport_ = std::move(transport);
  activated_ = false;
  state_.clear();
}

Device::Session::Session(Device &device) : device_(device) {
  if (device_.activated_) {
    throw TransportError(
        ErrorKind::TransportOpenError,
        fmt::format("{} was already opened for {}",
                    device_.transport_->describe(), device_.id()));
  }
  device_.transport_->open();
  device_.activated_ = true;
  device_.codec_.reset();
  device_.state_.clear();
  LOG_INFO("DEVICE", device_.id(), "Session opened on {}",
           device_.transport_->describe());
}

Device::Session::~Session() {
  device_.stop();
  device_.transport_->close();
  LOG_INFO("DEVICE", device_.id(), "Session closed");
}

} // namespace benchio
