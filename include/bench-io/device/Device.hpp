#pragma once
#include "bench-io/Command.hpp"
#include "bench-io/codec/ProtocolCodec.hpp"
#include "bench-io/transport/Transport.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace benchio {

enum class DeviceMode { Idle, Measuring, MinMaxTracking };

const char *device_mode_name(DeviceMode mode);

/// Static metadata of a device model
struct DeviceInfo {
  std::string id;
  std::string description;
  std::set<CommandKind> capabilities;
  std::vector<TransportKind> transports;
  /// Interface and endpoint layout applied to USB descriptors
  std::optional<UsbDescriptor> usb_layout;

  bool supports(CommandKind kind) const {
    return capabilities.count(kind) > 0;
  }
  bool supports(TransportKind kind) const;
};

/// Mutable per-device aggregate, cleared by Reset and at session start
struct DeviceState {
  DeviceMode mode{DeviceMode::Idle};
  std::optional<double> running_min;
  std::optional<double> running_max;
  uint64_t samples{0};

  void clear() { *this = DeviceState{}; }
};

/// One instrument: a codec bound to an exclusively owned transport.
class Device {
public:
  Device(DeviceInfo info, ProtocolCodec codec,
         std::unique_ptr<Transport> transport);

  Device(const Device &) = delete;
  Device &operator=(const Device &) = delete;

  const std::string &id() const { return info_.id; }
  const DeviceInfo &info() const { return info_; }
  bool supports(CommandKind kind) const { return info_.supports(kind); }

  ProtocolCodec &codec() { return codec_; }
  const ProtocolCodec &codec() const { return codec_; }
  Transport &transport() { return *transport_; }
  const DeviceState &state() const { return state_; }

  /// Capability and parameter checks (skipped for Raw), then encode.
  /// Throws CapabilityError.
  EncodedRequest prepare(const Command &cmd);

  /// State transition after the command reached the device
  void on_executed(const Command &cmd);

  /// Fold a decoded sample into the running bounds when tracking
  void record(const Measurement &m);

  /// Measuring/MinMaxTracking -> Idle. Bounds are kept.
  void stop();

  /// Replace the transport. The current one must be closed.
  void rebind(std::unique_ptr<Transport> transport);

  /// Scoped activation: opens the transport, resets codec and state, and
  /// closes the transport on every exit path.
  class Session {
  public:
    explicit Session(Device &device);
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

  private:
    Device &device_;
  };

private:
  DeviceInfo info_;
  ProtocolCodec codec_;
  std::unique_ptr<Transport> transport_;
  DeviceState state_;
  bool activated_{false};
};

} // namespace benchio
