#pragma once
#include "bench-io/device/Device.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace benchio {

class DeviceRegistry {
public:
  /// Builds the codec for a model; receives the bound transport's kind
  using CodecFactory = std::function<ProtocolCodec(TransportKind)>;

  static DeviceRegistry &instance() {
    static DeviceRegistry registry;
    return registry;
  }

  /// Add or replace a model
  void register_device(DeviceInfo info, CodecFactory factory);

  bool has_device(const std::string &id) const;

  /// Registered models sorted by id
  std::vector<DeviceInfo> list_devices() const;

  /// Throws ResolutionError (UnknownDevice)
  DeviceInfo capabilities(const std::string &id) const;

  /// Build a Device for the descriptor. Does not open the transport.
  /// Throws ResolutionError (UnknownDevice, UnsupportedTransport).
  std::unique_ptr<Device> resolve(const std::string &id,
                                  const TransportDescriptor &descriptor) const;

  /// Same, with a caller-constructed transport
  std::unique_ptr<Device> resolve(const std::string &id,
                                  std::unique_ptr<Transport> transport) const;

private:
  DeviceRegistry();

  DeviceRegistry(const DeviceRegistry &) = delete;
  DeviceRegistry &operator=(const DeviceRegistry &) = delete;

  struct Entry {
    DeviceInfo info;
    CodecFactory make_codec;
  };

  const Entry &lookup(const std::string &id) const;
  void register_builtin_devices();

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

} // namespace benchio
