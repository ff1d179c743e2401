#include "bench-io/device/DeviceRegistry.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/Logger.hpp"
#include "bench-io/transport/TransportFactory.hpp"

namespace benchio {

namespace {

UsbDescriptor usb_layout(uint8_t bulk_in, uint8_t bulk_out) {
  UsbDescriptor layout;
  layout.interface = 0;
  layout.bulk_in = bulk_in;
  layout.bulk_out = bulk_out;
  return layout;
}

TransferKind scpi_transfer(TransportKind kind) {
  return kind == TransportKind::UsbDevice ? TransferKind::Bulk
                                          : TransferKind::Stream;
}

} // namespace

DeviceRegistry::DeviceRegistry() { register_builtin_devices(); }

void DeviceRegistry::register_builtin_devices() {
  register_device(
      DeviceInfo{"unit161d",
                 "UNI-T UT161D multimeter (CP2110 HID)",
                 {CommandKind::Measure, CommandKind::MinMax,
                  CommandKind::Reset, CommandKind::Key},
                 {TransportKind::Hid},
                 std::nullopt},
      [](TransportKind) { return ProtocolCodec(Unit161dCodec{}); });

  register_device(
      DeviceInfo{"peaktech4055mv",
                 "PeakTech 4055MV waveform source (USB binary)",
                 {CommandKind::Apply, CommandKind::Reset},
                 {TransportKind::UsbDevice},
                 usb_layout(0x82, 0x02)},
      [](TransportKind) { return ProtocolCodec(WaveformSourceCodec{}); });

  register_device(
      DeviceInfo{"peaktech4055mv_scpi",
                 "PeakTech 4055MV waveform source (SCPI over USB)",
                 {CommandKind::Apply, CommandKind::Reset, CommandKind::Scpi},
                 {TransportKind::UsbDevice},
                 usb_layout(0x82, 0x02)},
      [](TransportKind kind) {
        return ProtocolCodec(
            ScpiCodec(ScpiDialect::PeakTech, scpi_transfer(kind)));
      });

  register_device(
      DeviceInfo{"generic_scpi",
                 "SCPI instrument (USB bulk or TCP socket)",
                 {CommandKind::Measure, CommandKind::Reset, CommandKind::Apply,
                  CommandKind::Scpi},
                 {TransportKind::UsbDevice, TransportKind::ScpiSocket},
                 usb_layout(0x81, 0x01)},
      [](TransportKind kind) {
        return ProtocolCodec(
            ScpiCodec(ScpiDialect::Standard, scpi_transfer(kind)));
      });
}

void DeviceRegistry::register_device(DeviceInfo info, CodecFactory factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string id = info.id;
  entries_[id] = Entry{std::move(info), std::move(factory)};
}

bool DeviceRegistry::has_device(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) > 0;
}

std::vector<DeviceInfo> DeviceRegistry::list_devices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DeviceInfo> result;
  for (const auto &[id, entry] : entries_) {
    result.push_back(entry.info);
  }
  return result;
}

const DeviceRegistry::Entry &
DeviceRegistry::lookup(const std::string &id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw ResolutionError(ErrorKind::UnknownDevice,
                          fmt::format("Unknown device '{}'", id));
  }
  return it->second;
}

DeviceInfo DeviceRegistry::capabilities(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lookup(id).info;
}

std::unique_ptr<Device>
DeviceRegistry::resolve(const std::string &id,
                        const TransportDescriptor &descriptor) const {
  TransportKind kind = descriptor_kind(descriptor);
  TransportDescriptor bound = descriptor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry &entry = lookup(id);
    if (!entry.info.supports(kind)) {
      throw ResolutionError(
          ErrorKind::UnsupportedTransport,
          fmt::format("Device '{}' cannot use a {} transport", id,
                      transport_kind_name(kind)));
    }
    auto *usb = std::get_if<UsbDescriptor>(&bound);
    if (usb && entry.info.usb_layout) {
      usb->interface = entry.info.usb_layout->interface;
      usb->bulk_in = entry.info.usb_layout->bulk_in;
      usb->bulk_out = entry.info.usb_layout->bulk_out;
    }
  }

  LOG_DEBUG("REGISTRY", id, "Binding {}", benchio::describe(bound));
  return resolve(id, make_transport(bound));
}

std::unique_ptr<Device>
DeviceRegistry::resolve(const std::string &id,
                        std::unique_ptr<Transport> transport) const {
  if (!transport) {
    throw std::invalid_argument("resolve() requires a transport");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const Entry &entry = lookup(id);
  TransportKind kind = transport->kind();
  if (!entry.info.supports(kind)) {
    throw ResolutionError(
        ErrorKind::UnsupportedTransport,
        fmt::format("Device '{}' cannot use a {} transport", id,
                    transport_kind_name(kind)));
  }

  return std::make_unique<Device>(entry.info, entry.make_codec(kind),
                                  std::move(transport));
}

} // namespace benchio
