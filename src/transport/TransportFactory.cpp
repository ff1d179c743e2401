#include "bench-io/transport/TransportFactory.hpp"
#include "bench-io/transport/HidTransport.hpp"
#include "bench-io/transport/ScpiSocketTransport.hpp"
#include "bench-io/transport/UsbTransport.hpp"

namespace benchio {

std::unique_ptr<Transport>
make_transport(const TransportDescriptor &descriptor) {
  if (const auto *hid = std::get_if<HidDescriptor>(&descriptor))
    return std::make_unique<HidTransport>(*hid);
  if (const auto *usb = std::get_if<UsbDescriptor>(&descriptor))
    return std::make_unique<UsbTransport>(*usb);
  return std::make_unique<ScpiSocketTransport>(
      std::get<ScpiSocketDescriptor>(descriptor));
}

} // namespace benchio
