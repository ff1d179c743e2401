#pragma once
#include "bench-io/transport/Transport.hpp"
#include <memory>

namespace benchio {

/// Platform backend for a descriptor. Does not open the transport.
std::unique_ptr<Transport> make_transport(const TransportDescriptor &descriptor);

} // namespace benchio
