#include "bench-io/codec/ProtocolCodec.hpp"

namespace benchio {

const char *ProtocolCodec::name() const {
  switch (impl_.index()) {
  case 0:
    return "unit161d";
  case 1:
    return "waveform-binary";
  default:
    return std::get<ScpiCodec>(impl_).dialect() == ScpiDialect::PeakTech
               ? "scpi-peaktech"
               : "scpi";
  }
}

} // namespace benchio
