#include "bench-io/Errors.hpp"

namespace benchio {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnknownDevice:
    return "UnknownDevice";
  case ErrorKind::UnknownCommand:
    return "UnknownCommand";
  case ErrorKind::ArgCountMismatch:
    return "ArgCountMismatch";
  case ErrorKind::ArgParseError:
    return "ArgParseError";
  case ErrorKind::UnsupportedTransport:
    return "UnsupportedTransport";
  case ErrorKind::TransportOpenError:
    return "TransportOpenError";
  case ErrorKind::TransportIoError:
    return "TransportIoError";
  case ErrorKind::IoTimeout:
    return "IoTimeout";
  case ErrorKind::ProtocolDecodeError:
    return "ProtocolDecodeError";
  case ErrorKind::CapabilityMismatch:
    return "CapabilityMismatch";
  case ErrorKind::ConfigError:
    return "ConfigError";
  }
  return "Unknown";
}

bool is_retryable(ErrorKind kind) {
  return kind == ErrorKind::TransportIoError || kind == ErrorKind::IoTimeout;
}

} // namespace benchio
