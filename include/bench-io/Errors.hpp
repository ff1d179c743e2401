#pragma once
#include <stdexcept>
#include <string>

namespace benchio {

enum class ErrorKind {
  UnknownDevice,
  UnknownCommand,
  ArgCountMismatch,
  ArgParseError,
  UnsupportedTransport,
  TransportOpenError,
  TransportIoError,
  IoTimeout,
  ProtocolDecodeError,
  CapabilityMismatch,
  ConfigError
};

/// Stable name used in logs and JSON events (e.g. "IoTimeout")
const char *error_kind_name(ErrorKind kind);

/// Retryable kinds may be attempted again by the pipeline's retry policy
bool is_retryable(ErrorKind kind);

/// Base of every error raised by bench-io
class BenchError : public std::runtime_error {
public:
  BenchError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  bool retryable() const { return is_retryable(kind_); }

private:
  ErrorKind kind_;
};

/// UnknownCommand, ArgCountMismatch, ArgParseError
class ParseError : public BenchError {
public:
  using BenchError::BenchError;
};

/// UnknownDevice, UnsupportedTransport
class ResolutionError : public BenchError {
public:
  using BenchError::BenchError;
};

/// TransportOpenError, TransportIoError, IoTimeout
class TransportError : public BenchError {
public:
  using BenchError::BenchError;
};

/// ProtocolDecodeError. The codec has already discarded the bad bytes.
class ProtocolError : public BenchError {
public:
  explicit ProtocolError(const std::string &message)
      : BenchError(ErrorKind::ProtocolDecodeError, message) {}
};

class CapabilityError : public BenchError {
public:
  explicit CapabilityError(const std::string &message)
      : BenchError(ErrorKind::CapabilityMismatch, message) {}
};

class ConfigError : public BenchError {
public:
  explicit ConfigError(const std::string &message)
      : BenchError(ErrorKind::ConfigError, message) {}
};

} // namespace benchio
