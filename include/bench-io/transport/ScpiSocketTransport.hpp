#pragma once
#include "bench-io/transport/Transport.hpp"
#include <string>

namespace benchio {

/// SCPI over a raw TCP socket (port 5025 by convention)
class ScpiSocketTransport : public Transport {
public:
  static constexpr size_t RECV_CHUNK = 4096;
  static constexpr int CONNECT_TIMEOUT_MS = 3000;

  explicit ScpiSocketTransport(ScpiSocketDescriptor descriptor);
  ~ScpiSocketTransport() override;

  ScpiSocketTransport(const ScpiSocketTransport &) = delete;
  ScpiSocketTransport &operator=(const ScpiSocketTransport &) = delete;

  void open() override;
  void close() noexcept override;
  bool is_open() const override { return fd_ >= 0; }

  void write(const Frame &frame) override;

  /// Blocks until one '\n'-terminated line is available and returns it
  /// (terminator included). Bytes after the line stay buffered.
  Frame read(std::chrono::milliseconds timeout) override;

  TransportKind kind() const override { return TransportKind::ScpiSocket; }
  std::string describe() const override;

private:
  Frame take_line(size_t eol);

  ScpiSocketDescriptor descriptor_;
  int fd_{-1};
  std::vector<uint8_t> rx_;
};

} // namespace benchio
