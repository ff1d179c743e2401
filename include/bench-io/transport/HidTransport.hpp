#pragma once
#include "bench-io/transport/Transport.hpp"

namespace benchio {

/// Linux hidraw backend. Reports are exchanged with their report id as the
/// first byte.
class HidTransport : public Transport {
public:
  static constexpr size_t REPORT_SIZE = 64;
  static constexpr uint8_t MAX_DATA_REPORT = 63;

  explicit HidTransport(HidDescriptor descriptor);
  ~HidTransport() override;

  HidTransport(const HidTransport &) = delete;
  HidTransport &operator=(const HidTransport &) = delete;

  void open() override;
  void close() noexcept override;
  bool is_open() const override { return fd_ >= 0; }

  /// Without a fixed report id the payload is split into data reports of at
  /// most 63 bytes, each tagged with its length
  void write(const Frame &frame) override;

  /// Returns the payload of the next report passing the id filter
  Frame read(std::chrono::milliseconds timeout) override;

  TransportKind kind() const override { return TransportKind::Hid; }
  std::string describe() const override;

private:
  bool accepts(uint8_t report_id, size_t payload_size) const;

  HidDescriptor descriptor_;
  int fd_{-1};
};

} // namespace benchio
