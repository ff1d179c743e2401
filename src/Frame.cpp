#include "bench-io/Frame.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace benchio {

std::string to_hex(const std::vector<uint8_t> &bytes, size_t max_bytes) {
  std::string out;
  size_t n = std::min(bytes.size(), max_bytes);
  out.reserve(n * 3 + 4);
  for (size_t i = 0; i < n; ++i) {
    if (i > 0)
      out += ' ';
    out += fmt::format("{:02X}", bytes[i]);
  }
  if (bytes.size() > max_bytes)
    out += " ...";
  return out;
}

const char *transfer_kind_name(TransferKind kind) {
  switch (kind) {
  case TransferKind::HidReport:
    return "hid-report";
  case TransferKind::Control:
    return "control";
  case TransferKind::Bulk:
    return "bulk";
  case TransferKind::Stream:
    return "stream";
  }
  return "unknown";
}

} // namespace benchio
