#include "bench-io/transport/Transport.hpp"
#include "bench-io/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fmt/format.h>

namespace benchio {

namespace {

uint16_t parse_hex16(const std::string &text, const std::string &whole) {
  std::string digits = text;
  if (digits.rfind("0x", 0) == 0 || digits.rfind("0X", 0) == 0)
    digits = digits.substr(2);
  if (digits.empty() || digits.size() > 4) {
    throw ParseError(ErrorKind::ArgParseError,
                     fmt::format("Invalid USB address '{}': expected "
                                 "<vendor>:<product> in hex",
                                 whole));
  }
  bool all_hex = std::all_of(digits.begin(), digits.end(), [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
  });
  if (!all_hex) {
    throw ParseError(ErrorKind::ArgParseError,
                     fmt::format("Invalid hex id '{}' in USB address '{}'",
                                 text, whole));
  }
  return static_cast<uint16_t>(std::strtoul(digits.c_str(), nullptr, 16));
}

} // namespace

TransportKind descriptor_kind(const TransportDescriptor &descriptor) {
  switch (descriptor.index()) {
  case 0:
    return TransportKind::Hid;
  case 1:
    return TransportKind::UsbDevice;
  default:
    return TransportKind::ScpiSocket;
  }
}

const char *transport_kind_name(TransportKind kind) {
  switch (kind) {
  case TransportKind::Hid:
    return "hid";
  case TransportKind::UsbDevice:
    return "usb";
  case TransportKind::ScpiSocket:
    return "scpi";
  }
  return "unknown";
}

std::string describe(const TransportDescriptor &descriptor) {
  if (const auto *hid = std::get_if<HidDescriptor>(&descriptor))
    return "hid:" + hid->path;
  if (const auto *usb = std::get_if<UsbDescriptor>(&descriptor))
    return fmt::format("usb:{:04x}:{:04x}", usb->vendor_id, usb->product_id);
  const auto &sock = std::get<ScpiSocketDescriptor>(descriptor);
  if (sock.host.find(':') != std::string::npos)
    return fmt::format("scpi:[{}]:{}", sock.host, sock.port);
  return fmt::format("scpi:{}:{}", sock.host, sock.port);
}

UsbDescriptor parse_usb_address(const std::string &text) {
  size_t colon = text.find(':');
  if (colon == std::string::npos) {
    throw ParseError(ErrorKind::ArgParseError,
                     fmt::format("Invalid USB address '{}': expected "
                                 "<vendor>:<product> in hex",
                                 text));
  }
  UsbDescriptor usb;
  usb.vendor_id = parse_hex16(text.substr(0, colon), text);
  usb.product_id = parse_hex16(text.substr(colon + 1), text);
  return usb;
}

ScpiSocketDescriptor parse_socket_address(const std::string &text) {
  ScpiSocketDescriptor sock;
  std::string port_text;

  if (!text.empty() && text.front() == '[') {
    size_t close = text.find(']');
    if (close == std::string::npos) {
      throw ParseError(ErrorKind::ArgParseError,
                       fmt::format("Invalid socket address '{}'", text));
    }
    sock.host = text.substr(1, close - 1);
    if (close + 1 < text.size()) {
      if (text[close + 1] != ':') {
        throw ParseError(ErrorKind::ArgParseError,
                         fmt::format("Invalid socket address '{}'", text));
      }
      port_text = text.substr(close + 2);
    }
  } else {
    size_t colon = text.rfind(':');
    if (colon != std::string::npos &&
        text.find(':') == colon) { // a single colon separates the port
      sock.host = text.substr(0, colon);
      port_text = text.substr(colon + 1);
    } else {
      sock.host = text;
    }
  }

  if (sock.host.empty()) {
    throw ParseError(ErrorKind::ArgParseError,
                     fmt::format("Missing host in socket address '{}'", text));
  }

  if (!port_text.empty()) {
    char *end = nullptr;
    unsigned long port = std::strtoul(port_text.c_str(), &end, 10);
    if (*end != '\0' || port == 0 || port > 65535) {
      throw ParseError(ErrorKind::ArgParseError,
                       fmt::format("Invalid port '{}' in '{}'", port_text,
                                   text));
    }
    sock.port = static_cast<uint16_t>(port);
  }
  return sock;
}

} // namespace benchio
