#include "util/hex.hpp"

namespace tidelink::util {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";

std::string_view StripPrefix(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  return hex;
}

int FromHex(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out;
  out.resize(data.size() * 2);
  for (std::size_t i = 0; i < data.size(); ++i) {
    const auto byte = data[i];
    out[i * 2] = kHexLower[(byte >> 4) & 0x0F];
    out[i * 2 + 1] = kHexLower[byte & 0x0F];
  }
  return out;
}

std::string HexEncodePrefixed(std::span<const std::uint8_t> data) {
  return "0x" + HexEncode(data);
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  hex = StripPrefix(hex);
  if (hex.size() % 2 != 0) {
    return false;
  }
  out->clear();
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = FromHex(hex[i]);
    const int lo = FromHex(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out->clear();
      return false;
    }
    out->push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string ShortHex(std::span<const std::uint8_t> data) {
  if (data.size() <= 8) {
    return HexEncodePrefixed(data);
  }
  return "0x" + HexEncode(data.first(4)) + ".." + HexEncode(data.last(4));
}

}  // namespace tidelink::util
