#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tidelink::util {

std::string HexEncode(std::span<const std::uint8_t> data);
// Lower-case hex with a leading "0x", the form used in chain snapshots and logs.
std::string HexEncodePrefixed(std::span<const std::uint8_t> data);

// Accepts an optional "0x"/"0X" prefix. An empty string (or a bare prefix)
// decodes to an empty buffer.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

// Decodes exactly N bytes. Shorter input is rejected rather than padded so a
// truncated address or hash never silently becomes a different value.
template <std::size_t N>
bool HexDecodeFixed(std::string_view hex, std::array<std::uint8_t, N>* out) {
  std::vector<std::uint8_t> bytes;
  if (!HexDecode(hex, &bytes) || bytes.size() != N) {
    return false;
  }
  for (std::size_t i = 0; i < N; ++i) {
    (*out)[i] = bytes[i];
  }
  return true;
}

// Short "0x1234..abcd" form for log lines.
std::string ShortHex(std::span<const std::uint8_t> data);

}  // namespace tidelink::util
