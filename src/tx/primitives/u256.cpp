#include "primitives/u256.hpp"

#include <algorithm>
#include <cctype>

namespace tidelink::primitives {

namespace {

// 64x64 -> 128 multiply split into 32-bit halves.
void Mul64(std::uint64_t a, std::uint64_t b, std::uint64_t* hi, std::uint64_t* lo) {
  const std::uint64_t a_lo = a & 0xFFFFFFFFULL;
  const std::uint64_t a_hi = a >> 32;
  const std::uint64_t b_lo = b & 0xFFFFFFFFULL;
  const std::uint64_t b_hi = b >> 32;

  const std::uint64_t p0 = a_lo * b_lo;
  const std::uint64_t p1 = a_lo * b_hi;
  const std::uint64_t p2 = a_hi * b_lo;
  const std::uint64_t p3 = a_hi * b_hi;

  const std::uint64_t middle = (p0 >> 32) + (p1 & 0xFFFFFFFFULL) + (p2 & 0xFFFFFFFFULL);
  *lo = (middle << 32) | (p0 & 0xFFFFFFFFULL);
  *hi = p3 + (p1 >> 32) + (p2 >> 32) + (middle >> 32);
}

}  // namespace

bool CheckedAdd(const U256& a, const U256& b, U256* out) {
  U256 sum = a + b;
  if (sum < a) {
    return false;
  }
  if (out) *out = sum;
  return true;
}

bool CheckedSub(const U256& a, const U256& b, U256* out) {
  if (b > a) {
    return false;
  }
  if (out) *out = a - b;
  return true;
}

bool CheckedMul(const U256& a, std::uint64_t b, U256* out) {
  U256 result;
  std::uint64_t carry = 0;
  for (std::size_t i = 0; i < a.limbs_.size(); ++i) {
    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    Mul64(a.limbs_[i], b, &hi, &lo);
    const std::uint64_t sum = lo + carry;
    if (sum < lo) {
      ++hi;
    }
    result.limbs_[i] = sum;
    carry = hi;
  }
  if (carry != 0) {
    return false;
  }
  if (out) *out = result;
  return true;
}

U256 Divide(const U256& dividend, const U256& divisor, U256* remainder_out) {
  if (divisor.IsZero()) {
    if (remainder_out) *remainder_out = U256::Zero();
    return U256::Zero();
  }
  U256 quotient;
  U256 remainder;
  for (int bit = 255; bit >= 0; --bit) {
    remainder.ShiftLeft1();
    if (dividend.TestBit(bit)) {
      remainder.limbs_[0] |= 1ULL;
    }
    if (remainder >= divisor) {
      remainder -= divisor;
      quotient.SetBit(bit);
    }
  }
  if (remainder_out) *remainder_out = remainder;
  return quotient;
}

std::string U256::ToString() const {
  if (IsZero()) {
    return "0";
  }
  std::string digits;
  U256 value = *this;
  const U256 ten(10);
  while (!value.IsZero()) {
    U256 rem;
    value = Divide(value, ten, &rem);
    digits.push_back(static_cast<char>('0' + rem.Low64()));
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

bool ParseU256(const std::string& text, U256* out) {
  if (text.empty()) {
    return false;
  }
  U256 value;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    if (text.size() - 2 > 64) {
      return false;
    }
    for (std::size_t i = 2; i < text.size(); ++i) {
      const char c = text[i];
      std::uint64_t nibble = 0;
      if (c >= '0' && c <= '9') {
        nibble = static_cast<std::uint64_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        nibble = static_cast<std::uint64_t>(10 + (c - 'a'));
      } else if (c >= 'A' && c <= 'F') {
        nibble = static_cast<std::uint64_t>(10 + (c - 'A'));
      } else {
        return false;
      }
      if (!CheckedMul(value, 16, &value)) return false;
      value += U256(nibble);
    }
  } else {
    for (char c : text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        return false;
      }
      if (!CheckedMul(value, 10, &value)) return false;
      if (!CheckedAdd(value, U256(static_cast<std::uint64_t>(c - '0')), &value)) return false;
    }
  }
  if (out) *out = value;
  return true;
}

}  // namespace tidelink::primitives
