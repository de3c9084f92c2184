#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <span>
#include <string>

namespace tidelink::primitives {

class U256;

// Returns false on overflow/underflow and leaves *out untouched.
bool CheckedAdd(const U256& a, const U256& b, U256* out);
bool CheckedSub(const U256& a, const U256& b, U256* out);
bool CheckedMul(const U256& a, std::uint64_t b, U256* out);

// Integer division; a zero divisor yields zero.
U256 Divide(const U256& dividend, const U256& divisor, U256* remainder = nullptr);

// Unsigned 256-bit integer used for token amounts and fee arithmetic. Limbs
// are little-endian; the wire form is 32 bytes big-endian.
class U256 {
 public:
  U256() = default;
  U256(std::uint64_t value) { limbs_[0] = value; }  // NOLINT(google-explicit-constructor)

  static U256 Zero() { return U256(); }

  static U256 Max() {
    U256 value;
    value.limbs_.fill(std::numeric_limits<std::uint64_t>::max());
    return value;
  }

  static U256 FromBigEndian(std::span<const std::uint8_t, 32> bytes) {
    U256 value;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      const std::uint8_t byte = bytes[bytes.size() - 1 - i];
      const std::size_t limb = i / 8;
      const std::size_t shift = (i % 8) * 8;
      value.limbs_[limb] |= static_cast<std::uint64_t>(byte) << shift;
    }
    return value;
  }

  std::array<std::uint8_t, 32> ToBigEndian() const {
    std::array<std::uint8_t, 32> out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
      const std::size_t limb = i / 8;
      const std::size_t shift = (i % 8) * 8;
      out[out.size() - 1 - i] = static_cast<std::uint8_t>((limbs_[limb] >> shift) & 0xFF);
    }
    return out;
  }

  bool IsZero() const {
    for (auto limb : limbs_) {
      if (limb != 0) return false;
    }
    return true;
  }

  bool FitsUint64() const { return limbs_[1] == 0 && limbs_[2] == 0 && limbs_[3] == 0; }
  std::uint64_t Low64() const { return limbs_[0]; }

  // Wrapping arithmetic; use CheckedAdd/CheckedSub where overflow matters.
  U256& operator+=(const U256& other) {
    std::uint64_t carry = 0;
    for (std::size_t i = 0; i < limbs_.size(); ++i) {
      const std::uint64_t sum = limbs_[i] + other.limbs_[i];
      const std::uint64_t carry1 = sum < limbs_[i] ? 1 : 0;
      const std::uint64_t sum2 = sum + carry;
      const std::uint64_t carry2 = sum2 < sum ? 1 : 0;
      limbs_[i] = sum2;
      carry = carry1 | carry2;
    }
    return *this;
  }

  U256& operator-=(const U256& other) {
    std::uint64_t borrow = 0;
    for (std::size_t i = 0; i < limbs_.size(); ++i) {
      const std::uint64_t diff = limbs_[i] - other.limbs_[i];
      const std::uint64_t borrow1 = limbs_[i] < other.limbs_[i] ? 1 : 0;
      const std::uint64_t diff2 = diff - borrow;
      const std::uint64_t borrow2 = diff < borrow ? 1 : 0;
      limbs_[i] = diff2;
      borrow = borrow1 | borrow2;
    }
    return *this;
  }

  friend U256 operator+(U256 lhs, const U256& rhs) {
    lhs += rhs;
    return lhs;
  }

  friend U256 operator-(U256 lhs, const U256& rhs) {
    lhs -= rhs;
    return lhs;
  }

  friend bool operator==(const U256& lhs, const U256& rhs) { return lhs.limbs_ == rhs.limbs_; }
  friend bool operator!=(const U256& lhs, const U256& rhs) { return !(lhs == rhs); }

  friend bool operator<(const U256& lhs, const U256& rhs) {
    for (std::size_t i = lhs.limbs_.size(); i-- > 0;) {
      if (lhs.limbs_[i] < rhs.limbs_[i]) return true;
      if (lhs.limbs_[i] > rhs.limbs_[i]) return false;
    }
    return false;
  }

  friend bool operator>(const U256& lhs, const U256& rhs) { return rhs < lhs; }
  friend bool operator<=(const U256& lhs, const U256& rhs) { return !(rhs < lhs); }
  friend bool operator>=(const U256& lhs, const U256& rhs) { return !(lhs < rhs); }

  void ShiftLeft1() {
    std::uint64_t carry = 0;
    for (std::size_t i = 0; i < limbs_.size(); ++i) {
      const std::uint64_t next = limbs_[i] >> 63;
      limbs_[i] = (limbs_[i] << 1) | carry;
      carry = next;
    }
  }

  bool TestBit(int bit) const {
    if (bit < 0 || bit >= 256) return false;
    const std::size_t limb = static_cast<std::size_t>(bit) / 64;
    const std::size_t offset = static_cast<std::size_t>(bit) % 64;
    return (limbs_[limb] >> offset) & 1ULL;
  }

  void SetBit(int bit) {
    if (bit < 0 || bit >= 256) return;
    const std::size_t limb = static_cast<std::size_t>(bit) / 64;
    const std::size_t offset = static_cast<std::size_t>(bit) % 64;
    limbs_[limb] |= (std::uint64_t{1} << offset);
  }

  // Decimal rendering for logs and JSON.
  std::string ToString() const;

 private:
  std::array<std::uint64_t, 4> limbs_{};

  friend U256 Divide(const U256& dividend, const U256& divisor, U256* remainder);
  friend bool CheckedMul(const U256& a, std::uint64_t b, U256* out);
};

// Parses a non-negative decimal string or a "0x"-prefixed hex string.
bool ParseU256(const std::string& text, U256* out);

}  // namespace tidelink::primitives
