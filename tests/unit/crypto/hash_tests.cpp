#include <array>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "util/hex.hpp"

using tidelink::crypto::Sha3_256;
using tidelink::crypto::Sha3Writer;
using tidelink::crypto::TaggedHash;
using tidelink::util::HexDecode;
using tidelink::util::HexDecodeFixed;
using tidelink::util::HexEncode;
using tidelink::util::HexEncodePrefixed;
using tidelink::util::ShortHex;

int main() {
  try {
    if (HexEncode(Sha3_256(std::string_view(""))) !=
        "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a") {
      std::cerr << "SHA3-256 of the empty string mismatch\n";
      return EXIT_FAILURE;
    }
    if (HexEncode(Sha3_256(std::string_view("abc"))) !=
        "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532") {
      std::cerr << "SHA3-256 of \"abc\" mismatch\n";
      return EXIT_FAILURE;
    }

    {
      Sha3Writer writer;
      writer.Write(std::string_view("a")).Write(std::string_view("bc"));
      if (writer.Finalize() != Sha3_256(std::string_view("abc"))) {
        std::cerr << "incremental hash differs from one-shot hash\n";
        return EXIT_FAILURE;
      }
    }

    {
      Sha3Writer writer;
      writer.WriteUint64BE(0x0102030405060708ULL);
      const std::vector<std::uint8_t> expected{1, 2, 3, 4, 5, 6, 7, 8};
      if (writer.Finalize() != Sha3_256(expected)) {
        std::cerr << "WriteUint64BE is not big-endian\n";
        return EXIT_FAILURE;
      }
    }

    {
      const std::vector<std::uint8_t> a{0x01, 0x02};
      const std::vector<std::uint8_t> b{0x03};
      if (TaggedHash("tag-one", a, b) == TaggedHash("tag-two", a, b)) {
        std::cerr << "tagged hash ignores the tag\n";
        return EXIT_FAILURE;
      }
      const std::vector<std::uint8_t> preimage{'t', 'a', 'g', 0x01, 0x02, 0x03};
      if (TaggedHash("tag", a, b) != Sha3_256(preimage)) {
        std::cerr << "tagged hash is not SHA3(tag || a || b)\n";
        return EXIT_FAILURE;
      }
    }

    {
      std::vector<std::uint8_t> bytes;
      if (!HexDecode("0xDEadBEef", &bytes) || HexEncode(bytes) != "deadbeef") {
        std::cerr << "hex decode with prefix and mixed case failed\n";
        return EXIT_FAILURE;
      }
      if (HexDecode("abc", &bytes) || HexDecode("zz", &bytes)) {
        std::cerr << "malformed hex accepted\n";
        return EXIT_FAILURE;
      }
      if (!HexDecode("0x", &bytes) || !bytes.empty()) {
        std::cerr << "bare prefix should decode to nothing\n";
        return EXIT_FAILURE;
      }
      std::array<std::uint8_t, 4> fixed{};
      if (HexDecodeFixed("0x010203", &fixed) || !HexDecodeFixed("0x01020304", &fixed) ||
          fixed[3] != 0x04) {
        std::cerr << "HexDecodeFixed length handling wrong\n";
        return EXIT_FAILURE;
      }
      if (HexEncodePrefixed(fixed) != "0x01020304") {
        std::cerr << "HexEncodePrefixed mismatch\n";
        return EXIT_FAILURE;
      }
      std::array<std::uint8_t, 32> hash{};
      hash[0] = 0xAB;
      hash[31] = 0xCD;
      if (ShortHex(hash) != "0xab000000..000000cd") {
        std::cerr << "ShortHex mismatch: " << ShortHex(hash) << "\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "hash_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
