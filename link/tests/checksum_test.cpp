#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "base64.h"
#include "checksum.h"
#include "hex_utils.h"

using glasslink::common::Base64Decode;
using glasslink::common::Base64Encode;
using glasslink::link::checksum::Crc32;

namespace {

std::vector<std::uint8_t> Bytes(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::string Md5HexOf(const std::string& s) {
  const auto digest = glasslink::link::checksum::Md5(Bytes(s));
  return glasslink::common::BytesToHex(digest.bytes.data(),
                                       digest.bytes.size());
}

}  // namespace

int main() {
  // RFC 1321 test suite.
  assert(Md5HexOf("") == "d41d8cd98f00b204e9800998ecf8427e");
  assert(Md5HexOf("a") == "0cc175b9c0f1b6a831c399e269772661");
  assert(Md5HexOf("abc") == "900150983cd24fb0d6963f7d28e17f72");
  assert(Md5HexOf("message digest") == "f96b697d7cb7938d525a2f31aaf161d0");
  assert(Md5HexOf("abcdefghijklmnopqrstuvwxyz") ==
         "c3fcd3d76192e4007dfb496cca67e13b");
  assert(Md5HexOf("12345678901234567890123456789012345678901234567890123456789"
                  "012345678901234567890") ==
         "57edf4a22be3c955ac49da2e2107b67a");
  assert(Md5HexOf("The quick brown fox jumps over the lazy dog") ==
         "9e107d9d372bb6826bd81d3542a419d6");

  // Padding boundary: 55, 56 and 64 byte inputs take different paths.
  {
    const auto a = glasslink::link::checksum::Md5(Bytes(std::string(55, 'x')));
    const auto b = glasslink::link::checksum::Md5(Bytes(std::string(56, 'x')));
    const auto c = glasslink::link::checksum::Md5(Bytes(std::string(64, 'x')));
    assert(a != b);
    assert(b != c);
  }

  assert(Crc32(Bytes("123456789")) == 0xCBF43926u);
  assert(Crc32(Bytes("")) == 0x00000000u);
  assert(Crc32(Bytes("The quick brown fox jumps over the lazy dog")) ==
         0x414FA339u);

  // Hex helpers.
  {
    const std::vector<std::uint8_t> raw = {0x00, 0xAB, 0x7F};
    assert(glasslink::common::BytesToHex(raw.data(), raw.size()) == "00ab7f");
    std::vector<std::uint8_t> out;
    assert(glasslink::common::HexToBytes("00AB7f", out));
    assert(out == raw);
    assert(!glasslink::common::HexToBytes("0", out));
    assert(!glasslink::common::HexToBytes("zz", out));
  }

  // Base64, standard alphabet with padding.
  {
    assert(Base64Encode(Bytes("")) == "");
    assert(Base64Encode(Bytes("f")) == "Zg==");
    assert(Base64Encode(Bytes("fo")) == "Zm8=");
    assert(Base64Encode(Bytes("foo")) == "Zm9v");
    assert(Base64Encode(Bytes("foobar")) == "Zm9vYmFy");
    const std::vector<std::uint8_t> hi = {0xFB, 0xFF};
    assert(Base64Encode(hi) == "+/8=");

    std::vector<std::uint8_t> out;
    assert(Base64Decode("Zm9vYg==", out));
    assert(out == Bytes("foob"));
    assert(Base64Decode("+/8=", out));
    assert(out == hi);
    assert(Base64Decode("", out));
    assert(out.empty());
    assert(!Base64Decode("Zm9", out));
    assert(!Base64Decode("Zm=v", out));
    assert(!Base64Decode("Zg==Zg==", out));
    assert(!Base64Decode("Zm9v\n", out));
    assert(!Base64Decode("Z!9v", out));
  }

  return 0;
}
