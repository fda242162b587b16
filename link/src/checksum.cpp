#include "checksum.h"

#include <cstring>

namespace glasslink::link::checksum {

namespace {

constexpr std::uint32_t kInitState[4] = {0x67452301, 0xefcdab89, 0x98badcfe,
                                         0x10325476};

constexpr std::uint32_t kK[64] = {
    0xd76aa478, 0xe8c7b756, 0x242070db, 0xc1bdceee, 0xf57c0faf, 0x4787c62a,
    0xa8304613, 0xfd469501, 0x698098d8, 0x8b44f7af, 0xffff5bb1, 0x895cd7be,
    0x6b901122, 0xfd987193, 0xa679438e, 0x49b40821, 0xf61e2562, 0xc040b340,
    0x265e5a51, 0xe9b6c7aa, 0xd62f105d, 0x02441453, 0xd8a1e681, 0xe7d3fbc8,
    0x21e1cde6, 0xc33707d6, 0xf4d50d87, 0x455a14ed, 0xa9e3e905, 0xfcefa3f8,
    0x676f02d9, 0x8d2a4c8a, 0xfffa3942, 0x8771f681, 0x6d9d6122, 0xfde5380c,
    0xa4beea44, 0x4bdecfa9, 0xf6bb4b60, 0xbebfbc70, 0x289b7ec6, 0xeaa127fa,
    0xd4ef3085, 0x04881d05, 0xd9d4d039, 0xe6db99e5, 0x1fa27cf8, 0xc4ac5665,
    0xf4292244, 0x432aff97, 0xab9423a7, 0xfc93a039, 0x655b59c3, 0x8f0ccc92,
    0xffeff47d, 0x85845dd1, 0x6fa87e4f, 0xfe2ce6e0, 0xa3014314, 0x4e0811a1,
    0xf7537e82, 0xbd3af235, 0x2ad7d2bb, 0xeb86d391};

constexpr std::uint32_t kShift[64] = {
    7, 12, 17, 22, 7, 12, 17, 22, 7, 12, 17, 22, 7, 12, 17, 22,
    5, 9,  14, 20, 5, 9,  14, 20, 5, 9,  14, 20, 5, 9,  14, 20,
    4, 11, 16, 23, 4, 11, 16, 23, 4, 11, 16, 23, 4, 11, 16, 23,
    6, 10, 15, 21, 6, 10, 15, 21, 6, 10, 15, 21, 6, 10, 15, 21};

inline std::uint32_t RotL(std::uint32_t x, std::uint32_t n) {
  return (x << n) | (x >> (32U - n));
}

void ProcessChunk(const std::uint8_t chunk[64], std::uint32_t state[4]) {
  std::uint32_t m[16];
  for (int i = 0; i < 16; ++i) {
    m[i] = static_cast<std::uint32_t>(chunk[i * 4]) |
           (static_cast<std::uint32_t>(chunk[i * 4 + 1]) << 8) |
           (static_cast<std::uint32_t>(chunk[i * 4 + 2]) << 16) |
           (static_cast<std::uint32_t>(chunk[i * 4 + 3]) << 24);
  }

  std::uint32_t a = state[0];
  std::uint32_t b = state[1];
  std::uint32_t c = state[2];
  std::uint32_t d = state[3];

  for (int i = 0; i < 64; ++i) {
    std::uint32_t f = 0;
    int g = 0;
    if (i < 16) {
      f = (b & c) | ((~b) & d);
      g = i;
    } else if (i < 32) {
      f = (d & b) | ((~d) & c);
      g = (5 * i + 1) % 16;
    } else if (i < 48) {
      f = b ^ c ^ d;
      g = (3 * i + 5) % 16;
    } else {
      f = c ^ (b | (~d));
      g = (7 * i) % 16;
    }
    f = f + a + kK[i] + m[g];
    a = d;
    d = c;
    c = b;
    b = b + RotL(f, kShift[i]);
  }

  state[0] += a;
  state[1] += b;
  state[2] += c;
  state[3] += d;
}

struct Crc32Table {
  std::uint32_t entries[256];

  Crc32Table() {
    for (std::uint32_t i = 0; i < 256; ++i) {
      std::uint32_t c = i;
      for (int k = 0; k < 8; ++k) {
        c = (c & 1U) ? (0xEDB88320U ^ (c >> 1)) : (c >> 1);
      }
      entries[i] = c;
    }
  }
};

const Crc32Table& CrcTable() {
  static const Crc32Table table;
  return table;
}

}  // namespace

Md5Digest Md5(const std::uint8_t* data, std::size_t len) {
  std::uint32_t state[4];
  std::memcpy(state, kInitState, sizeof(state));

  const std::size_t full_chunks = (data != nullptr) ? len / 64 : 0;
  for (std::size_t i = 0; i < full_chunks; ++i) {
    ProcessChunk(data + i * 64, state);
  }

  std::uint8_t buffer[128];
  const std::size_t rem = (data != nullptr) ? len % 64 : 0;
  if (rem != 0) {
    std::memcpy(buffer, data + full_chunks * 64, rem);
  }
  buffer[rem] = 0x80;
  std::size_t total = rem + 1;
  const std::size_t pad_to = (total <= 56) ? 56 : 120;
  std::memset(buffer + total, 0, pad_to - total);
  total = pad_to;

  const std::uint64_t bit_len =
      (data != nullptr) ? static_cast<std::uint64_t>(len) * 8U : 0;
  for (int i = 0; i < 8; ++i) {
    buffer[total + static_cast<std::size_t>(i)] =
        static_cast<std::uint8_t>((bit_len >> (8 * i)) & 0xFF);
  }
  total += 8;

  ProcessChunk(buffer, state);
  if (total == 128) {
    ProcessChunk(buffer + 64, state);
  }

  Md5Digest out;
  for (int i = 0; i < 4; ++i) {
    out.bytes[i * 4] = static_cast<std::uint8_t>(state[i] & 0xFF);
    out.bytes[i * 4 + 1] = static_cast<std::uint8_t>((state[i] >> 8) & 0xFF);
    out.bytes[i * 4 + 2] = static_cast<std::uint8_t>((state[i] >> 16) & 0xFF);
    out.bytes[i * 4 + 3] = static_cast<std::uint8_t>((state[i] >> 24) & 0xFF);
  }
  return out;
}

std::uint32_t Crc32(const std::uint8_t* data, std::size_t len) {
  const Crc32Table& table = CrcTable();
  std::uint32_t crc = 0xFFFFFFFFU;
  if (data) {
    for (std::size_t i = 0; i < len; ++i) {
      crc = table.entries[(crc ^ data[i]) & 0xFFU] ^ (crc >> 8);
    }
  }
  return crc ^ 0xFFFFFFFFU;
}

}  // namespace glasslink::link::checksum
