#ifndef GLASSLINK_LINK_CHECKSUM_H
#define GLASSLINK_LINK_CHECKSUM_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace glasslink::link::checksum {

struct Md5Digest {
  std::array<std::uint8_t, 16> bytes{};

  bool operator==(const Md5Digest& other) const {
    return bytes == other.bytes;
  }
  bool operator!=(const Md5Digest& other) const { return !(*this == other); }
};

// Whole-payload digest carried by the transfer START packet.
Md5Digest Md5(const std::uint8_t* data, std::size_t len);
inline Md5Digest Md5(const std::vector<std::uint8_t>& data) {
  return Md5(data.data(), data.size());
}

// CRC-32 (IEEE 802.3, reflected, poly 0xEDB88320) used per DATA chunk.
std::uint32_t Crc32(const std::uint8_t* data, std::size_t len);
inline std::uint32_t Crc32(const std::vector<std::uint8_t>& data) {
  return Crc32(data.data(), data.size());
}

}  // namespace glasslink::link::checksum

#endif  // GLASSLINK_LINK_CHECKSUM_H
