#ifndef GLASSLINK_LINK_PROTOCOL_H
#define GLASSLINK_LINK_PROTOCOL_H

#include <cstddef>
#include <cstdint>
#include <vector>

// All multi-byte integers on the link are big-endian.
namespace glasslink::link::proto {

struct ByteView {
  const std::uint8_t* data{nullptr};
  std::size_t size{0};
};

inline ByteView MakeByteView(const std::vector<std::uint8_t>& data) {
  return ByteView{data.data(), data.size()};
}

void WriteUint8(std::uint8_t v, std::vector<std::uint8_t>& out);
void WriteUint16(std::uint16_t v, std::vector<std::uint8_t>& out);
void WriteUint32(std::uint32_t v, std::vector<std::uint8_t>& out);

bool ReadUint8(ByteView data, std::size_t& offset, std::uint8_t& out);
bool ReadUint16(ByteView data, std::size_t& offset, std::uint16_t& out);
bool ReadUint32(ByteView data, std::size_t& offset, std::uint32_t& out);

// Reads exactly `len` raw bytes (no length prefix).
bool ReadRaw(ByteView data, std::size_t& offset, std::size_t len,
             std::vector<std::uint8_t>& out);

inline void WriteRaw(const std::uint8_t* data, std::size_t len,
                     std::vector<std::uint8_t>& out) {
  if (!data || len == 0) {
    return;
  }
  out.insert(out.end(), data, data + len);
}

std::uint16_t LoadUint16(const std::uint8_t* p);
std::uint32_t LoadUint32(const std::uint8_t* p);

}  // namespace glasslink::link::proto

#endif  // GLASSLINK_LINK_PROTOCOL_H
