#include "protocol.h"

namespace glasslink::link::proto {

void WriteUint8(std::uint8_t v, std::vector<std::uint8_t>& out) {
  out.push_back(v);
}

void WriteUint16(std::uint16_t v, std::vector<std::uint8_t>& out) {
  out.reserve(out.size() + 2);
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void WriteUint32(std::uint32_t v, std::vector<std::uint8_t>& out) {
  out.reserve(out.size() + 4);
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

std::uint16_t LoadUint16(const std::uint8_t* p) {
  return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) |
                                    static_cast<std::uint16_t>(p[1]));
}

std::uint32_t LoadUint32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
         static_cast<std::uint32_t>(p[3]);
}

bool ReadUint8(ByteView data, std::size_t& offset, std::uint8_t& out) {
  if (!data.data || offset + 1 > data.size) {
    return false;
  }
  out = data.data[offset];
  offset += 1;
  return true;
}

bool ReadUint16(ByteView data, std::size_t& offset, std::uint16_t& out) {
  if (!data.data || offset + 2 > data.size) {
    return false;
  }
  out = LoadUint16(data.data + offset);
  offset += 2;
  return true;
}

bool ReadUint32(ByteView data, std::size_t& offset, std::uint32_t& out) {
  if (!data.data || offset + 4 > data.size) {
    return false;
  }
  out = LoadUint32(data.data + offset);
  offset += 4;
  return true;
}

bool ReadRaw(ByteView data, std::size_t& offset, std::size_t len,
             std::vector<std::uint8_t>& out) {
  if (len == 0) {
    out.clear();
    return true;
  }
  if (!data.data || offset > data.size || len > data.size - offset) {
    return false;
  }
  out.assign(data.data + offset, data.data + offset + len);
  offset += len;
  return true;
}

}  // namespace glasslink::link::proto
