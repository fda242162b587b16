#include "transfer_packet.h"

#include <algorithm>
#include <cstring>

namespace glasslink::link {

namespace {

bool HasTag(proto::ByteView packet, PacketTag tag) {
  return packet.data && packet.size > 0 &&
         packet.data[0] == static_cast<std::uint8_t>(tag);
}

}  // namespace

std::optional<PacketTag> PacketTagFromByte(std::uint8_t b) {
  if (b >= static_cast<std::uint8_t>(PacketTag::kStart) &&
      b <= static_cast<std::uint8_t>(PacketTag::kRetry)) {
    return static_cast<PacketTag>(b);
  }
  return std::nullopt;
}

const char* PacketTagName(PacketTag tag) {
  switch (tag) {
    case PacketTag::kStart:
      return "START";
    case PacketTag::kData:
      return "DATA";
    case PacketTag::kEnd:
      return "END";
    case PacketTag::kAck:
      return "ACK";
    case PacketTag::kRetry:
      return "RETRY";
  }
  return "UNKNOWN";
}

const char* TransferStatusName(TransferStatus status) {
  switch (status) {
    case TransferStatus::kSuccess:
      return "SUCCESS";
    case TransferStatus::kCrcError:
      return "CRC_ERROR";
    case TransferStatus::kMd5Error:
      return "MD5_ERROR";
    case TransferStatus::kTimeout:
      return "TIMEOUT";
    case TransferStatus::kOutOfMemory:
      return "OUT_OF_MEMORY";
    case TransferStatus::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::vector<std::uint8_t> EncodeStart(const StartPacket& packet) {
  std::vector<std::uint8_t> out;
  out.reserve(kStartPacketBytes);
  proto::WriteUint8(static_cast<std::uint8_t>(PacketTag::kStart), out);
  proto::WriteUint32(packet.total_size, out);
  proto::WriteUint32(packet.total_chunks, out);
  proto::WriteRaw(packet.md5.bytes.data(), packet.md5.bytes.size(), out);
  return out;
}

bool EncodeData(std::uint32_t chunk_index, const std::uint8_t* data,
                std::size_t len, std::vector<std::uint8_t>& out) {
  out.clear();
  if (len > kMaxDataPayloadBytes || (!data && len != 0)) {
    return false;
  }
  out.reserve(kDataHeaderBytes + len);
  proto::WriteUint8(static_cast<std::uint8_t>(PacketTag::kData), out);
  proto::WriteUint16(static_cast<std::uint16_t>(len), out);
  proto::WriteUint32(chunk_index, out);
  proto::WriteUint32(checksum::Crc32(data, len), out);
  proto::WriteRaw(data, len, out);
  return true;
}

std::vector<std::uint8_t> EncodeEnd(TransferStatus status) {
  return {static_cast<std::uint8_t>(PacketTag::kEnd),
          static_cast<std::uint8_t>(status)};
}

std::vector<std::uint8_t> EncodeAck(std::uint32_t chunk_index,
                                    TransferStatus status) {
  std::vector<std::uint8_t> out;
  out.reserve(kAckPacketBytes);
  proto::WriteUint8(static_cast<std::uint8_t>(PacketTag::kAck), out);
  proto::WriteUint32(chunk_index, out);
  proto::WriteUint8(static_cast<std::uint8_t>(status), out);
  return out;
}

std::vector<std::uint8_t> EncodeRetry(std::uint32_t chunk_index) {
  std::vector<std::uint8_t> out;
  out.reserve(kRetryPacketBytes);
  proto::WriteUint8(static_cast<std::uint8_t>(PacketTag::kRetry), out);
  proto::WriteUint32(chunk_index, out);
  return out;
}

std::optional<StartPacket> ParseStart(proto::ByteView packet) {
  if (packet.size != kStartPacketBytes || !HasTag(packet, PacketTag::kStart)) {
    return std::nullopt;
  }
  StartPacket out;
  std::size_t off = 1;
  if (!proto::ReadUint32(packet, off, out.total_size) ||
      !proto::ReadUint32(packet, off, out.total_chunks)) {
    return std::nullopt;
  }
  std::memcpy(out.md5.bytes.data(), packet.data + off, out.md5.bytes.size());
  return out;
}

std::optional<DataPacket> ParseData(proto::ByteView packet) {
  if (packet.size < kDataHeaderBytes || !HasTag(packet, PacketTag::kData)) {
    return std::nullopt;
  }
  std::size_t off = 1;
  std::uint16_t len = 0;
  DataPacket out;
  if (!proto::ReadUint16(packet, off, len) ||
      !proto::ReadUint32(packet, off, out.chunk_index) ||
      !proto::ReadUint32(packet, off, out.declared_crc)) {
    return std::nullopt;
  }
  if (packet.size != kDataHeaderBytes + len) {
    return std::nullopt;
  }
  if (!proto::ReadRaw(packet, off, len, out.payload)) {
    return std::nullopt;
  }
  out.actual_crc = checksum::Crc32(out.payload);
  return out;
}

std::optional<TransferStatus> ParseEnd(proto::ByteView packet) {
  if (packet.size != kEndPacketBytes || !HasTag(packet, PacketTag::kEnd)) {
    return std::nullopt;
  }
  return static_cast<TransferStatus>(packet.data[1]);
}

std::optional<AckPacket> ParseAck(proto::ByteView packet) {
  if (packet.size != kAckPacketBytes || !HasTag(packet, PacketTag::kAck)) {
    return std::nullopt;
  }
  AckPacket out;
  std::size_t off = 1;
  std::uint8_t status = 0;
  if (!proto::ReadUint32(packet, off, out.chunk_index) ||
      !proto::ReadUint8(packet, off, status)) {
    return std::nullopt;
  }
  out.status = static_cast<TransferStatus>(status);
  return out;
}

std::optional<std::uint32_t> ParseRetry(proto::ByteView packet) {
  if (packet.size != kRetryPacketBytes || !HasTag(packet, PacketTag::kRetry)) {
    return std::nullopt;
  }
  return proto::LoadUint32(packet.data + 1);
}

std::uint32_t ChunkCount(std::size_t total_size, std::size_t chunk_size) {
  if (chunk_size == 0) {
    return 0;
  }
  return static_cast<std::uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

std::vector<std::vector<std::uint8_t>> SplitChunks(
    const std::vector<std::uint8_t>& data, std::size_t chunk_size) {
  std::vector<std::vector<std::uint8_t>> out;
  if (chunk_size == 0) {
    return out;
  }
  out.reserve(ChunkCount(data.size(), chunk_size));
  for (std::size_t off = 0; off < data.size(); off += chunk_size) {
    const std::size_t n = std::min(chunk_size, data.size() - off);
    out.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(off),
                     data.begin() + static_cast<std::ptrdiff_t>(off + n));
  }
  return out;
}

std::optional<std::vector<std::uint8_t>> ReassembleChunks(
    const std::map<std::uint32_t, std::vector<std::uint8_t>>& chunks,
    std::uint32_t total_chunks) {
  std::size_t total = 0;
  for (std::uint32_t i = 0; i < total_chunks; ++i) {
    const auto it = chunks.find(i);
    if (it == chunks.end()) {
      return std::nullopt;
    }
    total += it->second.size();
  }
  std::vector<std::uint8_t> out;
  out.reserve(total);
  for (std::uint32_t i = 0; i < total_chunks; ++i) {
    const auto& chunk = chunks.at(i);
    out.insert(out.end(), chunk.begin(), chunk.end());
  }
  return out;
}

}  // namespace glasslink::link
