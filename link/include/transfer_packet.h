#ifndef GLASSLINK_LINK_TRANSFER_PACKET_H
#define GLASSLINK_LINK_TRANSFER_PACKET_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "checksum.h"
#include "protocol.h"

namespace glasslink::link {

enum class PacketTag : std::uint8_t {
  kStart = 0x01,
  kData = 0x02,
  kEnd = 0x03,
  kAck = 0x04,
  kRetry = 0x05,
};

enum class TransferStatus : std::uint8_t {
  kSuccess = 0x00,
  kCrcError = 0x01,
  kMd5Error = 0x02,
  kTimeout = 0x03,
  kOutOfMemory = 0x04,
  kError = 0xFF,
};

inline constexpr std::size_t kStartPacketBytes = 25;
inline constexpr std::size_t kDataHeaderBytes = 11;
inline constexpr std::size_t kEndPacketBytes = 2;
inline constexpr std::size_t kAckPacketBytes = 6;
inline constexpr std::size_t kRetryPacketBytes = 5;
inline constexpr std::size_t kMaxDataPayloadBytes = 0xFFFF;

struct StartPacket {
  std::uint32_t total_size{0};
  std::uint32_t total_chunks{0};
  checksum::Md5Digest md5;
};

struct DataPacket {
  std::uint32_t chunk_index{0};
  std::vector<std::uint8_t> payload;
  std::uint32_t declared_crc{0};
  std::uint32_t actual_crc{0};

  bool crc_valid() const { return declared_crc == actual_crc; }
};

struct AckPacket {
  std::uint32_t chunk_index{0};
  TransferStatus status{TransferStatus::kSuccess};
};

std::optional<PacketTag> PacketTagFromByte(std::uint8_t b);
const char* PacketTagName(PacketTag tag);
const char* TransferStatusName(TransferStatus status);

std::vector<std::uint8_t> EncodeStart(const StartPacket& packet);
// Fails when the chunk exceeds the 16-bit length field.
bool EncodeData(std::uint32_t chunk_index, const std::uint8_t* data,
                std::size_t len, std::vector<std::uint8_t>& out);
std::vector<std::uint8_t> EncodeEnd(TransferStatus status);
std::vector<std::uint8_t> EncodeAck(std::uint32_t chunk_index,
                                    TransferStatus status);
std::vector<std::uint8_t> EncodeRetry(std::uint32_t chunk_index);

// Structural errors (wrong tag, wrong size) yield nullopt. A DATA packet
// whose payload fails its CRC still parses; check crc_valid().
std::optional<StartPacket> ParseStart(proto::ByteView packet);
std::optional<DataPacket> ParseData(proto::ByteView packet);
std::optional<TransferStatus> ParseEnd(proto::ByteView packet);
std::optional<AckPacket> ParseAck(proto::ByteView packet);
std::optional<std::uint32_t> ParseRetry(proto::ByteView packet);

std::uint32_t ChunkCount(std::size_t total_size, std::size_t chunk_size);
std::vector<std::vector<std::uint8_t>> SplitChunks(
    const std::vector<std::uint8_t>& data, std::size_t chunk_size);
// nullopt when any index in [0, total_chunks) is missing.
std::optional<std::vector<std::uint8_t>> ReassembleChunks(
    const std::map<std::uint32_t, std::vector<std::uint8_t>>& chunks,
    std::uint32_t total_chunks);

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_TRANSFER_PACKET_H
