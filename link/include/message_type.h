#ifndef GLASSLINK_LINK_MESSAGE_TYPE_H
#define GLASSLINK_LINK_MESSAGE_TYPE_H

#include <cstddef>
#include <cstdint>
#include <optional>

namespace glasslink::link {

// The numeric code is the wire identity. Codes never change meaning.
enum class MessageType : std::uint8_t {
  kHandshake = 0x00,
  kHandshakeAck = 0x01,
  kHeartbeat = 0x02,
  kHeartbeatAck = 0x03,
  kDisconnect = 0x0F,

  kVoiceStart = 0x10,
  kVoiceData = 0x11,
  kVoiceEnd = 0x12,
  kVoiceCancel = 0x13,
  kRemoteRecordStart = 0x14,
  kRemoteRecordStop = 0x15,

  kAiProcessing = 0x20,
  kAiResponseText = 0x21,
  kAiResponseTts = 0x22,
  kUserTranscript = 0x23,
  kAiError = 0x2F,

  kDisplayText = 0x30,
  kDisplayClear = 0x31,
  kDisplayStatus = 0x32,

  kPhotoStart = 0x40,
  kPhotoData = 0x41,
  kPhotoEnd = 0x42,
  kPhotoAck = 0x43,
  kPhotoRetry = 0x44,
  kPhotoCancel = 0x45,
  kPhotoAnalysisResult = 0x46,
  kCapturePhoto = 0x47,

  kLiveSessionStart = 0x50,
  kLiveSessionEnd = 0x51,
  kLiveTranscription = 0x52,
  kVideoFrame = 0x53,

  kSystemStatus = 0xF0,
  kSystemConfig = 0xF1,
  kSystemError = 0xFF,
};

enum class MessageCategory : std::uint8_t {
  kConnection = 0,
  kVoice,
  kAi,
  kDisplay,
  kPhoto,
  kLive,
  kSystem,
};

struct CategoryRange {
  MessageCategory category;
  std::uint8_t first;
  std::uint8_t last;
};

inline constexpr std::size_t kMessageTypeCount = 34;
inline constexpr std::size_t kCategoryCount = 7;

// Every registered type, in code order.
const MessageType* AllMessageTypes();
const CategoryRange* AllCategoryRanges();

inline std::uint32_t Code(MessageType type) {
  return static_cast<std::uint32_t>(type);
}

std::optional<MessageType> MessageTypeFromCode(std::uint32_t code);
MessageCategory CategoryOf(MessageType type);
const char* MessageTypeName(MessageType type);
const char* CategoryName(MessageCategory category);

// HANDSHAKE, HANDSHAKE_ACK, HEARTBEAT, HEARTBEAT_ACK, DISCONNECT.
inline bool IsConnectionControl(MessageType type) {
  return CategoryOf(type) == MessageCategory::kConnection;
}

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_MESSAGE_TYPE_H
