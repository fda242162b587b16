#include "message_type.h"

namespace glasslink::link {

namespace {

struct TypeEntry {
  MessageType type;
  const char* name;
};

constexpr TypeEntry kTypes[kMessageTypeCount] = {
    {MessageType::kHandshake, "HANDSHAKE"},
    {MessageType::kHandshakeAck, "HANDSHAKE_ACK"},
    {MessageType::kHeartbeat, "HEARTBEAT"},
    {MessageType::kHeartbeatAck, "HEARTBEAT_ACK"},
    {MessageType::kDisconnect, "DISCONNECT"},
    {MessageType::kVoiceStart, "VOICE_START"},
    {MessageType::kVoiceData, "VOICE_DATA"},
    {MessageType::kVoiceEnd, "VOICE_END"},
    {MessageType::kVoiceCancel, "VOICE_CANCEL"},
    {MessageType::kRemoteRecordStart, "REMOTE_RECORD_START"},
    {MessageType::kRemoteRecordStop, "REMOTE_RECORD_STOP"},
    {MessageType::kAiProcessing, "AI_PROCESSING"},
    {MessageType::kAiResponseText, "AI_RESPONSE_TEXT"},
    {MessageType::kAiResponseTts, "AI_RESPONSE_TTS"},
    {MessageType::kUserTranscript, "USER_TRANSCRIPT"},
    {MessageType::kAiError, "AI_ERROR"},
    {MessageType::kDisplayText, "DISPLAY_TEXT"},
    {MessageType::kDisplayClear, "DISPLAY_CLEAR"},
    {MessageType::kDisplayStatus, "DISPLAY_STATUS"},
    {MessageType::kPhotoStart, "PHOTO_START"},
    {MessageType::kPhotoData, "PHOTO_DATA"},
    {MessageType::kPhotoEnd, "PHOTO_END"},
    {MessageType::kPhotoAck, "PHOTO_ACK"},
    {MessageType::kPhotoRetry, "PHOTO_RETRY"},
    {MessageType::kPhotoCancel, "PHOTO_CANCEL"},
    {MessageType::kPhotoAnalysisResult, "PHOTO_ANALYSIS_RESULT"},
    {MessageType::kCapturePhoto, "CAPTURE_PHOTO"},
    {MessageType::kLiveSessionStart, "LIVE_SESSION_START"},
    {MessageType::kLiveSessionEnd, "LIVE_SESSION_END"},
    {MessageType::kLiveTranscription, "LIVE_TRANSCRIPTION"},
    {MessageType::kVideoFrame, "VIDEO_FRAME"},
    {MessageType::kSystemStatus, "SYSTEM_STATUS"},
    {MessageType::kSystemConfig, "SYSTEM_CONFIG"},
    {MessageType::kSystemError, "SYSTEM_ERROR"},
};

constexpr MessageType kTypeList[kMessageTypeCount] = {
    MessageType::kHandshake,         MessageType::kHandshakeAck,
    MessageType::kHeartbeat,         MessageType::kHeartbeatAck,
    MessageType::kDisconnect,        MessageType::kVoiceStart,
    MessageType::kVoiceData,         MessageType::kVoiceEnd,
    MessageType::kVoiceCancel,       MessageType::kRemoteRecordStart,
    MessageType::kRemoteRecordStop,  MessageType::kAiProcessing,
    MessageType::kAiResponseText,    MessageType::kAiResponseTts,
    MessageType::kUserTranscript,    MessageType::kAiError,
    MessageType::kDisplayText,       MessageType::kDisplayClear,
    MessageType::kDisplayStatus,     MessageType::kPhotoStart,
    MessageType::kPhotoData,         MessageType::kPhotoEnd,
    MessageType::kPhotoAck,          MessageType::kPhotoRetry,
    MessageType::kPhotoCancel,       MessageType::kPhotoAnalysisResult,
    MessageType::kCapturePhoto,      MessageType::kLiveSessionStart,
    MessageType::kLiveSessionEnd,    MessageType::kLiveTranscription,
    MessageType::kVideoFrame,        MessageType::kSystemStatus,
    MessageType::kSystemConfig,      MessageType::kSystemError,
};

constexpr CategoryRange kRanges[kCategoryCount] = {
    {MessageCategory::kConnection, 0x00, 0x0F},
    {MessageCategory::kVoice, 0x10, 0x1F},
    {MessageCategory::kAi, 0x20, 0x2F},
    {MessageCategory::kDisplay, 0x30, 0x3F},
    {MessageCategory::kPhoto, 0x40, 0x4F},
    {MessageCategory::kLive, 0x50, 0x5F},
    {MessageCategory::kSystem, 0xF0, 0xFF},
};

}  // namespace

const MessageType* AllMessageTypes() { return kTypeList; }

const CategoryRange* AllCategoryRanges() { return kRanges; }

std::optional<MessageType> MessageTypeFromCode(std::uint32_t code) {
  for (const auto& entry : kTypes) {
    if (static_cast<std::uint32_t>(entry.type) == code) {
      return entry.type;
    }
  }
  return std::nullopt;
}

MessageCategory CategoryOf(MessageType type) {
  const auto code = static_cast<std::uint8_t>(type);
  for (const auto& range : kRanges) {
    if (code >= range.first && code <= range.last) {
      return range.category;
    }
  }
  return MessageCategory::kSystem;
}

const char* MessageTypeName(MessageType type) {
  for (const auto& entry : kTypes) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

const char* CategoryName(MessageCategory category) {
  switch (category) {
    case MessageCategory::kConnection:
      return "connection";
    case MessageCategory::kVoice:
      return "voice";
    case MessageCategory::kAi:
      return "ai";
    case MessageCategory::kDisplay:
      return "display";
    case MessageCategory::kPhoto:
      return "photo";
    case MessageCategory::kLive:
      return "live";
    case MessageCategory::kSystem:
      return "system";
  }
  return "unknown";
}

}  // namespace glasslink::link
