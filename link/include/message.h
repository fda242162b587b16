#ifndef GLASSLINK_LINK_MESSAGE_H
#define GLASSLINK_LINK_MESSAGE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "message_type.h"
#include "protocol.h"

namespace glasslink::link {

struct Message {
  std::string id;
  MessageType type{MessageType::kHeartbeat};
  std::int64_t timestamp{0};
  std::optional<std::string> payload;
  std::optional<std::vector<std::uint8_t>> binary_data;
};

// Identity is the id plus the type; payloads are not compared.
inline bool operator==(const Message& a, const Message& b) {
  return a.id == b.id && a.type == b.type;
}
inline bool operator!=(const Message& a, const Message& b) {
  return !(a == b);
}

enum class Encoding : std::uint8_t {
  kText = 0,
  kBinary = 1,
};

inline constexpr std::size_t kBinaryHeaderBytes = 8;

std::string NewMessageId();

// Fresh id and the current wall-clock time.
Message NewMessage(MessageType type);
Message NewMessage(MessageType type, std::string payload);
Message NewMessage(MessageType type, std::vector<std::uint8_t> binary);

Message MakeHandshake(const std::string& device_name);
Message MakeHandshakeAck(const std::string& device_name);
Message MakeHeartbeat();
Message MakeHeartbeatAck();
Message MakeDisconnect();
Message MakeVoiceStart();
Message MakeVoiceData(std::vector<std::uint8_t> audio);
Message MakeVoiceEnd();
Message MakeVoiceCancel();
Message MakeAiProcessing(const std::string& status);
Message MakeAiResponseText(const std::string& text);
Message MakeAiResponseTts(std::vector<std::uint8_t> audio);
Message MakeAiError(const std::string& error);
Message MakeUserTranscript(const std::string& text);
Message MakeDisplayText(const std::string& text);
Message MakeDisplayClear();
Message MakeDisplayStatus(const std::string& status);
Message MakeCapturePhoto();
Message MakePhotoCancel();
Message MakePhotoAnalysisResult(const std::string& result);

// Textual form: one JSON object, binary_data as Base64. No trailing newline.
std::string EncodeText(const Message& msg);
std::optional<Message> DecodeText(std::string_view text);

// Compact form: typeCode:4 BE, length:4 BE, binary_data bytes.
// Only the type and binary_data survive; id and timestamp are regenerated.
std::vector<std::uint8_t> EncodeBinary(const Message& msg);
std::optional<Message> DecodeBinary(proto::ByteView data);
inline std::optional<Message> DecodeBinary(
    const std::vector<std::uint8_t>& data) {
  return DecodeBinary(proto::MakeByteView(data));
}

std::string Describe(const Message& msg);

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_MESSAGE_H
