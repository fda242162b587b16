#include "message.h"

#include <atomic>
#include <limits>
#include <utility>

#include <nlohmann/json.hpp>

#include "base64.h"
#include "platform_random.h"
#include "platform_time.h"

namespace glasslink::link {

namespace {

using nlohmann::json;

constexpr char kKeyId[] = "id";
constexpr char kKeyType[] = "type";
constexpr char kKeyTimestamp[] = "timestamp";
constexpr char kKeyPayload[] = "payload";
constexpr char kKeyBinary[] = "binaryData";

std::atomic<std::uint64_t> g_fallback_counter{0};

std::string FallbackId() {
  // Only reached when the system entropy source is unavailable.
  const auto n = g_fallback_counter.fetch_add(1);
  return "local-" + std::to_string(platform::NowUnixMs()) + "-" +
         std::to_string(n);
}

std::optional<std::uint32_t> ReadTypeCode(const json& obj) {
  const auto it = obj.find(kKeyType);
  if (it == obj.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    const auto v = it->get<std::uint64_t>();
    if (v > (std::numeric_limits<std::uint32_t>::max)()) {
      return std::nullopt;
    }
    return static_cast<std::uint32_t>(v);
  }
  if (it->is_number_integer()) {
    const auto v = it->get<std::int64_t>();
    if (v < 0 || v > (std::numeric_limits<std::uint32_t>::max)()) {
      return std::nullopt;
    }
    return static_cast<std::uint32_t>(v);
  }
  return std::nullopt;
}

}  // namespace

std::string NewMessageId() {
  std::string id = platform::RandomUuid();
  if (id.empty()) {
    id = FallbackId();
  }
  return id;
}

Message NewMessage(MessageType type) {
  Message msg;
  msg.id = NewMessageId();
  msg.type = type;
  msg.timestamp = platform::NowUnixMs();
  return msg;
}

Message NewMessage(MessageType type, std::string payload) {
  Message msg = NewMessage(type);
  msg.payload = std::move(payload);
  return msg;
}

Message NewMessage(MessageType type, std::vector<std::uint8_t> binary) {
  Message msg = NewMessage(type);
  msg.binary_data = std::move(binary);
  return msg;
}

Message MakeHandshake(const std::string& device_name) {
  return NewMessage(MessageType::kHandshake, device_name);
}

Message MakeHandshakeAck(const std::string& device_name) {
  return NewMessage(MessageType::kHandshakeAck, device_name);
}

Message MakeHeartbeat() { return NewMessage(MessageType::kHeartbeat); }

Message MakeHeartbeatAck() { return NewMessage(MessageType::kHeartbeatAck); }

Message MakeDisconnect() { return NewMessage(MessageType::kDisconnect); }

Message MakeVoiceStart() { return NewMessage(MessageType::kVoiceStart); }

Message MakeVoiceData(std::vector<std::uint8_t> audio) {
  return NewMessage(MessageType::kVoiceData, std::move(audio));
}

Message MakeVoiceEnd() { return NewMessage(MessageType::kVoiceEnd); }

Message MakeVoiceCancel() { return NewMessage(MessageType::kVoiceCancel); }

Message MakeAiProcessing(const std::string& status) {
  return NewMessage(MessageType::kAiProcessing, status);
}

Message MakeAiResponseText(const std::string& text) {
  return NewMessage(MessageType::kAiResponseText, text);
}

Message MakeAiResponseTts(std::vector<std::uint8_t> audio) {
  return NewMessage(MessageType::kAiResponseTts, std::move(audio));
}

Message MakeAiError(const std::string& error) {
  return NewMessage(MessageType::kAiError, error);
}

Message MakeUserTranscript(const std::string& text) {
  return NewMessage(MessageType::kUserTranscript, text);
}

Message MakeDisplayText(const std::string& text) {
  return NewMessage(MessageType::kDisplayText, text);
}

Message MakeDisplayClear() { return NewMessage(MessageType::kDisplayClear); }

Message MakeDisplayStatus(const std::string& status) {
  return NewMessage(MessageType::kDisplayStatus, status);
}

Message MakeCapturePhoto() { return NewMessage(MessageType::kCapturePhoto); }

Message MakePhotoCancel() { return NewMessage(MessageType::kPhotoCancel); }

Message MakePhotoAnalysisResult(const std::string& result) {
  return NewMessage(MessageType::kPhotoAnalysisResult, result);
}

std::string EncodeText(const Message& msg) {
  json obj = json::object();
  obj[kKeyId] = msg.id;
  obj[kKeyType] = Code(msg.type);
  obj[kKeyTimestamp] = msg.timestamp;
  if (msg.payload) {
    obj[kKeyPayload] = *msg.payload;
  }
  if (msg.binary_data) {
    obj[kKeyBinary] = common::Base64Encode(*msg.binary_data);
  }
  // Invalid UTF-8 in the payload is replaced instead of throwing.
  return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<Message> DecodeText(std::string_view text) {
  const json obj = json::parse(text.begin(), text.end(), nullptr, false);
  if (obj.is_discarded() || !obj.is_object()) {
    return std::nullopt;
  }
  const auto code = ReadTypeCode(obj);
  if (!code) {
    return std::nullopt;
  }
  const auto type = MessageTypeFromCode(*code);
  if (!type) {
    return std::nullopt;
  }

  Message msg;
  msg.type = *type;

  const auto id_it = obj.find(kKeyId);
  if (id_it != obj.end() && id_it->is_string()) {
    msg.id = id_it->get<std::string>();
  } else {
    msg.id = NewMessageId();
  }

  const auto ts_it = obj.find(kKeyTimestamp);
  if (ts_it != obj.end() && ts_it->is_number_integer()) {
    msg.timestamp = ts_it->get<std::int64_t>();
  } else {
    msg.timestamp = platform::NowUnixMs();
  }

  const auto payload_it = obj.find(kKeyPayload);
  if (payload_it != obj.end()) {
    if (!payload_it->is_string()) {
      return std::nullopt;
    }
    msg.payload = payload_it->get<std::string>();
  }

  const auto bin_it = obj.find(kKeyBinary);
  if (bin_it != obj.end()) {
    if (!bin_it->is_string()) {
      return std::nullopt;
    }
    std::vector<std::uint8_t> bytes;
    if (!common::Base64Decode(bin_it->get_ref<const std::string&>(), bytes)) {
      return std::nullopt;
    }
    msg.binary_data = std::move(bytes);
  }
  return msg;
}

std::vector<std::uint8_t> EncodeBinary(const Message& msg) {
  std::vector<std::uint8_t> out;
  const std::size_t len = msg.binary_data ? msg.binary_data->size() : 0;
  out.reserve(kBinaryHeaderBytes + len);
  proto::WriteUint32(Code(msg.type), out);
  proto::WriteUint32(static_cast<std::uint32_t>(len), out);
  if (len != 0) {
    proto::WriteRaw(msg.binary_data->data(), len, out);
  }
  return out;
}

std::optional<Message> DecodeBinary(proto::ByteView data) {
  if (!data.data || data.size < kBinaryHeaderBytes) {
    return std::nullopt;
  }
  std::size_t off = 0;
  std::uint32_t code = 0;
  std::uint32_t len = 0;
  if (!proto::ReadUint32(data, off, code) ||
      !proto::ReadUint32(data, off, len)) {
    return std::nullopt;
  }
  const auto type = MessageTypeFromCode(code);
  if (!type) {
    return std::nullopt;
  }
  if (len > data.size - off) {
    return std::nullopt;
  }
  Message msg = NewMessage(*type);
  if (len != 0) {
    std::vector<std::uint8_t> bytes;
    if (!proto::ReadRaw(data, off, len, bytes)) {
      return std::nullopt;
    }
    msg.binary_data = std::move(bytes);
  }
  return msg;
}

std::string Describe(const Message& msg) {
  std::string out = MessageTypeName(msg.type);
  out += " id=";
  out += msg.id;
  if (msg.payload) {
    out += " payload_len=";
    out += std::to_string(msg.payload->size());
  }
  if (msg.binary_data) {
    out += " binary_len=";
    out += std::to_string(msg.binary_data->size());
  }
  return out;
}

}  // namespace glasslink::link
