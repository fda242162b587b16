#include "voice_stream.h"

#include <utility>

#include "platform_log.h"

namespace glasslink::link {

namespace {

namespace pl = glasslink::platform::log;

constexpr char kTag[] = "voice";

}  // namespace

VoiceAssembler::VoiceAssembler(std::size_t max_bytes) : max_bytes_(max_bytes) {}

void VoiceAssembler::Clear() {
  buffer_.clear();
  active_ = false;
  overflowed_ = false;
}

std::optional<std::vector<std::uint8_t>> VoiceAssembler::OnMessage(
    const Message& msg) {
  switch (msg.type) {
    case MessageType::kVoiceStart:
      Clear();
      active_ = true;
      return std::nullopt;
    case MessageType::kVoiceData: {
      if (overflowed_ || !msg.binary_data) {
        return std::nullopt;
      }
      active_ = true;
      const auto& chunk = *msg.binary_data;
      if (buffer_.size() + chunk.size() > max_bytes_) {
        pl::Log(pl::Level::kWarn, kTag, "utterance too large, dropped",
                {{"limit", std::to_string(max_bytes_)}});
        buffer_.clear();
        overflowed_ = true;
        ++dropped_;
        return std::nullopt;
      }
      buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());
      return std::nullopt;
    }
    case MessageType::kVoiceEnd: {
      const bool overflowed = overflowed_;
      std::vector<std::uint8_t> audio = std::move(buffer_);
      Clear();
      if (msg.binary_data && !msg.binary_data->empty()) {
        return *msg.binary_data;
      }
      if (overflowed || audio.empty()) {
        return std::nullopt;
      }
      return audio;
    }
    case MessageType::kVoiceCancel:
      Clear();
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

}  // namespace glasslink::link
