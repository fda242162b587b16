#ifndef GLASSLINK_LINK_VOICE_STREAM_H
#define GLASSLINK_LINK_VOICE_STREAM_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "message.h"

namespace glasslink::link {

// Joins VOICE_START, VOICE_DATA* and VOICE_END into one utterance.
class VoiceAssembler {
 public:
  explicit VoiceAssembler(std::size_t max_bytes);

  // Returns the utterance when |msg| is a VOICE_END that completes one.
  // Non-voice messages are ignored.
  std::optional<std::vector<std::uint8_t>> OnMessage(const Message& msg);
  void Clear();

  bool active() const { return active_; }
  std::size_t buffered() const { return buffer_.size(); }
  std::uint64_t dropped_utterances() const { return dropped_; }

 private:
  std::size_t max_bytes_;
  std::vector<std::uint8_t> buffer_;
  bool active_{false};
  bool overflowed_{false};
  std::uint64_t dropped_{0};
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_VOICE_STREAM_H
