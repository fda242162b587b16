#include <cassert>
#include <cstdint>
#include <cstring>
#include <set>
#include <string>

#include "message_type.h"

using glasslink::link::AllCategoryRanges;
using glasslink::link::AllMessageTypes;
using glasslink::link::CategoryOf;
using glasslink::link::Code;
using glasslink::link::MessageCategory;
using glasslink::link::MessageType;
using glasslink::link::MessageTypeFromCode;
using glasslink::link::MessageTypeName;

int main() {
  const MessageType* types = AllMessageTypes();
  const auto* ranges = AllCategoryRanges();

  std::set<std::uint32_t> codes;
  std::set<std::string> names;
  for (std::size_t i = 0; i < glasslink::link::kMessageTypeCount; ++i) {
    const MessageType t = types[i];
    codes.insert(Code(t));
    names.insert(MessageTypeName(t));
    assert(std::strcmp(MessageTypeName(t), "UNKNOWN") != 0);

    const auto back = MessageTypeFromCode(Code(t));
    assert(back.has_value());
    assert(*back == t);

    bool in_range = false;
    for (std::size_t r = 0; r < glasslink::link::kCategoryCount; ++r) {
      if (Code(t) >= ranges[r].first && Code(t) <= ranges[r].last) {
        assert(ranges[r].category == CategoryOf(t));
        in_range = true;
      }
    }
    assert(in_range);
  }
  assert(codes.size() == 34);
  assert(names.size() == 34);

  // Ranges are disjoint.
  for (std::size_t a = 0; a < glasslink::link::kCategoryCount; ++a) {
    for (std::size_t b = a + 1; b < glasslink::link::kCategoryCount; ++b) {
      assert(ranges[a].last < ranges[b].first ||
             ranges[b].last < ranges[a].first);
    }
  }

  assert(Code(MessageType::kHandshake) == 0x00);
  assert(Code(MessageType::kDisconnect) == 0x0F);
  assert(Code(MessageType::kVoiceData) == 0x11);
  assert(Code(MessageType::kAiError) == 0x2F);
  assert(Code(MessageType::kPhotoCancel) == 0x45);
  assert(Code(MessageType::kVideoFrame) == 0x53);
  assert(Code(MessageType::kSystemError) == 0xFF);

  assert(CategoryOf(MessageType::kHeartbeatAck) == MessageCategory::kConnection);
  assert(CategoryOf(MessageType::kRemoteRecordStop) == MessageCategory::kVoice);
  assert(CategoryOf(MessageType::kCapturePhoto) == MessageCategory::kPhoto);
  assert(CategoryOf(MessageType::kSystemConfig) == MessageCategory::kSystem);
  assert(glasslink::link::IsConnectionControl(MessageType::kHeartbeat));
  assert(!glasslink::link::IsConnectionControl(MessageType::kDisplayText));

  // Unregistered codes, including gaps inside a range.
  assert(!MessageTypeFromCode(0x04).has_value());
  assert(!MessageTypeFromCode(0x16).has_value());
  assert(!MessageTypeFromCode(0x60).has_value());
  assert(!MessageTypeFromCode(0xEF).has_value());
  assert(!MessageTypeFromCode(0x100).has_value());
  assert(!MessageTypeFromCode(0xFFFFFFFFu).has_value());

  return 0;
}
