#include "stream_demux.h"

#include <algorithm>

#include "message.h"
#include "platform_log.h"
#include "protocol.h"
#include "transfer_packet.h"

namespace glasslink::link {

namespace {

namespace pl = glasslink::platform::log;

constexpr char kTag[] = "demux";
constexpr std::size_t kCompactThreshold = 4096;

// Total size of a transfer packet, or 0 while the header is incomplete.
std::size_t TransferPacketSize(PacketTag tag, const std::uint8_t* p,
                               std::size_t avail) {
  switch (tag) {
    case PacketTag::kStart:
      return kStartPacketBytes;
    case PacketTag::kEnd:
      return kEndPacketBytes;
    case PacketTag::kAck:
      return kAckPacketBytes;
    case PacketTag::kRetry:
      return kRetryPacketBytes;
    case PacketTag::kData:
      if (avail < 3) {
        return 0;
      }
      return kDataHeaderBytes + proto::LoadUint16(p + 1);
  }
  return 0;
}

bool IsFiller(std::uint8_t b) { return b == '\n' || b == '\r' || b == ' '; }

}  // namespace

StreamDemux::StreamDemux(FramingSection config) : config_(config) {}

void StreamDemux::Feed(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  buf_.insert(buf_.end(), data, data + len);
}

void StreamDemux::Reset() {
  buf_.clear();
  pos_ = 0;
  skip_remaining_ = 0;
  skip_to_newline_ = false;
}

void StreamDemux::Compact() {
  if (pos_ == 0) {
    return;
  }
  if (pos_ >= buf_.size()) {
    buf_.clear();
    pos_ = 0;
    return;
  }
  if (pos_ >= kCompactThreshold || pos_ * 2 >= buf_.size()) {
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ = 0;
  }
}

Frame StreamDemux::Take(FrameKind kind, std::size_t len) {
  Frame frame;
  frame.kind = kind;
  frame.bytes.assign(buf_.begin() + static_cast<std::ptrdiff_t>(pos_),
                     buf_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
  pos_ += len;
  ++stats_.frames;
  return frame;
}

// Returns true once any pending discard has finished.
bool StreamDemux::SkipPending() {
  if (skip_remaining_ > 0) {
    const std::size_t n = std::min(skip_remaining_, Available());
    pos_ += n;
    skip_remaining_ -= n;
    if (skip_remaining_ > 0) {
      return false;
    }
  }
  if (skip_to_newline_) {
    const auto begin = buf_.begin() + static_cast<std::ptrdiff_t>(pos_);
    const auto nl = std::find(begin, buf_.end(), static_cast<std::uint8_t>('\n'));
    if (nl == buf_.end()) {
      pos_ = buf_.size();
      return false;
    }
    pos_ = static_cast<std::size_t>(nl - buf_.begin()) + 1;
    skip_to_newline_ = false;
  }
  return true;
}

std::optional<Frame> StreamDemux::Next() {
  while (true) {
    if (!SkipPending() || Available() == 0) {
      Compact();
      return std::nullopt;
    }
    const std::uint8_t* p = buf_.data() + pos_;
    const std::size_t avail = Available();
    const std::uint8_t lead = p[0];

    if (IsFiller(lead)) {
      ++pos_;
      continue;
    }

    if (const auto tag = PacketTagFromByte(lead)) {
      const std::size_t need = TransferPacketSize(*tag, p, avail);
      if (need == 0 || avail < need) {
        Compact();
        return std::nullopt;
      }
      return Take(FrameKind::kTransferPacket, need);
    }

    if (lead == 0x00) {
      if (avail < kBinaryHeaderBytes) {
        Compact();
        return std::nullopt;
      }
      const std::uint32_t code = proto::LoadUint32(p);
      if (code > 0xFFu) {
        // Not a message header; resync on the next byte.
        ++pos_;
        ++stats_.dropped_bytes;
        continue;
      }
      const std::uint32_t len = proto::LoadUint32(p + 4);
      if (len > config_.max_binary_frame_bytes) {
        pl::Log(pl::Level::kWarn, kTag, "binary frame too large",
                {{"len", std::to_string(len)}});
        ++stats_.oversized_frames;
        pos_ += kBinaryHeaderBytes;
        skip_remaining_ = len;
        continue;
      }
      const std::size_t need = kBinaryHeaderBytes + len;
      if (avail < need) {
        Compact();
        return std::nullopt;
      }
      return Take(FrameKind::kBinaryMessage, need);
    }

    if (lead == '{') {
      const auto nl = std::find(p, p + avail, static_cast<std::uint8_t>('\n'));
      if (nl == p + avail) {
        if (avail > config_.max_text_frame_bytes) {
          pl::Log(pl::Level::kWarn, kTag, "text frame too large");
          ++stats_.oversized_frames;
          pos_ = buf_.size();
          skip_to_newline_ = true;
        }
        Compact();
        return std::nullopt;
      }
      std::size_t len = static_cast<std::size_t>(nl - p);
      const std::size_t consumed = len + 1;
      if (len > 0 && p[len - 1] == '\r') {
        --len;
      }
      if (len > config_.max_text_frame_bytes) {
        ++stats_.oversized_frames;
        pos_ += consumed;
        continue;
      }
      Frame frame = Take(FrameKind::kTextMessage, len);
      pos_ += consumed - len;
      return frame;
    }

    ++pos_;
    ++stats_.dropped_bytes;
  }
}

}  // namespace glasslink::link
