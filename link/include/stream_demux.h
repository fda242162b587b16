#ifndef GLASSLINK_LINK_STREAM_DEMUX_H
#define GLASSLINK_LINK_STREAM_DEMUX_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "link_config.h"

namespace glasslink::link {

enum class FrameKind : std::uint8_t {
  kTransferPacket = 0,
  kBinaryMessage = 1,
  kTextMessage = 2,
};

struct Frame {
  FrameKind kind{FrameKind::kTextMessage};
  // Whole frame: the packet, the 8-byte header plus body, or the JSON text
  // without its line terminator.
  std::vector<std::uint8_t> bytes;
};

struct DemuxStats {
  std::uint64_t frames{0};
  std::uint64_t dropped_bytes{0};
  std::uint64_t oversized_frames{0};
};

// Splits the inbound serial byte stream by each frame's leading byte.
class StreamDemux {
 public:
  explicit StreamDemux(FramingSection config);

  void Feed(const std::uint8_t* data, std::size_t len);
  // Next complete frame, or nullopt when more bytes are needed.
  std::optional<Frame> Next();
  void Reset();

  const DemuxStats& stats() const { return stats_; }
  std::size_t buffered() const { return buf_.size() - pos_; }

 private:
  std::size_t Available() const { return buf_.size() - pos_; }
  void Compact();
  bool SkipPending();
  Frame Take(FrameKind kind, std::size_t len);

  FramingSection config_;
  std::vector<std::uint8_t> buf_;
  std::size_t pos_{0};
  // Body bytes of an oversized binary frame still to be thrown away.
  std::size_t skip_remaining_{0};
  // An oversized text frame is being discarded up to its newline.
  bool skip_to_newline_{false};
  DemuxStats stats_;
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_STREAM_DEMUX_H
