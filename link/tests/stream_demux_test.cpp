#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "message.h"
#include "stream_demux.h"
#include "transfer_packet.h"

using glasslink::link::FrameKind;
using glasslink::link::FramingSection;
using glasslink::link::StreamDemux;

namespace {

using Bytes = std::vector<std::uint8_t>;

void Append(Bytes& out, const Bytes& more) {
  out.insert(out.end(), more.begin(), more.end());
}

Bytes TextLine(const std::string& json, const char* terminator = "\n") {
  Bytes out(json.begin(), json.end());
  for (const char* t = terminator; *t; ++t) {
    out.push_back(static_cast<std::uint8_t>(*t));
  }
  return out;
}

}  // namespace

int main() {
  const auto text_msg = glasslink::link::MakeDisplayText("hi");
  const std::string text = glasslink::link::EncodeText(text_msg);
  const Bytes binary =
      glasslink::link::EncodeBinary(glasslink::link::MakeVoiceData({9, 8, 7}));
  const Bytes ack =
      glasslink::link::EncodeAck(4, glasslink::link::TransferStatus::kSuccess);
  Bytes data_pkt;
  const Bytes chunk = {'a', 'b', 'c', 'd'};
  assert(glasslink::link::EncodeData(2, chunk.data(), chunk.size(), data_pkt));

  // Mixed frames fed in one go come out in order, classified by lead byte.
  {
    StreamDemux demux{FramingSection{}};
    Bytes stream;
    Append(stream, TextLine(text));
    Append(stream, binary);
    Append(stream, ack);
    Append(stream, data_pkt);
    Append(stream, TextLine(text, "\r\n"));
    demux.Feed(stream.data(), stream.size());

    auto f = demux.Next();
    assert(f && f->kind == FrameKind::kTextMessage);
    assert(std::string(f->bytes.begin(), f->bytes.end()) == text);
    f = demux.Next();
    assert(f && f->kind == FrameKind::kBinaryMessage && f->bytes == binary);
    f = demux.Next();
    assert(f && f->kind == FrameKind::kTransferPacket && f->bytes == ack);
    f = demux.Next();
    assert(f && f->kind == FrameKind::kTransferPacket && f->bytes == data_pkt);
    f = demux.Next();
    assert(f && f->kind == FrameKind::kTextMessage);
    assert(std::string(f->bytes.begin(), f->bytes.end()) == text);
    assert(!demux.Next().has_value());
    assert(demux.stats().frames == 5);
    assert(demux.buffered() == 0);
  }

  // Byte-at-a-time delivery.
  {
    StreamDemux demux{FramingSection{}};
    Bytes stream = binary;
    Append(stream, data_pkt);
    Append(stream, TextLine(text));
    std::vector<FrameKind> kinds;
    for (std::uint8_t b : stream) {
      demux.Feed(&b, 1);
      while (auto f = demux.Next()) {
        kinds.push_back(f->kind);
      }
    }
    assert(kinds.size() == 3);
    assert(kinds[0] == FrameKind::kBinaryMessage);
    assert(kinds[1] == FrameKind::kTransferPacket);
    assert(kinds[2] == FrameKind::kTextMessage);
  }

  // Garbage between frames is dropped and counted.
  {
    StreamDemux demux{FramingSection{}};
    Bytes stream = {0x7F, 0xEE, '\n', ' '};
    Append(stream, ack);
    // A zero lead whose first four bytes cannot be a message code.
    const Bytes fake = {0x00, 0x12, 0x34, 0x56};
    Append(stream, fake);
    Append(stream, TextLine(text));
    demux.Feed(stream.data(), stream.size());

    auto f = demux.Next();
    assert(f && f->bytes == ack);
    f = demux.Next();
    assert(f && f->kind == FrameKind::kTextMessage);
    assert(demux.stats().dropped_bytes >= 2);
  }

  // Oversized frames are skipped without losing the frames after them.
  {
    FramingSection cfg;
    cfg.max_binary_frame_bytes = 16;
    cfg.max_text_frame_bytes = 32;
    StreamDemux demux{cfg};

    Bytes stream = glasslink::link::EncodeBinary(
        glasslink::link::MakeVoiceData(Bytes(40, 0x55)));
    Append(stream, TextLine("{\"type\":48,\"payload\":\"" +
                            std::string(64, 'x') + "\"}"));
    Append(stream, ack);

    // Split the oversized binary body across feeds.
    demux.Feed(stream.data(), 20);
    assert(!demux.Next().has_value());
    demux.Feed(stream.data() + 20, stream.size() - 20);
    auto f = demux.Next();
    assert(f && f->bytes == ack);
    assert(demux.stats().oversized_frames == 2);
    assert(demux.stats().frames == 1);
  }

  // A long text frame with no newline yet is discarded up to its newline.
  {
    FramingSection cfg;
    cfg.max_text_frame_bytes = 8;
    StreamDemux demux{cfg};
    const std::string head = "{\"type\":48,\"payload\":\"long";
    demux.Feed(reinterpret_cast<const std::uint8_t*>(head.data()), head.size());
    assert(!demux.Next().has_value());
    const Bytes tail = TextLine("\"}");
    demux.Feed(tail.data(), tail.size());
    demux.Feed(ack.data(), ack.size());
    auto f = demux.Next();
    assert(f && f->bytes == ack);
    assert(demux.stats().oversized_frames == 1);
  }

  // Reset drops partial input.
  {
    StreamDemux demux{FramingSection{}};
    demux.Feed(binary.data(), 5);
    assert(demux.buffered() == 5);
    demux.Reset();
    assert(demux.buffered() == 0);
    demux.Feed(ack.data(), ack.size());
    assert(demux.Next().has_value());
  }

  return 0;
}
