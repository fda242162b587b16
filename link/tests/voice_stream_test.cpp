#include <cassert>
#include <cstdint>
#include <vector>

#include "message.h"
#include "voice_stream.h"

using glasslink::link::DecodeBinary;
using glasslink::link::EncodeBinary;
using glasslink::link::Message;
using glasslink::link::VoiceAssembler;

namespace {

// Voice messages travel in the compact binary encoding.
Message OverTheWire(const Message& msg) {
  const auto decoded = DecodeBinary(EncodeBinary(msg));
  assert(decoded.has_value());
  return *decoded;
}

}  // namespace

int main() {
  // START, DATA x3, END keeps order and bytes.
  {
    VoiceAssembler voice(1024);
    const std::vector<std::vector<std::uint8_t>> frames = {
        {1, 2, 3}, {4, 5}, {6, 7, 8, 9}};
    assert(!voice.OnMessage(OverTheWire(glasslink::link::MakeVoiceStart())));
    assert(voice.active());
    for (const auto& f : frames) {
      assert(!voice.OnMessage(OverTheWire(glasslink::link::MakeVoiceData(f))));
    }
    assert(voice.buffered() == 9);
    const auto audio =
        voice.OnMessage(OverTheWire(glasslink::link::MakeVoiceEnd()));
    assert(audio.has_value());
    assert((*audio == std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9}));
    assert(!voice.active());
    assert(voice.buffered() == 0);
  }

  // DATA without START opens an utterance.
  {
    VoiceAssembler voice(1024);
    voice.OnMessage(glasslink::link::MakeVoiceData({42}));
    const auto audio = voice.OnMessage(glasslink::link::MakeVoiceEnd());
    assert(audio && audio->size() == 1 && (*audio)[0] == 42);
  }

  // END with its own data returns that data.
  {
    VoiceAssembler voice(1024);
    voice.OnMessage(glasslink::link::MakeVoiceStart());
    voice.OnMessage(glasslink::link::MakeVoiceData({1}));
    Message end = glasslink::link::MakeVoiceEnd();
    end.binary_data = std::vector<std::uint8_t>{7, 7};
    const auto audio = voice.OnMessage(end);
    assert(audio && (*audio == std::vector<std::uint8_t>{7, 7}));
  }

  // Empty utterance and cancel yield nothing.
  {
    VoiceAssembler voice(1024);
    voice.OnMessage(glasslink::link::MakeVoiceStart());
    assert(!voice.OnMessage(glasslink::link::MakeVoiceEnd()).has_value());

    voice.OnMessage(glasslink::link::MakeVoiceStart());
    voice.OnMessage(glasslink::link::MakeVoiceData({1, 2}));
    voice.OnMessage(glasslink::link::MakeVoiceCancel());
    assert(!voice.active());
    assert(!voice.OnMessage(glasslink::link::MakeVoiceEnd()).has_value());
  }

  // Overflow drops the utterance until the next START.
  {
    VoiceAssembler voice(4);
    voice.OnMessage(glasslink::link::MakeVoiceStart());
    voice.OnMessage(glasslink::link::MakeVoiceData({1, 2, 3}));
    voice.OnMessage(glasslink::link::MakeVoiceData({4, 5}));
    assert(voice.dropped_utterances() == 1);
    voice.OnMessage(glasslink::link::MakeVoiceData({6}));
    assert(voice.buffered() == 0);
    assert(!voice.OnMessage(glasslink::link::MakeVoiceEnd()).has_value());

    voice.OnMessage(glasslink::link::MakeVoiceStart());
    voice.OnMessage(glasslink::link::MakeVoiceData({1, 2, 3, 4}));
    const auto audio = voice.OnMessage(glasslink::link::MakeVoiceEnd());
    assert(audio && audio->size() == 4);
  }

  // Other messages do not touch the buffer.
  {
    VoiceAssembler voice(16);
    voice.OnMessage(glasslink::link::MakeVoiceStart());
    voice.OnMessage(glasslink::link::MakeVoiceData({1}));
    assert(!voice.OnMessage(glasslink::link::MakeDisplayText("x")));
    assert(voice.buffered() == 1);
  }

  return 0;
}
