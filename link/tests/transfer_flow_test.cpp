#include <cassert>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "link_config.h"
#include "transfer_receiver.h"
#include "transfer_sender.h"

using glasslink::link::EncodeData;
using glasslink::link::EncodeEnd;
using glasslink::link::EncodeStart;
using glasslink::link::PacketTag;
using glasslink::link::StartPacket;
using glasslink::link::TransferDirection;
using glasslink::link::TransferReceiver;
using glasslink::link::TransferSection;
using glasslink::link::TransferSender;
using glasslink::link::TransferStats;
using glasslink::link::TransferStatus;
using glasslink::link::proto::MakeByteView;

namespace {

class Recorder : public glasslink::link::TransferObserver {
 public:
  void OnTransferStarted(TransferDirection, std::uint32_t total_size,
                         std::uint32_t total_chunks) override {
    ++started;
    started_size = total_size;
    started_chunks = total_chunks;
  }
  void OnTransferProgress(TransferDirection, std::uint32_t done,
                          std::uint32_t) override {
    last_progress = done;
  }
  void OnTransferCompleted(TransferDirection,
                           const std::vector<std::uint8_t>& data,
                           const TransferStats& s) override {
    ++completed;
    received = data;
    stats = s;
  }
  void OnTransferFailed(TransferDirection, TransferStatus status,
                        const std::string& why) override {
    ++failed;
    fail_status = status;
    reason = why;
  }

  int started{0};
  int completed{0};
  int failed{0};
  std::uint32_t started_size{0};
  std::uint32_t started_chunks{0};
  std::uint32_t last_progress{0};
  std::vector<std::uint8_t> received;
  TransferStats stats;
  TransferStatus fail_status{TransferStatus::kSuccess};
  std::string reason;
};

using Packet = std::vector<std::uint8_t>;

// Queued, in-order delivery between one sender and one receiver.
struct Harness {
  explicit Harness(TransferSection cfg) : sender(cfg), receiver(cfg) {
    sender.SetObserver(&tx_events);
    receiver.SetObserver(&rx_events);
    sender.SetSendFn([this](const Packet& p) {
      to_receiver.push_back(p);
      return true;
    });
    receiver.SetSendFn([this](const Packet& p) {
      to_sender.push_back(p);
      return true;
    });
  }

  void Pump(std::uint64_t now_ms) {
    while (!to_receiver.empty() || !to_sender.empty()) {
      if (!to_receiver.empty()) {
        Packet p = to_receiver.front();
        to_receiver.pop_front();
        if (tamper) {
          tamper(p);
        }
        if (drop_to_receiver) {
          continue;
        }
        receiver.OnPacket(MakeByteView(p), now_ms);
      }
      if (!to_sender.empty()) {
        Packet p = to_sender.front();
        to_sender.pop_front();
        from_receiver.push_back(p);
        sender.OnPacket(MakeByteView(p), now_ms);
      }
    }
  }

  TransferSender sender;
  TransferReceiver receiver;
  Recorder tx_events;
  Recorder rx_events;
  std::deque<Packet> to_receiver;
  std::deque<Packet> to_sender;
  std::vector<Packet> from_receiver;
  std::function<void(Packet&)> tamper;
  bool drop_to_receiver{false};
};

std::vector<std::uint8_t> Pattern(std::size_t n) {
  std::vector<std::uint8_t> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = static_cast<std::uint8_t>(i % 251);
  }
  return out;
}

TransferSection SmallChunks() {
  TransferSection cfg;
  cfg.chunk_size = 512;
  cfg.max_retry_count = 3;
  cfg.ack_timeout_ms = 100;
  cfg.transfer_timeout_ms = 1000;
  return cfg;
}

}  // namespace

int main() {
  // End to end: 2 * chunk_size + 321 bytes.
  {
    TransferSection cfg;
    Harness h(cfg);
    const auto payload = Pattern(2 * cfg.chunk_size + 321);
    std::string err;
    assert(h.sender.Start(payload, 0, err));
    assert(h.sender.active());
    h.Pump(10);
    assert(!h.sender.active());
    assert(!h.receiver.active());
    assert(h.rx_events.completed == 1);
    assert(h.rx_events.received == payload);
    assert(h.rx_events.started_chunks == 3);
    assert(h.rx_events.stats.bytes == payload.size());
    assert(h.tx_events.completed == 1);
    assert(h.tx_events.stats.chunks == 3);
    assert(h.tx_events.stats.retries == 0);
    assert(h.tx_events.last_progress == 3);
    assert(h.tx_events.failed == 0 && h.rx_events.failed == 0);
  }

  // Corrupt chunk 5 once: receiver asks for RETRY(5), resend completes.
  {
    Harness h(SmallChunks());
    const auto payload = Pattern(8 * 512);
    bool corrupted = false;
    h.tamper = [&corrupted](Packet& p) {
      if (!corrupted && p[0] == static_cast<std::uint8_t>(PacketTag::kData) &&
          p[6] == 5) {
        p.back() ^= 0x40;
        corrupted = true;
      }
    };
    std::string err;
    assert(h.sender.Start(payload, 0, err));
    h.Pump(1);
    assert(corrupted);

    bool saw_retry5 = false;
    for (const auto& p : h.from_receiver) {
      if (p[0] == static_cast<std::uint8_t>(PacketTag::kRetry)) {
        assert(*glasslink::link::ParseRetry(MakeByteView(p)) == 5);
        saw_retry5 = true;
      }
    }
    assert(saw_retry5);
    assert(h.rx_events.completed == 1);
    assert(h.rx_events.received == payload);
    assert(h.rx_events.stats.retries == 1);
    assert(h.tx_events.stats.retries == 1);
  }

  // Retry budget exhausted: every DATA is corrupted.
  {
    Harness h(SmallChunks());
    h.tamper = [](Packet& p) {
      if (p[0] == static_cast<std::uint8_t>(PacketTag::kData)) {
        p.back() ^= 0x01;
      }
    };
    std::string err;
    assert(h.sender.Start(Pattern(600), 0, err));
    h.Pump(1);
    assert(!h.sender.active());
    assert(h.tx_events.failed == 1);
    assert(h.tx_events.fail_status == TransferStatus::kCrcError);
    // END(ERROR) tears the receive session down too.
    assert(h.rx_events.failed == 1);
    assert(!h.receiver.active());
  }

  // Ack timeout resends, then gives up after max_retry_count resends.
  {
    Harness h(SmallChunks());
    h.drop_to_receiver = true;
    std::string err;
    assert(h.sender.Start(Pattern(100), 0, err));
    h.Pump(0);
    h.sender.Poll(50);
    assert(h.sender.active());
    h.sender.Poll(100);
    h.sender.Poll(200);
    h.sender.Poll(300);
    assert(h.sender.active());
    h.sender.Poll(400);
    assert(!h.sender.active());
    assert(h.tx_events.fail_status == TransferStatus::kTimeout);
  }

  // Single outbound transfer and payload validation.
  {
    TransferSection cfg = SmallChunks();
    cfg.max_payload_bytes = 2048;
    cfg.max_chunks = 3;
    Harness h(cfg);
    std::string err;
    assert(!h.sender.Start({}, 0, err));
    assert(!h.sender.Start(Pattern(2049), 0, err));
    assert(!h.sender.Start(Pattern(4 * 512), 0, err));
    assert(h.sender.Start(Pattern(3 * 512), 0, err));
    assert(!h.sender.Start(Pattern(10), 0, err));
    assert(err == "transfer already in progress");
  }

  // ACK for another index is ignored.
  {
    Harness h(SmallChunks());
    std::string err;
    assert(h.sender.Start(Pattern(1024), 0, err));
    h.to_receiver.clear();
    h.sender.OnPacket(
        MakeByteView(glasslink::link::EncodeAck(1, TransferStatus::kSuccess)),
        1);
    assert(h.sender.in_flight_index() == 0);
    h.sender.OnPacket(
        MakeByteView(glasslink::link::EncodeAck(0, TransferStatus::kSuccess)),
        1);
    assert(h.sender.in_flight_index() == 1);
  }

  // Receiver: gap at END fails with no data exposed.
  {
    TransferReceiver rx(SmallChunks());
    Recorder ev;
    std::vector<Packet> out;
    rx.SetObserver(&ev);
    rx.SetSendFn([&out](const Packet& p) {
      out.push_back(p);
      return true;
    });
    const auto payload = Pattern(3 * 512);
    StartPacket start;
    start.total_size = static_cast<std::uint32_t>(payload.size());
    start.total_chunks = 3;
    start.md5 = glasslink::link::checksum::Md5(payload);
    rx.OnPacket(MakeByteView(EncodeStart(start)), 0);
    assert(rx.active());
    assert(out.empty());

    Packet data;
    assert(EncodeData(0, payload.data(), 512, data));
    rx.OnPacket(MakeByteView(data), 1);
    assert(EncodeData(2, payload.data() + 1024, 512, data));
    rx.OnPacket(MakeByteView(data), 2);
    // Duplicate overwrites and is ACKed again.
    rx.OnPacket(MakeByteView(data), 3);
    assert(rx.received_chunks() == 2);
    assert(out.size() == 3);

    // Out of range index.
    assert(EncodeData(9, payload.data(), 10, data));
    rx.OnPacket(MakeByteView(data), 4);
    const auto nack = glasslink::link::ParseAck(MakeByteView(out.back()));
    assert(nack && nack->chunk_index == 9 &&
           nack->status == TransferStatus::kError);

    rx.OnPacket(MakeByteView(EncodeEnd(TransferStatus::kSuccess)), 5);
    assert(!rx.active());
    assert(ev.failed == 1);
    assert(ev.completed == 0);
    assert(ev.reason == "missing chunks");
  }

  // Receiver: MD5 mismatch.
  {
    TransferReceiver rx(SmallChunks());
    Recorder ev;
    rx.SetObserver(&ev);
    rx.SetSendFn([](const Packet&) { return true; });
    const auto payload = Pattern(100);
    StartPacket start;
    start.total_size = 100;
    start.total_chunks = 1;
    start.md5 = glasslink::link::checksum::Md5(Pattern(99));
    rx.OnPacket(MakeByteView(EncodeStart(start)), 0);
    Packet data;
    assert(EncodeData(0, payload.data(), payload.size(), data));
    rx.OnPacket(MakeByteView(data), 1);
    rx.OnPacket(MakeByteView(EncodeEnd(TransferStatus::kSuccess)), 2);
    assert(ev.failed == 1);
    assert(ev.fail_status == TransferStatus::kMd5Error);
  }

  // Receiver: rejected START answers a failing ACK(0); DATA without session
  // is ignored; idle timeout.
  {
    TransferReceiver rx(SmallChunks());
    Recorder ev;
    std::vector<Packet> out;
    rx.SetObserver(&ev);
    rx.SetSendFn([&out](const Packet& p) {
      out.push_back(p);
      return true;
    });
    StartPacket empty;
    rx.OnPacket(MakeByteView(EncodeStart(empty)), 0);
    assert(!rx.active());
    assert(out.size() == 1);
    auto rejected = glasslink::link::ParseAck(MakeByteView(out[0]));
    assert(rejected && rejected->chunk_index == 0 &&
           rejected->status == TransferStatus::kError);

    StartPacket huge;
    huge.total_size = SmallChunks().max_payload_bytes + 1;
    huge.total_chunks = 1;
    rx.OnPacket(MakeByteView(EncodeStart(huge)), 0);
    assert(!rx.active());
    assert(out.size() == 2);
    rejected = glasslink::link::ParseAck(MakeByteView(out[1]));
    assert(rejected && rejected->chunk_index == 0 &&
           rejected->status == TransferStatus::kOutOfMemory);
    out.clear();

    Packet data;
    const auto payload = Pattern(10);
    assert(EncodeData(0, payload.data(), payload.size(), data));
    rx.OnPacket(MakeByteView(data), 1);
    assert(out.empty());

    StartPacket start;
    start.total_size = 10;
    start.total_chunks = 1;
    start.md5 = glasslink::link::checksum::Md5(payload);
    rx.OnPacket(MakeByteView(EncodeStart(start)), 100);
    rx.Poll(1099);
    assert(rx.active());
    rx.Poll(1100);
    assert(!rx.active());
    assert(ev.fail_status == TransferStatus::kTimeout);
  }

  // Receiver: chunks may not hold more than the declared size.
  {
    TransferReceiver rx(SmallChunks());
    Recorder ev;
    std::vector<Packet> out;
    rx.SetObserver(&ev);
    rx.SetSendFn([&out](const Packet& p) {
      out.push_back(p);
      return true;
    });
    const auto payload = Pattern(512);
    StartPacket start;
    start.total_size = 600;
    start.total_chunks = 2;
    rx.OnPacket(MakeByteView(EncodeStart(start)), 0);
    Packet data;
    assert(EncodeData(0, payload.data(), payload.size(), data));
    rx.OnPacket(MakeByteView(data), 1);
    // Duplicates replace, so they do not add up.
    rx.OnPacket(MakeByteView(data), 2);
    assert(rx.active());
    assert(EncodeData(1, payload.data(), payload.size(), data));
    rx.OnPacket(MakeByteView(data), 3);
    assert(!rx.active());
    assert(ev.failed == 1);
    assert(ev.fail_status == TransferStatus::kOutOfMemory);
    const auto nack = glasslink::link::ParseAck(MakeByteView(out.back()));
    assert(nack && nack->chunk_index == 1 &&
           nack->status == TransferStatus::kOutOfMemory);
  }

  // Sender stops on a rejecting ACK and leaves END to the receive side.
  {
    Harness h(SmallChunks());
    std::string err;
    assert(h.sender.Start(Pattern(10), 0, err));
    h.sender.OnPacket(MakeByteView(EncodeEnd(TransferStatus::kError)), 1);
    assert(h.sender.active());
    h.sender.OnPacket(
        MakeByteView(glasslink::link::EncodeAck(0, TransferStatus::kOutOfMemory)),
        1);
    assert(!h.sender.active());
    assert(h.tx_events.failed == 1);
    assert(h.tx_events.fail_status == TransferStatus::kOutOfMemory);
    assert(h.tx_events.reason == "rejected by peer");
  }

  // Sender against a receiver with a smaller payload limit.
  {
    TransferSection small = SmallChunks();
    small.max_payload_bytes = 1000;
    Harness h(SmallChunks());
    TransferReceiver narrow(small);
    Recorder narrow_events;
    narrow.SetObserver(&narrow_events);
    narrow.SetSendFn([&h](const Packet& p) {
      h.to_sender.push_back(p);
      return true;
    });
    std::string err;
    assert(h.sender.Start(Pattern(2000), 0, err));
    while (!h.to_receiver.empty() || !h.to_sender.empty()) {
      if (!h.to_receiver.empty()) {
        const Packet p = h.to_receiver.front();
        h.to_receiver.pop_front();
        narrow.OnPacket(MakeByteView(p), 1);
      }
      if (!h.to_sender.empty()) {
        const Packet p = h.to_sender.front();
        h.to_sender.pop_front();
        h.sender.OnPacket(MakeByteView(p), 1);
      }
    }
    assert(!h.sender.active());
    assert(h.tx_events.fail_status == TransferStatus::kOutOfMemory);
    assert(narrow_events.started == 0);
    assert(narrow_events.failed == 0);
  }

  return 0;
}
