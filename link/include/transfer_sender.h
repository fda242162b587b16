#ifndef GLASSLINK_LINK_TRANSFER_SENDER_H
#define GLASSLINK_LINK_TRANSFER_SENDER_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "link_config.h"
#include "transfer_types.h"

namespace glasslink::link {

// Stop-and-wait sender: one DATA packet in flight, advanced by ACK(SUCCESS),
// resent on RETRY, ACK(failure) or ack timeout. Not thread-safe.
class TransferSender {
 public:
  explicit TransferSender(TransferSection config);

  void SetSendFn(PacketSendFn fn) { send_ = std::move(fn); }
  void SetObserver(TransferObserver* observer) { observer_ = observer; }

  // Sends START and the first DATA packet.
  bool Start(std::vector<std::uint8_t> payload, std::uint64_t now_ms,
             std::string& error);

  // ACK and RETRY. An ACK carrying ERROR or OUT_OF_MEMORY is a rejection by
  // the peer. Other tags are ignored.
  void OnPacket(proto::ByteView packet, std::uint64_t now_ms);
  void Poll(std::uint64_t now_ms);

  // Aborts the transfer. END(ERROR) goes out only when |notify_peer|.
  void Abort(const std::string& reason, bool notify_peer);

  bool active() const { return active_; }
  std::uint32_t in_flight_index() const { return next_index_; }
  std::uint32_t total_chunks() const {
    return static_cast<std::uint32_t>(chunks_.size());
  }

 private:
  void SendCurrentChunk(std::uint64_t now_ms);
  void Resend(std::uint64_t now_ms, TransferStatus cause);
  void Finish(std::uint64_t now_ms);
  void Fail(TransferStatus status, const std::string& reason,
            bool notify_peer);
  void Reset();
  void Send(const std::vector<std::uint8_t>& packet);

  TransferSection config_;
  PacketSendFn send_;
  TransferObserver* observer_{nullptr};

  bool active_{false};
  std::vector<std::uint8_t> payload_;
  std::vector<std::vector<std::uint8_t>> chunks_;
  std::uint32_t next_index_{0};
  std::uint32_t chunk_retries_{0};
  std::uint32_t total_retries_{0};
  std::uint64_t started_ms_{0};
  std::uint64_t last_send_ms_{0};
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_TRANSFER_SENDER_H
