#ifndef GLASSLINK_LINK_TRANSFER_RECEIVER_H
#define GLASSLINK_LINK_TRANSFER_RECEIVER_H

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include "link_config.h"
#include "transfer_types.h"

namespace glasslink::link {

// Receive side of the chunked transfer. One session at a time; a new START
// replaces the current one. Not thread-safe.
class TransferReceiver {
 public:
  explicit TransferReceiver(TransferSection config);

  void SetSendFn(PacketSendFn fn) { send_ = std::move(fn); }
  void SetObserver(TransferObserver* observer) { observer_ = observer; }

  // START, DATA and END. Other tags are ignored.
  void OnPacket(proto::ByteView packet, std::uint64_t now_ms);
  void Poll(std::uint64_t now_ms);

  // Drops the session without touching the wire.
  void Cancel(const char* reason);

  bool active() const { return active_; }
  std::uint32_t received_chunks() const {
    return static_cast<std::uint32_t>(chunks_.size());
  }
  std::uint32_t total_chunks() const { return start_.total_chunks; }

 private:
  void HandleStart(proto::ByteView packet, std::uint64_t now_ms);
  void HandleData(proto::ByteView packet, std::uint64_t now_ms);
  void HandleEnd(proto::ByteView packet, std::uint64_t now_ms);
  void Fail(TransferStatus status, const std::string& reason);
  void Reset();
  void Send(const std::vector<std::uint8_t>& packet);

  TransferSection config_;
  PacketSendFn send_;
  TransferObserver* observer_{nullptr};

  bool active_{false};
  StartPacket start_;
  std::map<std::uint32_t, std::vector<std::uint8_t>> chunks_;
  std::uint64_t held_bytes_{0};
  std::uint64_t started_ms_{0};
  std::uint64_t last_activity_ms_{0};
  std::uint32_t retry_requests_{0};
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_TRANSFER_RECEIVER_H
