#ifndef GLASSLINK_LINK_TRANSFER_TYPES_H
#define GLASSLINK_LINK_TRANSFER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "transfer_packet.h"

namespace glasslink::link {

enum class TransferDirection : std::uint8_t {
  kOutbound = 0,
  kInbound = 1,
};

inline const char* TransferDirectionName(TransferDirection dir) {
  return dir == TransferDirection::kOutbound ? "outbound" : "inbound";
}

struct TransferStats {
  std::size_t bytes{0};
  std::uint32_t chunks{0};
  std::uint64_t elapsed_ms{0};
  // Outbound: chunk resends. Inbound: RETRY requests issued.
  std::uint32_t retries{0};
};

using PacketSendFn = std::function<bool(const std::vector<std::uint8_t>&)>;

class TransferObserver {
 public:
  virtual ~TransferObserver() = default;

  virtual void OnTransferStarted(TransferDirection dir,
                                 std::uint32_t total_size,
                                 std::uint32_t total_chunks) {
    (void)dir;
    (void)total_size;
    (void)total_chunks;
  }
  virtual void OnTransferProgress(TransferDirection dir,
                                  std::uint32_t done_chunks,
                                  std::uint32_t total_chunks) {
    (void)dir;
    (void)done_chunks;
    (void)total_chunks;
  }
  // Inbound: the verified payload. Outbound: the payload that was delivered.
  virtual void OnTransferCompleted(TransferDirection dir,
                                   const std::vector<std::uint8_t>& data,
                                   const TransferStats& stats) = 0;
  virtual void OnTransferFailed(TransferDirection dir, TransferStatus status,
                                const std::string& reason) = 0;
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_TRANSFER_TYPES_H
