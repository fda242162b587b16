#ifndef GLASSLINK_LINK_LINK_ENDPOINT_H
#define GLASSLINK_LINK_LINK_ENDPOINT_H

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "connection_supervisor.h"
#include "link_config.h"
#include "link_transport.h"
#include "message.h"
#include "stream_demux.h"
#include "transfer_receiver.h"
#include "transfer_sender.h"
#include "voice_stream.h"

namespace glasslink::link {

class LinkObserver {
 public:
  virtual ~LinkObserver() = default;

  virtual void OnStateChanged(ConnectionState from, ConnectionState to) {
    (void)from;
    (void)to;
  }
  virtual void OnReconnectRequested(std::uint32_t attempt) { (void)attempt; }
  // Application messages only; connection control never reaches here.
  virtual void OnMessage(const Message& msg) { (void)msg; }
  virtual void OnVoiceUtterance(const std::vector<std::uint8_t>& audio) {
    (void)audio;
  }
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
  virtual void OnTransferCompleted(TransferDirection dir,
                                   const std::vector<std::uint8_t>& data,
                                   const TransferStats& stats) {
    (void)dir;
    (void)data;
    (void)stats;
  }
  virtual void OnTransferFailed(TransferDirection dir, TransferStatus status,
                                const std::string& reason) {
    (void)dir;
    (void)status;
    (void)reason;
  }
};

struct EndpointStats {
  std::uint64_t frames_in{0};
  std::uint64_t decode_failures{0};
  std::uint64_t messages_in{0};
  std::uint64_t messages_out{0};
  std::uint64_t dropped_not_connected{0};
  std::uint64_t send_failures{0};
};

// One side of the link: demultiplexer, supervisor and both transfer
// directions. Not internally synchronized. Callers that touch it from more
// than one thread hold mutex(); observer callbacks run under that lock and
// may call back into the endpoint directly.
class LinkEndpoint : private TransferObserver {
 public:
  LinkEndpoint(LinkConfig config, LinkTransport* transport,
               LinkObserver* observer);
  LinkEndpoint(const LinkEndpoint&) = delete;
  LinkEndpoint& operator=(const LinkEndpoint&) = delete;

  void OnLinkUp(std::uint64_t now_ms);
  void OnLinkDown(std::uint64_t now_ms);
  void OnBytes(const std::uint8_t* data, std::size_t len,
               std::uint64_t now_ms);
  void Poll(std::uint64_t now_ms);

  // Leaves DISCONNECTED or ERROR.
  bool Connect(std::uint64_t now_ms);
  void Stop(std::uint64_t now_ms);

  bool SendMessage(const Message& msg, Encoding encoding, std::string& error);
  bool SendPayload(std::vector<std::uint8_t> payload, std::uint64_t now_ms,
                   std::string& error);
  void CancelOutbound(const std::string& reason);
  // Drops the inbound transfer and asks the peer to stop sending.
  void CancelInbound(const std::string& reason);

  ConnectionState state() const { return supervisor_.state(); }
  const std::string& peer_name() const { return supervisor_.peer_name(); }
  // Peer as learned from the handshake; battery and firmware stay unknown.
  DeviceInfo peer_info() const;
  const LinkConfig& config() const { return config_; }
  const EndpointStats& stats() const { return stats_; }
  const DemuxStats& demux_stats() const { return demux_.stats(); }
  bool outbound_active() const { return sender_.active(); }
  bool inbound_active() const { return receiver_.active(); }

  std::mutex& mutex() { return mutex_; }

 private:
  void OnTransferStarted(TransferDirection dir, std::uint32_t total_size,
                         std::uint32_t total_chunks) override;
  void OnTransferProgress(TransferDirection dir, std::uint32_t done_chunks,
                          std::uint32_t total_chunks) override;
  void OnTransferCompleted(TransferDirection dir,
                           const std::vector<std::uint8_t>& data,
                           const TransferStats& stats) override;
  void OnTransferFailed(TransferDirection dir, TransferStatus status,
                        const std::string& reason) override;

  void HandleFrame(const Frame& frame, std::uint64_t now_ms);
  void HandleTransferPacket(const std::vector<std::uint8_t>& packet,
                            std::uint64_t now_ms);
  void DispatchMessage(const Message& msg, std::uint64_t now_ms);
  void HandleStateChange(ConnectionState from, ConnectionState to);
  bool WriteMessage(const Message& msg, Encoding encoding, std::string& error);
  bool WriteBytes(const std::vector<std::uint8_t>& bytes);

  LinkConfig config_;
  LinkTransport* transport_;
  LinkObserver* observer_;
  StreamDemux demux_;
  ConnectionSupervisor supervisor_;
  TransferSender sender_;
  TransferReceiver receiver_;
  VoiceAssembler voice_;
  EndpointStats stats_;
  std::mutex mutex_;
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_LINK_ENDPOINT_H
