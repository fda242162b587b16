#ifndef GLASSLINK_LINK_CONNECTION_SUPERVISOR_H
#define GLASSLINK_LINK_CONNECTION_SUPERVISOR_H

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "connection_state.h"
#include "link_config.h"
#include "message.h"

namespace glasslink::link {

// Handshake, heartbeat and reconnect supervision for one link.
// Not thread-safe; the owner serializes every call. All time arguments are
// steady-clock milliseconds.
class ConnectionSupervisor {
 public:
  using SendFn = std::function<bool(const Message& msg)>;
  using StateFn =
      std::function<void(ConnectionState from, ConnectionState to)>;
  using ReconnectFn = std::function<void(std::uint32_t attempt)>;

  ConnectionSupervisor(ConnectionSection config, std::string device_name);

  void SetSendFn(SendFn fn) { send_ = std::move(fn); }
  void SetStateFn(StateFn fn) { on_state_ = std::move(fn); }
  void SetReconnectFn(ReconnectFn fn) { on_reconnect_ = std::move(fn); }

  // DISCONNECTED or ERROR -> CONNECTING. Resets the reconnect budget.
  bool Connect(std::uint64_t now_ms);
  // Any state -> DISCONNECTED. Sends DISCONNECT first when CONNECTED.
  void Stop(std::uint64_t now_ms);
  // Transport reported the physical link gone.
  void OnLinkLost(std::uint64_t now_ms);

  // Every decoded inbound frame, control or not.
  void OnInboundTraffic(std::uint64_t now_ms);
  // Consumes connection-range messages. Returns false for anything else.
  bool HandleControl(const Message& msg, std::uint64_t now_ms);

  void Poll(std::uint64_t now_ms);

  ConnectionState state() const { return state_; }
  bool connected() const { return state_ == ConnectionState::kConnected; }
  std::uint32_t reconnect_attempts() const { return attempts_; }
  const std::string& peer_name() const { return peer_name_; }

  static bool IsAllowedTransition(ConnectionState from, ConnectionState to);

 private:
  bool TransitionTo(ConnectionState next, std::uint64_t now_ms,
                    const char* reason);
  void Send(const Message& msg);
  void EnterConnected(std::uint64_t now_ms, const Message& msg);

  ConnectionSection config_;
  std::string device_name_;
  SendFn send_;
  StateFn on_state_;
  ReconnectFn on_reconnect_;

  ConnectionState state_{ConnectionState::kDisconnected};
  std::uint64_t state_since_ms_{0};
  std::uint64_t last_inbound_ms_{0};
  std::uint64_t last_heartbeat_sent_ms_{0};
  std::uint64_t last_handshake_sent_ms_{0};
  std::uint32_t attempts_{0};
  bool reconnect_cycle_{false};
  std::string peer_name_;
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_CONNECTION_SUPERVISOR_H
