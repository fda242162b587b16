#include "connection_supervisor.h"

#include <utility>

#include "platform_log.h"

namespace glasslink::link {

namespace {

namespace pl = glasslink::platform::log;

constexpr char kTag[] = "supervisor";

struct Transition {
  ConnectionState from;
  ConnectionState to;
};

// Transitions into DISCONNECTED are legal from every state and are not listed.
constexpr Transition kTransitions[] = {
    {ConnectionState::kDisconnected, ConnectionState::kConnecting},
    {ConnectionState::kConnecting, ConnectionState::kConnected},
    {ConnectionState::kConnecting, ConnectionState::kError},
    {ConnectionState::kConnecting, ConnectionState::kReconnecting},
    {ConnectionState::kConnected, ConnectionState::kReconnecting},
    {ConnectionState::kReconnecting, ConnectionState::kConnecting},
    {ConnectionState::kReconnecting, ConnectionState::kError},
    {ConnectionState::kError, ConnectionState::kConnecting},
};

}  // namespace

ConnectionSupervisor::ConnectionSupervisor(ConnectionSection config,
                                           std::string device_name)
    : config_(config), device_name_(std::move(device_name)) {}

bool ConnectionSupervisor::IsAllowedTransition(ConnectionState from,
                                               ConnectionState to) {
  if (to == ConnectionState::kDisconnected) {
    return from != ConnectionState::kDisconnected;
  }
  for (const auto& t : kTransitions) {
    if (t.from == from && t.to == to) {
      return true;
    }
  }
  return false;
}

bool ConnectionSupervisor::TransitionTo(ConnectionState next,
                                        std::uint64_t now_ms,
                                        const char* reason) {
  const ConnectionState prev = state_;
  if (!IsAllowedTransition(prev, next)) {
    pl::Log(pl::Level::kWarn, kTag, "transition rejected",
            {{"from", ConnectionStateName(prev)},
             {"to", ConnectionStateName(next)},
             {"reason", reason}});
    return false;
  }
  state_ = next;
  state_since_ms_ = now_ms;
  pl::Log(pl::Level::kInfo, kTag, "state changed",
          {{"from", ConnectionStateName(prev)},
           {"to", ConnectionStateName(next)},
           {"reason", reason}});

  switch (next) {
    case ConnectionState::kConnecting:
      last_handshake_sent_ms_ = now_ms;
      Send(MakeHandshake(device_name_));
      break;
    case ConnectionState::kConnected:
      attempts_ = 0;
      reconnect_cycle_ = false;
      last_inbound_ms_ = now_ms;
      last_heartbeat_sent_ms_ = now_ms;
      break;
    case ConnectionState::kReconnecting:
      reconnect_cycle_ = true;
      break;
    case ConnectionState::kDisconnected:
    case ConnectionState::kError:
      attempts_ = 0;
      reconnect_cycle_ = false;
      break;
  }

  if (on_state_) {
    on_state_(prev, next);
  }
  if (next == ConnectionState::kReconnecting && on_reconnect_) {
    on_reconnect_(attempts_ + 1);
  }
  return true;
}

void ConnectionSupervisor::Send(const Message& msg) {
  if (!send_) {
    return;
  }
  if (!send_(msg)) {
    pl::Log(pl::Level::kWarn, kTag, "control send failed",
            {{"type", MessageTypeName(msg.type)}});
  }
}

bool ConnectionSupervisor::Connect(std::uint64_t now_ms) {
  if (state_ != ConnectionState::kDisconnected &&
      state_ != ConnectionState::kError) {
    return false;
  }
  attempts_ = 0;
  reconnect_cycle_ = false;
  return TransitionTo(ConnectionState::kConnecting, now_ms, "connect");
}

void ConnectionSupervisor::Stop(std::uint64_t now_ms) {
  if (state_ == ConnectionState::kDisconnected) {
    return;
  }
  if (state_ == ConnectionState::kConnected) {
    Send(MakeDisconnect());
  }
  TransitionTo(ConnectionState::kDisconnected, now_ms, "local stop");
}

void ConnectionSupervisor::OnLinkLost(std::uint64_t now_ms) {
  if (state_ == ConnectionState::kConnected) {
    TransitionTo(ConnectionState::kReconnecting, now_ms, "link lost");
  }
}

void ConnectionSupervisor::OnInboundTraffic(std::uint64_t now_ms) {
  last_inbound_ms_ = now_ms;
}

void ConnectionSupervisor::EnterConnected(std::uint64_t now_ms,
                                          const Message& msg) {
  if (msg.payload) {
    peer_name_ = *msg.payload;
  }
  TransitionTo(ConnectionState::kConnected, now_ms, MessageTypeName(msg.type));
}

bool ConnectionSupervisor::HandleControl(const Message& msg,
                                         std::uint64_t now_ms) {
  if (!IsConnectionControl(msg.type)) {
    return false;
  }
  switch (msg.type) {
    case MessageType::kHandshake:
      if (state_ == ConnectionState::kConnecting) {
        Send(MakeHandshakeAck(device_name_));
        EnterConnected(now_ms, msg);
      } else if (state_ == ConnectionState::kConnected) {
        // Peer restarted its side of the handshake.
        if (msg.payload) {
          peer_name_ = *msg.payload;
        }
        Send(MakeHandshakeAck(device_name_));
      } else {
        pl::Log(pl::Level::kDebug, kTag, "handshake ignored",
                {{"state", ConnectionStateName(state_)}});
      }
      break;
    case MessageType::kHandshakeAck:
      if (state_ == ConnectionState::kConnecting) {
        EnterConnected(now_ms, msg);
      }
      break;
    case MessageType::kHeartbeat:
      if (state_ == ConnectionState::kConnected) {
        Send(MakeHeartbeatAck());
      }
      break;
    case MessageType::kHeartbeatAck:
      break;
    case MessageType::kDisconnect:
      if (state_ != ConnectionState::kDisconnected) {
        TransitionTo(ConnectionState::kDisconnected, now_ms, "peer disconnect");
      }
      break;
    default:
      break;
  }
  return true;
}

void ConnectionSupervisor::Poll(std::uint64_t now_ms) {
  switch (state_) {
    case ConnectionState::kConnecting: {
      if (now_ms - state_since_ms_ >= config_.handshake_timeout_ms) {
        const ConnectionState next = reconnect_cycle_
                                         ? ConnectionState::kReconnecting
                                         : ConnectionState::kError;
        TransitionTo(next, now_ms, "handshake timeout");
        return;
      }
      if (now_ms - last_handshake_sent_ms_ >= config_.heartbeat_interval_ms) {
        last_handshake_sent_ms_ = now_ms;
        Send(MakeHandshake(device_name_));
      }
      return;
    }
    case ConnectionState::kConnected: {
      const std::uint64_t limit =
          static_cast<std::uint64_t>(config_.heartbeat_interval_ms) *
          config_.heartbeat_miss_limit;
      if (now_ms - last_inbound_ms_ >= limit) {
        TransitionTo(ConnectionState::kReconnecting, now_ms, "heartbeat lost");
        return;
      }
      if (now_ms - last_heartbeat_sent_ms_ >= config_.heartbeat_interval_ms) {
        last_heartbeat_sent_ms_ = now_ms;
        Send(MakeHeartbeat());
      }
      return;
    }
    case ConnectionState::kReconnecting: {
      if (now_ms - state_since_ms_ < config_.reconnect_delay_ms) {
        return;
      }
      if (attempts_ >= config_.max_reconnect_attempts) {
        TransitionTo(ConnectionState::kError, now_ms, "reconnect exhausted");
        return;
      }
      ++attempts_;
      pl::Log(pl::Level::kInfo, kTag, "reconnect attempt",
              {{"attempt", std::to_string(attempts_)}});
      TransitionTo(ConnectionState::kConnecting, now_ms, "reconnect");
      return;
    }
    case ConnectionState::kDisconnected:
    case ConnectionState::kError:
      return;
  }
}

}  // namespace glasslink::link
