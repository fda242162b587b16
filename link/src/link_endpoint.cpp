#include "link_endpoint.h"

#include <string_view>
#include <utility>

#include "platform_log.h"

namespace glasslink::link {

namespace {

namespace pl = glasslink::platform::log;

constexpr char kTag[] = "endpoint";

}  // namespace

LinkEndpoint::LinkEndpoint(LinkConfig config, LinkTransport* transport,
                           LinkObserver* observer)
    : config_(std::move(config)),
      transport_(transport),
      observer_(observer),
      demux_(config_.framing),
      supervisor_(config_.connection, config_.link.device_name),
      sender_(config_.transfer),
      receiver_(config_.transfer),
      voice_(config_.framing.max_voice_bytes) {
  supervisor_.SetSendFn([this](const Message& msg) {
    std::string error;
    return WriteMessage(msg, Encoding::kText, error);
  });
  supervisor_.SetStateFn([this](ConnectionState from, ConnectionState to) {
    HandleStateChange(from, to);
  });
  supervisor_.SetReconnectFn([this](std::uint32_t attempt) {
    if (observer_) {
      observer_->OnReconnectRequested(attempt);
    }
  });
  const auto write_packet = [this](const std::vector<std::uint8_t>& packet) {
    return WriteBytes(packet);
  };
  sender_.SetSendFn(write_packet);
  sender_.SetObserver(this);
  receiver_.SetSendFn(write_packet);
  receiver_.SetObserver(this);
}

void LinkEndpoint::OnLinkUp(std::uint64_t now_ms) {
  pl::Log(pl::Level::kInfo, kTag, "link up",
          {{"device", config_.link.device_name},
           {"role", DeviceRoleName(config_.link.role)}});
  demux_.Reset();
  if (supervisor_.state() == ConnectionState::kDisconnected) {
    supervisor_.Connect(now_ms);
  }
}

void LinkEndpoint::OnLinkDown(std::uint64_t now_ms) {
  pl::Log(pl::Level::kInfo, kTag, "link down",
          {{"device", config_.link.device_name}});
  demux_.Reset();
  sender_.Abort("link lost", false);
  receiver_.Cancel("link lost");
  supervisor_.OnLinkLost(now_ms);
}

DeviceInfo LinkEndpoint::peer_info() const {
  DeviceInfo info;
  info.name = supervisor_.peer_name();
  info.role = config_.link.role == DeviceRole::kPhone ? DeviceRole::kGlasses
                                                      : DeviceRole::kPhone;
  return info;
}

bool LinkEndpoint::Connect(std::uint64_t now_ms) {
  return supervisor_.Connect(now_ms);
}

void LinkEndpoint::Stop(std::uint64_t now_ms) {
  if (supervisor_.connected()) {
    sender_.Abort("local stop", true);
  }
  supervisor_.Stop(now_ms);
}

void LinkEndpoint::OnBytes(const std::uint8_t* data, std::size_t len,
                           std::uint64_t now_ms) {
  demux_.Feed(data, len);
  while (auto frame = demux_.Next()) {
    ++stats_.frames_in;
    HandleFrame(*frame, now_ms);
  }
}

void LinkEndpoint::Poll(std::uint64_t now_ms) {
  supervisor_.Poll(now_ms);
  sender_.Poll(now_ms);
  receiver_.Poll(now_ms);
}

void LinkEndpoint::HandleFrame(const Frame& frame, std::uint64_t now_ms) {
  switch (frame.kind) {
    case FrameKind::kTransferPacket:
      supervisor_.OnInboundTraffic(now_ms);
      HandleTransferPacket(frame.bytes, now_ms);
      return;
    case FrameKind::kBinaryMessage: {
      const auto msg = DecodeBinary(frame.bytes);
      if (!msg) {
        ++stats_.decode_failures;
        pl::Log(pl::Level::kDebug, kTag, "binary frame undecodable");
        return;
      }
      DispatchMessage(*msg, now_ms);
      return;
    }
    case FrameKind::kTextMessage: {
      const std::string_view text(
          reinterpret_cast<const char*>(frame.bytes.data()),
          frame.bytes.size());
      const auto msg = DecodeText(text);
      if (!msg) {
        ++stats_.decode_failures;
        pl::Log(pl::Level::kDebug, kTag, "text frame undecodable");
        return;
      }
      DispatchMessage(*msg, now_ms);
      return;
    }
  }
}

void LinkEndpoint::HandleTransferPacket(
    const std::vector<std::uint8_t>& packet, std::uint64_t now_ms) {
  if (!supervisor_.connected()) {
    ++stats_.dropped_not_connected;
    pl::Log(pl::Level::kDebug, kTag, "transfer packet while not connected");
    return;
  }
  const proto::ByteView view = proto::MakeByteView(packet);
  const auto tag = PacketTagFromByte(packet.front());
  if (!tag) {
    return;
  }
  switch (*tag) {
    // START, DATA and END come from the peer's sender; ACK and RETRY from
    // its receiver.
    case PacketTag::kStart:
    case PacketTag::kData:
    case PacketTag::kEnd:
      receiver_.OnPacket(view, now_ms);
      return;
    case PacketTag::kAck:
    case PacketTag::kRetry:
      sender_.OnPacket(view, now_ms);
      return;
  }
}

void LinkEndpoint::DispatchMessage(const Message& msg, std::uint64_t now_ms) {
  ++stats_.messages_in;
  supervisor_.OnInboundTraffic(now_ms);
  if (supervisor_.HandleControl(msg, now_ms)) {
    return;
  }
  if (!supervisor_.connected()) {
    ++stats_.dropped_not_connected;
    pl::Log(pl::Level::kDebug, kTag, "message while not connected",
            {{"type", MessageTypeName(msg.type)}});
    return;
  }
  if (msg.type == MessageType::kPhotoCancel) {
    receiver_.Cancel("cancelled by peer");
    sender_.Abort("cancelled by peer", true);
  }
  if (observer_) {
    observer_->OnMessage(msg);
  }
  if (CategoryOf(msg.type) == MessageCategory::kVoice) {
    auto utterance = voice_.OnMessage(msg);
    if (utterance && observer_) {
      observer_->OnVoiceUtterance(*utterance);
    }
  }
}

void LinkEndpoint::HandleStateChange(ConnectionState from,
                                     ConnectionState to) {
  if (from == ConnectionState::kConnected) {
    sender_.Abort("link not connected", false);
    receiver_.Cancel("link not connected");
    voice_.Clear();
  }
  if (observer_) {
    observer_->OnStateChanged(from, to);
  }
}

bool LinkEndpoint::SendMessage(const Message& msg, Encoding encoding,
                               std::string& error) {
  if (!supervisor_.connected()) {
    error = "not connected";
    return false;
  }
  if (IsConnectionControl(msg.type)) {
    error = "connection control is owned by the supervisor";
    return false;
  }
  return WriteMessage(msg, encoding, error);
}

bool LinkEndpoint::WriteMessage(const Message& msg, Encoding encoding,
                                std::string& error) {
  std::vector<std::uint8_t> bytes;
  if (encoding == Encoding::kBinary) {
    if (msg.binary_data &&
        msg.binary_data->size() > config_.framing.max_binary_frame_bytes) {
      error = "binary frame too large";
      return false;
    }
    bytes = EncodeBinary(msg);
  } else {
    const std::string text = EncodeText(msg);
    if (text.size() > config_.framing.max_text_frame_bytes) {
      error = "text frame too large";
      return false;
    }
    bytes.assign(text.begin(), text.end());
    bytes.push_back('\n');
  }
  if (!WriteBytes(bytes)) {
    error = "transport send failed";
    return false;
  }
  ++stats_.messages_out;
  return true;
}

bool LinkEndpoint::WriteBytes(const std::vector<std::uint8_t>& bytes) {
  if (!transport_) {
    ++stats_.send_failures;
    return false;
  }
  std::string error;
  if (!transport_->Send(bytes, error)) {
    ++stats_.send_failures;
    pl::Log(pl::Level::kWarn, kTag, "transport send failed",
            {{"error", error}});
    return false;
  }
  return true;
}

bool LinkEndpoint::SendPayload(std::vector<std::uint8_t> payload,
                               std::uint64_t now_ms, std::string& error) {
  if (!supervisor_.connected()) {
    error = "not connected";
    return false;
  }
  return sender_.Start(std::move(payload), now_ms, error);
}

void LinkEndpoint::CancelOutbound(const std::string& reason) {
  sender_.Abort(reason, supervisor_.connected());
}

void LinkEndpoint::CancelInbound(const std::string& reason) {
  if (!receiver_.active()) {
    return;
  }
  receiver_.Cancel(reason.c_str());
  if (supervisor_.connected()) {
    std::string error;
    if (!WriteMessage(MakePhotoCancel(), Encoding::kText, error)) {
      pl::Log(pl::Level::kWarn, kTag, "cancel notice not sent",
              {{"error", error}});
    }
  }
}

void LinkEndpoint::OnTransferStarted(TransferDirection dir,
                                     std::uint32_t total_size,
                                     std::uint32_t total_chunks) {
  if (observer_) {
    observer_->OnTransferStarted(dir, total_size, total_chunks);
  }
}

void LinkEndpoint::OnTransferProgress(TransferDirection dir,
                                      std::uint32_t done_chunks,
                                      std::uint32_t total_chunks) {
  if (observer_) {
    observer_->OnTransferProgress(dir, done_chunks, total_chunks);
  }
}

void LinkEndpoint::OnTransferCompleted(TransferDirection dir,
                                       const std::vector<std::uint8_t>& data,
                                       const TransferStats& stats) {
  if (observer_) {
    observer_->OnTransferCompleted(dir, data, stats);
  }
}

void LinkEndpoint::OnTransferFailed(TransferDirection dir,
                                    TransferStatus status,
                                    const std::string& reason) {
  if (observer_) {
    observer_->OnTransferFailed(dir, status, reason);
  }
}

}  // namespace glasslink::link
