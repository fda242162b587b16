#include "transfer_sender.h"

#include "hex_utils.h"
#include "platform_log.h"

namespace glasslink::link {

namespace {

namespace pl = glasslink::platform::log;

constexpr char kTag[] = "transfer.tx";

}  // namespace

TransferSender::TransferSender(TransferSection config) : config_(config) {}

void TransferSender::Send(const std::vector<std::uint8_t>& packet) {
  if (!send_) {
    return;
  }
  // A lost write is recovered by the ack timeout.
  if (!send_(packet)) {
    pl::Log(pl::Level::kWarn, kTag, "packet send failed");
  }
}

void TransferSender::Reset() {
  active_ = false;
  payload_.clear();
  chunks_.clear();
  next_index_ = 0;
  chunk_retries_ = 0;
  total_retries_ = 0;
  started_ms_ = 0;
  last_send_ms_ = 0;
}

bool TransferSender::Start(std::vector<std::uint8_t> payload,
                           std::uint64_t now_ms, std::string& error) {
  if (active_) {
    error = "transfer already in progress";
    return false;
  }
  if (payload.empty()) {
    error = "empty payload";
    return false;
  }
  if (payload.size() > config_.max_payload_bytes) {
    error = "payload exceeds max_payload_bytes";
    return false;
  }
  if (config_.chunk_size == 0 || config_.chunk_size > kMaxDataPayloadBytes) {
    error = "invalid chunk_size";
    return false;
  }
  const std::uint32_t count = ChunkCount(payload.size(), config_.chunk_size);
  if (count > config_.max_chunks) {
    error = "payload exceeds max_chunks";
    return false;
  }

  StartPacket start;
  start.total_size = static_cast<std::uint32_t>(payload.size());
  start.total_chunks = count;
  start.md5 = checksum::Md5(payload);

  chunks_ = SplitChunks(payload, config_.chunk_size);
  payload_ = std::move(payload);
  active_ = true;
  next_index_ = 0;
  chunk_retries_ = 0;
  total_retries_ = 0;
  started_ms_ = now_ms;

  pl::Log(pl::Level::kInfo, kTag, "transfer started",
          {{"size", std::to_string(start.total_size)},
           {"chunks", std::to_string(count)},
           {"md5", common::BytesToHex(start.md5.bytes.data(),
                                      start.md5.bytes.size())}});
  if (observer_) {
    observer_->OnTransferStarted(TransferDirection::kOutbound,
                                 start.total_size, count);
  }
  Send(EncodeStart(start));
  if (active_) {
    SendCurrentChunk(now_ms);
  }
  return true;
}

void TransferSender::SendCurrentChunk(std::uint64_t now_ms) {
  last_send_ms_ = now_ms;
  const auto& chunk = chunks_[next_index_];
  std::vector<std::uint8_t> packet;
  if (!EncodeData(next_index_, chunk.data(), chunk.size(), packet)) {
    Fail(TransferStatus::kError, "chunk encode failed", true);
    return;
  }
  Send(packet);
}

void TransferSender::Resend(std::uint64_t now_ms, TransferStatus cause) {
  if (chunk_retries_ >= config_.max_retry_count) {
    Fail(cause, "retry limit reached for chunk " + std::to_string(next_index_),
         true);
    return;
  }
  ++chunk_retries_;
  ++total_retries_;
  pl::Log(pl::Level::kDebug, kTag, "resending chunk",
          {{"index", std::to_string(next_index_)},
           {"attempt", std::to_string(chunk_retries_)},
           {"cause", TransferStatusName(cause)}});
  SendCurrentChunk(now_ms);
}

void TransferSender::Finish(std::uint64_t now_ms) {
  Send(EncodeEnd(TransferStatus::kSuccess));
  TransferStats stats;
  stats.bytes = payload_.size();
  stats.chunks = static_cast<std::uint32_t>(chunks_.size());
  stats.elapsed_ms = now_ms - started_ms_;
  stats.retries = total_retries_;
  const std::vector<std::uint8_t> payload = std::move(payload_);
  Reset();
  pl::Log(pl::Level::kInfo, kTag, "transfer completed",
          {{"bytes", std::to_string(stats.bytes)},
           {"retries", std::to_string(stats.retries)},
           {"elapsed_ms", std::to_string(stats.elapsed_ms)}});
  if (observer_) {
    observer_->OnTransferCompleted(TransferDirection::kOutbound, payload,
                                   stats);
  }
}

void TransferSender::Fail(TransferStatus status, const std::string& reason,
                          bool notify_peer) {
  pl::Log(pl::Level::kWarn, kTag, "transfer failed",
          {{"status", TransferStatusName(status)}, {"reason", reason}});
  Reset();
  if (notify_peer) {
    Send(EncodeEnd(TransferStatus::kError));
  }
  if (observer_) {
    observer_->OnTransferFailed(TransferDirection::kOutbound, status, reason);
  }
}

void TransferSender::Abort(const std::string& reason, bool notify_peer) {
  if (!active_) {
    return;
  }
  Fail(TransferStatus::kError, reason, notify_peer);
}

void TransferSender::OnPacket(proto::ByteView packet, std::uint64_t now_ms) {
  if (!active_ || !packet.data || packet.size == 0) {
    return;
  }
  const auto tag = PacketTagFromByte(packet.data[0]);
  if (!tag) {
    return;
  }
  switch (*tag) {
    case PacketTag::kAck: {
      const auto ack = ParseAck(packet);
      if (!ack || ack->chunk_index != next_index_) {
        return;
      }
      if (ack->status == TransferStatus::kError ||
          ack->status == TransferStatus::kOutOfMemory) {
        Fail(ack->status, "rejected by peer", false);
        return;
      }
      if (ack->status != TransferStatus::kSuccess) {
        Resend(now_ms, ack->status);
        return;
      }
      ++next_index_;
      chunk_retries_ = 0;
      if (observer_) {
        observer_->OnTransferProgress(TransferDirection::kOutbound,
                                      next_index_, total_chunks());
      }
      if (!active_) {
        return;
      }
      if (next_index_ >= chunks_.size()) {
        Finish(now_ms);
      } else {
        SendCurrentChunk(now_ms);
      }
      return;
    }
    case PacketTag::kRetry: {
      const auto index = ParseRetry(packet);
      if (!index || *index != next_index_) {
        return;
      }
      Resend(now_ms, TransferStatus::kCrcError);
      return;
    }
    case PacketTag::kEnd:
    case PacketTag::kStart:
    case PacketTag::kData:
      return;
  }
}

void TransferSender::Poll(std::uint64_t now_ms) {
  if (!active_) {
    return;
  }
  if (now_ms - last_send_ms_ >= config_.ack_timeout_ms) {
    Resend(now_ms, TransferStatus::kTimeout);
  }
}

}  // namespace glasslink::link
