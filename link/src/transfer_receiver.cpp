#include "transfer_receiver.h"

#include <string>

#include "hex_utils.h"
#include "platform_log.h"

namespace glasslink::link {

namespace {

namespace pl = glasslink::platform::log;

constexpr char kTag[] = "transfer.rx";

}  // namespace

TransferReceiver::TransferReceiver(TransferSection config) : config_(config) {}

void TransferReceiver::Send(const std::vector<std::uint8_t>& packet) {
  if (!send_) {
    return;
  }
  if (!send_(packet)) {
    pl::Log(pl::Level::kWarn, kTag, "packet send failed");
  }
}

void TransferReceiver::Reset() {
  active_ = false;
  start_ = StartPacket{};
  chunks_.clear();
  held_bytes_ = 0;
  started_ms_ = 0;
  last_activity_ms_ = 0;
  retry_requests_ = 0;
}

void TransferReceiver::Fail(TransferStatus status, const std::string& reason) {
  pl::Log(pl::Level::kWarn, kTag, "transfer failed",
          {{"status", TransferStatusName(status)}, {"reason", reason}});
  Reset();
  if (observer_) {
    observer_->OnTransferFailed(TransferDirection::kInbound, status, reason);
  }
}

void TransferReceiver::Cancel(const char* reason) {
  if (!active_) {
    return;
  }
  Fail(TransferStatus::kError, reason);
}

void TransferReceiver::OnPacket(proto::ByteView packet, std::uint64_t now_ms) {
  if (!packet.data || packet.size == 0) {
    return;
  }
  const auto tag = PacketTagFromByte(packet.data[0]);
  if (!tag) {
    return;
  }
  switch (*tag) {
    case PacketTag::kStart:
      HandleStart(packet, now_ms);
      break;
    case PacketTag::kData:
      HandleData(packet, now_ms);
      break;
    case PacketTag::kEnd:
      HandleEnd(packet, now_ms);
      break;
    case PacketTag::kAck:
    case PacketTag::kRetry:
      break;
  }
}

void TransferReceiver::HandleStart(proto::ByteView packet,
                                   std::uint64_t now_ms) {
  const auto start = ParseStart(packet);
  if (!start) {
    pl::Log(pl::Level::kDebug, kTag, "malformed START dropped");
    return;
  }
  if (active_) {
    Fail(TransferStatus::kError, "superseded by new START");
  }
  // Rejection is an ACK for chunk 0 so it reaches the peer's sender.
  TransferStatus reject = TransferStatus::kSuccess;
  if (start->total_size > config_.max_payload_bytes ||
      start->total_chunks > config_.max_chunks) {
    reject = TransferStatus::kOutOfMemory;
  } else if (start->total_size == 0 || start->total_chunks == 0 ||
             start->total_chunks > start->total_size) {
    reject = TransferStatus::kError;
  }
  if (reject != TransferStatus::kSuccess) {
    pl::Log(pl::Level::kWarn, kTag, "START rejected",
            {{"size", std::to_string(start->total_size)},
             {"chunks", std::to_string(start->total_chunks)},
             {"status", TransferStatusName(reject)}});
    Send(EncodeAck(0, reject));
    return;
  }

  active_ = true;
  start_ = *start;
  started_ms_ = now_ms;
  last_activity_ms_ = now_ms;
  pl::Log(pl::Level::kInfo, kTag, "transfer started",
          {{"size", std::to_string(start_.total_size)},
           {"chunks", std::to_string(start_.total_chunks)},
           {"md5", common::BytesToHex(start_.md5.bytes.data(),
                                      start_.md5.bytes.size())}});
  if (observer_) {
    observer_->OnTransferStarted(TransferDirection::kInbound,
                                 start_.total_size, start_.total_chunks);
  }
}

void TransferReceiver::HandleData(proto::ByteView packet,
                                  std::uint64_t now_ms) {
  if (!active_) {
    pl::Log(pl::Level::kDebug, kTag, "DATA without session ignored");
    return;
  }
  auto data = ParseData(packet);
  if (!data) {
    pl::Log(pl::Level::kDebug, kTag, "malformed DATA dropped");
    return;
  }
  last_activity_ms_ = now_ms;
  const std::uint32_t index = data->chunk_index;
  if (index >= start_.total_chunks) {
    Send(EncodeAck(index, TransferStatus::kError));
    return;
  }
  if (!data->crc_valid()) {
    ++retry_requests_;
    pl::Log(pl::Level::kDebug, kTag, "chunk crc mismatch",
            {{"index", std::to_string(index)}});
    Send(EncodeRetry(index));
    return;
  }
  auto& slot = chunks_[index];
  held_bytes_ -= slot.size();
  held_bytes_ += data->payload.size();
  slot = std::move(data->payload);
  if (held_bytes_ > start_.total_size) {
    Send(EncodeAck(index, TransferStatus::kOutOfMemory));
    Fail(TransferStatus::kOutOfMemory, "chunks exceed declared size");
    return;
  }
  Send(EncodeAck(index, TransferStatus::kSuccess));
  if (observer_) {
    observer_->OnTransferProgress(TransferDirection::kInbound,
                                  received_chunks(), start_.total_chunks);
  }
}

void TransferReceiver::HandleEnd(proto::ByteView packet, std::uint64_t now_ms) {
  if (!active_) {
    return;
  }
  const auto status = ParseEnd(packet);
  if (!status) {
    pl::Log(pl::Level::kDebug, kTag, "malformed END dropped");
    return;
  }
  if (*status != TransferStatus::kSuccess) {
    Fail(*status, "sender aborted");
    return;
  }
  auto assembled = ReassembleChunks(chunks_, start_.total_chunks);
  if (!assembled) {
    Fail(TransferStatus::kError, "missing chunks");
    return;
  }
  if (assembled->size() != start_.total_size) {
    Fail(TransferStatus::kError, "size mismatch");
    return;
  }
  if (checksum::Md5(*assembled) != start_.md5) {
    Fail(TransferStatus::kMd5Error, "md5 mismatch");
    return;
  }

  TransferStats stats;
  stats.bytes = assembled->size();
  stats.chunks = start_.total_chunks;
  stats.elapsed_ms = now_ms - started_ms_;
  stats.retries = retry_requests_;
  const std::vector<std::uint8_t> payload = std::move(*assembled);
  Reset();
  pl::Log(pl::Level::kInfo, kTag, "transfer completed",
          {{"bytes", std::to_string(stats.bytes)},
           {"elapsed_ms", std::to_string(stats.elapsed_ms)}});
  if (observer_) {
    observer_->OnTransferCompleted(TransferDirection::kInbound, payload, stats);
  }
}

void TransferReceiver::Poll(std::uint64_t now_ms) {
  if (!active_) {
    return;
  }
  if (now_ms - last_activity_ms_ >= config_.transfer_timeout_ms) {
    Fail(TransferStatus::kTimeout, "idle timeout");
  }
}

}  // namespace glasslink::link
