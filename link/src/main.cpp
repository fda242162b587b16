#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "link_config.h"
#include "link_endpoint.h"
#include "link_transport.h"
#include "link_worker.h"
#include "platform_log.h"
#include "platform_time.h"

namespace {

using glasslink::link::ConnectionState;
using glasslink::link::LinkEndpoint;
using glasslink::link::TransferDirection;

void LogError(const std::string& msg) {
  std::cerr << "[glasslink_demo] " << msg << "\n";
}

void LogInfo(const std::string& msg) {
  std::cout << "[glasslink_demo] " << msg << "\n";
}

// In-memory stand-in for one direction of the serial link.
class LoopbackTransport : public glasslink::link::LinkTransport {
 public:
  bool Send(const std::vector<std::uint8_t>& bytes,
            std::string& out_error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.size() + bytes.size() > kMaxPendingBytes) {
      out_error = "loopback buffer full";
      return false;
    }
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
    return true;
  }

  std::vector<std::uint8_t> Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint8_t> out;
    out.swap(pending_);
    return out;
  }

 private:
  static constexpr std::size_t kMaxPendingBytes = 4u * 1024u * 1024u;

  std::mutex mutex_;
  std::vector<std::uint8_t> pending_;
};

class DemoObserver : public glasslink::link::LinkObserver {
 public:
  explicit DemoObserver(std::string name) : name_(std::move(name)) {}

  void OnStateChanged(ConnectionState from, ConnectionState to) override {
    LogInfo(name_ + " state " +
            glasslink::link::ConnectionStateName(from) + " -> " +
            glasslink::link::ConnectionStateName(to));
  }
  void OnMessage(const glasslink::link::Message& msg) override {
    LogInfo(name_ + " received " + glasslink::link::Describe(msg) +
            (msg.payload ? " text=\"" + *msg.payload + "\"" : ""));
  }
  void OnVoiceUtterance(const std::vector<std::uint8_t>& audio) override {
    LogInfo(name_ + " utterance bytes=" + std::to_string(audio.size()));
  }
  void OnTransferCompleted(TransferDirection dir,
                           const std::vector<std::uint8_t>& data,
                           const glasslink::link::TransferStats& stats) override {
    LogInfo(name_ + " " + glasslink::link::TransferDirectionName(dir) +
            " transfer done bytes=" + std::to_string(data.size()) +
            " chunks=" + std::to_string(stats.chunks) +
            " retries=" + std::to_string(stats.retries));
    done_.store(true);
  }
  void OnTransferFailed(TransferDirection dir,
                        glasslink::link::TransferStatus status,
                        const std::string& reason) override {
    LogError(name_ + " " + glasslink::link::TransferDirectionName(dir) +
             " transfer failed status=" +
             glasslink::link::TransferStatusName(status) + " " + reason);
    done_.store(true);
  }

  bool transfer_done() const { return done_.load(); }

 private:
  std::string name_;
  std::atomic<bool> done_{false};
};

void Deliver(LoopbackTransport& from, LinkEndpoint& to) {
  const auto bytes = from.Drain();
  if (bytes.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(to.mutex());
  to.OnBytes(bytes.data(), bytes.size(), glasslink::platform::NowSteadyMs());
}

template <typename Pred>
bool PumpUntil(LoopbackTransport& a_to_b, LinkEndpoint& b,
               LoopbackTransport& b_to_a, LinkEndpoint& a, Pred done,
               std::uint32_t timeout_ms) {
  const std::uint64_t deadline =
      glasslink::platform::NowSteadyMs() + timeout_ms;
  while (glasslink::platform::NowSteadyMs() < deadline) {
    Deliver(a_to_b, b);
    Deliver(b_to_a, a);
    if (done()) {
      return true;
    }
    glasslink::platform::SleepMs(1);
  }
  return done();
}

ConnectionState LockedState(LinkEndpoint& ep) {
  std::lock_guard<std::mutex> lock(ep.mutex());
  return ep.state();
}

}  // namespace

int main(int argc, char** argv) {
  glasslink::link::LinkConfig base;
  if (argc > 1) {
    std::string error;
    if (!glasslink::link::LoadLinkConfig(argv[1], base, error)) {
      LogError(error);
      return 1;
    }
  }
  if (base.link.debug_log) {
    glasslink::platform::log::SetMinLevel(
        glasslink::platform::log::Level::kDebug);
  }

  glasslink::link::LinkConfig phone_cfg = base;
  phone_cfg.link.device_name = base.link.device_name + "-phone";
  phone_cfg.link.role = glasslink::link::DeviceRole::kPhone;
  glasslink::link::LinkConfig glasses_cfg = base;
  glasses_cfg.link.device_name = base.link.device_name + "-glasses";
  glasses_cfg.link.role = glasslink::link::DeviceRole::kGlasses;

  LoopbackTransport phone_out;
  LoopbackTransport glasses_out;
  DemoObserver phone_obs("phone");
  DemoObserver glasses_obs("glasses");
  LinkEndpoint phone(phone_cfg, &phone_out, &phone_obs);
  LinkEndpoint glasses(glasses_cfg, &glasses_out, &glasses_obs);

  glasslink::link::LinkWorker phone_worker(&phone,
                                           base.worker.tick_interval_ms);
  glasslink::link::LinkWorker glasses_worker(&glasses,
                                             base.worker.tick_interval_ms);
  std::string error;
  if (!phone_worker.Start(error) || !glasses_worker.Start(error)) {
    LogError(error);
    return 1;
  }

  {
    std::lock_guard<std::mutex> lock(phone.mutex());
    phone.OnLinkUp(glasslink::platform::NowSteadyMs());
  }
  {
    std::lock_guard<std::mutex> lock(glasses.mutex());
    glasses.OnLinkUp(glasslink::platform::NowSteadyMs());
  }
  const bool connected = PumpUntil(
      phone_out, glasses, glasses_out, phone,
      [&] {
        return LockedState(phone) == ConnectionState::kConnected &&
               LockedState(glasses) == ConnectionState::kConnected;
      },
      5000);
  if (!connected) {
    LogError("handshake did not complete");
    return 1;
  }

  {
    std::lock_guard<std::mutex> lock(glasses.mutex());
    using glasslink::link::Encoding;
    bool ok = glasses.SendMessage(glasslink::link::MakeVoiceStart(),
                                  Encoding::kBinary, error);
    for (int i = 0; ok && i < 4; ++i) {
      std::vector<std::uint8_t> pcm(640, static_cast<std::uint8_t>(i));
      ok = glasses.SendMessage(glasslink::link::MakeVoiceData(std::move(pcm)),
                               Encoding::kBinary, error);
    }
    ok = ok && glasses.SendMessage(glasslink::link::MakeVoiceEnd(),
                                   Encoding::kBinary, error);
    if (!ok) {
      LogError(error);
      return 1;
    }
  }
  {
    std::lock_guard<std::mutex> lock(phone.mutex());
    if (!phone.SendMessage(
            glasslink::link::MakeAiResponseText("Looking at the photo now."),
            glasslink::link::Encoding::kText, error)) {
      LogError(error);
      return 1;
    }
  }

  std::vector<std::uint8_t> photo(3 * phone_cfg.transfer.chunk_size + 321);
  for (std::size_t i = 0; i < photo.size(); ++i) {
    photo[i] = static_cast<std::uint8_t>(i % 251);
  }
  {
    std::lock_guard<std::mutex> lock(glasses.mutex());
    if (!glasses.SendPayload(photo, glasslink::platform::NowSteadyMs(),
                             error)) {
      LogError(error);
      return 1;
    }
  }
  const bool transferred = PumpUntil(
      glasses_out, phone, phone_out, glasses,
      [&] { return phone_obs.transfer_done() && glasses_obs.transfer_done(); },
      10000);
  if (!transferred) {
    LogError("photo transfer did not finish");
  }

  {
    std::lock_guard<std::mutex> lock(phone.mutex());
    phone.Stop(glasslink::platform::NowSteadyMs());
  }
  if (!PumpUntil(
          phone_out, glasses, glasses_out, phone,
          [&] {
            return LockedState(glasses) == ConnectionState::kDisconnected;
          },
          1000)) {
    LogError("glasses did not see the disconnect");
  }

  phone_worker.Stop();
  glasses_worker.Stop();
  {
    std::lock_guard<std::mutex> lock(glasses.mutex());
    const auto& st = glasses.stats();
    LogInfo("glasses frames_in=" + std::to_string(st.frames_in) +
            " messages_out=" + std::to_string(st.messages_out) +
            " decode_failures=" + std::to_string(st.decode_failures));
  }
  return transferred ? 0 : 1;
}
