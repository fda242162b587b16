#include <cassert>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "link_endpoint.h"
#include "link_worker.h"
#include "platform_time.h"

using glasslink::link::ConnectionState;
using glasslink::link::LinkConfig;
using glasslink::link::LinkEndpoint;
using glasslink::link::LinkWorker;

namespace {

class NullTransport : public glasslink::link::LinkTransport {
 public:
  bool Send(const std::vector<std::uint8_t>& bytes, std::string&) override {
    sent += bytes.size();
    return true;
  }
  std::size_t sent{0};
};

}  // namespace

int main() {
  LinkConfig cfg;
  cfg.connection.heartbeat_interval_ms = 10;
  cfg.connection.handshake_timeout_ms = 40;
  NullTransport transport;
  LinkEndpoint endpoint(cfg, &transport, nullptr);
  {
    std::lock_guard<std::mutex> lock(endpoint.mutex());
    endpoint.OnLinkUp(glasslink::platform::NowSteadyMs());
  }

  LinkWorker worker(&endpoint, 5);
  std::string err;
  assert(worker.Start(err));
  assert(worker.running());
  assert(!worker.Start(err));
  assert(err == "worker already running");

  // The worker drives the handshake timeout with nobody answering.
  ConnectionState state = ConnectionState::kConnecting;
  for (int i = 0; i < 400 && state != ConnectionState::kError; ++i) {
    glasslink::platform::SleepMs(5);
    std::lock_guard<std::mutex> lock(endpoint.mutex());
    state = endpoint.state();
  }
  assert(state == ConnectionState::kError);
  assert(worker.ticks() > 0);

  worker.Stop();
  assert(!worker.running());
  worker.Stop();

  {
    std::lock_guard<std::mutex> lock(endpoint.mutex());
    // Handshakes were resent while connecting.
    assert(transport.sent > 0);
  }

  LinkWorker orphan(nullptr, 5);
  assert(!orphan.Start(err));
  assert(err == "endpoint missing");
  return 0;
}
