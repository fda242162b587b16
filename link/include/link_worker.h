#ifndef GLASSLINK_LINK_LINK_WORKER_H
#define GLASSLINK_LINK_LINK_WORKER_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "link_endpoint.h"

namespace glasslink::link {

// Ticks an endpoint from a background thread so heartbeats and timeouts run
// independently of transport reads.
class LinkWorker {
 public:
  LinkWorker(LinkEndpoint* endpoint, std::uint32_t tick_interval_ms);
  ~LinkWorker();

  LinkWorker(const LinkWorker&) = delete;
  LinkWorker& operator=(const LinkWorker&) = delete;

  bool Start(std::string& error);
  void Stop();
  bool running() const { return running_.load(); }
  std::uint64_t ticks() const { return ticks_.load(); }

 private:
  void Run();

  LinkEndpoint* endpoint_;
  std::uint32_t tick_interval_ms_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
  std::thread worker_;
  std::mutex wait_mutex_;
  std::condition_variable wake_;
};

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_LINK_WORKER_H
