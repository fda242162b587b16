#include "link_worker.h"

#include <chrono>
#include <system_error>

#include "platform_log.h"
#include "platform_time.h"

namespace glasslink::link {

namespace {

namespace pl = glasslink::platform::log;

constexpr char kTag[] = "worker";

}  // namespace

LinkWorker::LinkWorker(LinkEndpoint* endpoint, std::uint32_t tick_interval_ms)
    : endpoint_(endpoint),
      tick_interval_ms_(tick_interval_ms == 0 ? 1 : tick_interval_ms) {}

LinkWorker::~LinkWorker() { Stop(); }

bool LinkWorker::Start(std::string& error) {
  if (!endpoint_) {
    error = "endpoint missing";
    return false;
  }
  if (running_.exchange(true)) {
    error = "worker already running";
    return false;
  }
  try {
    worker_ = std::thread(&LinkWorker::Run, this);
  } catch (const std::system_error& ex) {
    running_.store(false);
    error = std::string("worker thread start failed: ") + ex.what();
    return false;
  }
  pl::Log(pl::Level::kDebug, kTag, "started",
          {{"tick_ms", std::to_string(tick_interval_ms_)}});
  return true;
}

void LinkWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (!running_.exchange(false) && !worker_.joinable()) {
      return;
    }
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void LinkWorker::Run() {
  while (running_.load()) {
    {
      std::lock_guard<std::mutex> lock(endpoint_->mutex());
      endpoint_->Poll(platform::NowSteadyMs());
    }
    ticks_.fetch_add(1);
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wake_.wait_for(lock, std::chrono::milliseconds(tick_interval_ms_),
                   [this] { return !running_.load(); });
  }
}

}  // namespace glasslink::link
