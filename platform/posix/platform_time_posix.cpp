#include "platform_time.h"

#include <chrono>
#include <thread>

namespace glasslink::platform {

std::uint64_t NowSteadyMs() {
  static const auto kStart = std::chrono::steady_clock::now();
  const auto now = std::chrono::steady_clock::now();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now - kStart)
          .count());
}

std::int64_t NowUnixMs() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  return ms <= 0 ? 0 : static_cast<std::int64_t>(ms);
}

void SleepMs(std::uint32_t ms) {
  if (ms == 0) {
    std::this_thread::yield();
    return;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace glasslink::platform
