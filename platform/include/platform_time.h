#ifndef GLASSLINK_PLATFORM_TIME_H
#define GLASSLINK_PLATFORM_TIME_H

#include <cstdint>

namespace glasslink::platform {

// Monotonic milliseconds since first use. Drives every protocol timeout.
std::uint64_t NowSteadyMs();
// Wall clock, used only for message timestamps.
std::int64_t NowUnixMs();
void SleepMs(std::uint32_t ms);

}  // namespace glasslink::platform

#endif  // GLASSLINK_PLATFORM_TIME_H
