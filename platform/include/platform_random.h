#ifndef GLASSLINK_PLATFORM_RANDOM_H
#define GLASSLINK_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace glasslink::platform {

bool RandomBytes(std::uint8_t* out, std::size_t len);

// RFC 4122 version 4 UUID in canonical 8-4-4-4-12 lowercase form.
// Empty when the OS entropy source is unavailable.
std::string RandomUuid();

}  // namespace glasslink::platform

#endif  // GLASSLINK_PLATFORM_RANDOM_H
