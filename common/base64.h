#ifndef GLASSLINK_BASE64_H
#define GLASSLINK_BASE64_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace glasslink::common {

// Standard alphabet, '=' padded, no line breaks.
std::string Base64Encode(const std::uint8_t* data, std::size_t len);
inline std::string Base64Encode(const std::vector<std::uint8_t>& data) {
  return Base64Encode(data.data(), data.size());
}

// Rejects characters outside the alphabet, bad padding and truncated quads.
bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out);

}  // namespace glasslink::common

#endif  // GLASSLINK_BASE64_H
