#ifndef GLASSLINK_HEX_UTILS_H
#define GLASSLINK_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace glasslink::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);

}  // namespace glasslink::common

#endif  // GLASSLINK_HEX_UTILS_H
