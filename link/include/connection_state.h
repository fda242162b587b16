#ifndef GLASSLINK_LINK_CONNECTION_STATE_H
#define GLASSLINK_LINK_CONNECTION_STATE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace glasslink::link {

enum class ConnectionState : std::uint8_t {
  kDisconnected = 0,
  kConnecting = 1,
  kConnected = 2,
  kReconnecting = 3,
  kError = 4,
};

enum class DeviceRole : std::uint8_t {
  kPhone = 0,
  kGlasses = 1,
};

struct DeviceInfo {
  std::string name;
  std::string address;
  DeviceRole role{DeviceRole::kPhone};
  int battery_level{-1};
  std::string firmware_version;
};

inline const char* ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "DISCONNECTED";
    case ConnectionState::kConnecting:
      return "CONNECTING";
    case ConnectionState::kConnected:
      return "CONNECTED";
    case ConnectionState::kReconnecting:
      return "RECONNECTING";
    case ConnectionState::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

inline const char* DeviceRoleName(DeviceRole role) {
  return role == DeviceRole::kGlasses ? "glasses" : "phone";
}

inline std::optional<DeviceRole> ParseDeviceRole(std::string_view text) {
  if (text == "phone" || text == "PHONE") {
    return DeviceRole::kPhone;
  }
  if (text == "glasses" || text == "GLASSES") {
    return DeviceRole::kGlasses;
  }
  return std::nullopt;
}

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_CONNECTION_STATE_H
