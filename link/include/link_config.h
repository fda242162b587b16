#ifndef GLASSLINK_LINK_LINK_CONFIG_H
#define GLASSLINK_LINK_LINK_CONFIG_H

#include <cstdint>
#include <string>

#include "connection_state.h"

namespace glasslink::link {

struct LinkSection {
  std::string device_name{"glasslink"};
  DeviceRole role{DeviceRole::kPhone};
  bool debug_log{false};
};

struct ConnectionSection {
  std::uint32_t heartbeat_interval_ms{5000};
  std::uint32_t heartbeat_miss_limit{3};
  std::uint32_t handshake_timeout_ms{10000};
  std::uint32_t reconnect_delay_ms{3000};
  std::uint32_t max_reconnect_attempts{5};
};

struct TransferSection {
  std::uint32_t chunk_size{4096};
  std::uint32_t max_payload_bytes{5u * 1024u * 1024u};
  std::uint32_t max_chunks{2048};
  std::uint32_t max_retry_count{3};
  std::uint32_t ack_timeout_ms{5000};
  std::uint32_t transfer_timeout_ms{30000};
};

struct FramingSection {
  std::uint32_t max_text_frame_bytes{1024u * 1024u};
  std::uint32_t max_binary_frame_bytes{1024u * 1024u};
  std::uint32_t max_voice_bytes{4u * 1024u * 1024u};
};

struct WorkerSection {
  std::uint32_t tick_interval_ms{50};
};

struct LinkConfig {
  LinkSection link;
  ConnectionSection connection;
  TransferSection transfer;
  FramingSection framing;
  WorkerSection worker;
};

// Starts from defaults, applies the INI file, then validates.
bool LoadLinkConfig(const std::string& path, LinkConfig& out_config,
                    std::string& error);

bool ValidateLinkConfig(const LinkConfig& config, std::string& error);

}  // namespace glasslink::link

#endif  // GLASSLINK_LINK_LINK_CONFIG_H
