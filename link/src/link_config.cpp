#include "link_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace glasslink::link {

namespace {

std::string Trim(const std::string& input) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  char* end_ptr = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || value > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "on") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

struct IniState {
  std::string section;
  LinkConfig* cfg{nullptr};
};

// Returns false only when a known key carries an unparsable value.
bool ApplyKV(IniState& state, const std::string& key,
             const std::string& value) {
  LinkConfig& cfg = *state.cfg;
  if (state.section == "link") {
    if (key == "device_name") {
      cfg.link.device_name = value;
    } else if (key == "role") {
      const auto role = ParseDeviceRole(value);
      if (!role) {
        return false;
      }
      cfg.link.role = *role;
    } else if (key == "debug_log") {
      return ParseBool(value, cfg.link.debug_log);
    }
    return true;
  }
  if (state.section == "connection") {
    if (key == "heartbeat_interval_ms") {
      return ParseUint32(value, cfg.connection.heartbeat_interval_ms);
    } else if (key == "heartbeat_miss_limit") {
      return ParseUint32(value, cfg.connection.heartbeat_miss_limit);
    } else if (key == "handshake_timeout_ms") {
      return ParseUint32(value, cfg.connection.handshake_timeout_ms);
    } else if (key == "reconnect_delay_ms") {
      return ParseUint32(value, cfg.connection.reconnect_delay_ms);
    } else if (key == "max_reconnect_attempts") {
      return ParseUint32(value, cfg.connection.max_reconnect_attempts);
    }
    return true;
  }
  if (state.section == "transfer") {
    if (key == "chunk_size") {
      return ParseUint32(value, cfg.transfer.chunk_size);
    } else if (key == "max_payload_bytes") {
      return ParseUint32(value, cfg.transfer.max_payload_bytes);
    } else if (key == "max_chunks") {
      return ParseUint32(value, cfg.transfer.max_chunks);
    } else if (key == "max_retry_count") {
      return ParseUint32(value, cfg.transfer.max_retry_count);
    } else if (key == "ack_timeout_ms") {
      return ParseUint32(value, cfg.transfer.ack_timeout_ms);
    } else if (key == "transfer_timeout_ms") {
      return ParseUint32(value, cfg.transfer.transfer_timeout_ms);
    }
    return true;
  }
  if (state.section == "framing") {
    if (key == "max_text_frame_bytes") {
      return ParseUint32(value, cfg.framing.max_text_frame_bytes);
    } else if (key == "max_binary_frame_bytes") {
      return ParseUint32(value, cfg.framing.max_binary_frame_bytes);
    } else if (key == "max_voice_bytes") {
      return ParseUint32(value, cfg.framing.max_voice_bytes);
    }
    return true;
  }
  if (state.section == "worker") {
    if (key == "tick_interval_ms") {
      return ParseUint32(value, cfg.worker.tick_interval_ms);
    }
    return true;
  }
  return true;
}

bool ParseIni(const std::string& path, LinkConfig& out, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "config file not found: " + path;
    return false;
  }

  IniState state;
  state.cfg = &out;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    const std::string trimmed = StripInlineComment(Trim(line));
    if (trimmed.empty()) {
      continue;
    }
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      state.section = Trim(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    const auto pos = trimmed.find('=');
    if (pos == std::string::npos) {
      std::ostringstream oss;
      oss << "invalid line " << line_no;
      error = oss.str();
      return false;
    }
    const std::string key = Trim(trimmed.substr(0, pos));
    const std::string value = Trim(trimmed.substr(pos + 1));
    if (!ApplyKV(state, key, value)) {
      std::ostringstream oss;
      oss << "invalid value for " << state.section << "." << key << " at line "
          << line_no;
      error = oss.str();
      return false;
    }
  }
  return true;
}

}  // namespace

bool ValidateLinkConfig(const LinkConfig& config, std::string& error) {
  if (config.link.device_name.empty()) {
    error = "link.device_name missing";
    return false;
  }
  const auto& conn = config.connection;
  if (conn.heartbeat_interval_ms == 0 || conn.heartbeat_miss_limit == 0 ||
      conn.handshake_timeout_ms == 0 || conn.reconnect_delay_ms == 0) {
    error = "connection intervals must be non-zero";
    return false;
  }
  const auto& xfer = config.transfer;
  if (xfer.chunk_size == 0 || xfer.chunk_size > 0xFFFFu) {
    error = "transfer.chunk_size must be within 1..65535";
    return false;
  }
  if (xfer.max_payload_bytes == 0 || xfer.max_chunks == 0) {
    error = "transfer limits must be non-zero";
    return false;
  }
  if (xfer.ack_timeout_ms == 0 || xfer.transfer_timeout_ms == 0) {
    error = "transfer timeouts must be non-zero";
    return false;
  }
  const auto& framing = config.framing;
  if (framing.max_text_frame_bytes == 0 ||
      framing.max_binary_frame_bytes == 0 || framing.max_voice_bytes == 0) {
    error = "framing limits must be non-zero";
    return false;
  }
  if (config.worker.tick_interval_ms == 0) {
    error = "worker.tick_interval_ms must be non-zero";
    return false;
  }
  return true;
}

bool LoadLinkConfig(const std::string& path, LinkConfig& out_config,
                    std::string& error) {
  out_config = LinkConfig{};
  if (!ParseIni(path, out_config, error)) {
    return false;
  }
  return ValidateLinkConfig(out_config, error);
}

}  // namespace glasslink::link
