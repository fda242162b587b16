#include "platform_log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace glasslink::platform::log {

namespace {

std::mutex g_log_mutex;
LogCallback g_log_cb = nullptr;
void* g_log_user = nullptr;
std::atomic<std::uint8_t> g_min_level{static_cast<std::uint8_t>(Level::kInfo)};

bool IsDelimiter(char ch) {
  const unsigned char uc = static_cast<unsigned char>(ch);
  return std::isspace(uc) != 0 || ch == ',' || ch == ';';
}

std::string ToLowerAscii(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// Rewrites every "key=value" token whose key names peer hardware identity.
std::string RedactInline(std::string_view message) {
  std::string out;
  out.reserve(message.size());
  std::size_t pos = 0;
  while (pos < message.size()) {
    if (IsDelimiter(message[pos])) {
      out.push_back(message[pos++]);
      continue;
    }
    std::size_t end = pos;
    while (end < message.size() && !IsDelimiter(message[end])) {
      ++end;
    }
    const std::string_view token = message.substr(pos, end - pos);
    const std::size_t eq = token.find('=');
    if (eq != std::string_view::npos && eq + 1 < token.size() &&
        IsSensitiveKey(token.substr(0, eq))) {
      out.append(token.data(), eq + 1);
      out.append("***");
    } else {
      out.append(token.data(), token.size());
    }
    pos = end;
  }
  return out;
}

std::string FormatLine(Level level, std::string_view tag,
                       std::string_view message, const Field* fields,
                       std::size_t field_count) {
  std::string line = "[glasslink] ";
  line += LevelName(level);
  if (!tag.empty()) {
    line += ' ';
    line += tag;
  }
  line += ": ";
  line += message;
  for (std::size_t i = 0; i < field_count; ++i) {
    if (fields[i].key.empty()) {
      continue;
    }
    line += ' ';
    line += fields[i].key;
    line += '=';
    line += fields[i].value;
  }
  line += '\n';
  return line;
}

void WriteDefault(Level level, const std::string& line) {
  std::FILE* out =
      (level == Level::kError || level == Level::kWarn) ? stderr : stdout;
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

}  // namespace

void SetLogCallback(LogCallback cb, void* user_data) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_cb = cb;
  g_log_user = user_data;
}

void SetMinLevel(Level level) {
  g_min_level.store(static_cast<std::uint8_t>(level));
}

Level MinLevel() {
  return static_cast<Level>(g_min_level.load());
}

const char* LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields) {
  if (static_cast<std::uint8_t>(level) < g_min_level.load()) {
    return;
  }
  LogCallback cb = nullptr;
  void* user = nullptr;
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    cb = g_log_cb;
    user = g_log_user;
  }

  const std::string tag_copy(tag);
  const std::string msg_copy = RedactMessage(message);
  std::vector<std::string> redacted_values;
  std::vector<Field> safe_fields;
  redacted_values.reserve(fields.size());
  safe_fields.reserve(fields.size());
  for (const auto& field : fields) {
    redacted_values.push_back(RedactValue(field.key, field.value));
  }
  std::size_t i = 0;
  for (const auto& field : fields) {
    safe_fields.push_back(Field{field.key, redacted_values[i++]});
  }

  if (cb) {
    cb(level, tag_copy.c_str(), msg_copy.c_str(), safe_fields.data(),
       safe_fields.size(), user);
    return;
  }
  WriteDefault(level, FormatLine(level, tag_copy, msg_copy, safe_fields.data(),
                                 safe_fields.size()));
}

bool IsSensitiveKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  const std::string lower = ToLowerAscii(key);
  return lower.find("address") != std::string::npos ||
         lower.find("mac") != std::string::npos ||
         lower.find("serial") != std::string::npos;
}

std::string RedactValue(std::string_view key, std::string_view value) {
  if (IsSensitiveKey(key)) {
    return "***";
  }
  return std::string(value);
}

std::string RedactMessage(std::string_view message) {
  return RedactInline(message);
}

}  // namespace glasslink::platform::log
