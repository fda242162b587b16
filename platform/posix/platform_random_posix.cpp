#include "platform_random.h"

#include <array>

#include <fcntl.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace glasslink::platform {

namespace {

bool ReadUrandom(std::uint8_t* out, std::size_t len) {
  int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  std::size_t done = 0;
  while (done < len) {
    const ssize_t got = ::read(fd, out + done, len - done);
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  ::close(fd);
  return done == len;
}

}  // namespace

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  if (!out || len == 0) {
    return false;
  }
#if defined(__linux__)
  std::size_t done = 0;
  while (done < len) {
    const ssize_t got = getrandom(out + done, len - done, 0);
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  if (done == len) {
    return true;
  }
#endif
  return ReadUrandom(out, len);
}

std::string RandomUuid() {
  std::array<std::uint8_t, 16> raw{};
  if (!RandomBytes(raw.data(), raw.size())) {
    return {};
  }
  raw[6] = static_cast<std::uint8_t>((raw[6] & 0x0F) | 0x40);
  raw[8] = static_cast<std::uint8_t>((raw[8] & 0x3F) | 0x80);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHex[raw[i] >> 4]);
    out.push_back(kHex[raw[i] & 0x0F]);
  }
  return out;
}

}  // namespace glasslink::platform
