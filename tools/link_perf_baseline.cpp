#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "checksum.h"
#include "message.h"
#include "stream_demux.h"
#include "transfer_packet.h"

namespace {

struct BenchConfig {
  bool quick{false};
  std::size_t chunk_payload{4096};
  std::size_t digest_bytes{8u * 1024u * 1024u};
  std::uint32_t packet_iters{60000};
  std::uint32_t message_iters{30000};
};

struct Metric {
  std::string name;
  double value{0.0};
  std::string unit;
};

double ElapsedSeconds(std::chrono::steady_clock::time_point start,
                      std::chrono::steady_clock::time_point end) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(end - start)
      .count();
}

void PrintMetric(const Metric& metric) {
  std::cout << metric.name << ": " << metric.value;
  if (!metric.unit.empty()) {
    std::cout << " " << metric.unit;
  }
  std::cout << "\n";
}

double Mb(std::uint64_t bytes) { return bytes / (1024.0 * 1024.0); }

bool BenchDataPackets(const BenchConfig& cfg, Metric& enc_mbps,
                      Metric& parse_mbps) {
  std::vector<std::uint8_t> chunk(cfg.chunk_payload, 0xAB);
  std::vector<std::uint8_t> packet;
  std::uint64_t bytes = 0;

  auto start = std::chrono::steady_clock::now();
  for (std::uint32_t i = 0; i < cfg.packet_iters; ++i) {
    chunk[0] = static_cast<std::uint8_t>(i & 0xFFu);
    if (!glasslink::link::EncodeData(i, chunk.data(), chunk.size(), packet)) {
      return false;
    }
    bytes += packet.size();
  }
  auto end = std::chrono::steady_clock::now();
  double seconds = ElapsedSeconds(start, end);
  if (seconds <= 0.0) {
    return false;
  }
  enc_mbps = {"data_packet_encode_mbps", Mb(bytes) / seconds, "MB/s"};

  bytes = 0;
  std::uint64_t bad = 0;
  const auto view = glasslink::link::proto::MakeByteView(packet);
  start = std::chrono::steady_clock::now();
  for (std::uint32_t i = 0; i < cfg.packet_iters; ++i) {
    const auto parsed = glasslink::link::ParseData(view);
    if (!parsed) {
      return false;
    }
    if (!parsed->crc_valid()) {
      ++bad;
    }
    bytes += packet.size();
  }
  end = std::chrono::steady_clock::now();
  seconds = ElapsedSeconds(start, end);
  if (seconds <= 0.0 || bad != 0) {
    return false;
  }
  parse_mbps = {"data_packet_parse_mbps", Mb(bytes) / seconds, "MB/s"};
  return true;
}

bool BenchMessages(const BenchConfig& cfg, Metric& text_ops,
                   Metric& binary_ops) {
  const auto text_msg = glasslink::link::MakeAiResponseText(
      "The sign says the museum opens at nine.");
  std::uint64_t ok = 0;

  auto start = std::chrono::steady_clock::now();
  for (std::uint32_t i = 0; i < cfg.message_iters; ++i) {
    const std::string text = glasslink::link::EncodeText(text_msg);
    if (glasslink::link::DecodeText(text)) {
      ++ok;
    }
  }
  auto end = std::chrono::steady_clock::now();
  double seconds = ElapsedSeconds(start, end);
  if (seconds <= 0.0 || ok != cfg.message_iters) {
    return false;
  }
  text_ops = {"text_message_roundtrip_ops",
              static_cast<double>(cfg.message_iters) / seconds, "ops/s"};

  const auto voice =
      glasslink::link::MakeVoiceData(std::vector<std::uint8_t>(640, 0x11));
  ok = 0;
  start = std::chrono::steady_clock::now();
  for (std::uint32_t i = 0; i < cfg.message_iters; ++i) {
    const auto bytes = glasslink::link::EncodeBinary(voice);
    if (glasslink::link::DecodeBinary(bytes)) {
      ++ok;
    }
  }
  end = std::chrono::steady_clock::now();
  seconds = ElapsedSeconds(start, end);
  if (seconds <= 0.0 || ok != cfg.message_iters) {
    return false;
  }
  binary_ops = {"binary_message_roundtrip_ops",
                static_cast<double>(cfg.message_iters) / seconds, "ops/s"};
  return true;
}

bool BenchDigests(const BenchConfig& cfg, Metric& md5_mbps, Metric& crc_mbps) {
  std::vector<std::uint8_t> data(cfg.digest_bytes);
  for (std::size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<std::uint8_t>(i % 251);
  }

  auto start = std::chrono::steady_clock::now();
  const auto digest = glasslink::link::checksum::Md5(data);
  auto end = std::chrono::steady_clock::now();
  double seconds = ElapsedSeconds(start, end);
  if (seconds <= 0.0 || digest.bytes.size() != 16) {
    return false;
  }
  md5_mbps = {"md5_mbps", Mb(data.size()) / seconds, "MB/s"};

  start = std::chrono::steady_clock::now();
  const std::uint32_t crc = glasslink::link::checksum::Crc32(data);
  end = std::chrono::steady_clock::now();
  seconds = ElapsedSeconds(start, end);
  if (seconds <= 0.0 || crc == 0) {
    return false;
  }
  crc_mbps = {"crc32_mbps", Mb(data.size()) / seconds, "MB/s"};
  return true;
}

bool BenchDemux(const BenchConfig& cfg, Metric& mbps) {
  std::vector<std::uint8_t> stream;
  std::vector<std::uint8_t> chunk(cfg.chunk_payload, 0x42);
  std::vector<std::uint8_t> packet;
  for (std::uint32_t i = 0; i < 256; ++i) {
    if (!glasslink::link::EncodeData(i, chunk.data(), chunk.size(), packet)) {
      return false;
    }
    stream.insert(stream.end(), packet.begin(), packet.end());
    const std::string line =
        glasslink::link::EncodeText(glasslink::link::MakeDisplayStatus("ok")) +
        "\n";
    stream.insert(stream.end(), line.begin(), line.end());
  }

  glasslink::link::StreamDemux demux{glasslink::link::FramingSection{}};
  const std::uint32_t rounds = cfg.quick ? 20 : 80;
  std::uint64_t frames = 0;
  const auto start = std::chrono::steady_clock::now();
  for (std::uint32_t r = 0; r < rounds; ++r) {
    // Serial reads arrive in small pieces.
    for (std::size_t off = 0; off < stream.size(); off += 512) {
      const std::size_t n = std::min<std::size_t>(512, stream.size() - off);
      demux.Feed(stream.data() + off, n);
      while (demux.Next()) {
        ++frames;
      }
    }
  }
  const auto end = std::chrono::steady_clock::now();
  const double seconds = ElapsedSeconds(start, end);
  if (seconds <= 0.0 || frames != static_cast<std::uint64_t>(rounds) * 512u) {
    return false;
  }
  mbps = {"demux_mbps",
          Mb(static_cast<std::uint64_t>(stream.size()) * rounds) / seconds,
          "MB/s"};
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  BenchConfig cfg;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--quick") {
      cfg.quick = true;
    } else if (arg == "--chunk" && i + 1 < argc) {
      cfg.chunk_payload = static_cast<std::size_t>(std::stoul(argv[++i]));
    }
  }
  if (cfg.chunk_payload == 0 ||
      cfg.chunk_payload > glasslink::link::kMaxDataPayloadBytes) {
    std::cerr << "--chunk must be within 1..65535\n";
    return 1;
  }
  if (cfg.quick) {
    cfg.packet_iters = 15000;
    cfg.message_iters = 5000;
    cfg.digest_bytes = 2u * 1024u * 1024u;
  }

  std::cout << "glasslink perf baseline\n";

  Metric enc_mbps, parse_mbps;
  if (BenchDataPackets(cfg, enc_mbps, parse_mbps)) {
    PrintMetric(enc_mbps);
    PrintMetric(parse_mbps);
  } else {
    std::cerr << "data packet bench failed\n";
    return 1;
  }

  Metric text_ops, binary_ops;
  if (BenchMessages(cfg, text_ops, binary_ops)) {
    PrintMetric(text_ops);
    PrintMetric(binary_ops);
  } else {
    std::cerr << "message codec bench failed\n";
    return 1;
  }

  Metric md5_mbps, crc_mbps;
  if (BenchDigests(cfg, md5_mbps, crc_mbps)) {
    PrintMetric(md5_mbps);
    PrintMetric(crc_mbps);
  } else {
    std::cerr << "digest bench failed\n";
    return 1;
  }

  Metric demux_mbps;
  if (BenchDemux(cfg, demux_mbps)) {
    PrintMetric(demux_mbps);
  } else {
    std::cerr << "demux bench failed\n";
    return 1;
  }

  return 0;
}
