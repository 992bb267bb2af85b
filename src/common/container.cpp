#include "container.hpp"
#include <array>

namespace rawlink {

uint32_t load_le32(const uint8_t *p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
         ((uint32_t)p[3] << 24);
}

void append_le32(std::vector<uint8_t> &out, uint32_t v) {
  out.push_back((uint8_t)(v & 0xFF));
  out.push_back((uint8_t)((v >> 8) & 0xFF));
  out.push_back((uint8_t)((v >> 16) & 0xFF));
  out.push_back((uint8_t)((v >> 24) & 0xFF));
}

std::optional<ContainerHeader> decode_header(const uint8_t *data, size_t len) {
  if (data == nullptr || len < kHeaderBytes)
    return std::nullopt;
  ContainerHeader h;
  h.magic = load_le32(data);
  h.version = load_le32(data + 4);
  h.sample_rate = load_le32(data + 8);
  h.total_samples = load_le32(data + 12);
  h.start_timestamp = load_le32(data + 16);
  h.end_timestamp = load_le32(data + 20);
  return h;
}

std::optional<SampleRecord> decode_sample(const uint8_t *data, size_t len) {
  if (data == nullptr || len < kSampleBytes)
    return std::nullopt;
  SampleRecord s;
  s.mic_sample = load_le32(data);
  s.timestamp = load_le32(data + 4);
  s.sequence_count = load_le32(data + 8);
  return s;
}

void encode_header(const ContainerHeader &h, std::vector<uint8_t> &out) {
  out.reserve(out.size() + kHeaderBytes);
  append_le32(out, h.magic);
  append_le32(out, h.version);
  append_le32(out, h.sample_rate);
  append_le32(out, h.total_samples);
  append_le32(out, h.start_timestamp);
  append_le32(out, h.end_timestamp);
}

void encode_sample(const SampleRecord &s, std::vector<uint8_t> &out) {
  out.reserve(out.size() + kSampleBytes);
  append_le32(out, s.mic_sample);
  append_le32(out, s.timestamp);
  append_le32(out, s.sequence_count);
}

uint32_t crc32c(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = [] {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (0x82F63B78u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

} // namespace rawlink
