#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

namespace rawlink {

// Recording container layout:
// [ContainerHeader: 24 bytes][SampleRecord: 12 bytes] x N
// All fields are little-endian uint32, serialized field by field.

constexpr uint32_t kMagic = 0x52415741; // "RAWA" as the firmware defines it; bytes on disk 41 57 41 52
constexpr uint32_t kVersion = 1;
constexpr uint32_t kSampleRate = 16000;

constexpr size_t kHeaderBytes = 24;
constexpr size_t kSampleBytes = 12;

constexpr uint32_t kAdcMax = 4095;          // 12-bit ADC
constexpr uint32_t kAdcCorruptSentinel = 0xFFFF;

struct ContainerHeader {
    uint32_t magic{0};
    uint32_t version{0};
    uint32_t sample_rate{0};
    uint32_t total_samples{0};   // advisory
    uint32_t start_timestamp{0}; // device ms
    uint32_t end_timestamp{0};   // device ms
};

struct SampleRecord {
    uint32_t mic_sample{0};
    uint32_t timestamp{0};
    uint32_t sequence_count{0};
};

uint32_t load_le32(const uint8_t* p);
void append_le32(std::vector<uint8_t>& out, uint32_t v);

std::optional<ContainerHeader> decode_header(const uint8_t* data, size_t len);
std::optional<SampleRecord> decode_sample(const uint8_t* data, size_t len);

void encode_header(const ContainerHeader& h, std::vector<uint8_t>& out);
void encode_sample(const SampleRecord& s, std::vector<uint8_t>& out);

// CRC-32C (Castagnoli).
uint32_t crc32c(const uint8_t* data, size_t len);

} // namespace rawlink
