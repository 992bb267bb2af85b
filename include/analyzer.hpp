#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "container.hpp"

namespace rawlink {

constexpr uint64_t kSuspiciousTimestampMs = 1000000000000ull;
constexpr uint32_t kSuspiciousTotalSamples = 1000000;
constexpr int64_t kMaxTimestampDeltaMs = 1000;

constexpr size_t kMaxReportedExtremes = 10;
constexpr size_t kMaxReportedFfff = 10;
constexpr size_t kMaxReportedTimestampIssues = 5;
constexpr size_t kMaxReportedSequenceErrors = 10;

struct HeaderAnalysis {
    bool valid{false};
    bool parsed{false};          // false when fewer than 24 bytes were available
    ContainerHeader header{};
    bool magic_valid{false};
    std::string magic_hex;       // e.g. "52415741"
    std::string magic_text;      // printable rendering, '?' for others
    uint32_t duration_ms{0};
    std::vector<std::string> issues;
};

struct AdcStats {
    uint32_t min{0};
    uint32_t max{0};
    double mean{0.0};
    size_t unique_values{0};
};

struct SampleAnalysis {
    bool attempted{false};       // only entered after a valid header
    bool valid{false};
    size_t sample_count{0};

    std::vector<uint32_t> extreme_values;       // first kMaxReportedExtremes
    size_t extreme_count{0};
    std::vector<size_t> ffff_positions;         // first kMaxReportedFfff
    size_t ffff_count{0};
    std::vector<int64_t> timestamp_issues;      // first kMaxReportedTimestampIssues deltas
    size_t timestamp_issue_count{0};
    std::vector<size_t> sequence_errors;        // first kMaxReportedSequenceErrors indices
    size_t sequence_error_count{0};

    std::optional<AdcStats> adc_stats;          // absent on failure or with no records
    bool declared_count_matches{false};         // header.total_samples == sample_count
    uint32_t payload_crc32c{0};
    std::vector<std::string> issues;
};

struct CorruptionReport {
    size_t file_size{0};
    HeaderAnalysis header;
    SampleAnalysis samples;
    bool overall_valid{false};

    size_t issue_count() const { return header.issues.size() + samples.issues.size(); }
    const char* integrity() const { return overall_valid ? "GOOD" : "CORRUPTED"; }
};

// Pure and re-entrant. Never throws; every failure is described in the report.
CorruptionReport analyze(const uint8_t* data, size_t len);
CorruptionReport analyze(const std::vector<uint8_t>& bytes);
CorruptionReport analyze_file(const std::string& path);

HeaderAnalysis analyze_header(const uint8_t* data, size_t len);
SampleAnalysis analyze_samples(const uint8_t* data, size_t len, const ContainerHeader& header);

std::string format_report(const CorruptionReport& report, const std::string& label);

} // namespace rawlink
