#include "analyzer.hpp"
#include "util.hpp"
#include <algorithm>
#include <exception>
#include <sstream>
#include <unordered_set>

namespace rawlink {

HeaderAnalysis analyze_header(const uint8_t *data, size_t len) {
  HeaderAnalysis a;
  auto h = decode_header(data, len);
  if (!h) {
    a.issues.push_back(strprintf(
        "File too short for header: %zu bytes (need %zu)", len, kHeaderBytes));
    return a;
  }
  a.parsed = true;
  a.header = *h;
  a.magic_valid = h->magic == kMagic;
  a.magic_hex = bytes_to_hex(data, 4);
  a.magic_text = printable_ascii(data, 4);
  a.duration_ms = h->end_timestamp > h->start_timestamp
                      ? h->end_timestamp - h->start_timestamp
                      : 0;

  if (!a.magic_valid)
    a.issues.push_back(strprintf(
        "Invalid magic number: %08X (expected: %08X), bytes %s '%s'", h->magic,
        kMagic, a.magic_hex.c_str(), a.magic_text.c_str()));
  if (h->version != kVersion)
    a.issues.push_back(strprintf("Unexpected version: %u (expected: %u)",
                                 h->version, kVersion));
  if (h->sample_rate != kSampleRate)
    a.issues.push_back(strprintf("Unexpected sample rate: %u (expected: %u)",
                                 h->sample_rate, kSampleRate));
  // Garbage or shifted bytes read as timestamps.
  if ((uint64_t)h->start_timestamp > kSuspiciousTimestampMs)
    a.issues.push_back(
        strprintf("Suspicious start timestamp: %u", h->start_timestamp));
  if (h->total_samples > kSuspiciousTotalSamples)
    a.issues.push_back(
        strprintf("Suspicious total samples: %u", h->total_samples));

  a.valid = a.issues.empty();
  return a;
}

SampleAnalysis analyze_samples(const uint8_t *data, size_t len,
                               const ContainerHeader &header) {
  SampleAnalysis a;
  a.attempted = true;

  if (len % kSampleBytes != 0) {
    a.issues.push_back(strprintf(
        "Data length not divisible by sample size (%zu bytes): %zu bytes, "
        "%zu trailing",
        kSampleBytes, len, len % kSampleBytes));
    return a;
  }

  const size_t count = len / kSampleBytes;
  std::vector<SampleRecord> samples;
  samples.reserve(count);
  for (size_t i = 0; i < count; i++) {
    size_t off = i * kSampleBytes;
    auto s = decode_sample(data + off, len - off);
    if (!s) {
      a.issues.push_back(strprintf(
          "Sample parsing error at index %zu (offset %zu)", i,
          kHeaderBytes + off));
      return a;
    }
    samples.push_back(*s);
  }
  a.sample_count = count;
  a.declared_count_matches = header.total_samples == count;
  a.payload_crc32c = crc32c(data, len);

  if (samples.empty()) {
    a.valid = true;
    return a;
  }

  for (size_t i = 0; i < samples.size(); i++) {
    uint32_t v = samples[i].mic_sample;
    if (v > kAdcMax) {
      if (a.extreme_values.size() < kMaxReportedExtremes)
        a.extreme_values.push_back(v);
      a.extreme_count++;
    }
    if (v == kAdcCorruptSentinel) {
      if (a.ffff_positions.size() < kMaxReportedFfff)
        a.ffff_positions.push_back(i);
      a.ffff_count++;
    }
  }
  if (a.extreme_count)
    a.issues.push_back(strprintf("Found %zu extreme ADC values > %u",
                                 a.extreme_count, kAdcMax));
  if (a.ffff_count)
    a.issues.push_back(
        strprintf("Found %zu samples with 0xFFFF value", a.ffff_count));

  for (size_t i = 1; i < samples.size(); i++) {
    int64_t d = (int64_t)samples[i].timestamp - (int64_t)samples[i - 1].timestamp;
    if (d < 0 || d > kMaxTimestampDeltaMs) {
      if (a.timestamp_issues.size() < kMaxReportedTimestampIssues)
        a.timestamp_issues.push_back(d);
      a.timestamp_issue_count++;
    }
  }
  if (a.timestamp_issue_count)
    a.issues.push_back(strprintf("Found %zu invalid timestamp differences",
                                 a.timestamp_issue_count));

  // Baseline is the first record's counter, corrupt or not.
  const uint64_t base = samples[0].sequence_count;
  for (size_t i = 0; i < samples.size(); i++) {
    if ((uint64_t)samples[i].sequence_count != base + i) {
      if (a.sequence_errors.size() < kMaxReportedSequenceErrors)
        a.sequence_errors.push_back(i);
      a.sequence_error_count++;
    }
  }
  if (a.sequence_error_count) {
    std::ostringstream os;
    os << "Found " << a.sequence_error_count
       << " sample count sequence errors (first at index "
       << a.sequence_errors.front() << ")";
    a.issues.push_back(os.str());
  }

  AdcStats st;
  st.min = samples[0].mic_sample;
  st.max = samples[0].mic_sample;
  uint64_t sum = 0;
  std::unordered_set<uint32_t> distinct;
  for (const auto &s : samples) {
    st.min = std::min(st.min, s.mic_sample);
    st.max = std::max(st.max, s.mic_sample);
    sum += s.mic_sample;
    distinct.insert(s.mic_sample);
  }
  st.mean = (double)sum / (double)samples.size();
  st.unique_values = distinct.size();
  a.adc_stats = st;

  a.valid = a.issues.empty();
  return a;
}

CorruptionReport analyze(const uint8_t *data, size_t len) {
  CorruptionReport r;
  r.file_size = len;
  try {
    r.header = analyze_header(data, len);
    if (r.header.valid)
      r.samples = analyze_samples(data + kHeaderBytes, len - kHeaderBytes,
                                  r.header.header);
  } catch (const std::exception &e) {
    r.samples.valid = false;
    r.samples.issues.push_back(std::string("Analysis failed: ") + e.what());
  }
  r.overall_valid = r.header.valid && r.samples.attempted && r.samples.valid;
  return r;
}

CorruptionReport analyze(const std::vector<uint8_t> &bytes) {
  return analyze(bytes.data(), bytes.size());
}

CorruptionReport analyze_file(const std::string &path) {
  std::vector<uint8_t> bytes;
  std::string err;
  bool ok = false;
  try {
    ok = read_file(path, bytes, err);
  } catch (const std::exception &e) {
    err = e.what();
  }
  if (!ok) {
    CorruptionReport r;
    r.header.issues.push_back("Failed to read file: " + err);
    return r;
  }
  return analyze(bytes);
}

std::string format_report(const CorruptionReport &r, const std::string &label) {
  std::ostringstream os;
  os << "BLE Data Corruption Analysis Report\n";
  os << std::string(50, '=') << "\n";
  os << "File: " << label << "\n";
  os << "Size: " << r.file_size << " bytes\n";
  os << "Overall Status: " << (r.overall_valid ? "VALID" : "CORRUPTED")
     << "\n\n";

  const auto &h = r.header;
  os << "HEADER ANALYSIS:\n";
  if (h.parsed) {
    os << "  Magic: " << h.magic_text << " (" << h.magic_hex << ")\n";
    os << "  Version: " << h.header.version
       << "  Sample Rate: " << h.header.sample_rate << "\n";
    os << "  Declared Samples: " << h.header.total_samples
       << "  Duration: " << h.duration_ms << " ms\n";
  }
  os << "  Valid: " << (h.valid ? "yes" : "no") << "\n";
  for (const auto &issue : h.issues)
    os << "  ! " << issue << "\n";
  os << "\n";

  const auto &s = r.samples;
  if (s.attempted) {
    os << "SAMPLE ANALYSIS:\n";
    os << "  Sample Count: " << s.sample_count;
    if (h.parsed && !s.declared_count_matches && s.issues.empty())
      os << " (header declares " << h.header.total_samples << ")";
    os << "\n";
    os << "  Valid: " << (s.valid ? "yes" : "no") << "\n";
    if (s.adc_stats) {
      os << "  ADC Range: " << s.adc_stats->min << " - " << s.adc_stats->max
         << " (expected: 0-" << kAdcMax << ")\n";
      os << "  ADC Mean: " << strprintf("%.1f", s.adc_stats->mean) << "\n";
      os << "  Unique Values: " << s.adc_stats->unique_values << "\n";
      os << "  Payload CRC32C: " << strprintf("%08X", s.payload_crc32c) << "\n";
    }
    for (const auto &issue : s.issues)
      os << "  ! " << issue << "\n";
    os << "\n";
  }

  os << "SUMMARY:\n";
  os << "  Issues Found: " << r.issue_count() << "\n";
  os << "  Data Integrity: " << r.integrity() << "\n\n";
  os << "RECOMMENDATIONS:\n";
  if (!r.overall_valid) {
    os << "  - Check BLE connection stability\n";
    os << "  - Verify firmware data validation\n";
    os << "  - Consider adding CRC checks\n";
    os << "  - Test with smaller BLE packets\n";
  } else {
    os << "  - Data appears to be intact\n";
    os << "  - Consider monitoring for intermittent corruption\n";
  }
  return os.str();
}

} // namespace rawlink
