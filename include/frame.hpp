#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace rawlink {

// Notification stream framing:
//   "FILE:<name>:<decimal size>"  header-begin (text)
//   <raw bytes>                   data
//   "END"                         end-of-transfer (text)
constexpr const char* kHeaderTag = "FILE:";
constexpr const char* kEndSentinel = "END";

// Default per-notification limit on the bridge (ATT MTU 517 minus 3).
constexpr size_t kDefaultMaxPayload = 514;
// Chunk size the peripheral firmware uses.
constexpr size_t kDefaultChunkSize = 240;

enum class FrameKind : uint8_t { HeaderBegin, EndOfTransfer, Data };

struct Frame {
    FrameKind kind{FrameKind::Data};
    std::string filename;        // HeaderBegin only
    uint64_t declared_size{0};   // HeaderBegin only
    std::vector<uint8_t> data;   // Data only, unmodified payload
};

const char* frame_kind_name(FrameKind k);

// UTF-8 decode that drops invalid sequences instead of failing.
std::string decode_text_lossy(const uint8_t* data, size_t len);

// Never fails: anything that is not a well-formed control frame is Data.
Frame classify(const uint8_t* data, size_t len);
Frame classify(const std::vector<uint8_t>& payload);

std::vector<uint8_t> make_header_frame(const std::string& filename, uint64_t size);
std::vector<uint8_t> make_end_frame();
std::vector<std::vector<uint8_t>> split_payload(const std::vector<uint8_t>& data, size_t max_payload);

} // namespace rawlink
