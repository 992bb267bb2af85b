#include "frame.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace rawlink {

namespace {

bool is_cont(uint8_t b) { return (b & 0xC0) == 0x80; }

// Number of bytes a valid sequence starting at p[0] occupies, or 0 if the
// bytes at p do not begin a valid sequence (maximal invalid prefix is then
// reported through `skip`).
size_t utf8_seq(const uint8_t *p, size_t avail, size_t &skip) {
  uint8_t b0 = p[0];
  skip = 1;
  if (b0 < 0x80)
    return 1;
  size_t need;
  uint8_t lo = 0x80, hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    need = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    need = 3;
    if (b0 == 0xE0)
      lo = 0xA0;
    else if (b0 == 0xED)
      hi = 0x9F;
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    need = 4;
    if (b0 == 0xF0)
      lo = 0x90;
    else if (b0 == 0xF4)
      hi = 0x8F;
  } else {
    return 0;
  }
  for (size_t i = 1; i < need; i++) {
    if (i >= avail)
      return 0;
    uint8_t b = p[i];
    if (i == 1 ? (b < lo || b > hi) : !is_cont(b))
      return 0;
    skip = i + 1;
  }
  return need;
}

bool parse_size(const std::string &s, uint64_t &out) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b]))
    b++;
  while (e > b && std::isspace((unsigned char)s[e - 1]))
    e--;
  if (b < e && s[b] == '+')
    b++;
  if (b == e)
    return false;
  uint64_t v = 0;
  for (size_t i = b; i < e; i++) {
    if (s[i] < '0' || s[i] > '9')
      return false;
    uint64_t d = (uint64_t)(s[i] - '0');
    if (v > (std::numeric_limits<uint64_t>::max() - d) / 10)
      return false;
    v = v * 10 + d;
  }
  out = v;
  return true;
}

std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> parts;
  size_t start = 0;
  for (;;) {
    auto pos = s.find(sep, start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace

const char *frame_kind_name(FrameKind k) {
  switch (k) {
  case FrameKind::HeaderBegin:
    return "header-begin";
  case FrameKind::EndOfTransfer:
    return "end";
  default:
    return "data";
  }
}

std::string decode_text_lossy(const uint8_t *data, size_t len) {
  std::string out;
  out.reserve(len);
  size_t i = 0;
  while (i < len) {
    size_t skip = 1;
    size_t n = utf8_seq(data + i, len - i, skip);
    if (n == 0) {
      i += skip;
      continue;
    }
    out.append(reinterpret_cast<const char *>(data + i), n);
    i += n;
  }
  return out;
}

Frame classify(const uint8_t *data, size_t len) {
  Frame f;
  std::string text = decode_text_lossy(data, len);
  if (text == kEndSentinel) {
    f.kind = FrameKind::EndOfTransfer;
    return f;
  }
  if (text.compare(0, 5, kHeaderTag) == 0) {
    auto parts = split(text, ':');
    uint64_t size = 0;
    if (parts.size() >= 3 && parse_size(parts[2], size)) {
      f.kind = FrameKind::HeaderBegin;
      f.filename = parts[1];
      f.declared_size = size;
      return f;
    }
  }
  f.kind = FrameKind::Data;
  if (len)
    f.data.assign(data, data + len);
  return f;
}

Frame classify(const std::vector<uint8_t> &payload) {
  return classify(payload.data(), payload.size());
}

std::vector<uint8_t> make_header_frame(const std::string &filename,
                                       uint64_t size) {
  std::string s = std::string(kHeaderTag) + filename + ":" +
                  std::to_string(size);
  return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> make_end_frame() {
  std::string s(kEndSentinel);
  return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<std::vector<uint8_t>>
split_payload(const std::vector<uint8_t> &data, size_t max_payload) {
  std::vector<std::vector<uint8_t>> chunks;
  if (max_payload == 0)
    return chunks;
  size_t off = 0;
  while (off < data.size()) {
    size_t n = std::min(max_payload, data.size() - off);
    chunks.emplace_back(data.begin() + off, data.begin() + off + n);
    off += n;
  }
  return chunks;
}

} // namespace rawlink
