#include "feed.hpp"
#include "logging.hpp"
#include <utility>

namespace rawlink {

bool encode_notification(const std::vector<uint8_t> &payload,
                         std::vector<uint8_t> &out) {
  if (payload.size() > kMaxNotificationLength)
    return false;
  out.push_back((uint8_t)(payload.size() & 0xFF));
  out.push_back((uint8_t)((payload.size() >> 8) & 0xFF));
  out.insert(out.end(), payload.begin(), payload.end());
  return true;
}

NotificationFeed::NotificationFeed(size_t max_payload)
    : max_payload_(max_payload) {}

NotificationFeed::NotificationFeed(size_t max_payload,
                                   TransferMachine::Clock clock)
    : max_payload_(max_payload), machine_(std::move(clock)) {}

std::vector<TransferEvent> NotificationFeed::feed(const uint8_t *data,
                                                  size_t len) {
  std::vector<TransferEvent> out;
  if (len > 0)
    inbuf_.insert(inbuf_.end(), data, data + len);
  size_t off = 0;
  while (inbuf_.size() - off >= kNotificationPrefix) {
    size_t plen = (size_t)inbuf_[off] | ((size_t)inbuf_[off + 1] << 8);
    size_t need = kNotificationPrefix + plen;
    if (inbuf_.size() - off < need)
      break;
    const uint8_t *payload = inbuf_.data() + off + kNotificationPrefix;
    if (plen > max_payload_) {
      dropped_++;
      Logger::instance().log(LogLevel::WARN,
                             "notification of %zu bytes exceeds limit %zu, dropped",
                             plen, max_payload_);
    } else {
      auto ev = machine_.on_payload(payload, plen);
      for (auto &e : ev)
        out.push_back(std::move(e));
    }
    off += need;
  }
  if (off > 0)
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off);
  return out;
}

std::vector<TransferEvent>
NotificationFeed::feed(const std::vector<uint8_t> &bytes) {
  return feed(bytes.data(), bytes.size());
}

std::vector<TransferEvent> NotificationFeed::disconnect() {
  if (!inbuf_.empty()) {
    Logger::instance().log(LogLevel::WARN,
                           "%zu bytes of a partial notification discarded",
                           inbuf_.size());
    inbuf_.clear();
  }
  return machine_.cancel();
}

} // namespace rawlink
