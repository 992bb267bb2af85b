#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include "transfer.hpp"

namespace rawlink {

// Bridge wire format: each notification is [uint16 LE length][payload].
constexpr size_t kNotificationPrefix = 2;
constexpr size_t kMaxNotificationLength = 0xFFFF;

// Appends one length-prefixed notification. False if the payload does not fit
// the 16-bit length.
bool encode_notification(const std::vector<uint8_t>& payload, std::vector<uint8_t>& out);

// Cuts the bridge byte stream back into notifications and runs each one
// through the transfer state machine in arrival order. Reads may split a
// notification anywhere. Notifications longer than max_payload are dropped.
class NotificationFeed {
public:
    explicit NotificationFeed(size_t max_payload);
    NotificationFeed(size_t max_payload, TransferMachine::Clock clock);

    std::vector<TransferEvent> feed(const uint8_t* data, size_t len);
    std::vector<TransferEvent> feed(const std::vector<uint8_t>& bytes);

    // Bridge gone or shutting down: a partial notification is discarded and a
    // live transfer ends as Incomplete(Cancelled).
    std::vector<TransferEvent> disconnect();

    size_t pending() const { return inbuf_.size(); }
    size_t dropped() const { return dropped_; }
    const TransferMachine& machine() const { return machine_; }

private:
    size_t max_payload_;
    TransferMachine machine_;
    std::vector<uint8_t> inbuf_;
    size_t dropped_{0};
};

} // namespace rawlink
