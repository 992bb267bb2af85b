#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "frame.hpp"

namespace rawlink {

struct CompletedTransfer {
    std::string filename;
    uint64_t declared_size{0};
    std::vector<uint8_t> bytes;
    double elapsed_s{0.0};
    double bytes_per_second{0.0};   // 0 when elapsed_s is 0
    bool size_mismatch{false};      // declared_size != bytes.size()
};

enum class IncompleteReason : uint8_t { Superseded, Cancelled };

struct TransferEvent {
    enum class Type {
        SessionStarted,
        DataIgnored,    // data frame with no live session
        EndIgnored,     // end frame with no live session
        Completed,
        Incomplete,     // live session discarded before END
    } type = Type::SessionStarted;

    std::string filename;
    uint64_t declared_size{0};
    uint64_t received_size{0};

    // Present when type == Completed
    std::optional<CompletedTransfer> completed;
    // Meaningful when type == Incomplete
    IncompleteReason reason{IncompleteReason::Superseded};
};

const char* event_type_name(TransferEvent::Type t);

// One in-flight reception. Owned exclusively by TransferMachine.
struct TransferSession {
    std::string filename;
    uint64_t declared_size{0};
    std::vector<uint8_t> received;
    std::chrono::steady_clock::time_point started_at;
    int progress_decile{0};
};

// Reassembles the notification stream into completed containers.
// Each call handles one payload to completion and returns the events it
// produced, in order.
class TransferMachine {
public:
    enum class State : uint8_t { Idle, Receiving };
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    TransferMachine();
    explicit TransferMachine(Clock clock);

    std::vector<TransferEvent> on_payload(const uint8_t* data, size_t len);
    std::vector<TransferEvent> on_payload(const std::vector<uint8_t>& payload);
    std::vector<TransferEvent> on_frame(Frame&& frame);

    // Disconnect or shutdown: discard a live session as Incomplete(Cancelled).
    std::vector<TransferEvent> cancel();

    State state() const { return session_ ? State::Receiving : State::Idle; }
    bool receiving() const { return session_.has_value(); }

private:
    void begin(Frame&& frame, std::vector<TransferEvent>& out);
    void append(std::vector<uint8_t>&& data);
    void finish(std::vector<TransferEvent>& out);
    void abandon(IncompleteReason reason, std::vector<TransferEvent>& out);
    void log_progress(TransferSession& s);

    Clock clock_;
    std::optional<TransferSession> session_;
};

} // namespace rawlink
