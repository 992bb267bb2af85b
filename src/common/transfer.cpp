#include "transfer.hpp"
#include "logging.hpp"

namespace rawlink {

const char *event_type_name(TransferEvent::Type t) {
  switch (t) {
  case TransferEvent::Type::SessionStarted:
    return "session-started";
  case TransferEvent::Type::DataIgnored:
    return "data-ignored";
  case TransferEvent::Type::EndIgnored:
    return "end-ignored";
  case TransferEvent::Type::Completed:
    return "completed";
  default:
    return "incomplete";
  }
}

TransferMachine::TransferMachine()
    : clock_([] { return std::chrono::steady_clock::now(); }) {}

TransferMachine::TransferMachine(Clock clock) : clock_(std::move(clock)) {}

std::vector<TransferEvent> TransferMachine::on_payload(const uint8_t *data,
                                                       size_t len) {
  return on_frame(classify(data, len));
}

std::vector<TransferEvent>
TransferMachine::on_payload(const std::vector<uint8_t> &payload) {
  return on_frame(classify(payload));
}

std::vector<TransferEvent> TransferMachine::on_frame(Frame &&frame) {
  std::vector<TransferEvent> out;
  switch (frame.kind) {
  case FrameKind::HeaderBegin:
    if (session_)
      abandon(IncompleteReason::Superseded, out);
    begin(std::move(frame), out);
    break;
  case FrameKind::Data:
    if (!session_) {
      TransferEvent ev;
      ev.type = TransferEvent::Type::DataIgnored;
      ev.received_size = frame.data.size();
      Logger::instance().log(LogLevel::DEBUG,
                             "data frame (%zu bytes) with no open transfer",
                             frame.data.size());
      out.push_back(std::move(ev));
      break;
    }
    append(std::move(frame.data));
    break;
  case FrameKind::EndOfTransfer:
    if (!session_) {
      TransferEvent ev;
      ev.type = TransferEvent::Type::EndIgnored;
      Logger::instance().log(LogLevel::DEBUG,
                             "end frame with no open transfer");
      out.push_back(std::move(ev));
      break;
    }
    finish(out);
    break;
  }
  return out;
}

std::vector<TransferEvent> TransferMachine::cancel() {
  std::vector<TransferEvent> out;
  if (session_)
    abandon(IncompleteReason::Cancelled, out);
  return out;
}

void TransferMachine::begin(Frame &&frame, std::vector<TransferEvent> &out) {
  TransferSession s;
  s.filename = std::move(frame.filename);
  s.declared_size = frame.declared_size;
  s.started_at = clock_();
  if (s.declared_size > 0 && s.declared_size <= (64u << 20))
    s.received.reserve((size_t)s.declared_size);
  Logger::instance().log(LogLevel::INFO, "transfer started: %s (%llu bytes)",
                         s.filename.c_str(),
                         (unsigned long long)s.declared_size);

  TransferEvent ev;
  ev.type = TransferEvent::Type::SessionStarted;
  ev.filename = s.filename;
  ev.declared_size = s.declared_size;
  out.push_back(std::move(ev));
  session_ = std::move(s);
}

void TransferMachine::append(std::vector<uint8_t> &&data) {
  auto &s = *session_;
  s.received.insert(s.received.end(), data.begin(), data.end());
  log_progress(s);
}

void TransferMachine::log_progress(TransferSession &s) {
  if (s.declared_size == 0)
    return;
  uint64_t got = s.received.size();
  int decile = (int)(got >= s.declared_size ? 10 : (got * 10) / s.declared_size);
  if (decile <= s.progress_decile)
    return;
  s.progress_decile = decile;
  Logger::instance().log(LogLevel::INFO,
                         "transfer progress: %d%% (%llu/%llu bytes)",
                         decile * 10, (unsigned long long)got,
                         (unsigned long long)s.declared_size);
}

void TransferMachine::finish(std::vector<TransferEvent> &out) {
  TransferSession s = std::move(*session_);
  session_.reset();

  CompletedTransfer done;
  done.filename = std::move(s.filename);
  done.declared_size = s.declared_size;
  done.bytes = std::move(s.received);
  done.elapsed_s =
      std::chrono::duration<double>(clock_() - s.started_at).count();
  if (done.elapsed_s < 0)
    done.elapsed_s = 0;
  done.bytes_per_second =
      done.elapsed_s > 0 ? (double)done.bytes.size() / done.elapsed_s : 0.0;
  done.size_mismatch = done.bytes.size() != done.declared_size;

  Logger::instance().log(LogLevel::INFO,
                         "transfer complete: %s, %zu bytes in %.2f s (%.2f B/s)",
                         done.filename.c_str(), done.bytes.size(),
                         done.elapsed_s, done.bytes_per_second);
  if (done.size_mismatch)
    Logger::instance().log(LogLevel::WARN,
                           "size mismatch for %s: declared %llu, received %zu",
                           done.filename.c_str(),
                           (unsigned long long)done.declared_size,
                           done.bytes.size());

  TransferEvent ev;
  ev.type = TransferEvent::Type::Completed;
  ev.filename = done.filename;
  ev.declared_size = done.declared_size;
  ev.received_size = done.bytes.size();
  ev.completed = std::move(done);
  out.push_back(std::move(ev));
}

void TransferMachine::abandon(IncompleteReason reason,
                              std::vector<TransferEvent> &out) {
  TransferSession s = std::move(*session_);
  session_.reset();

  Logger::instance().log(
      LogLevel::WARN, "transfer incomplete (%s): %s, %zu/%llu bytes discarded",
      reason == IncompleteReason::Superseded ? "superseded" : "cancelled",
      s.filename.c_str(), s.received.size(),
      (unsigned long long)s.declared_size);

  TransferEvent ev;
  ev.type = TransferEvent::Type::Incomplete;
  ev.filename = std::move(s.filename);
  ev.declared_size = s.declared_size;
  ev.received_size = s.received.size();
  ev.reason = reason;
  out.push_back(std::move(ev));
}

} // namespace rawlink
