#include "delivery.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <filesystem>
#include <sstream>

namespace rawlink {

bool LoggingUploadSink::upload(const std::string &path) {
  Logger::instance().log(LogLevel::INFO, "would upload %s to cloud",
                         path.c_str());
  uploaded_.push_back(path);
  return true;
}

Delivery::Delivery(const DeliveryConfig &cfg, UploadSink &sink)
    : cfg_(cfg), sink_(sink) {}

bool Delivery::prepare() {
  std::error_code ec;
  std::filesystem::create_directories(cfg_.output_dir, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "cannot create %s: %s",
                           cfg_.output_dir.c_str(), ec.message().c_str());
    return false;
  }
  return true;
}

std::vector<DeliveryOutcome>
Delivery::handle(std::vector<TransferEvent> &&events) {
  std::vector<DeliveryOutcome> out;
  for (auto &ev : events) {
    if (ev.type == TransferEvent::Type::Completed && ev.completed)
      out.push_back(deliver(std::move(*ev.completed)));
  }
  return out;
}

DeliveryOutcome Delivery::deliver(CompletedTransfer &&done) {
  DeliveryOutcome o;
  std::filesystem::path p =
      std::filesystem::path(cfg_.output_dir) / sanitize_filename(done.filename);
  o.path = p.string();

  std::string err;
  if (!write_file(o.path, done.bytes, err)) {
    Logger::instance().log(LogLevel::ERROR, "store failed: %s", err.c_str());
    return o;
  }
  o.stored = true;
  Logger::instance().log(LogLevel::INFO, "stored %s (%zu bytes)",
                         o.path.c_str(), done.bytes.size());

  bool pass = true;
  if (cfg_.analyze) {
    // Analyze what is on disk, not the transfer buffer.
    o.report = analyze_file(o.path);
    pass = o.report->overall_valid;
    LogLevel lvl = pass ? LogLevel::INFO : LogLevel::WARN;
    Logger::instance().log(lvl, "integrity %s: %s, %zu issue(s)",
                           o.report->integrity(), o.path.c_str(),
                           o.report->issue_count());
    std::istringstream lines(format_report(*o.report, o.path));
    std::string line;
    while (std::getline(lines, line))
      Logger::instance().log(LogLevel::DEBUG, "%s", line.c_str());
  }

  if (!pass) {
    Logger::instance().log(LogLevel::WARN, "upload skipped for %s",
                           o.path.c_str());
    return o;
  }
  o.uploaded = sink_.upload(o.path);
  if (!o.uploaded)
    Logger::instance().log(LogLevel::WARN, "upload failed for %s",
                           o.path.c_str());
  return o;
}

} // namespace rawlink
