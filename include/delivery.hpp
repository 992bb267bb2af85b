#pragma once
#include <optional>
#include <string>
#include <vector>
#include "analyzer.hpp"
#include "transfer.hpp"

namespace rawlink {

// Destination for containers that passed the integrity gate.
class UploadSink {
public:
    virtual ~UploadSink() = default;
    virtual bool upload(const std::string& path) = 0;
};

// Stand-in for the cloud uploader: records the request and logs it.
class LoggingUploadSink : public UploadSink {
public:
    bool upload(const std::string& path) override;
    const std::vector<std::string>& uploaded() const { return uploaded_; }
private:
    std::vector<std::string> uploaded_;
};

struct DeliveryConfig {
    std::string output_dir{"received_audio"};
    bool analyze{true};
};

struct DeliveryOutcome {
    std::string path;
    bool stored{false};
    bool uploaded{false};
    std::optional<CorruptionReport> report;   // absent when analysis is disabled
};

// Persists completed transfers, runs the analyzer on the closed file, and
// forwards intact containers to the upload sink.
class Delivery {
public:
    Delivery(const DeliveryConfig& cfg, UploadSink& sink);
    bool prepare();
    std::vector<DeliveryOutcome> handle(std::vector<TransferEvent>&& events);
    const DeliveryConfig& config() const { return cfg_; }
private:
    DeliveryOutcome deliver(CompletedTransfer&& done);

    DeliveryConfig cfg_;
    UploadSink& sink_;
};

} // namespace rawlink
