#include <gtest/gtest.h>
#include <filesystem>
#include "delivery.hpp"
#include "util.hpp"
#include "test_support.hpp"

using namespace rawlink;
using namespace rawlink::test;
namespace fs = std::filesystem;

namespace {

class DeliveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("rawlink_delivery_" + std::string(::testing::UnitTest::GetInstance()
                                                  ->current_test_info()
                                                  ->name()));
    std::error_code ec;
    fs::remove_all(dir_, ec);
    cfg_.output_dir = dir_.string();
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::vector<TransferEvent> transfer(const std::string &name,
                                      const std::vector<uint8_t> &bytes) {
    TransferMachine m;
    std::vector<TransferEvent> all;
    auto push = [&](std::vector<TransferEvent> ev) {
      for (auto &e : ev)
        all.push_back(std::move(e));
    };
    push(m.on_payload(make_header_frame(name, bytes.size())));
    for (auto &c : split_payload(bytes, kDefaultChunkSize))
      push(m.on_payload(c));
    push(m.on_payload(make_end_frame()));
    return all;
  }

  fs::path dir_;
  DeliveryConfig cfg_;
  LoggingUploadSink sink_;
};

} // namespace

TEST_F(DeliveryTest, StoresAnalyzesAndUploadsIntactContainer) {
  Delivery d(cfg_, sink_);
  ASSERT_TRUE(d.prepare());
  auto container = build_container(good_header(50), clean_samples(50));
  auto out = d.handle(transfer("rec_01.raw", container));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_TRUE(out[0].stored);
  EXPECT_TRUE(out[0].uploaded);
  ASSERT_TRUE(out[0].report.has_value());
  EXPECT_TRUE(out[0].report->overall_valid);
  EXPECT_EQ(out[0].path, (dir_ / "rec_01.raw").string());

  std::vector<uint8_t> on_disk;
  std::string err;
  ASSERT_TRUE(read_file(out[0].path, on_disk, err)) << err;
  EXPECT_EQ(on_disk, container);
  ASSERT_EQ(sink_.uploaded().size(), 1u);
  EXPECT_EQ(sink_.uploaded()[0], out[0].path);
}

TEST_F(DeliveryTest, CorruptedContainerIsStoredButNotUploaded) {
  Delivery d(cfg_, sink_);
  ASSERT_TRUE(d.prepare());
  auto s = clean_samples(10);
  s[3].mic_sample = 0xFFFF;
  auto out = d.handle(transfer("bad.raw", build_container(good_header(10), s)));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_TRUE(out[0].stored);
  EXPECT_FALSE(out[0].uploaded);
  ASSERT_TRUE(out[0].report.has_value());
  EXPECT_FALSE(out[0].report->overall_valid);
  EXPECT_TRUE(sink_.uploaded().empty());
}

TEST_F(DeliveryTest, AnalysisDisabledUploadsUnchecked) {
  cfg_.analyze = false;
  Delivery d(cfg_, sink_);
  ASSERT_TRUE(d.prepare());
  auto out = d.handle(transfer("any.raw", {1, 2, 3}));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FALSE(out[0].report.has_value());
  EXPECT_TRUE(out[0].uploaded);
}

TEST_F(DeliveryTest, SenderPathIsConfinedToOutputDir) {
  Delivery d(cfg_, sink_);
  ASSERT_TRUE(d.prepare());
  auto out = d.handle(transfer("../../etc/evil.raw", {1}));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].path, (dir_ / "evil.raw").string());
  EXPECT_TRUE(fs::exists(dir_ / "evil.raw"));
}

TEST_F(DeliveryTest, IgnoresNonCompletionEvents) {
  Delivery d(cfg_, sink_);
  ASSERT_TRUE(d.prepare());
  TransferMachine m;
  std::vector<TransferEvent> ev = m.on_payload(make_header_frame("a.raw", 10));
  auto cancelled = m.cancel();
  ev.insert(ev.end(), cancelled.begin(), cancelled.end());
  EXPECT_TRUE(d.handle(std::move(ev)).empty());
  EXPECT_TRUE(sink_.uploaded().empty());
}
