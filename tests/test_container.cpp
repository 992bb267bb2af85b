#include <gtest/gtest.h>
#include "container.hpp"
#include "test_support.hpp"

using namespace rawlink;
using namespace rawlink::test;

TEST(Container, MagicMatchesFirmwareConstant) {
  std::vector<uint8_t> out;
  append_le32(out, kMagic);
  ASSERT_EQ(out.size(), 4u);
  EXPECT_EQ(std::string(out.begin(), out.end()), "AWAR");
  const uint8_t rawa[] = {'R', 'A', 'W', 'A'};
  EXPECT_EQ(load_le32(rawa), 0x41574152u);
  EXPECT_NE(load_le32(rawa), kMagic);
}

TEST(Container, HeaderFieldOrder) {
  std::vector<uint8_t> bytes;
  encode_header(good_header(2, 1000, 1050), bytes);
  ASSERT_EQ(bytes.size(), kHeaderBytes);
  EXPECT_EQ(load_le32(bytes.data() + 0), kMagic);
  EXPECT_EQ(load_le32(bytes.data() + 4), 1u);
  EXPECT_EQ(load_le32(bytes.data() + 8), 16000u);
  EXPECT_EQ(load_le32(bytes.data() + 12), 2u);
  EXPECT_EQ(load_le32(bytes.data() + 16), 1000u);
  EXPECT_EQ(load_le32(bytes.data() + 20), 1050u);

  auto h = decode_header(bytes.data(), bytes.size());
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->total_samples, 2u);
  EXPECT_EQ(h->end_timestamp, 1050u);
}

TEST(Container, ShortHeaderRejected) {
  std::vector<uint8_t> bytes;
  encode_header(good_header(0), bytes);
  EXPECT_FALSE(decode_header(bytes.data(), kHeaderBytes - 1).has_value());
  EXPECT_FALSE(decode_header(nullptr, 0).has_value());
}

TEST(Container, SampleLayout) {
  std::vector<uint8_t> bytes;
  encode_sample(SampleRecord{0x0FFF, 0x01020304, 7}, bytes);
  ASSERT_EQ(bytes.size(), kSampleBytes);
  EXPECT_EQ(bytes[0], 0xFF);
  EXPECT_EQ(bytes[1], 0x0F);
  EXPECT_EQ(bytes[4], 0x04);
  EXPECT_EQ(bytes[7], 0x01);
  EXPECT_EQ(bytes[8], 7);

  auto s = decode_sample(bytes.data(), bytes.size());
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->mic_sample, 0x0FFFu);
  EXPECT_EQ(s->timestamp, 0x01020304u);
  EXPECT_EQ(s->sequence_count, 7u);
  EXPECT_FALSE(decode_sample(bytes.data(), 11).has_value());
}

TEST(Container, Crc32cKnownVector) {
  const std::string s = "123456789";
  EXPECT_EQ(crc32c(reinterpret_cast<const uint8_t *>(s.data()), s.size()),
            0xE3069283u);
  EXPECT_EQ(crc32c(nullptr, 0), 0u);
}
