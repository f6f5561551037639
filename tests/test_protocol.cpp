#include <gtest/gtest.h>
#include <set>
#include <string>
#include "protocol.hpp"

using namespace tilecast;

TEST(FrameHeaderCodec, RoundTripsEveryField) {
  const FrameHeader samples[] = {
      {0, 0, 0, 1, 0},
      {2, 0, 2, 3, 0},
      {399, 19, 19, 400, 0xDEADBEEF},
      {65534, 255, 255, 65535, 0xFFFFFFFF},
  };
  for (const auto &h : samples) {
    auto bytes = encode_header(h);
    auto back = decode_header(bytes.data(), bytes.size());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, h);
  }
}

TEST(FrameHeaderCodec, LittleEndianLayout) {
  FrameHeader h{0x0102, 3, 4, 0x0506, 0x0A090807};
  auto b = encode_header(h);
  const uint8_t expect[kHeaderSize] = {0x02, 0x01, 3, 4, 0x06, 0x05,
                                       0x07, 0x08, 0x09, 0x0A};
  for (size_t i = 0; i < kHeaderSize; i++)
    EXPECT_EQ(b[i], expect[i]) << "byte " << i;
}

TEST(FrameHeaderCodec, AppendsToBuffer) {
  std::vector<uint8_t> out{0xAA};
  encode_header(FrameHeader{1, 0, 1, 2, 0}, out);
  ASSERT_EQ(out.size(), 1 + kHeaderSize);
  EXPECT_EQ(out[0], 0xAA);
  EXPECT_EQ(out[1], 1);
}

TEST(FrameHeaderCodec, RejectsWrongLength) {
  auto b = encode_header(FrameHeader{0, 0, 0, 1, 0});
  std::vector<uint8_t> longer(b.begin(), b.end());
  longer.push_back(0);
  EXPECT_FALSE(decode_header(b.data(), 9).has_value());
  EXPECT_FALSE(decode_header(longer.data(), longer.size()).has_value());
  EXPECT_FALSE(decode_header(nullptr, kHeaderSize).has_value());
}

TEST(FrameHeaderCodec, RejectsIndexOutsideSession) {
  auto same = encode_header(FrameHeader{3, 0, 3, 3, 0});
  EXPECT_FALSE(decode_header(same.data(), same.size()).has_value());
  auto empty = encode_header(FrameHeader{0, 0, 0, 0, 0});
  EXPECT_FALSE(decode_header(empty.data(), empty.size()).has_value());
}

TEST(SessionParams, PayloadLengths) {
  SessionParams p;
  p.chunk_size = 100;
  p.total_length = 250;
  EXPECT_EQ(p.total_frames(), 3);
  EXPECT_EQ(payload_length(p, 0), 100u);
  EXPECT_EQ(payload_length(p, 1), 100u);
  EXPECT_EQ(payload_length(p, 2), 50u);
  EXPECT_EQ(payload_length(p, 3), 0u);

  p.total_length = 300;
  EXPECT_EQ(p.total_frames(), 3);
  EXPECT_EQ(payload_length(p, 2), 100u);

  p.total_length = 0;
  EXPECT_EQ(p.total_frames(), 0);
}

TEST(SessionParams, ChunkSizeRange) {
  EXPECT_FALSE(valid_chunk_size(79));
  EXPECT_TRUE(valid_chunk_size(80));
  EXPECT_TRUE(valid_chunk_size(100));
  EXPECT_FALSE(valid_chunk_size(101));
  EXPECT_EQ(frames_for_length(1, 80), 1u);
  EXPECT_EQ(frames_for_length(160, 80), 2u);
  EXPECT_EQ(frames_for_length(161, 80), 3u);
}

TEST(FrameStatus, HasNames) {
  EXPECT_STREQ(status_str(FrameStatus::DuplicateFrame), "duplicate frame");
  EXPECT_STREQ(status_str(FrameStatus::DesyncError), "desync");
  EXPECT_STREQ(status_str(FrameStatus::SessionClosed), "session closed");
}

TEST(FrameStatus, EveryStatusHasItsOwnName) {
  const FrameStatus all[] = {
      FrameStatus::Ok,           FrameStatus::MalformedHeader,
      FrameStatus::TruncatedFrame, FrameStatus::SessionMismatch,
      FrameStatus::DuplicateFrame, FrameStatus::DesyncError,
      FrameStatus::SessionClosed};
  std::set<std::string> names;
  for (FrameStatus st : all) {
    std::string n = status_str(st);
    EXPECT_NE(n, "unknown");
    names.insert(n);
  }
  EXPECT_EQ(names.size(), sizeof(all) / sizeof(all[0]));
}
