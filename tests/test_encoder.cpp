#include <gtest/gtest.h>
#include "encoder.hpp"
#include "test_util.hpp"

using namespace tilecast;
using tilecast::testing::make_bytes;

TEST(FrameEncoder, SplitsIntoChunksInOffsetOrder) {
  EncoderConfig cfg;
  cfg.chunk_size = 100;
  FrameEncoder enc(cfg);
  auto data = make_bytes(250);
  std::vector<Frame> frames;
  GridShape grid;
  ASSERT_TRUE(enc.encode(data, frames, &grid));
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[0].payload.size(), 100u);
  EXPECT_EQ(frames[1].payload.size(), 100u);
  EXPECT_EQ(frames[2].payload.size(), 50u);
  for (uint16_t i = 0; i < 3; i++) {
    EXPECT_EQ(frames[i].hdr.frame_index, i);
    EXPECT_EQ(frames[i].hdr.total_frames, 3);
    EXPECT_EQ(frames[i].hdr.reserved, 0u);
  }
  EXPECT_EQ(grid.rows, 2);
  EXPECT_EQ(grid.cols, 2);
  EXPECT_EQ(frames[2].hdr.row, 1);
  EXPECT_EQ(frames[2].hdr.col, 0);
}

TEST(FrameEncoder, ConcatenatedPayloadsEqualInput) {
  for (uint16_t chunk = kMinChunkSize; chunk <= kMaxChunkSize; chunk += 7) {
    EncoderConfig cfg;
    cfg.chunk_size = chunk;
    FrameEncoder enc(cfg);
    auto data = make_bytes(1234 + chunk, chunk);
    std::vector<Frame> frames;
    ASSERT_TRUE(enc.encode(data, frames));
    std::vector<uint8_t> joined;
    for (const auto &f : frames) {
      EXPECT_GT(f.payload.size(), 0u);
      EXPECT_LE(f.payload.size(), chunk);
      joined.insert(joined.end(), f.payload.begin(), f.payload.end());
    }
    EXPECT_EQ(joined, data) << "chunk " << chunk;
  }
}

TEST(FrameEncoder, EmptyInputYieldsNoFrames) {
  FrameEncoder enc(EncoderConfig{});
  std::vector<Frame> frames(2);
  GridShape grid{9, 9};
  EXPECT_TRUE(enc.encode({}, frames, &grid));
  EXPECT_TRUE(frames.empty());
  EXPECT_EQ(grid.rows, 0);
  EXPECT_EQ(grid.cols, 0);
}

TEST(FrameEncoder, RejectsChunkSizeOutsideRange) {
  auto data = make_bytes(500);
  std::vector<Frame> frames;
  EncoderConfig cfg;
  cfg.chunk_size = 79;
  EXPECT_FALSE(FrameEncoder(cfg).encode(data, frames));
  cfg.chunk_size = 101;
  EXPECT_FALSE(FrameEncoder(cfg).encode(data, frames));
  EXPECT_TRUE(frames.empty());
}

TEST(FrameEncoder, RejectsImageNeedingTooManyFrames) {
  EncoderConfig cfg;
  cfg.chunk_size = kMinChunkSize;
  std::vector<uint8_t> data((size_t)kMaxFrames * kMinChunkSize + 1, 1);
  std::vector<Frame> frames;
  EXPECT_FALSE(FrameEncoder(cfg).encode(data, frames));
}

TEST(FrameEncoder, FixedColumnsLayout) {
  EncoderConfig cfg;
  cfg.chunk_size = 80;
  cfg.grid = GridPolicy::FixedColumns;
  cfg.fixed_cols = 20;
  FrameEncoder enc(cfg);
  auto data = make_bytes(80 * 45);
  std::vector<Frame> frames;
  GridShape grid;
  ASSERT_TRUE(enc.encode(data, frames, &grid));
  ASSERT_EQ(frames.size(), 45u);
  EXPECT_EQ(grid.cols, 20);
  EXPECT_EQ(grid.rows, 3);
  EXPECT_EQ(frames[21].hdr.row, 1);
  EXPECT_EQ(frames[21].hdr.col, 1);
  EXPECT_EQ(frames[44].hdr.row, 2);
  EXPECT_EQ(frames[44].hdr.col, 4);
}

TEST(FrameEncoder, ExplicitGridMustHoldAllFrames) {
  EncoderConfig cfg;
  cfg.chunk_size = 100;
  FrameEncoder enc(cfg);
  auto data = make_bytes(1000);
  std::vector<Frame> frames;
  EXPECT_FALSE(enc.encode(data, GridShape{3, 3}, frames));
  EXPECT_TRUE(enc.encode(data, GridShape{2, 5}, frames));
  EXPECT_EQ(frames.size(), 10u);
  EXPECT_EQ(frames[7].hdr.row, 1);
  EXPECT_EQ(frames[7].hdr.col, 2);
}

TEST(GridShapes, SquareGrid) {
  EXPECT_EQ(square_grid(1).rows, 1);
  EXPECT_EQ(square_grid(1).cols, 1);
  EXPECT_EQ(square_grid(16).cols, 4);
  EXPECT_EQ(square_grid(16).rows, 4);
  EXPECT_EQ(square_grid(17).cols, 5);
  EXPECT_EQ(square_grid(17).rows, 4);
  EXPECT_EQ(square_grid(65535).cols, 256);
}

TEST(GridShapes, ParsePolicy) {
  GridPolicy p = GridPolicy::Square;
  EXPECT_TRUE(parse_grid_policy("columns", p));
  EXPECT_EQ(p, GridPolicy::FixedColumns);
  EXPECT_TRUE(parse_grid_policy("square", p));
  EXPECT_EQ(p, GridPolicy::Square);
  EXPECT_FALSE(parse_grid_policy("hex", p));
}
