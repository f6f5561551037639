
#include "encoder.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>

namespace tilecast {

bool parse_grid_policy(const std::string &s, GridPolicy &out) {
  if (s == "square") {
    out = GridPolicy::Square;
    return true;
  }
  if (s == "columns") {
    out = GridPolicy::FixedColumns;
    return true;
  }
  return false;
}

GridShape square_grid(uint32_t frame_count) {
  if (frame_count == 0)
    return GridShape{0, 0};
  uint32_t cols = (uint32_t)std::ceil(std::sqrt((double)frame_count));
  // guard against sqrt rounding on perfect squares
  while (cols > 1 && (uint64_t)(cols - 1) * (cols - 1) >= frame_count)
    cols--;
  while ((uint64_t)cols * cols < frame_count)
    cols++;
  uint32_t rows = (frame_count + cols - 1) / cols;
  return GridShape{(uint16_t)rows, (uint16_t)cols};
}

GridShape column_grid(uint32_t frame_count, uint16_t cols) {
  if (frame_count == 0 || cols == 0)
    return GridShape{0, 0};
  uint32_t rows = (frame_count + cols - 1) / cols;
  return GridShape{(uint16_t)std::min<uint32_t>(rows, 0xFFFF), cols};
}

GridShape FrameEncoder::grid_for(uint32_t frame_count) const {
  if (cfg_.grid == GridPolicy::FixedColumns)
    return column_grid(frame_count, cfg_.fixed_cols);
  return square_grid(frame_count);
}

bool FrameEncoder::encode(const std::vector<uint8_t> &data,
                          std::vector<Frame> &frames,
                          GridShape *grid_out) const {
  uint32_t n = frames_for_length((uint32_t)data.size(), cfg_.chunk_size);
  GridShape grid = grid_for(n);
  if (grid_out)
    *grid_out = grid;
  return encode(data, grid, frames);
}

bool FrameEncoder::encode(const std::vector<uint8_t> &data,
                          const GridShape &grid,
                          std::vector<Frame> &frames) const {
  frames.clear();
  if (!valid_chunk_size(cfg_.chunk_size)) {
    Logger::instance().log(LogLevel::ERROR,
                           "chunk size %u outside [%u,%u]",
                           (unsigned)cfg_.chunk_size, (unsigned)kMinChunkSize,
                           (unsigned)kMaxChunkSize);
    return false;
  }
  if (data.empty())
    return true;
  if (data.size() > (size_t)kMaxFrames * cfg_.chunk_size) {
    Logger::instance().log(LogLevel::ERROR,
                           "image of %zu bytes needs more than %u frames",
                           data.size(), (unsigned)kMaxFrames);
    return false;
  }

  size_t total = data.size();
  size_t chunk = cfg_.chunk_size;
  uint32_t total_frames = frames_for_length((uint32_t)total, cfg_.chunk_size);
  if (grid.cols == 0 || (uint64_t)grid.rows * grid.cols < total_frames) {
    Logger::instance().log(LogLevel::ERROR,
                           "grid %ux%u cannot hold %u frames",
                           (unsigned)grid.rows, (unsigned)grid.cols,
                           (unsigned)total_frames);
    return false;
  }
  uint32_t last_row = (total_frames - 1) / grid.cols;
  if (grid.cols > kMaxGridSide || last_row >= kMaxGridSide) {
    Logger::instance().log(LogLevel::ERROR,
                           "grid %ux%u does not fit one-byte coordinates",
                           (unsigned)grid.rows, (unsigned)grid.cols);
    return false;
  }

  frames.reserve(total_frames);
  size_t offset = 0;
  for (uint32_t i = 0; i < total_frames; i++) {
    size_t n = std::min(chunk, total - offset);
    Frame f;
    f.hdr.frame_index = (uint16_t)i;
    f.hdr.row = (uint8_t)(i / grid.cols);
    f.hdr.col = (uint8_t)(i % grid.cols);
    f.hdr.total_frames = (uint16_t)total_frames;
    f.payload.assign(data.begin() + offset, data.begin() + offset + n);
    frames.push_back(std::move(f));
    offset += n;
  }
  Logger::instance().log(LogLevel::DEBUG,
                         "encoded %zu bytes into %u frames (chunk %zu, grid "
                         "%ux%u)",
                         total, (unsigned)total_frames, chunk,
                         (unsigned)grid.rows, (unsigned)grid.cols);
  return true;
}

} // namespace tilecast
