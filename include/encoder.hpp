
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace tilecast {

enum class GridPolicy : uint8_t { Square = 0, FixedColumns = 1 };

struct GridShape {
    uint16_t rows{0};
    uint16_t cols{0};
};

struct EncoderConfig {
    uint16_t chunk_size{90};
    GridPolicy grid{GridPolicy::Square};
    uint16_t fixed_cols{20};
};

bool parse_grid_policy(const std::string& s, GridPolicy& out);

// Square-ish grid: cols = ceil(sqrt(n)), rows = ceil(n / cols).
GridShape square_grid(uint32_t frame_count);
GridShape column_grid(uint32_t frame_count, uint16_t cols);

class FrameEncoder {
public:
    explicit FrameEncoder(const EncoderConfig& cfg) : cfg_(cfg) {}

    GridShape grid_for(uint32_t frame_count) const;

    // Splits data into frames in offset order using the configured grid policy.
    bool encode(const std::vector<uint8_t>& data, std::vector<Frame>& frames,
                GridShape* grid_out = nullptr) const;
    // Same with an explicit grid; fails when rows*cols cannot hold every frame.
    bool encode(const std::vector<uint8_t>& data, const GridShape& grid,
                std::vector<Frame>& frames) const;

    const EncoderConfig& config() const { return cfg_; }
private:
    EncoderConfig cfg_;
};

} // namespace tilecast
