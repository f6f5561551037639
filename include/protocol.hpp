
#pragma once
#include <cstdint>
#include <cstddef>
#include <array>
#include <optional>
#include <vector>

namespace tilecast {

constexpr size_t   kHeaderSize = 10;
constexpr uint16_t kMinChunkSize = 80;
constexpr uint16_t kMaxChunkSize = 100;
constexpr uint32_t kMaxFrames = 0xFFFF;
// row and col are one byte each on the wire
constexpr uint32_t kMaxGridSide = 256;

// Wire layout (little-endian): frame_index u16, row u8, col u8,
// total_frames u16, reserved u32.
struct FrameHeader {
    uint16_t frame_index{0};
    uint8_t  row{0};
    uint8_t  col{0};
    uint16_t total_frames{0};
    uint32_t reserved{0};
};

inline bool operator==(const FrameHeader& a, const FrameHeader& b) {
    return a.frame_index == b.frame_index && a.row == b.row && a.col == b.col &&
           a.total_frames == b.total_frames && a.reserved == b.reserved;
}
inline bool operator!=(const FrameHeader& a, const FrameHeader& b) { return !(a == b); }

struct Frame {
    FrameHeader hdr{};
    std::vector<uint8_t> payload;
};

// Parameters fixed for the lifetime of one session.
struct SessionParams {
    uint16_t chunk_size{0};
    uint32_t total_length{0};
    uint16_t grid_rows{0};  // 0 = grid unknown to the receiver
    uint16_t grid_cols{0};

    uint16_t total_frames() const;
    bool grid_known() const { return grid_rows != 0 && grid_cols != 0; }
};

inline bool operator==(const SessionParams& a, const SessionParams& b) {
    return a.chunk_size == b.chunk_size && a.total_length == b.total_length &&
           a.grid_rows == b.grid_rows && a.grid_cols == b.grid_cols;
}
inline bool operator!=(const SessionParams& a, const SessionParams& b) { return !(a == b); }

enum class FrameStatus : uint8_t {
    Ok = 0,
    MalformedHeader,
    TruncatedFrame,
    SessionMismatch,
    DuplicateFrame,
    DesyncError,
    SessionClosed
};

const char* status_str(FrameStatus st);

bool valid_chunk_size(uint32_t chunk_size);
uint32_t frames_for_length(uint32_t total_length, uint16_t chunk_size);

// Byte length of frame_index's payload, 0 when the index is past the end.
size_t payload_length(const SessionParams& params, uint16_t frame_index);

std::array<uint8_t, kHeaderSize> encode_header(const FrameHeader& h);
void encode_header(const FrameHeader& h, std::vector<uint8_t>& out);

// Empty result means MalformedHeader: wrong length or frame_index >= total_frames.
std::optional<FrameHeader> decode_header(const uint8_t* data, size_t len);

// Little-endian helpers shared by the header and hello codecs.
inline void put_u16_le(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}
inline void put_u32_le(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}
inline uint16_t get_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}
inline uint32_t get_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace tilecast
