
#include "protocol.hpp"

namespace tilecast {

uint16_t SessionParams::total_frames() const {
  uint32_t n = frames_for_length(total_length, chunk_size);
  return n > kMaxFrames ? 0 : (uint16_t)n;
}

const char *status_str(FrameStatus st) {
  switch (st) {
  case FrameStatus::Ok:
    return "ok";
  case FrameStatus::MalformedHeader:
    return "malformed header";
  case FrameStatus::TruncatedFrame:
    return "truncated frame";
  case FrameStatus::SessionMismatch:
    return "session mismatch";
  case FrameStatus::DuplicateFrame:
    return "duplicate frame";
  case FrameStatus::DesyncError:
    return "desync";
  case FrameStatus::SessionClosed:
    return "session closed";
  }
  return "unknown";
}

bool valid_chunk_size(uint32_t chunk_size) {
  return chunk_size >= kMinChunkSize && chunk_size <= kMaxChunkSize;
}

uint32_t frames_for_length(uint32_t total_length, uint16_t chunk_size) {
  if (chunk_size == 0)
    return 0;
  return (uint32_t)(((uint64_t)total_length + chunk_size - 1) / chunk_size);
}

size_t payload_length(const SessionParams &params, uint16_t frame_index) {
  size_t offset = (size_t)frame_index * params.chunk_size;
  if (offset >= params.total_length)
    return 0;
  size_t remain = params.total_length - offset;
  return remain < params.chunk_size ? remain : params.chunk_size;
}

std::array<uint8_t, kHeaderSize> encode_header(const FrameHeader &h) {
  std::array<uint8_t, kHeaderSize> b{};
  put_u16_le(b.data() + 0, h.frame_index);
  b[2] = h.row;
  b[3] = h.col;
  put_u16_le(b.data() + 4, h.total_frames);
  put_u32_le(b.data() + 6, h.reserved);
  return b;
}

void encode_header(const FrameHeader &h, std::vector<uint8_t> &out) {
  auto b = encode_header(h);
  out.insert(out.end(), b.begin(), b.end());
}

std::optional<FrameHeader> decode_header(const uint8_t *data, size_t len) {
  if (data == nullptr || len != kHeaderSize)
    return std::nullopt;
  FrameHeader h;
  h.frame_index = get_u16_le(data + 0);
  h.row = data[2];
  h.col = data[3];
  h.total_frames = get_u16_le(data + 4);
  h.reserved = get_u32_le(data + 6);
  if (h.frame_index >= h.total_frames)
    return std::nullopt;
  return h;
}

} // namespace tilecast
