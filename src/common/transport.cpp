
#include "transport.hpp"
#include <algorithm>
#include <cstring>

namespace tilecast {

static void put_fixed_string(uint8_t *p, size_t width, const std::string &s) {
  size_t n = std::min(width, s.size());
  std::memcpy(p, s.data(), n);
  std::memset(p + n, 0, width - n);
}

static std::string get_fixed_string(const uint8_t *p, size_t width) {
  size_t n = 0;
  while (n < width && p[n] != 0)
    n++;
  return std::string((const char *)p, n);
}

std::vector<uint8_t> encode_hello(const SessionHello &hello) {
  std::vector<uint8_t> b(kHelloSize, 0);
  uint8_t *p = b.data();
  put_u32_le(p + 0, kHelloMagic);
  p[4] = kHelloVersion;
  p[5] = 0;
  put_u16_le(p + 6, hello.params.chunk_size);
  put_u32_le(p + 8, hello.params.total_length);
  put_u16_le(p + 12, hello.params.grid_rows);
  put_u16_le(p + 14, hello.params.grid_cols);
  put_fixed_string(p + 16, kIdFieldSize, hello.transmitter_id);
  put_fixed_string(p + 16 + kIdFieldSize, kNameFieldSize, hello.image_name);
  return b;
}

FrameStatus validate_params(const SessionParams &params) {
  if (!valid_chunk_size(params.chunk_size))
    return FrameStatus::MalformedHeader;
  uint32_t n = frames_for_length(params.total_length, params.chunk_size);
  if (n > kMaxFrames)
    return FrameStatus::MalformedHeader;
  if (params.grid_rows == 0 && params.grid_cols == 0)
    return FrameStatus::Ok;
  if (params.grid_rows == 0 || params.grid_cols == 0)
    return FrameStatus::MalformedHeader;
  if (params.grid_rows > kMaxGridSide || params.grid_cols > kMaxGridSide)
    return FrameStatus::MalformedHeader;
  if ((uint32_t)params.grid_rows * params.grid_cols < n)
    return FrameStatus::MalformedHeader;
  return FrameStatus::Ok;
}

FrameStatus decode_hello(const uint8_t *data, size_t len, SessionHello &out) {
  if (data == nullptr || len != kHelloSize)
    return FrameStatus::MalformedHeader;
  if (get_u32_le(data) != kHelloMagic || data[4] != kHelloVersion)
    return FrameStatus::DesyncError;
  SessionHello h;
  h.params.chunk_size = get_u16_le(data + 6);
  h.params.total_length = get_u32_le(data + 8);
  h.params.grid_rows = get_u16_le(data + 12);
  h.params.grid_cols = get_u16_le(data + 14);
  h.transmitter_id = get_fixed_string(data + 16, kIdFieldSize);
  h.image_name = get_fixed_string(data + 16 + kIdFieldSize, kNameFieldSize);
  if (h.transmitter_id.empty())
    return FrameStatus::MalformedHeader;
  FrameStatus st = validate_params(h.params);
  if (st != FrameStatus::Ok)
    return st;
  out = std::move(h);
  return FrameStatus::Ok;
}

std::vector<uint8_t> serialize_frame(const Frame &f) {
  std::vector<uint8_t> buf;
  buf.reserve(kHeaderSize + f.payload.size());
  encode_header(f.hdr, buf);
  buf.insert(buf.end(), f.payload.begin(), f.payload.end());
  return buf;
}

void FrameReader::feed(const uint8_t *data, size_t n) {
  if (failed_ || n == 0)
    return;
  inbuf_.insert(inbuf_.end(), data, data + n);
}

void FrameReader::compact() {
  if (off_ == 0)
    return;
  inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off_);
  off_ = 0;
}

FrameReader::Event FrameReader::next(SessionHello &hello, Frame &frame,
                                     FrameStatus &err) {
  if (failed_) {
    err = FrameStatus::DesyncError;
    return Event::Error;
  }
  if (in_session_)
    return read_frame(frame, err);

  size_t avail = inbuf_.size() - off_;
  const uint8_t *p = inbuf_.data() + off_;
  if (avail < 4) {
    compact();
    return Event::NeedMore;
  }
  // between sessions a record without the hello magic can only be a late
  // repeat of the session that just ended
  if (get_u32_le(p) != kHelloMagic && have_params_)
    return read_frame(frame, err);
  if (avail < kHelloSize) {
    compact();
    return Event::NeedMore;
  }
  FrameStatus st = decode_hello(p, kHelloSize, hello);
  if (st != FrameStatus::Ok) {
    failed_ = true;
    err = st;
    return Event::Error;
  }
  off_ += kHelloSize;
  params_ = hello.params;
  have_params_ = true;
  remaining_ = params_.total_frames();
  seen_.assign(remaining_, false);
  in_session_ = remaining_ > 0;
  return Event::Hello;
}

FrameReader::Event FrameReader::read_frame(Frame &frame, FrameStatus &err) {
  size_t avail = inbuf_.size() - off_;
  const uint8_t *p = inbuf_.data() + off_;
  if (avail < kHeaderSize) {
    compact();
    return Event::NeedMore;
  }
  auto hdr = decode_header(p, kHeaderSize);
  if (!hdr) {
    failed_ = true;
    err = FrameStatus::MalformedHeader;
    return Event::Error;
  }
  size_t plen = payload_length(params_, hdr->frame_index);
  if (plen == 0) {
    // the index lies outside the announced session, so the payload
    // boundary is unknown
    failed_ = true;
    err = FrameStatus::DesyncError;
    return Event::Error;
  }
  if (avail < kHeaderSize + plen) {
    compact();
    return Event::NeedMore;
  }
  frame.hdr = *hdr;
  frame.payload.assign(p + kHeaderSize, p + kHeaderSize + plen);
  off_ += kHeaderSize + plen;
  // repeats and frames claiming another total do not advance the session
  if (in_session_ && hdr->total_frames == params_.total_frames() &&
      !seen_[hdr->frame_index]) {
    seen_[hdr->frame_index] = true;
    if (--remaining_ == 0)
      in_session_ = false;
  }
  return Event::Frame;
}

} // namespace tilecast
