
#include "reassembler.hpp"
#include <algorithm>
#include <cstring>

namespace tilecast {

const char *reason_str(FinalizeReason r) {
  switch (r) {
  case FinalizeReason::Completed:
    return "completed";
  case FinalizeReason::IdleTimeout:
    return "idle timeout";
  case FinalizeReason::ConnectionClosed:
    return "connection closed";
  case FinalizeReason::Superseded:
    return "superseded";
  default:
    return "shutdown";
  }
}

SessionReassembler::SessionReassembler(std::string transmitter_id,
                                       std::string image_name,
                                       const SessionParams &params,
                                       Clock::time_point now,
                                       uint8_t placeholder)
    : transmitter_id_(std::move(transmitter_id)),
      image_name_(std::move(image_name)), params_(params),
      total_frames_(params.total_frames()), placeholder_(placeholder),
      created_at_(now), last_activity_(now) {
  buffer_.assign(params_.total_length, 0);
  present_.assign(total_frames_, false);
  for (uint16_t i = 0; i < total_frames_; i++)
    missing_.insert(missing_.end(), i);
}

FrameStatus SessionReassembler::accept(const Frame &f, Clock::time_point now) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (state_ != SessionState::Open)
    return FrameStatus::SessionClosed;

  const FrameHeader &h = f.hdr;
  if (h.total_frames != total_frames_ || h.frame_index >= total_frames_) {
    stats_.mismatches++;
    return FrameStatus::SessionMismatch;
  }
  if (present_[h.frame_index]) {
    stats_.duplicates++;
    return FrameStatus::DuplicateFrame;
  }
  if (f.payload.size() != payload_length(params_, h.frame_index)) {
    stats_.mismatches++;
    return FrameStatus::SessionMismatch;
  }
  if (params_.grid_known() && (h.row != h.frame_index / params_.grid_cols ||
                               h.col != h.frame_index % params_.grid_cols)) {
    stats_.mismatches++;
    return FrameStatus::SessionMismatch;
  }

  size_t offset = (size_t)h.frame_index * params_.chunk_size;
  std::memcpy(buffer_.data() + offset, f.payload.data(), f.payload.size());
  present_[h.frame_index] = true;
  missing_.erase(h.frame_index);
  stats_.frames_accepted++;
  last_activity_ = now;
  return FrameStatus::Ok;
}

std::optional<FinalizedImage>
SessionReassembler::finalize(FinalizeReason reason) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (state_ != SessionState::Open)
    return std::nullopt;
  state_ = SessionState::Finalized;

  FinalizedImage out;
  out.transmitter_id = transmitter_id_;
  out.image_name = image_name_;
  out.params = params_;
  out.reason = reason;
  out.stats = stats_;
  out.missing.assign(missing_.begin(), missing_.end());
  for (uint16_t idx : missing_) {
    size_t offset = (size_t)idx * params_.chunk_size;
    size_t n = payload_length(params_, idx);
    std::fill(buffer_.begin() + offset, buffer_.begin() + offset + n,
              placeholder_);
  }
  out.data.swap(buffer_);
  present_.clear();
  missing_.clear();
  return out;
}

bool SessionReassembler::complete() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return missing_.empty();
}

bool SessionReassembler::expired(Clock::time_point now,
                                 Clock::duration idle_timeout) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_ == SessionState::Open && now - last_activity_ >= idle_timeout;
}

SessionState SessionReassembler::state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_;
}

size_t SessionReassembler::missing_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return missing_.size();
}

SessionStats SessionReassembler::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stats_;
}

Clock::time_point SessionReassembler::last_activity() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return last_activity_;
}

} // namespace tilecast
