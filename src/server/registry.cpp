
#include "registry.hpp"
#include "logging.hpp"
#include <vector>

namespace tilecast {

SessionRegistry::SessionRegistry(Clock::duration idle_timeout,
                                 FinalizeHandler handler, uint8_t placeholder)
    : idle_timeout_(idle_timeout), handler_(std::move(handler)),
      placeholder_(placeholder) {}

std::shared_ptr<SessionReassembler>
SessionRegistry::get_or_create(const std::string &transmitter_id,
                               const std::string &image_name,
                               const SessionParams &params,
                               Clock::time_point now) {
  std::shared_ptr<SessionReassembler> stale;
  std::shared_ptr<SessionReassembler> s;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sessions_.find(transmitter_id);
    if (it != sessions_.end()) {
      auto &cur = it->second;
      if (cur->state() == SessionState::Open && cur->params() == params &&
          cur->image_name() == image_name)
        return cur;
      stale = cur;
      sessions_.erase(it);
    }
    s = std::make_shared<SessionReassembler>(transmitter_id, image_name,
                                             params, now, placeholder_);
    sessions_[transmitter_id] = s;
  }
  Logger::instance().log(LogLevel::INFO,
                         "session open tx=%s image=%s frames=%u chunk=%u "
                         "bytes=%u",
                         transmitter_id.c_str(), image_name.c_str(),
                         (unsigned)params.total_frames(),
                         (unsigned)params.chunk_size,
                         (unsigned)params.total_length);
  if (stale)
    finalize(stale, FinalizeReason::Superseded);
  return s;
}

std::shared_ptr<SessionReassembler>
SessionRegistry::find(const std::string &transmitter_id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = sessions_.find(transmitter_id);
  if (it == sessions_.end())
    return nullptr;
  return it->second;
}

FrameStatus SessionRegistry::submit(const std::shared_ptr<SessionReassembler> &s,
                                    const Frame &f, Clock::time_point now) {
  FrameStatus st = s->accept(f, now);
  if (st == FrameStatus::Ok && s->complete())
    finalize(s, FinalizeReason::Completed);
  return st;
}

void SessionRegistry::detach(const std::shared_ptr<SessionReassembler> &s) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = sessions_.find(s->transmitter_id());
  if (it != sessions_.end() && it->second == s)
    sessions_.erase(it);
}

bool SessionRegistry::finalize(const std::shared_ptr<SessionReassembler> &s,
                               FinalizeReason reason) {
  if (!s)
    return false;
  auto img = s->finalize(reason);
  detach(s);
  if (!img)
    return false;
  Logger::instance().log(
      img->missing.empty() ? LogLevel::INFO : LogLevel::WARN,
      "session finalized tx=%s image=%s reason=%s accepted=%u missing=%zu "
      "dup=%u mismatch=%u",
      img->transmitter_id.c_str(), img->image_name.c_str(),
      reason_str(reason), (unsigned)img->stats.frames_accepted,
      img->missing.size(), (unsigned)img->stats.duplicates,
      (unsigned)img->stats.mismatches);
  if (handler_)
    handler_(std::move(*img));
  return true;
}

size_t SessionRegistry::expire_idle(Clock::time_point now) {
  std::vector<std::shared_ptr<SessionReassembler>> due;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &kv : sessions_) {
      if (kv.second->expired(now, idle_timeout_))
        due.push_back(kv.second);
    }
  }
  size_t n = 0;
  for (auto &s : due) {
    if (finalize(s, FinalizeReason::IdleTimeout))
      n++;
  }
  return n;
}

size_t SessionRegistry::finalize_all(FinalizeReason reason) {
  std::vector<std::shared_ptr<SessionReassembler>> all;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &kv : sessions_)
      all.push_back(kv.second);
  }
  size_t n = 0;
  for (auto &s : all) {
    if (finalize(s, reason))
      n++;
  }
  return n;
}

size_t SessionRegistry::active_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return sessions_.size();
}

} // namespace tilecast
