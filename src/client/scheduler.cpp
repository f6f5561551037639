
#include "scheduler.hpp"
#include "logging.hpp"

namespace tilecast {

bool parse_scheduler_mode(const std::string &s, SchedulerMode &out) {
  if (s == "manual")
    out = SchedulerMode::Manual;
  else if (s == "timed")
    out = SchedulerMode::Timed;
  else if (s == "continuous")
    out = SchedulerMode::Continuous;
  else
    return false;
  return true;
}

const char *state_str(SchedulerState st) {
  switch (st) {
  case SchedulerState::Idle:
    return "idle";
  case SchedulerState::Manual:
    return "manual";
  case SchedulerState::Timed:
    return "timed";
  case SchedulerState::Continuous:
    return "continuous";
  default:
    return "stopping";
  }
}

const char *result_str(SendResult r) {
  switch (r) {
  case SendResult::Sent:
    return "sent";
  case SendResult::NotDue:
    return "not due";
  case SendResult::Busy:
    return "busy";
  case SendResult::NoImage:
    return "no image";
  case SendResult::EncodeFailed:
    return "encode failed";
  case SendResult::LinkFailed:
    return "link failed";
  default:
    return "aborted";
  }
}

namespace {
struct BusyGuard {
  std::atomic<bool> &flag;
  ~BusyGuard() { flag = false; }
};
} // namespace

TransmissionScheduler::TransmissionScheduler(const SchedulerConfig &cfg,
                                             ImageSource &source,
                                             Uplink &uplink)
    : cfg_(cfg), source_(source), uplink_(uplink) {}

TransmissionScheduler::~TransmissionScheduler() { stop(); }

bool TransmissionScheduler::start(SchedulerMode mode, Clock::time_point now) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ != SchedulerState::Idle)
      return false;
    stop_requested_ = false;
    pending_trigger_ = false;
    next_due_ = now;
    switch (mode) {
    case SchedulerMode::Manual:
      state_ = SchedulerState::Manual;
      break;
    case SchedulerMode::Timed:
      state_ = SchedulerState::Timed;
      break;
    case SchedulerMode::Continuous:
      state_ = SchedulerState::Continuous;
      break;
    }
  }
  cv_.notify_all();
  Logger::instance().log(LogLevel::INFO, "scheduler %s for %s",
                         state_str(state()), cfg_.transmitter_id.c_str());
  return true;
}

void TransmissionScheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ == SchedulerState::Idle && !worker_.joinable())
      return;
    state_ = SchedulerState::Stopping;
    pending_trigger_ = false;
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    if (worker_.get_id() == std::this_thread::get_id())
      return;
    worker_.join();
  }
  TransmitStats st;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    state_ = SchedulerState::Idle;
    st = stats_;
  }
  Logger::instance().log(
      LogLevel::INFO,
      "scheduler stopped: sent=%llu aborted=%llu frames=%llu skipped=%llu",
      (unsigned long long)st.sessions_sent,
      (unsigned long long)st.sessions_aborted,
      (unsigned long long)st.frames_sent,
      (unsigned long long)st.triggers_skipped);
}

bool TransmissionScheduler::trigger() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ != SchedulerState::Manual)
      return false;
    if (busy_ || pending_trigger_) {
      stats_.triggers_skipped++;
      Logger::instance().log(LogLevel::DEBUG,
                             "trigger skipped, previous send in flight");
      return false;
    }
    pending_trigger_ = true;
  }
  cv_.notify_all();
  return true;
}

void TransmissionScheduler::count_skipped(uint64_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  stats_.triggers_skipped += n;
}

SendResult TransmissionScheduler::poll(Clock::time_point now) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    switch (state_) {
    case SchedulerState::Manual:
      if (!pending_trigger_)
        return SendResult::NotDue;
      pending_trigger_ = false;
      break;
    case SchedulerState::Timed: {
      if (now < next_due_)
        return SendResult::NotDue;
      if (cfg_.interval.count() <= 0) {
        next_due_ = now;
      } else {
        // ticks that fell inside a long send are dropped, not queued
        auto missed = (now - next_due_) / cfg_.interval;
        stats_.triggers_skipped += (uint64_t)missed;
        next_due_ += cfg_.interval * (missed + 1);
      }
      if (busy_) {
        stats_.triggers_skipped++;
        return SendResult::Busy;
      }
      break;
    }
    case SchedulerState::Continuous:
      break;
    default:
      return SendResult::NotDue;
    }
  }
  return send_once();
}

SendResult TransmissionScheduler::send_once() {
  if (busy_.exchange(true)) {
    count_skipped(1);
    return SendResult::Busy;
  }
  BusyGuard guard{busy_};
  SourceImage img;
  if (!source_.next_image(img))
    return SendResult::NoImage;
  SendResult r = transmit(img);
  if (r != SendResult::Sent)
    Logger::instance().log(LogLevel::WARN, "send of %s: %s", img.name.c_str(),
                           result_str(r));
  return r;
}

SendResult TransmissionScheduler::transmit(const SourceImage &img) {
  FrameEncoder enc(cfg_.encoder);
  std::vector<Frame> frames;
  GridShape grid;
  if (!enc.encode(img.bytes, frames, &grid))
    return SendResult::EncodeFailed;

  SessionHello hello;
  hello.transmitter_id = cfg_.transmitter_id;
  hello.image_name = img.name;
  hello.params.chunk_size = cfg_.encoder.chunk_size;
  hello.params.total_length = (uint32_t)img.bytes.size();
  hello.params.grid_rows = grid.rows;
  hello.params.grid_cols = grid.cols;
  Logger::instance().log(LogLevel::INFO,
                         "sending %s: %zu bytes, %zu frames, grid %ux%u",
                         img.name.c_str(), img.bytes.size(), frames.size(),
                         (unsigned)grid.rows, (unsigned)grid.cols);

  auto fail = [this](SendResult r) {
    uplink_.end_session(false);
    std::lock_guard<std::mutex> lk(mtx_);
    stats_.sessions_aborted++;
    return r;
  };

  if (!uplink_.begin_session(hello))
    return fail(SendResult::LinkFailed);
  for (const auto &f : frames) {
    if (stop_requested_)
      return fail(SendResult::Aborted);
    if (!uplink_.send_frame(f))
      return fail(SendResult::LinkFailed);
    std::lock_guard<std::mutex> lk(mtx_);
    stats_.frames_sent++;
  }
  uplink_.end_session(true);
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stats_.sessions_sent++;
  }
  Logger::instance().log(LogLevel::INFO, "sent %s", img.name.c_str());
  return SendResult::Sent;
}

void TransmissionScheduler::run_async() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (worker_.joinable())
    return;
  worker_ = std::thread([this]() { run_loop(); });
}

void TransmissionScheduler::run_loop() {
  std::unique_lock<std::mutex> lk(mtx_);
  for (;;) {
    if (state_ == SchedulerState::Idle || state_ == SchedulerState::Stopping)
      break;
    if (state_ == SchedulerState::Manual) {
      cv_.wait(lk, [this]() {
        return pending_trigger_ || state_ == SchedulerState::Stopping;
      });
    } else if (state_ == SchedulerState::Timed) {
      cv_.wait_until(lk, next_due_, [this]() {
        return state_ == SchedulerState::Stopping;
      });
    }
    if (state_ == SchedulerState::Stopping)
      break;
    lk.unlock();
    SendResult r = poll(Clock::now());
    lk.lock();
    if (state_ == SchedulerState::Continuous && r != SendResult::Sent) {
      cv_.wait_for(lk, cfg_.idle_backoff, [this]() {
        return state_ == SchedulerState::Stopping;
      });
    }
  }
}

SchedulerState TransmissionScheduler::state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_;
}

bool TransmissionScheduler::trigger_pending() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return pending_trigger_;
}

Clock::time_point TransmissionScheduler::next_due() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return next_due_;
}

TransmitStats TransmissionScheduler::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stats_;
}

} // namespace tilecast
