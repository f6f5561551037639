#include <gtest/gtest.h>
#include <functional>
#include <mutex>
#include <thread>
#include "scheduler.hpp"
#include "test_util.hpp"

using namespace tilecast;
using tilecast::testing::make_bytes;

namespace {

class FakeSource : public ImageSource {
public:
  std::vector<uint8_t> bytes = make_bytes(250);
  bool available = true;
  int calls = 0;
  bool next_image(SourceImage &out) override {
    if (!available)
      return false;
    calls++;
    out.name = "img_" + std::to_string(calls) + ".jpg";
    out.bytes = bytes;
    return true;
  }
};

class FakeUplink : public Uplink {
public:
  std::mutex mtx;
  std::vector<SessionHello> hellos;
  std::vector<uint16_t> sent;
  std::vector<bool> ends;
  bool fail_begin = false;
  int fail_at_frame = -1;
  std::function<void(const Frame &)> on_frame;

  bool begin_session(const SessionHello &hello) override {
    std::lock_guard<std::mutex> lk(mtx);
    if (fail_begin)
      return false;
    hellos.push_back(hello);
    return true;
  }
  bool send_frame(const Frame &f) override {
    if (on_frame)
      on_frame(f);
    std::lock_guard<std::mutex> lk(mtx);
    if ((int)f.hdr.frame_index == fail_at_frame)
      return false;
    sent.push_back(f.hdr.frame_index);
    return true;
  }
  void end_session(bool completed) override {
    std::lock_guard<std::mutex> lk(mtx);
    ends.push_back(completed);
  }
  size_t sessions() {
    std::lock_guard<std::mutex> lk(mtx);
    return ends.size();
  }
};

SchedulerConfig make_config() {
  SchedulerConfig cfg;
  cfg.transmitter_id = "tx-1";
  cfg.encoder.chunk_size = 100;
  cfg.interval = std::chrono::minutes(15);
  cfg.idle_backoff = std::chrono::milliseconds(10);
  return cfg;
}

const Clock::time_point t0 = Clock::time_point{} + std::chrono::hours(1);

} // namespace

TEST(TransmissionScheduler, SendOnceEmitsHelloThenFramesInOrder) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  EXPECT_EQ(sched.send_once(), SendResult::Sent);
  ASSERT_EQ(up.hellos.size(), 1u);
  EXPECT_EQ(up.hellos[0].transmitter_id, "tx-1");
  EXPECT_EQ(up.hellos[0].image_name, "img_1.jpg");
  EXPECT_EQ(up.hellos[0].params.total_length, 250u);
  EXPECT_EQ(up.hellos[0].params.chunk_size, 100);
  EXPECT_EQ(up.hellos[0].params.grid_rows, 2);
  EXPECT_EQ(up.sent, (std::vector<uint16_t>{0, 1, 2}));
  EXPECT_EQ(up.ends, (std::vector<bool>{true}));
  auto st = sched.stats();
  EXPECT_EQ(st.sessions_sent, 1u);
  EXPECT_EQ(st.frames_sent, 3u);
  EXPECT_FALSE(sched.busy());
}

TEST(TransmissionScheduler, EmptyImageSendsHelloOnly) {
  FakeSource src;
  src.bytes.clear();
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  EXPECT_EQ(sched.send_once(), SendResult::Sent);
  ASSERT_EQ(up.hellos.size(), 1u);
  EXPECT_EQ(up.hellos[0].params.total_length, 0u);
  EXPECT_TRUE(up.sent.empty());
}

TEST(TransmissionScheduler, NoImageAvailable) {
  FakeSource src;
  src.available = false;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  EXPECT_EQ(sched.send_once(), SendResult::NoImage);
  EXPECT_TRUE(up.hellos.empty());
}

TEST(TransmissionScheduler, ManualTriggerIsConsumedByPoll) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  EXPECT_FALSE(sched.trigger());
  ASSERT_TRUE(sched.start(SchedulerMode::Manual, t0));
  EXPECT_EQ(sched.state(), SchedulerState::Manual);
  EXPECT_EQ(sched.poll(t0), SendResult::NotDue);
  EXPECT_TRUE(sched.trigger());
  EXPECT_FALSE(sched.trigger());
  EXPECT_EQ(sched.stats().triggers_skipped, 1u);
  EXPECT_EQ(sched.poll(t0), SendResult::Sent);
  EXPECT_EQ(sched.poll(t0), SendResult::NotDue);
  EXPECT_EQ(up.sessions(), 1u);
  sched.stop();
  EXPECT_EQ(sched.state(), SchedulerState::Idle);
}

TEST(TransmissionScheduler, TriggerDuringSendIsSkipped) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  ASSERT_TRUE(sched.start(SchedulerMode::Manual, t0));
  std::vector<bool> accepted;
  up.on_frame = [&](const Frame &) { accepted.push_back(sched.trigger()); };
  ASSERT_TRUE(sched.trigger());
  EXPECT_EQ(sched.poll(t0), SendResult::Sent);
  EXPECT_EQ(accepted, (std::vector<bool>{false, false, false}));
  EXPECT_EQ(sched.stats().triggers_skipped, 3u);
  EXPECT_FALSE(sched.trigger_pending());
  EXPECT_EQ(up.sessions(), 1u);
}

TEST(TransmissionScheduler, TimedCadence) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  const auto iv = std::chrono::minutes(15);
  ASSERT_TRUE(sched.start(SchedulerMode::Timed, t0));
  EXPECT_EQ(sched.poll(t0), SendResult::Sent);
  EXPECT_EQ(sched.next_due(), t0 + iv);
  EXPECT_EQ(sched.poll(t0 + std::chrono::minutes(1)), SendResult::NotDue);
  EXPECT_EQ(sched.poll(t0 + iv), SendResult::Sent);
  EXPECT_EQ(sched.next_due(), t0 + 2 * iv);
  // the 30 and 45 minute ticks pass unserved; only one is owed
  EXPECT_EQ(sched.poll(t0 + std::chrono::minutes(50)), SendResult::Sent);
  EXPECT_EQ(sched.next_due(), t0 + 4 * iv);
  EXPECT_EQ(sched.stats().triggers_skipped, 1u);
  EXPECT_EQ(up.sessions(), 3u);
  EXPECT_FALSE(sched.trigger());
}

TEST(TransmissionScheduler, TimedTickWhileBusyIsSkipped) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  ASSERT_TRUE(sched.start(SchedulerMode::Timed, t0));
  std::vector<SendResult> nested;
  up.on_frame = [&](const Frame &f) {
    if (f.hdr.frame_index == 0)
      nested.push_back(sched.poll(t0 + std::chrono::minutes(15)));
  };
  EXPECT_EQ(sched.poll(t0), SendResult::Sent);
  EXPECT_EQ(nested, (std::vector<SendResult>{SendResult::Busy}));
  EXPECT_EQ(sched.stats().triggers_skipped, 1u);
  EXPECT_EQ(up.sessions(), 1u);
}

TEST(TransmissionScheduler, ContinuousAlwaysSends) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  ASSERT_TRUE(sched.start(SchedulerMode::Continuous, t0));
  EXPECT_FALSE(sched.start(SchedulerMode::Manual, t0));
  for (int i = 0; i < 3; i++)
    EXPECT_EQ(sched.poll(t0), SendResult::Sent);
  EXPECT_EQ(src.calls, 3);
  EXPECT_EQ(up.sessions(), 3u);
}

TEST(TransmissionScheduler, LinkFailureAbortsSession) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  up.fail_begin = true;
  EXPECT_EQ(sched.send_once(), SendResult::LinkFailed);
  up.fail_begin = false;
  up.fail_at_frame = 1;
  EXPECT_EQ(sched.send_once(), SendResult::LinkFailed);
  EXPECT_EQ(up.sent, (std::vector<uint16_t>{0}));
  EXPECT_EQ(up.ends, (std::vector<bool>{false, false}));
  EXPECT_EQ(sched.stats().sessions_aborted, 2u);
  EXPECT_EQ(sched.stats().sessions_sent, 0u);
}

TEST(TransmissionScheduler, StopAbortsAtFrameBoundary) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  ASSERT_TRUE(sched.start(SchedulerMode::Continuous, t0));
  up.on_frame = [&](const Frame &f) {
    if (f.hdr.frame_index == 0)
      sched.stop();
  };
  EXPECT_EQ(sched.poll(t0), SendResult::Aborted);
  EXPECT_EQ(up.sent, (std::vector<uint16_t>{0}));
  EXPECT_EQ(up.ends, (std::vector<bool>{false}));
  EXPECT_EQ(sched.state(), SchedulerState::Idle);
  EXPECT_EQ(sched.poll(t0), SendResult::NotDue);
}

TEST(TransmissionScheduler, WorkerServesManualTriggers) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  ASSERT_TRUE(sched.start(SchedulerMode::Manual));
  sched.run_async();
  ASSERT_TRUE(sched.trigger());
  auto deadline = Clock::now() + std::chrono::seconds(5);
  while (up.sessions() < 1 && Clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  sched.stop();
  EXPECT_EQ(up.sessions(), 1u);
  EXPECT_EQ(sched.state(), SchedulerState::Idle);
}

TEST(TransmissionScheduler, WorkerStopsContinuousLoop) {
  FakeSource src;
  FakeUplink up;
  TransmissionScheduler sched(make_config(), src, up);
  ASSERT_TRUE(sched.start(SchedulerMode::Continuous));
  sched.run_async();
  auto deadline = Clock::now() + std::chrono::seconds(5);
  while (up.sessions() < 3 && Clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  sched.stop();
  EXPECT_GE(up.sessions(), 3u);
  auto n = up.sessions();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(up.sessions(), n);
}

TEST(SchedulerModes, Parse) {
  SchedulerMode m = SchedulerMode::Manual;
  EXPECT_TRUE(parse_scheduler_mode("timed", m));
  EXPECT_EQ(m, SchedulerMode::Timed);
  EXPECT_TRUE(parse_scheduler_mode("continuous", m));
  EXPECT_EQ(m, SchedulerMode::Continuous);
  EXPECT_FALSE(parse_scheduler_mode("burst", m));
}
