
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include "encoder.hpp"
#include "image_source.hpp"
#include "uplink.hpp"

namespace tilecast {

using Clock = std::chrono::steady_clock;

enum class SchedulerMode : uint8_t { Manual, Timed, Continuous };
enum class SchedulerState : uint8_t { Idle, Manual, Timed, Continuous, Stopping };

enum class SendResult : uint8_t {
    Sent,
    NotDue,
    Busy,
    NoImage,
    EncodeFailed,
    LinkFailed,
    Aborted
};

bool parse_scheduler_mode(const std::string& s, SchedulerMode& out);
const char* state_str(SchedulerState st);
const char* result_str(SendResult r);

struct SchedulerConfig {
    std::string transmitter_id;
    EncoderConfig encoder;
    std::chrono::milliseconds interval{std::chrono::minutes(15)};
    // continuous mode pause after a send that did not go out
    std::chrono::milliseconds idle_backoff{1000};
};

struct TransmitStats {
    uint64_t sessions_sent{0};
    uint64_t sessions_aborted{0};
    uint64_t frames_sent{0};
    uint64_t triggers_skipped{0};
};

// Drives encoder + uplink. The decision step poll(now) takes time from the
// caller, so cadence logic runs in tests without a clock; run_async() hosts
// the same step on a worker thread against the steady clock.
class TransmissionScheduler {
public:
    TransmissionScheduler(const SchedulerConfig& cfg, ImageSource& source, Uplink& uplink);
    ~TransmissionScheduler();

    TransmissionScheduler(const TransmissionScheduler&) = delete;
    TransmissionScheduler& operator=(const TransmissionScheduler&) = delete;

    // Idle -> mode. Timed mode is first due at `now`.
    bool start(SchedulerMode mode, Clock::time_point now = Clock::now());
    // Cooperative: an in-flight sequence aborts at the next frame boundary.
    void stop();
    // Manual mode: requests one sequence. Skipped while a send is in flight.
    bool trigger();
    SendResult poll(Clock::time_point now);
    // One complete sequence on the calling thread.
    SendResult send_once();
    void run_async();

    SchedulerState state() const;
    bool busy() const { return busy_.load(); }
    bool trigger_pending() const;
    Clock::time_point next_due() const;
    TransmitStats stats() const;

private:
    SchedulerConfig cfg_;
    ImageSource& source_;
    Uplink& uplink_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    SchedulerState state_{SchedulerState::Idle};
    bool pending_trigger_{false};
    Clock::time_point next_due_{};
    TransmitStats stats_;

    std::atomic<bool> busy_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread worker_;

    void run_loop();
    SendResult transmit(const SourceImage& img);
    void count_skipped(uint64_t n);
};

} // namespace tilecast
