
#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace tilecast {

using Clock = std::chrono::steady_clock;

enum class SessionState : uint8_t { Open = 0, Finalized = 1 };

enum class FinalizeReason : uint8_t {
    Completed = 0,
    IdleTimeout,
    ConnectionClosed,
    Superseded,
    Shutdown
};

const char* reason_str(FinalizeReason r);

struct SessionStats {
    uint32_t frames_accepted{0};
    uint32_t duplicates{0};
    uint32_t mismatches{0};
};

struct FinalizedImage {
    std::string transmitter_id;
    std::string image_name;
    SessionParams params;
    FinalizeReason reason{FinalizeReason::Completed};
    std::vector<uint8_t> data;
    // indices that were never received and hold placeholder bytes
    std::vector<uint16_t> missing;
    SessionStats stats;
};

class SessionReassembler {
public:
    SessionReassembler(std::string transmitter_id, std::string image_name,
                       const SessionParams& params, Clock::time_point now,
                       uint8_t placeholder = 0);

    FrameStatus accept(const Frame& f, Clock::time_point now);
    // Only the first call returns a value.
    std::optional<FinalizedImage> finalize(FinalizeReason reason);

    bool complete() const;
    bool expired(Clock::time_point now, Clock::duration idle_timeout) const;
    SessionState state() const;
    size_t missing_count() const;
    SessionStats stats() const;
    Clock::time_point created_at() const { return created_at_; }
    Clock::time_point last_activity() const;

    const std::string& transmitter_id() const { return transmitter_id_; }
    const std::string& image_name() const { return image_name_; }
    const SessionParams& params() const { return params_; }

private:
    const std::string transmitter_id_;
    const std::string image_name_;
    const SessionParams params_;
    const uint16_t total_frames_;
    const uint8_t placeholder_;
    const Clock::time_point created_at_;

    mutable std::mutex mtx_;
    SessionState state_{SessionState::Open};
    Clock::time_point last_activity_;
    std::vector<uint8_t> buffer_;
    std::vector<bool> present_;
    std::set<uint16_t> missing_;
    SessionStats stats_;
};

} // namespace tilecast
