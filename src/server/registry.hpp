
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "reassembler.hpp"

namespace tilecast {

// Open sessions keyed by transmitter id. The map lock is held only for
// lookups; frame acceptance locks the individual session.
class SessionRegistry {
public:
    using FinalizeHandler = std::function<void(FinalizedImage&&)>;

    SessionRegistry(Clock::duration idle_timeout, FinalizeHandler handler,
                    uint8_t placeholder = 0);

    std::shared_ptr<SessionReassembler> get_or_create(const std::string& transmitter_id,
                                                      const std::string& image_name,
                                                      const SessionParams& params,
                                                      Clock::time_point now);
    std::shared_ptr<SessionReassembler> find(const std::string& transmitter_id) const;

    // accept + finalize once the last missing slot is filled
    FrameStatus submit(const std::shared_ptr<SessionReassembler>& s, const Frame& f,
                       Clock::time_point now);
    bool finalize(const std::shared_ptr<SessionReassembler>& s, FinalizeReason reason);
    size_t expire_idle(Clock::time_point now);
    size_t finalize_all(FinalizeReason reason);

    size_t active_count() const;
    Clock::duration idle_timeout() const { return idle_timeout_; }

private:
    Clock::duration idle_timeout_;
    FinalizeHandler handler_;
    uint8_t placeholder_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<SessionReassembler>> sessions_;

    void detach(const std::shared_ptr<SessionReassembler>& s);
};

} // namespace tilecast
