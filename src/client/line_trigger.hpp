
#pragma once
#include <asio.hpp>
#include <functional>
#include "scheduler.hpp"

namespace tilecast {

// Manual-mode trigger source: every line read from a descriptor requests one
// send. "q"/"quit" or end of input stops the scheduler and calls on_done,
// the latter only after a requested send has gone out.
class LineTrigger {
public:
    // Takes ownership of fd.
    LineTrigger(asio::io_context& io, int fd, TransmissionScheduler& sched,
                std::function<void()> on_done);

    void start();
    void cancel();

private:
    asio::posix::stream_descriptor in_;
    asio::steady_timer drain_timer_;
    asio::streambuf buf_;
    TransmissionScheduler& sched_;
    std::function<void()> on_done_;

    void read_line();
    void finish();
    void finish_when_idle();
};

} // namespace tilecast
