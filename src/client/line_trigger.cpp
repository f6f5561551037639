#include "line_trigger.hpp"
#include "logging.hpp"

namespace tilecast {

LineTrigger::LineTrigger(asio::io_context &io, int fd,
                         TransmissionScheduler &sched,
                         std::function<void()> on_done)
    : in_(io, fd), drain_timer_(io), sched_(sched),
      on_done_(std::move(on_done)) {}

void LineTrigger::start() { read_line(); }

void LineTrigger::cancel() {
  std::error_code ec;
  in_.cancel(ec);
  in_.close(ec);
  drain_timer_.cancel();
}

void LineTrigger::finish() {
  sched_.stop();
  if (on_done_)
    on_done_();
}

// Polls on a timer so other handlers, signals included, keep running while
// the last send is in flight.
void LineTrigger::finish_when_idle() {
  if (!sched_.busy() && !sched_.trigger_pending()) {
    finish();
    return;
  }
  drain_timer_.expires_after(std::chrono::milliseconds(50));
  drain_timer_.async_wait([this](std::error_code ec) {
    if (ec)
      return;
    finish_when_idle();
  });
}

void LineTrigger::read_line() {
  asio::async_read_until(
      in_, buf_, '\n', [this](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec != asio::error::operation_aborted) {
            Logger::instance().log(LogLevel::INFO, "trigger input closed");
            finish_when_idle();
          }
          return;
        }
        std::string line(asio::buffers_begin(buf_.data()),
                         asio::buffers_begin(buf_.data()) + n);
        buf_.consume(n);
        if (line == "q\n" || line == "quit\n") {
          finish();
          return;
        }
        if (!sched_.trigger())
          Logger::instance().log(LogLevel::WARN,
                                 "trigger ignored, a send is in flight");
        read_line();
      });
}

} // namespace tilecast
