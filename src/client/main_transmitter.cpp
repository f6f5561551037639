
#include "encoder.hpp"
#include "image_source.hpp"
#include "line_trigger.hpp"
#include "logging.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include "uplink.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <unistd.h>

using namespace tilecast;

static void usage(const char *prog) {
  std::cerr << "usage: " << prog
            << " --id NAME --image PATH [--server host:port]"
               " [--mode manual|timed|continuous] [--interval-ms N]"
               " [--backoff-ms N] [--chunk-size 80..100]"
               " [--grid square|columns] [--cols N]"
               " [--log-level trace|debug|info|warn|error] [--log-file PATH]\n"
               "manual mode sends one image per line read from stdin\n";
}

int main(int argc, char **argv) {
  std::string server = "127.0.0.1:49697";
  std::string image_path;
  std::string mode_str = "manual";
  SchedulerConfig scfg;
  LogLevel level = LogLevel::INFO;
  std::string log_file;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto number = [&](int &i, uint64_t max) -> uint64_t {
      std::string v = next(i);
      uint64_t out = 0;
      if (!parse_uint(v, max, out)) {
        std::cerr << "bad value for " << a << ": " << v << "\n";
        std::exit(1);
      }
      return out;
    };
    if (a == "--server")
      server = next(i);
    else if (a == "--id")
      scfg.transmitter_id = next(i);
    else if (a == "--image")
      image_path = next(i);
    else if (a == "--mode")
      mode_str = next(i);
    else if (a == "--interval-ms")
      scfg.interval = std::chrono::milliseconds(number(i, 0xFFFFFFFFu));
    else if (a == "--backoff-ms")
      scfg.idle_backoff = std::chrono::milliseconds(number(i, 0xFFFFFFFFu));
    else if (a == "--chunk-size")
      scfg.encoder.chunk_size = (uint16_t)number(i, 0xFFFF);
    else if (a == "--grid") {
      if (!parse_grid_policy(next(i), scfg.encoder.grid)) {
        std::cerr << "grid must be square or columns\n";
        return 1;
      }
    } else if (a == "--cols")
      scfg.encoder.fixed_cols = (uint16_t)number(i, kMaxGridSide);
    else if (a == "--log-file")
      log_file = next(i);
    else if (a == "--log-level") {
      if (!parse_log_level(next(i), level)) {
        std::cerr << "bad log level\n";
        return 1;
      }
    } else if (a == "-h" || a == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      usage(argv[0]);
      return 1;
    }
  }

  SchedulerMode mode;
  if (!parse_scheduler_mode(mode_str, mode)) {
    std::cerr << "bad mode " << mode_str << std::endl;
    return 1;
  }
  std::string host;
  uint16_t port;
  if (!parse_host_port(server, host, port)) {
    std::cerr << "bad server" << std::endl;
    return 1;
  }
  if (scfg.transmitter_id.empty() || scfg.transmitter_id.size() > kIdFieldSize) {
    std::cerr << "--id is required (at most " << kIdFieldSize << " bytes)"
              << std::endl;
    return 1;
  }
  if (image_path.empty()) {
    std::cerr << "--image is required" << std::endl;
    return 1;
  }
  if (!valid_chunk_size(scfg.encoder.chunk_size)) {
    std::cerr << "chunk size must be in [" << kMinChunkSize << ","
              << kMaxChunkSize << "]" << std::endl;
    return 1;
  }
  if (scfg.encoder.grid == GridPolicy::FixedColumns &&
      scfg.encoder.fixed_cols == 0) {
    std::cerr << "--cols must be positive" << std::endl;
    return 1;
  }
  if (mode == SchedulerMode::Timed && scfg.interval.count() == 0) {
    std::cerr << "--interval-ms must be positive" << std::endl;
    return 1;
  }
  Logger::instance().set_level(level);
  if (!log_file.empty() && !Logger::instance().open_file(log_file)) {
    std::cerr << "cannot open log file " << log_file << std::endl;
    return 1;
  }

  FileImageSource source(image_path, scfg.transmitter_id);
  TcpUplink uplink(host, port, mode == SchedulerMode::Continuous);
  TransmissionScheduler sched(scfg, source, uplink);

  asio::io_context io;
  std::unique_ptr<LineTrigger> stdin_trigger;
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "signal %d, stopping", sig);
    sched.stop();
    if (stdin_trigger)
      stdin_trigger->cancel();
  });

  sched.start(mode);
  sched.run_async();
  if (mode == SchedulerMode::Manual) {
    stdin_trigger.reset(
        new LineTrigger(io, ::dup(STDIN_FILENO), sched, [&signals]() {
          std::error_code ec;
          signals.cancel(ec);
        }));
    stdin_trigger->start();
  }

  io.run();
  sched.stop();
  return 0;
}
