
#include "image_store.hpp"
#include "logging.hpp"
#include "receiver_pool.hpp"
#include "registry.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace tilecast;

static void usage(const char *prog) {
  std::cerr << "usage: " << prog
            << " [--listen host:port] [--threads N] [--timeout-ms N]"
               " [--sweep-ms N] [--output DIR] [--placeholder BYTE]"
               " [--log-level trace|debug|info|warn|error] [--log-file PATH]\n";
}

int main(int argc, char **argv) {
  ReceiverConfig cfg;
  std::string listen = "0.0.0.0:49697";
  cfg.threads = (int)std::max(2u, std::thread::hardware_concurrency());
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
    if (a == "--listen")
      listen = next(i);
    else if (a == "--threads")
      cfg.threads = (int)number(i, 256);
    else if (a == "--timeout-ms")
      cfg.session_timeout_ms = (uint32_t)number(i, 0xFFFFFFFFu);
    else if (a == "--sweep-ms")
      cfg.sweep_interval_ms = (uint32_t)number(i, 0xFFFFFFFFu);
    else if (a == "--output")
      cfg.output_dir = next(i);
    else if (a == "--placeholder")
      cfg.placeholder = (uint8_t)number(i, 255);
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

  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  if (cfg.threads < 1 || cfg.session_timeout_ms == 0 ||
      cfg.sweep_interval_ms == 0) {
    std::cerr << "threads, timeout and sweep interval must be positive"
              << std::endl;
    return 1;
  }
  Logger::instance().set_level(level);
  if (!log_file.empty() && !Logger::instance().open_file(log_file)) {
    std::cerr << "cannot open log file " << log_file << std::endl;
    return 1;
  }

  ImageStore store(cfg.output_dir);
  SessionRegistry registry(
      std::chrono::milliseconds(cfg.session_timeout_ms),
      [&store](FinalizedImage &&img) { store.save(img); }, cfg.placeholder);

  asio::io_context io;
  ReceiverPool rp(io, cfg, registry);
  if (!rp.start())
    return 1;

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&rp](std::error_code ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "signal %d, shutting down", sig);
    rp.stop();
  });

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();

  registry.finalize_all(FinalizeReason::Shutdown);
  Logger::instance().log(LogLevel::INFO, "receiver done, %zu images saved",
                         store.saved_count());
  return 0;
}
