
#include "receiver_pool.hpp"
#include "logging.hpp"

namespace tilecast {

ReceiverPool::ReceiverPool(asio::io_context &io, const ReceiverConfig &cfg,
                           SessionRegistry &registry)
    : io_(io), cfg_(cfg), registry_(registry), strand_(asio::make_strand(io)),
      acceptor_(strand_), sweep_(strand_) {}

bool ReceiverPool::start() {
  std::error_code ec;
  auto addr = asio::ip::make_address(cfg_.listen_host, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "bad listen address %s: %s",
                           cfg_.listen_host.c_str(), ec.message().c_str());
    return false;
  }
  tcp::endpoint ep(addr, cfg_.listen_port);
  acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "listen on %s:%u failed: %s",
                           cfg_.listen_host.c_str(), (unsigned)cfg_.listen_port,
                           ec.message().c_str());
    return false;
  }
  bound_port_ = acceptor_.local_endpoint(ec).port();
  Logger::instance().log(LogLevel::INFO, "listening on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)bound_port_);
  do_accept();
  do_sweep();
  return true;
}

void ReceiverPool::stop() {
  if (stopped_.exchange(true))
    return;
  asio::post(strand_, [this]() {
    std::error_code ec;
    acceptor_.close(ec);
    sweep_.cancel();
  });
  std::vector<std::shared_ptr<Conn>> live;
  {
    std::lock_guard<std::mutex> lk(conns_mtx_);
    for (auto &kv : conns_) {
      if (auto c = kv.second.lock())
        live.push_back(c);
    }
  }
  for (auto &c : live) {
    asio::dispatch(c->sock.get_executor(), [this, c]() {
      abort_conn(c, FinalizeReason::Shutdown);
    });
  }
}

size_t ReceiverPool::connection_count() const {
  std::lock_guard<std::mutex> lk(conns_mtx_);
  return conns_.size();
}

void ReceiverPool::forget(Conn *c) {
  std::lock_guard<std::mutex> lk(conns_mtx_);
  conns_.erase(c);
}

void ReceiverPool::do_accept() {
  acceptor_.async_accept(
      asio::make_strand(io_), [this](std::error_code ec, tcp::socket sock) {
        if (ec) {
          if (ec != asio::error::operation_aborted)
            Logger::instance().log(LogLevel::ERROR, "accept failed: %s",
                                   ec.message().c_str());
          if (!stopped_ && acceptor_.is_open())
            do_accept();
          return;
        }
        auto c = std::make_shared<Conn>(std::move(sock));
        std::error_code pec;
        auto ep = c->sock.remote_endpoint(pec);
        c->peer = pec ? std::string("?")
                      : ep.address().to_string() + ":" +
                            std::to_string(ep.port());
        Logger::instance().log(LogLevel::INFO, "accepted %s", c->peer.c_str());
        {
          std::lock_guard<std::mutex> lk(conns_mtx_);
          conns_[c.get()] = c;
        }
        asio::dispatch(c->sock.get_executor(), [this, c]() { do_read(c); });
        do_accept();
      });
}

void ReceiverPool::do_sweep() {
  sweep_.expires_after(std::chrono::milliseconds(cfg_.sweep_interval_ms));
  sweep_.async_wait([this](std::error_code ec) {
    if (ec || stopped_)
      return;
    size_t n = registry_.expire_idle(Clock::now());
    if (n > 0)
      Logger::instance().log(LogLevel::DEBUG, "sweep expired %zu sessions", n);
    do_sweep();
  });
}

void ReceiverPool::arm_idle(std::shared_ptr<Conn> c) {
  c->idle.expires_after(std::chrono::milliseconds(cfg_.session_timeout_ms));
  c->idle.async_wait([this, c](std::error_code ec) {
    if (ec || c->closed)
      return;
    Logger::instance().log(LogLevel::WARN, "%s idle for %ums, dropping",
                           c->peer.c_str(), (unsigned)cfg_.session_timeout_ms);
    abort_conn(c, FinalizeReason::IdleTimeout);
  });
}

void ReceiverPool::do_read(std::shared_ptr<Conn> c) {
  if (c->closed)
    return;
  arm_idle(c);
  c->sock.async_read_some(asio::buffer(c->read_buf),
                          [this, c](std::error_code ec, std::size_t n) {
                            if (ec) {
                              on_closed(c, ec);
                              return;
                            }
                            c->reader.feed(c->read_buf.data(), n);
                            if (!drain(c)) {
                              abort_conn(c, FinalizeReason::ConnectionClosed);
                              return;
                            }
                            do_read(c);
                          });
}

bool ReceiverPool::drain(std::shared_ptr<Conn> c) {
  SessionHello hello;
  Frame frame;
  FrameStatus err = FrameStatus::Ok;
  for (;;) {
    switch (c->reader.next(hello, frame, err)) {
    case FrameReader::Event::NeedMore:
      return true;
    case FrameReader::Event::Error:
      Logger::instance().log(LogLevel::WARN, "%s: %s, aborting connection",
                             c->peer.c_str(), status_str(err));
      return false;
    case FrameReader::Event::Hello: {
      if (c->session && c->session->state() == SessionState::Open &&
          c->session->transmitter_id() != hello.transmitter_id)
        registry_.finalize(c->session, FinalizeReason::Superseded);
      c->session = registry_.get_or_create(
          hello.transmitter_id, hello.image_name, hello.params, Clock::now());
      if (hello.params.total_frames() == 0)
        registry_.finalize(c->session, FinalizeReason::Completed);
      break;
    }
    case FrameReader::Event::Frame: {
      FrameStatus st = registry_.submit(c->session, frame, Clock::now());
      switch (st) {
      case FrameStatus::Ok:
        Logger::instance().log(LogLevel::TRACE, "%s frame %u (r%u c%u)",
                               c->peer.c_str(), (unsigned)frame.hdr.frame_index,
                               (unsigned)frame.hdr.row,
                               (unsigned)frame.hdr.col);
        break;
      case FrameStatus::SessionMismatch:
        Logger::instance().log(LogLevel::WARN,
                               "%s frame %u rejected: %s", c->peer.c_str(),
                               (unsigned)frame.hdr.frame_index,
                               status_str(st));
        break;
      default:
        Logger::instance().log(LogLevel::DEBUG, "%s frame %u dropped: %s",
                               c->peer.c_str(),
                               (unsigned)frame.hdr.frame_index,
                               status_str(st));
        break;
      }
      break;
    }
    }
  }
}

void ReceiverPool::on_closed(std::shared_ptr<Conn> c,
                             const std::error_code &ec) {
  if (c->closed)
    return;
  if (ec == asio::error::eof) {
    if (c->reader.mid_record() || c->reader.in_session())
      Logger::instance().log(LogLevel::WARN,
                             "%s closed mid-session (%s, %u frames outstanding)",
                             c->peer.c_str(),
                             status_str(FrameStatus::TruncatedFrame),
                             (unsigned)c->reader.frames_remaining());
    else
      Logger::instance().log(LogLevel::INFO, "%s closed", c->peer.c_str());
  } else if (ec != asio::error::operation_aborted) {
    Logger::instance().log(LogLevel::WARN, "%s read error: %s",
                           c->peer.c_str(), ec.message().c_str());
  }
  abort_conn(c, FinalizeReason::ConnectionClosed);
}

void ReceiverPool::abort_conn(std::shared_ptr<Conn> c, FinalizeReason reason) {
  if (c->closed)
    return;
  c->closed = true;
  if (c->session) {
    registry_.finalize(c->session, reason);
    c->session.reset();
  }
  c->idle.cancel();
  std::error_code ec;
  c->sock.shutdown(tcp::socket::shutdown_both, ec);
  c->sock.close(ec);
  forget(c.get());
}

} // namespace tilecast
