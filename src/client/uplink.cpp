
#include "uplink.hpp"
#include "logging.hpp"

namespace tilecast {

TcpUplink::TcpUplink(std::string host, uint16_t port, bool persistent)
    : host_(std::move(host)), port_(port), persistent_(persistent),
      sock_(io_) {}

TcpUplink::~TcpUplink() { close(); }

bool TcpUplink::connect() {
  if (sock_.is_open())
    return true;
  std::error_code ec;
  tcp::resolver res(io_);
  auto results = res.resolve(host_, std::to_string(port_), ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "resolve %s failed: %s",
                           host_.c_str(), ec.message().c_str());
    return false;
  }
  asio::connect(sock_, results, ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "connect %s:%u failed: %s",
                           host_.c_str(), (unsigned)port_,
                           ec.message().c_str());
    close();
    return false;
  }
  sock_.set_option(tcp::no_delay(true), ec);
  Logger::instance().log(LogLevel::INFO, "connected to %s:%u", host_.c_str(),
                         (unsigned)port_);
  return true;
}

void TcpUplink::close() {
  if (!sock_.is_open())
    return;
  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_both, ec);
  sock_.close(ec);
}

bool TcpUplink::write_all(const std::vector<uint8_t> &buf, const char *what) {
  std::error_code ec;
  asio::write(sock_, asio::buffer(buf), ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "write %s failed: %s", what,
                           ec.message().c_str());
    close();
    return false;
  }
  return true;
}

bool TcpUplink::begin_session(const SessionHello &hello) {
  if (!connect())
    return false;
  return write_all(encode_hello(hello), "hello");
}

bool TcpUplink::send_frame(const Frame &f) {
  if (!sock_.is_open())
    return false;
  return write_all(serialize_frame(f), "frame");
}

void TcpUplink::end_session(bool completed) {
  if (!completed || !persistent_)
    close();
}

} // namespace tilecast
