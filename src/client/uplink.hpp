
#pragma once
#include <asio.hpp>
#include <string>
#include "protocol.hpp"
#include "transport.hpp"

namespace tilecast {

// Sender half of the transport. Calls arrive strictly as
// begin_session, send_frame..., end_session.
class Uplink {
public:
    virtual ~Uplink() = default;
    virtual bool begin_session(const SessionHello& hello) = 0;
    virtual bool send_frame(const Frame& f) = 0;
    // completed == false drops the connection so the receiver finalizes
    // whatever it already has.
    virtual void end_session(bool completed) = 0;
};

// Blocking TCP uplink. Connects lazily at the start of a session; a failed
// connection is not retried here, the next session reconnects.
class TcpUplink : public Uplink {
public:
    using tcp = asio::ip::tcp;
    TcpUplink(std::string host, uint16_t port, bool persistent);
    ~TcpUplink() override;

    bool begin_session(const SessionHello& hello) override;
    bool send_frame(const Frame& f) override;
    void end_session(bool completed) override;
    bool connected() const { return sock_.is_open(); }

private:
    std::string host_;
    uint16_t port_;
    bool persistent_;
    asio::io_context io_;
    tcp::socket sock_;

    bool connect();
    bool write_all(const std::vector<uint8_t>& buf, const char* what);
    void close();
};

} // namespace tilecast
