
#pragma once
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include "protocol.hpp"
#include "transport.hpp"
#include "registry.hpp"

namespace tilecast {

struct ReceiverConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{49697};
    int threads{4};
    uint32_t session_timeout_ms{60000};
    uint32_t sweep_interval_ms{1000};
    std::string output_dir{"RX_Output"};
    uint8_t placeholder{0};
};

// Accepts transmitter connections and feeds their frames into the registry.
// Every connection runs on its own strand; the registry is the only state
// shared between connections.
class ReceiverPool {
public:
    using tcp = asio::ip::tcp;

    struct Conn : public std::enable_shared_from_this<Conn> {
        tcp::socket sock;
        asio::steady_timer idle;
        std::vector<uint8_t> read_buf;
        FrameReader reader;
        std::shared_ptr<SessionReassembler> session;
        std::string peer;
        bool closed{false};
        explicit Conn(tcp::socket s)
            : sock(std::move(s)), idle(sock.get_executor()), read_buf(16*1024) {}
    };

    ReceiverPool(asio::io_context& io, const ReceiverConfig& cfg, SessionRegistry& registry);
    bool start();
    // Closes the acceptor and every connection; io.run() returns once they drain.
    void stop();
    uint16_t local_port() const { return bound_port_; }
    size_t connection_count() const;

private:
    asio::io_context& io_;
    ReceiverConfig cfg_;
    SessionRegistry& registry_;
    // acceptor_ and sweep_ are only touched from this strand once running
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::acceptor acceptor_;
    asio::steady_timer sweep_;
    std::atomic<bool> stopped_{false};
    uint16_t bound_port_{0};

    mutable std::mutex conns_mtx_;
    std::unordered_map<Conn*, std::weak_ptr<Conn>> conns_;

    void do_accept();
    void do_sweep();
    void do_read(std::shared_ptr<Conn> c);
    void arm_idle(std::shared_ptr<Conn> c);
    bool drain(std::shared_ptr<Conn> c);
    void on_closed(std::shared_ptr<Conn> c, const std::error_code& ec);
    void abort_conn(std::shared_ptr<Conn> c, FinalizeReason reason);
    void forget(Conn* c);
};

} // namespace tilecast
