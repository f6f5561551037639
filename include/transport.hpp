
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace tilecast {

constexpr uint32_t kHelloMagic = 0x53434C54; // 'TLCS'
constexpr uint8_t  kHelloVersion = 1;
constexpr size_t   kIdFieldSize = 50;
constexpr size_t   kNameFieldSize = 100;
constexpr size_t   kHelloSize = 4 + 1 + 1 + 2 + 4 + 2 + 2 + kIdFieldSize + kNameFieldSize;

// Opens a session on a connection. Frame records follow in any index order
// until every index has arrived at least once.
struct SessionHello {
    std::string transmitter_id;
    std::string image_name;
    SessionParams params;
};

std::vector<uint8_t> encode_hello(const SessionHello& hello);
// Returns Ok, DesyncError (magic/version) or MalformedHeader (bad fields).
FrameStatus decode_hello(const uint8_t* data, size_t len, SessionHello& out);
FrameStatus validate_params(const SessionParams& params);

// header ++ payload exactly as it goes on the wire
std::vector<uint8_t> serialize_frame(const Frame& f);

// Incremental decoder for one side of a connection. Bytes are fed as they
// arrive; records come out only once completely buffered.
class FrameReader {
public:
    enum class Event { NeedMore, Hello, Frame, Error };

    void feed(const uint8_t* data, size_t n);
    // After Error the reader stays failed; the connection must be dropped.
    Event next(SessionHello& hello, Frame& frame, FrameStatus& err);

    bool in_session() const { return in_session_; }
    // True when some bytes of an unfinished record are buffered.
    bool mid_record() const { return off_ < inbuf_.size(); }
    // Distinct indices of the current session not seen yet.
    uint32_t frames_remaining() const { return remaining_; }
    const SessionParams& params() const { return params_; }

private:
    std::vector<uint8_t> inbuf_;
    size_t off_{0};
    bool in_session_{false};
    bool failed_{false};
    // params_ outlives its session so late repeats can still be sized
    bool have_params_{false};
    SessionParams params_{};
    std::vector<bool> seen_;
    uint32_t remaining_{0};

    void compact();
    Event read_frame(Frame& frame, FrameStatus& err);
};

} // namespace tilecast
