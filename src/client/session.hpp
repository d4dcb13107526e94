#pragma once
#include <chrono>
#include <functional>
#include <istream>
#include <memory>
#include <system_error>
#include "protocol.hpp"
#include "status.hpp"
#include "transport.hpp"
#include "progress.hpp"

namespace btflash {

enum class SessionState {
    Idle,
    Connecting,
    Handshaking,
    Transferring,
    Finalizing,
    Completed,
    Failed
};

const char* state_name(SessionState s);

struct SessionMetrics {
    uint64_t total_bytes{0};
    uint64_t wire_bytes{0};
    uint64_t resends{0};
    std::chrono::steady_clock::duration elapsed{};
};

// Yields a connected transport with its response timeout already applied,
// or nullptr with `ec` set.
using Connector = std::function<std::unique_ptr<Transport>(std::error_code& ec)>;

class TransferSession {
public:
    TransferSession(const SessionConfig& cfg, Connector connect, ProgressSink& progress);
    // Single pass; the transport is closed before this returns.
    Status run(std::istream& firmware);

    SessionState state() const { return state_; }
    const SessionMetrics& metrics() const { return metrics_; }
    const FrameSequence& frames() const { return frames_; }
private:
    enum class FrameResult { Acked, Aborted, Exhausted, LinkError };

    Status connect();
    Status handshake();
    Status transfer();
    Status finalize();
    FrameResult send_frame(size_t index, std::error_code& ec);
    std::error_code send_marker(SessionMarker m);
    std::error_code read_byte(uint8_t& b);
    void enter(SessionState s);
    Status fail(Status st);

    SessionConfig cfg_;
    Connector connector_;
    ProgressSink& progress_;
    std::unique_ptr<Transport> transport_;
    FrameSequence frames_;
    SessionState state_{SessionState::Idle};
    SessionMetrics metrics_;
};

} // namespace btflash
