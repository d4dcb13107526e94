#include "session.hpp"
#include "logging.hpp"
#include <cstdio>
#include <cstring>
#include <string>

namespace btflash {

namespace {

// Closes and releases the transport on every way out of run().
struct TransportRelease {
  std::unique_ptr<Transport> &t;
  ~TransportRelease() {
    if (t) {
      t->close();
      t.reset();
    }
  }
};

std::string hex_byte(uint8_t b) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X", b);
  return buf;
}

} // namespace

const char *state_name(SessionState s) {
  switch (s) {
  case SessionState::Idle:
    return "idle";
  case SessionState::Connecting:
    return "connecting";
  case SessionState::Handshaking:
    return "handshaking";
  case SessionState::Transferring:
    return "transferring";
  case SessionState::Finalizing:
    return "finalizing";
  case SessionState::Completed:
    return "completed";
  case SessionState::Failed:
    return "failed";
  }
  return "?";
}

TransferSession::TransferSession(const SessionConfig &cfg, Connector connect,
                                 ProgressSink &progress)
    : cfg_(cfg), connector_(std::move(connect)), progress_(progress) {}

void TransferSession::enter(SessionState s) {
  Logger::instance().log(LogLevel::TRACE, "session: %s -> %s",
                         state_name(state_), state_name(s));
  state_ = s;
}

Status TransferSession::fail(Status st) {
  Logger::instance().log(LogLevel::DEBUG, "session failed while %s: %s",
                         state_name(state_), describe(st).c_str());
  enter(SessionState::Failed);
  return st;
}

Status TransferSession::run(std::istream &firmware) {
  Logger::instance().log(LogLevel::INFO, "Preparing packets");
  Status st = build_frames(firmware, cfg_.chunk_payload_size, frames_);
  if (!st.ok())
    return fail(st);
  Logger::instance().log(LogLevel::DEBUG,
                         "%zu frames, %u payload bytes per frame",
                         frames_.size(), (unsigned)cfg_.chunk_payload_size);

  st = connect();
  if (!st.ok())
    return fail(st);
  TransportRelease release{transport_};

  st = handshake();
  if (!st.ok())
    return fail(st);
  st = transfer();
  if (!st.ok())
    return fail(st);
  st = finalize();
  if (!st.ok())
    return fail(st);

  enter(SessionState::Completed);
  return Status::success();
}

Status TransferSession::connect() {
  enter(SessionState::Connecting);
  Logger::instance().log(LogLevel::INFO, "Trying to connect to target device");
  std::error_code ec;
  if (connector_)
    transport_ = connector_(ec);
  if (!transport_) {
    if (!ec)
      ec = std::make_error_code(std::errc::not_connected);
    return Status::error(ErrorCode::ConnectionError, ec.message());
  }
  Logger::instance().log(LogLevel::INFO, "Connected to %s",
                         transport_->describe().c_str());
  return Status::success();
}

std::error_code TransferSession::send_marker(SessionMarker m) {
  uint8_t b = static_cast<uint8_t>(m);
  return transport_->send(&b, 1);
}

std::error_code TransferSession::read_byte(uint8_t &b) {
  return transport_->receive(&b, 1);
}

Status TransferSession::handshake() {
  enter(SessionState::Handshaking);
  Logger::instance().log(LogLevel::INFO, "Starting transaction");
  std::error_code ec = transport_->send(
      reinterpret_cast<const uint8_t *>(kUpdateIdentifier),
      std::strlen(kUpdateIdentifier));
  if (ec)
    return Status::error(ErrorCode::ConnectionError, ec.message());

  uint8_t b = 0;
  ec = read_byte(b);
  if (is_timeout(ec))
    return Status::error(ErrorCode::HandshakeRejected,
                         "no response to update request");
  if (ec)
    return Status::error(ErrorCode::ConnectionError, ec.message());
  Logger::instance().log(LogLevel::TRACE, "liveness byte %s",
                         hex_byte(b).c_str());

  ec = send_marker(SessionMarker::Begin);
  if (ec)
    return Status::error(ErrorCode::ConnectionError, ec.message());
  ec = read_byte(b);
  if (is_timeout(ec))
    return Status::error(ErrorCode::HandshakeRejected,
                         "transfer did not begin (no response)");
  if (ec)
    return Status::error(ErrorCode::ConnectionError, ec.message());
  if (b != static_cast<uint8_t>(Response::Ack))
    return Status::error(ErrorCode::HandshakeRejected,
                         "transfer did not begin (" + hex_byte(b) + ")");
  return Status::success();
}

TransferSession::FrameResult TransferSession::send_frame(size_t index,
                                                         std::error_code &ec) {
  const Frame &f = frames_[index];
  const uint32_t n = cfg_.max_attempts_per_frame;
  for (uint32_t attempt = 1; attempt <= n; ++attempt) {
    if (attempt > 1)
      metrics_.resends++;
    ec = transport_->send(f.bytes);
    if (ec && !is_timeout(ec))
      return FrameResult::LinkError;
    if (ec) {
      Logger::instance().log(LogLevel::DEBUG,
                             "frame %zu attempt %u/%u: send timed out",
                             index + 1, attempt, n);
      continue;
    }
    uint8_t b = 0;
    ec = read_byte(b);
    if (is_timeout(ec)) {
      Logger::instance().log(LogLevel::DEBUG,
                             "frame %zu attempt %u/%u: no response",
                             index + 1, attempt, n);
      continue;
    }
    if (ec)
      return FrameResult::LinkError;
    switch (classify_response(b)) {
    case ResponseKind::Ack:
      Logger::instance().log(LogLevel::TRACE, "frame %zu acked (attempt %u)",
                             index + 1, attempt);
      return FrameResult::Acked;
    case ResponseKind::Abort:
      Logger::instance().log(LogLevel::WARN, "frame %zu: receiver aborted",
                             index + 1);
      return FrameResult::Aborted;
    case ResponseKind::Retry:
      Logger::instance().log(LogLevel::DEBUG,
                             "frame %zu attempt %u/%u: resend requested (%s)",
                             index + 1, attempt, n, hex_byte(b).c_str());
      break;
    }
  }
  ec.clear();
  Logger::instance().log(LogLevel::WARN, "frame %zu: no ack after %u attempts",
                         index + 1, n);
  return FrameResult::Exhausted;
}

Status TransferSession::transfer() {
  enter(SessionState::Transferring);
  Logger::instance().log(LogLevel::INFO, "Sending packets");
  using clock = std::chrono::steady_clock;
  const auto start = clock::now();
  const size_t count = frames_.size();
  for (size_t i = 0; i < count; ++i) {
    std::error_code ec;
    FrameResult r = send_frame(i, ec);
    metrics_.elapsed = clock::now() - start;
    progress_.on_progress(i + 1, count, metrics_.elapsed);
    if (r == FrameResult::Acked) {
      metrics_.total_bytes += frames_[i].payload_size();
      metrics_.wire_bytes += frames_[i].bytes.size();
      continue;
    }
    std::error_code mec = send_marker(SessionMarker::Error);
    if (mec)
      Logger::instance().log(LogLevel::WARN, "could not send error marker: %s",
                             mec.message().c_str());
    if (r == FrameResult::LinkError)
      return Status::frame_error(ErrorCode::ConnectionError, i, count,
                                 FrameFailure::None, ec.message());
    return Status::frame_error(ErrorCode::TransferAborted, i, count,
                               r == FrameResult::Aborted
                                   ? FrameFailure::Aborted
                                   : FrameFailure::Exhausted);
  }
  return Status::success();
}

Status TransferSession::finalize() {
  enter(SessionState::Finalizing);
  Logger::instance().log(LogLevel::INFO, "Ending transaction");
  std::error_code ec = send_marker(SessionMarker::End);
  if (ec)
    return Status::error(ErrorCode::ConnectionError, ec.message());
  uint8_t b = 0;
  ec = read_byte(b);
  if (is_timeout(ec))
    return Status::error(ErrorCode::TeardownRejected, "no response to end");
  if (ec)
    return Status::error(ErrorCode::ConnectionError, ec.message());
  if (b != static_cast<uint8_t>(Response::Ack))
    return Status::error(ErrorCode::TeardownRejected,
                         "receiver answered " + hex_byte(b));
  return Status::success();
}

} // namespace btflash
