#include "status.hpp"
#include <cstdio>
#include <utility>

namespace btflash {

Status Status::error(ErrorCode code, std::string detail) {
  Status st;
  st.code = code;
  st.detail = std::move(detail);
  return st;
}

Status Status::advisory(ErrorCode code, std::string detail) {
  Status st = error(code, std::move(detail));
  st.severity = Severity::Advisory;
  return st;
}

Status Status::frame_error(ErrorCode code, std::size_t index,
                           std::size_t count, FrameFailure why,
                           std::string detail) {
  Status st = error(code, std::move(detail));
  st.frame_index = index;
  st.frame_count = count;
  st.frame_failure = why;
  return st;
}

const char *error_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "ok";
  case ErrorCode::ConnectionError:
    return "connection error";
  case ErrorCode::ConfigurationError:
    return "configuration error";
  case ErrorCode::EmptyInputError:
    return "empty input";
  case ErrorCode::HandshakeRejected:
    return "handshake rejected";
  case ErrorCode::TransferAborted:
    return "transfer aborted";
  case ErrorCode::TeardownRejected:
    return "teardown rejected";
  case ErrorCode::DeviceNotFound:
    return "device not found";
  case ErrorCode::InvalidFirmware:
    return "invalid firmware file";
  case ErrorCode::UsageError:
    return "usage error";
  case ErrorCode::IoError:
    return "i/o error";
  }
  return "unknown error";
}

const char *frame_failure_name(FrameFailure f) {
  switch (f) {
  case FrameFailure::Aborted:
    return "aborted by receiver";
  case FrameFailure::Exhausted:
    return "attempts exhausted";
  default:
    return "none";
  }
}

std::string describe(const Status &st) {
  std::string out = error_name(st.code);
  if (st.code == ErrorCode::TransferAborted ||
      (st.frame_count > 0 && st.code == ErrorCode::ConnectionError)) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), ": frame %zu/%zu", st.frame_index + 1,
                  st.frame_count);
    out += buf;
    if (st.frame_failure != FrameFailure::None) {
      out += " (";
      out += frame_failure_name(st.frame_failure);
      out += ")";
    }
  }
  if (!st.detail.empty()) {
    out += ": ";
    out += st.detail;
  }
  return out;
}

} // namespace btflash
