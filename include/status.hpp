#pragma once
#include <cstddef>
#include <string>

namespace btflash {

enum class ErrorCode {
    None = 0,
    ConnectionError,
    ConfigurationError,
    EmptyInputError,
    HandshakeRejected,
    TransferAborted,
    TeardownRejected,
    DeviceNotFound,
    InvalidFirmware,
    UsageError,
    IoError
};

// Advisory statuses are reported but never end the run.
enum class Severity { Required, Advisory };

enum class FrameFailure { None, Aborted, Exhausted };

struct Status {
    ErrorCode code{ErrorCode::None};
    Severity severity{Severity::Required};
    std::size_t frame_index{0};
    std::size_t frame_count{0};
    FrameFailure frame_failure{FrameFailure::None};
    std::string detail;

    bool ok() const { return code == ErrorCode::None; }
    bool fatal() const { return !ok() && severity == Severity::Required; }

    static Status success() { return Status{}; }
    static Status error(ErrorCode code, std::string detail = {});
    static Status advisory(ErrorCode code, std::string detail = {});
    static Status frame_error(ErrorCode code, std::size_t index, std::size_t count,
                              FrameFailure why, std::string detail = {});
};

const char* error_name(ErrorCode code);
const char* frame_failure_name(FrameFailure f);
std::string describe(const Status& st);

} // namespace btflash
