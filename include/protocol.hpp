#pragma once
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <istream>
#include <vector>
#include "status.hpp"

namespace btflash {

constexpr char     kUpdateIdentifier[] = "firmware_update";
constexpr size_t   kLengthFieldSize = 2;
constexpr size_t   kChecksumFieldSize = 4;
constexpr size_t   kFrameOverhead = kLengthFieldSize + kChecksumFieldSize;
constexpr uint16_t kMaxPacketSize = 512;

constexpr uint32_t kDefaultAttempts = 3;
constexpr uint16_t kDefaultPacketSize = kMaxPacketSize;
constexpr std::chrono::milliseconds kDefaultResponseTimeout{1000};

// Sender -> receiver.
enum class SessionMarker : uint8_t {
    Begin = 0xAA,
    Error = 0xEE,
    End   = 0xFF
};

// Receiver -> sender. Shares byte values with SessionMarker; never mix them.
enum class Response : uint8_t {
    Ack   = 0xFF,
    Abort = 0xAA,
    Retry = 0xEE
};

enum class ResponseKind { Ack, Abort, Retry };

// Unknown bytes are treated as a request to resend.
ResponseKind classify_response(uint8_t byte);

struct FrameHeader {
    uint16_t length{0};
    uint32_t checksum{0};
};

// Wire image is `length LE16 || checksum LE32 || payload`, built once.
struct Frame {
    FrameHeader hdr{};
    std::vector<uint8_t> bytes;

    const uint8_t* payload() const { return bytes.data() + kFrameOverhead; }
    size_t payload_size() const { return hdr.length; }
};

using FrameSequence = std::vector<Frame>;

struct SessionConfig {
    uint32_t max_attempts_per_frame{kDefaultAttempts};
    uint16_t chunk_payload_size{kDefaultPacketSize - kFrameOverhead};
    std::chrono::milliseconds response_timeout{kDefaultResponseTimeout};
};

Status make_session_config(uint32_t attempts, uint32_t packet_size,
                           std::chrono::milliseconds timeout, SessionConfig& out);

uint32_t crc32(const uint8_t* data, size_t len);

Frame encode_frame(const uint8_t* data, uint16_t len);
bool parse_frame(const uint8_t* data, size_t len, Frame& out);

Status build_frames(std::istream& source, uint16_t chunk_payload_size,
                    FrameSequence& out);

} // namespace btflash
