#include "protocol.hpp"
#include <array>
#include <string>

namespace btflash {

namespace {

void put_le16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back((uint8_t)(v & 0xFF));
  out.push_back((uint8_t)(v >> 8));
}

void put_le32(std::vector<uint8_t> &out, uint32_t v) {
  for (int i = 0; i < 4; i++)
    out.push_back((uint8_t)(v >> (8 * i)));
}

uint16_t get_le16(const uint8_t *p) { return (uint16_t)(p[0] | (p[1] << 8)); }

uint32_t get_le32(const uint8_t *p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
         ((uint32_t)p[3] << 24);
}

std::array<uint32_t, 256> make_crc_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (int j = 0; j < 8; j++)
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    table[i] = c;
  }
  return table;
}

} // namespace

ResponseKind classify_response(uint8_t byte) {
  switch (static_cast<Response>(byte)) {
  case Response::Ack:
    return ResponseKind::Ack;
  case Response::Abort:
    return ResponseKind::Abort;
  default:
    return ResponseKind::Retry;
  }
}

Status make_session_config(uint32_t attempts, uint32_t packet_size,
                           std::chrono::milliseconds timeout,
                           SessionConfig &out) {
  if (attempts == 0)
    return Status::error(ErrorCode::ConfigurationError,
                         "attempts must be positive");
  if (packet_size == 0)
    return Status::error(ErrorCode::ConfigurationError,
                         "packet size must be positive");
  if (packet_size > kMaxPacketSize)
    return Status::error(ErrorCode::ConfigurationError,
                         "packet size must be no more than " +
                             std::to_string(kMaxPacketSize));
  if (packet_size <= kFrameOverhead)
    return Status::error(ErrorCode::ConfigurationError,
                         "packet size must exceed the " +
                             std::to_string(kFrameOverhead) +
                             "-byte frame overhead");
  if (timeout.count() <= 0)
    return Status::error(ErrorCode::ConfigurationError,
                         "response timeout must be positive");
  out.max_attempts_per_frame = attempts;
  out.chunk_payload_size = (uint16_t)(packet_size - kFrameOverhead);
  out.response_timeout = timeout;
  return Status::success();
}

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = make_crc_table();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

Frame encode_frame(const uint8_t *data, uint16_t len) {
  Frame f;
  f.hdr.length = len;
  f.hdr.checksum = crc32(data, len);
  f.bytes.reserve(kFrameOverhead + len);
  put_le16(f.bytes, f.hdr.length);
  put_le32(f.bytes, f.hdr.checksum);
  f.bytes.insert(f.bytes.end(), data, data + len);
  return f;
}

bool parse_frame(const uint8_t *data, size_t len, Frame &out) {
  if (len <= kFrameOverhead)
    return false;
  uint16_t plen = get_le16(data);
  if (plen == 0 || kFrameOverhead + plen != len)
    return false;
  uint32_t crc = get_le32(data + kLengthFieldSize);
  if (crc32(data + kFrameOverhead, plen) != crc)
    return false;
  out.hdr.length = plen;
  out.hdr.checksum = crc;
  out.bytes.assign(data, data + len);
  return true;
}

Status build_frames(std::istream &source, uint16_t chunk_payload_size,
                    FrameSequence &out) {
  if (chunk_payload_size == 0)
    return Status::error(ErrorCode::ConfigurationError,
                         "chunk payload size must be positive");
  FrameSequence frames;
  std::vector<uint8_t> chunk(chunk_payload_size);
  while (source) {
    source.read(reinterpret_cast<char *>(chunk.data()), chunk.size());
    std::streamsize n = source.gcount();
    if (n > 0)
      frames.push_back(encode_frame(chunk.data(), (uint16_t)n));
  }
  if (source.bad())
    return Status::error(ErrorCode::IoError, "failed to read firmware source");
  if (frames.empty())
    return Status::error(ErrorCode::EmptyInputError, "firmware image is empty");
  out = std::move(frames);
  return Status::success();
}

} // namespace btflash
