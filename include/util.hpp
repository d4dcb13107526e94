#pragma once
#include <string>
#include <cstdint>
#include "status.hpp"

namespace btflash {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
bool parse_uint(const std::string& s, uint32_t& out);

// Extensions classified as application/octet-stream.
bool is_generic_binary(const std::string& path);
Status check_firmware_file(const std::string& path);

std::string format_bytes(uint64_t n);

} // namespace btflash
