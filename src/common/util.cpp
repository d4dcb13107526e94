#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sys/stat.h>

namespace btflash {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  uint32_t p;
  if (!parse_uint(s.substr(pos + 1), p) || p == 0 || p > 65535)
    return false;
  host = s.substr(0, pos);
  port = (uint16_t)p;
  return true;
}

bool parse_uint(const std::string &s, uint32_t &out) {
  if (s.empty() || s.size() > 10)
    return false;
  uint64_t v = 0;
  for (char c : s) {
    if (!std::isdigit((unsigned char)c))
      return false;
    v = v * 10 + (uint64_t)(c - '0');
  }
  if (v > 0xFFFFFFFFull)
    return false;
  out = (uint32_t)v;
  return true;
}

bool is_generic_binary(const std::string &path) {
  static const char *const kExts[] = {".bin", ".a",   ".dll", ".exe",
                                      ".o",   ".obj", ".so"};
  auto slash = path.find_last_of('/');
  auto dot = path.rfind('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
    return false;
  std::string ext = path.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  for (const char *e : kExts)
    if (ext == e)
      return true;
  return false;
}

Status check_firmware_file(const std::string &path) {
  struct stat sb {};
  if (::stat(path.c_str(), &sb) != 0)
    return Status::error(ErrorCode::InvalidFirmware,
                         "the file " + path + " does not exist");
  if (!S_ISREG(sb.st_mode))
    return Status::error(ErrorCode::InvalidFirmware, path + " is not a file");
  if (!is_generic_binary(path))
    return Status::error(ErrorCode::InvalidFirmware,
                         "the file " + path + " is of the wrong type");
  return Status::success();
}

std::string format_bytes(uint64_t n) {
  char buf[32];
  if (n < 1024)
    std::snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)n);
  else if (n < 1024 * 1024)
    std::snprintf(buf, sizeof(buf), "%.2f KB", n / 1024.0);
  else
    std::snprintf(buf, sizeof(buf), "%.2f MB", n / (1024.0 * 1024.0));
  return buf;
}

} // namespace btflash
