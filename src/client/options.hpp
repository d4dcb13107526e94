#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "protocol.hpp"
#include "status.hpp"

namespace btflash {

struct CliOptions {
    uint32_t attempts{kDefaultAttempts};
    uint32_t packsize{kDefaultPacketSize};
    uint32_t timeout_ms{(uint32_t)kDefaultResponseTimeout.count()};
    uint32_t baud{115200};
    int verbose{0};
    bool list{false};
    bool help{false};
    bool version{false};
    std::string target;
    std::string name;
    std::string dev_dir{"/dev"};
    std::string path;
};

// Syntax only; ranges are checked by make_session_config.
Status parse_options(int argc, const char* const* argv, CliOptions& out);
// Cross-field rules for a transfer run (target and firmware path present).
Status check_transfer_options(const CliOptions& opts);
Status session_config_from(const CliOptions& opts, SessionConfig& out);

std::string usage(const char* prog);

} // namespace btflash
