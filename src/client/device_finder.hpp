#pragma once
#include <optional>
#include <string>
#include <vector>
#include "options.hpp"
#include "status.hpp"

namespace btflash {

struct DeviceInfo {
    std::string path;
    std::string name;
};

// Link devices (rfcomm*, ttyUSB*, ttyACM*) under `dev_dir`, sorted by path.
std::vector<DeviceInfo> list_devices(const std::string& dev_dir = "/dev");

std::optional<DeviceInfo> find_device_by_name(const std::vector<DeviceInfo>& devices,
                                              const std::string& needle);

// Picks the link to open: a --name hit, else --target. A name miss with a
// --target to fall back on is advisory.
Status resolve_target(const CliOptions& opts, std::string& target);

} // namespace btflash
