#include "device_finder.hpp"
#include "logging.hpp"
#include <algorithm>
#include <filesystem>

namespace btflash {

namespace fs = std::filesystem;

static bool is_link_device(const std::string &name) {
  static const char *const kPrefixes[] = {"rfcomm", "ttyUSB", "ttyACM"};
  for (const char *p : kPrefixes) {
    std::string prefix(p);
    if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0)
      return true;
  }
  return false;
}

std::vector<DeviceInfo> list_devices(const std::string &dev_dir) {
  std::vector<DeviceInfo> out;
  std::error_code ec;
  fs::directory_iterator it(dev_dir, ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "cannot scan %s: %s",
                           dev_dir.c_str(), ec.message().c_str());
    return out;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      Logger::instance().log(LogLevel::WARN, "scan of %s stopped: %s",
                             dev_dir.c_str(), ec.message().c_str());
      break;
    }
    std::string name = it->path().filename().string();
    if (is_link_device(name))
      out.push_back(DeviceInfo{it->path().string(), name});
  }
  std::sort(out.begin(), out.end(),
            [](const DeviceInfo &a, const DeviceInfo &b) {
              return a.path < b.path;
            });
  return out;
}

std::optional<DeviceInfo>
find_device_by_name(const std::vector<DeviceInfo> &devices,
                    const std::string &needle) {
  for (const auto &d : devices)
    if (d.name.find(needle) != std::string::npos)
      return d;
  return std::nullopt;
}

Status resolve_target(const CliOptions &opts, std::string &target) {
  target = opts.target;
  if (opts.name.empty())
    return Status::success();
  Logger::instance().log(LogLevel::INFO, "Finding device with name '%s'",
                         opts.name.c_str());
  auto dev = find_device_by_name(list_devices(opts.dev_dir), opts.name);
  if (dev) {
    if (!target.empty() && target != dev->path)
      Logger::instance().log(LogLevel::INFO, "Device '%s' overrides target %s",
                             dev->name.c_str(), target.c_str());
    target = dev->path;
    Logger::instance().log(LogLevel::INFO, "Device: %s", target.c_str());
    return Status::success();
  }
  if (!target.empty())
    return Status::advisory(ErrorCode::DeviceNotFound,
                            "no device named '" + opts.name + "', using " +
                                target);
  return Status::error(ErrorCode::DeviceNotFound,
                       "no device named '" + opts.name + "'");
}

} // namespace btflash
