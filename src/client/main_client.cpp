#include "asio_transport.hpp"
#include "device_finder.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "progress.hpp"
#include "session.hpp"
#include "util.hpp"
#include <fstream>
#include <iostream>

using namespace btflash;

static constexpr const char *kVersion = "0.1";

// Returns true when the run must stop.
static bool report(const Status &st) {
  if (st.ok())
    return false;
  if (st.severity == Severity::Advisory) {
    Logger::instance().log(LogLevel::WARN, "%s!", describe(st).c_str());
    return false;
  }
  Logger::instance().log(LogLevel::ERROR, "%s! Exiting...",
                         describe(st).c_str());
  return true;
}

static int list_mode(const CliOptions &opts) {
  Logger::instance().log(LogLevel::INFO, "Looking for devices in %s",
                         opts.dev_dir.c_str());
  auto devices = list_devices(opts.dev_dir);
  Logger::instance().log(LogLevel::INFO, "Found %zu devices", devices.size());
  for (size_t i = 0; i < devices.size(); i++)
    Logger::instance().log(LogLevel::INFO, "Device %zu => %s \t %s", i,
                           devices[i].path.c_str(), devices[i].name.c_str());
  return 0;
}

int main(int argc, char **argv) {
  CliOptions opts;
  Status st = parse_options(argc, argv, opts);
  if (!st.ok()) {
    std::cerr << usage(argv[0]) << argv[0] << ": error: " << st.detail
              << std::endl;
    return 1;
  }
  if (opts.help) {
    std::cout << usage(argv[0]);
    return 0;
  }
  if (opts.version) {
    std::cout << "btflash " << kVersion << std::endl;
    return 0;
  }
  Logger::instance().set_level(level_for_verbosity(opts.verbose));

  if (opts.list)
    return list_mode(opts);

  st = check_transfer_options(opts);
  if (!st.ok()) {
    std::cerr << usage(argv[0]) << argv[0] << ": error: " << st.detail
              << std::endl;
    return 1;
  }
  SessionConfig cfg;
  if (report(session_config_from(opts, cfg)))
    return 1;
  if (report(check_firmware_file(opts.path)))
    return 1;

  std::string target;
  st = resolve_target(opts, target);
  if (report(st))
    return 1;

  std::ifstream fw(opts.path, std::ios::binary);
  if (!fw &&
      report(Status::error(ErrorCode::IoError, "cannot open " + opts.path)))
    return 1;

  const unsigned baud = opts.baud;
  ConsoleProgress progress;
  TransferSession session(
      cfg,
      [&target, &cfg, baud](std::error_code &ec) {
        return open_transport(target, cfg.response_timeout, baud, ec);
      },
      progress);
  st = session.run(fw);
  if (report(st))
    return 1;

  const SessionMetrics &m = session.metrics();
  double secs = std::chrono::duration<double>(m.elapsed).count();
  Logger::instance().log(LogLevel::INFO, "Full size: %llu bytes (%s on wire)",
                         (unsigned long long)m.total_bytes,
                         format_bytes(m.wire_bytes).c_str());
  Logger::instance().log(LogLevel::INFO, "Loading time: %5.2f s", secs);
  if (secs > 0)
    Logger::instance().log(LogLevel::INFO, "Average speed: %5.2f KB/s",
                           m.total_bytes / secs / 1024.0);
  if (m.resends > 0)
    Logger::instance().log(LogLevel::INFO, "Resent packets: %llu",
                           (unsigned long long)m.resends);
  Logger::instance().log(LogLevel::INFO, "Firmware uploaded");
  return 0;
}
