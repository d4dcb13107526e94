#include "options.hpp"
#include "util.hpp"

namespace btflash {

Status parse_options(int argc, const char *const *argv, CliOptions &out) {
  CliOptions o;
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    std::string value;
    auto next = [&](int &i) -> bool {
      if (i + 1 >= argc)
        return false;
      value = argv[++i];
      return true;
    };
    auto number = [&](uint32_t &dst) -> Status {
      if (!next(i))
        return Status::error(ErrorCode::UsageError, "missing value for " + a);
      if (!parse_uint(value, dst))
        return Status::error(ErrorCode::UsageError,
                             "invalid number for " + a + ": " + value);
      return Status::success();
    };
    Status st;
    if (a == "-a" || a == "--attempts")
      st = number(o.attempts);
    else if (a == "-p" || a == "--packsize")
      st = number(o.packsize);
    else if (a == "-T" || a == "--timeout")
      st = number(o.timeout_ms);
    else if (a == "-b" || a == "--baud")
      st = number(o.baud);
    else if (a == "-v" || a == "--verbose")
      o.verbose++;
    else if (a.size() > 2 && a[0] == '-' &&
             a.find_first_not_of('v', 1) == std::string::npos)
      o.verbose += (int)a.size() - 1;
    else if (a == "-l" || a == "--list")
      o.list = true;
    else if (a == "-h" || a == "--help")
      o.help = true;
    else if (a == "--version")
      o.version = true;
    else if (a == "-t" || a == "--target" || a == "-n" || a == "--name" ||
             a == "--dev-dir") {
      if (!next(i))
        return Status::error(ErrorCode::UsageError, "missing value for " + a);
      if (a == "-t" || a == "--target")
        o.target = value;
      else if (a == "-n" || a == "--name")
        o.name = value;
      else
        o.dev_dir = value;
    } else if (!a.empty() && a[0] == '-')
      return Status::error(ErrorCode::UsageError, "unknown option " + a);
    else if (o.path.empty())
      o.path = a;
    else
      return Status::error(ErrorCode::UsageError, "unexpected argument " + a);
    if (!st.ok())
      return st;
  }
  out = o;
  return Status::success();
}

Status check_transfer_options(const CliOptions &opts) {
  if (opts.target.empty() && opts.name.empty())
    return Status::error(ErrorCode::UsageError,
                         "target address or name must be specified");
  if (opts.path.empty())
    return Status::error(ErrorCode::UsageError,
                         "path to firmware binary file is required");
  if (opts.baud == 0)
    return Status::error(ErrorCode::ConfigurationError,
                         "baud rate must be positive");
  return Status::success();
}

Status session_config_from(const CliOptions &opts, SessionConfig &out) {
  return make_session_config(opts.attempts, opts.packsize,
                             std::chrono::milliseconds(opts.timeout_ms), out);
}

std::string usage(const char *prog) {
  std::string p = prog ? prog : "btflash";
  return "usage: " + p +
         " [-h] [--version] [-a N] [-p N] [-T MS] [-b BAUD] [-v] [-l]\n"
         "       [-t TARGET] [-n NAME] [--dev-dir DIR] [PATH]\n"
         "\n"
         "Uploads firmware to a device over a serial or RFCOMM link.\n"
         "\n"
         "  -a, --attempts N   attempts to resend a packet (default 3)\n"
         "  -p, --packsize N   packet size in bytes, 7..512 (default 512)\n"
         "  -T, --timeout MS   response timeout in ms (default 1000)\n"
         "  -b, --baud N       serial baud rate (default 115200)\n"
         "  -v, --verbose      more output, repeat for more\n"
         "  -l, --list         print list of available devices\n"
         "  -t, --target ADDR  device path or host:port\n"
         "  -n, --name NAME    pick the device whose name contains NAME\n"
         "      --dev-dir DIR  where to look for devices (default /dev)\n"
         "  PATH               firmware binary file\n";
}

} // namespace btflash
