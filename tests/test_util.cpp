#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>
#include "device_finder.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "status.hpp"
#include "util.hpp"

using namespace btflash;

namespace {

class TempDir {
public:
  TempDir() {
    char tmpl[] = "/tmp/btflash-test-XXXXXX";
    const char *p = ::mkdtemp(tmpl);
    path_ = p ? p : "";
  }
  ~TempDir() {
    for (const auto &f : files_)
      std::remove(f.c_str());
    for (auto it = dirs_.rbegin(); it != dirs_.rend(); ++it)
      ::rmdir(it->c_str());
    ::rmdir(path_.c_str());
  }
  const std::string &path() const { return path_; }
  std::string touch(const std::string &name, const std::string &body = "x") {
    std::string p = path_ + "/" + name;
    std::ofstream(p, std::ios::binary) << body;
    files_.push_back(p);
    return p;
  }
  std::string mkdir(const std::string &name) {
    std::string p = path_ + "/" + name;
    ::mkdir(p.c_str(), 0700);
    dirs_.push_back(p);
    return p;
  }

private:
  std::string path_;
  std::vector<std::string> files_;
  std::vector<std::string> dirs_;
};

} // namespace

TEST(HostPort, Parses) {
  std::string host;
  uint16_t port = 0;
  ASSERT_TRUE(parse_host_port("127.0.0.1:46080", host, port));
  EXPECT_EQ(host, "127.0.0.1");
  EXPECT_EQ(port, 46080);
  EXPECT_FALSE(parse_host_port("nohost", host, port));
  EXPECT_FALSE(parse_host_port(":80", host, port));
  EXPECT_FALSE(parse_host_port("h:0", host, port));
  EXPECT_FALSE(parse_host_port("h:70000", host, port));
  EXPECT_FALSE(parse_host_port("h:8x", host, port));
}

TEST(FirmwareFile, BinaryExtensions) {
  EXPECT_TRUE(is_generic_binary("fw.bin"));
  EXPECT_TRUE(is_generic_binary("/a/b/FW.BIN"));
  EXPECT_TRUE(is_generic_binary("lib.so"));
  EXPECT_TRUE(is_generic_binary("x.exe"));
  EXPECT_FALSE(is_generic_binary("fw.hex"));
  EXPECT_FALSE(is_generic_binary("fw.txt"));
  EXPECT_FALSE(is_generic_binary("firmware"));
  EXPECT_FALSE(is_generic_binary("dir.bin/firmware"));
}

TEST(FirmwareFile, Checks) {
  TempDir dir;
  ASSERT_FALSE(dir.path().empty());
  EXPECT_TRUE(check_firmware_file(dir.touch("fw.bin")).ok());
  EXPECT_EQ(check_firmware_file(dir.touch("fw.txt")).code,
            ErrorCode::InvalidFirmware);
  EXPECT_EQ(check_firmware_file(dir.path() + "/missing.bin").code,
            ErrorCode::InvalidFirmware);
  EXPECT_EQ(check_firmware_file(dir.mkdir("d.bin")).code,
            ErrorCode::InvalidFirmware);
}

TEST(Devices, ListsLinkDevicesSorted) {
  TempDir dir;
  dir.touch("ttyUSB1");
  dir.touch("rfcomm0");
  dir.touch("ttyACM0");
  dir.touch("tty0");
  dir.touch("rfcomm");
  auto devices = list_devices(dir.path());
  ASSERT_EQ(devices.size(), 3u);
  EXPECT_EQ(devices[0].name, "rfcomm0");
  EXPECT_EQ(devices[1].name, "ttyACM0");
  EXPECT_EQ(devices[2].name, "ttyUSB1");
  EXPECT_EQ(devices[0].path, dir.path() + "/rfcomm0");

  auto hit = find_device_by_name(devices, "ACM");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->name, "ttyACM0");
  EXPECT_FALSE(find_device_by_name(devices, "nope").has_value());
}

TEST(Devices, MissingDirectoryListsNothing) {
  EXPECT_TRUE(list_devices("/nonexistent/btflash").empty());
}

TEST(StatusText, DescribesFrameFailures) {
  Status st = Status::frame_error(ErrorCode::TransferAborted, 2, 9,
                                  FrameFailure::Exhausted);
  EXPECT_EQ(describe(st), "transfer aborted: frame 3/9 (attempts exhausted)");
  EXPECT_TRUE(st.fatal());

  Status adv = Status::advisory(ErrorCode::DeviceNotFound, "using x");
  EXPECT_FALSE(adv.ok());
  EXPECT_FALSE(adv.fatal());
  EXPECT_EQ(describe(adv), "device not found: using x");
  EXPECT_EQ(describe(Status::error(ErrorCode::HandshakeRejected)),
            "handshake rejected");
}

TEST(ResolveTarget, NameHitPicksDevice) {
  TempDir dir;
  dir.touch("rfcomm3");
  CliOptions o;
  o.dev_dir = dir.path();
  o.name = "comm3";
  std::string target;
  Status st = resolve_target(o, target);
  EXPECT_TRUE(st.ok());
  EXPECT_EQ(target, dir.path() + "/rfcomm3");

  FILE *out = std::tmpfile();
  ASSERT_NE(out, nullptr);
  Logger::instance().set_output(out);
  o.target = "10.0.0.5:4000";
  st = resolve_target(o, target);
  Logger::instance().set_output(nullptr);
  std::rewind(out);
  char buf[1024] = {0};
  std::string text(buf, std::fread(buf, 1, sizeof(buf) - 1, out));
  std::fclose(out);
  ASSERT_TRUE(st.ok());
  EXPECT_EQ(target, dir.path() + "/rfcomm3");
  EXPECT_NE(text.find("overrides target 10.0.0.5:4000"), std::string::npos);
}

TEST(ResolveTarget, NameMissFallsBackToTargetWithWarning) {
  TempDir dir;
  dir.touch("ttyUSB0");
  CliOptions o;
  o.dev_dir = dir.path();
  o.name = "esp32";
  o.target = "/dev/rfcomm0";
  std::string target;
  Status st = resolve_target(o, target);
  EXPECT_EQ(st.code, ErrorCode::DeviceNotFound);
  EXPECT_EQ(st.severity, Severity::Advisory);
  EXPECT_FALSE(st.fatal());
  EXPECT_EQ(target, "/dev/rfcomm0");
}

TEST(ResolveTarget, NameMissWithoutTargetIsFatal) {
  TempDir dir;
  CliOptions o;
  o.dev_dir = dir.path();
  o.name = "esp32";
  std::string target;
  Status st = resolve_target(o, target);
  EXPECT_EQ(st.code, ErrorCode::DeviceNotFound);
  EXPECT_TRUE(st.fatal());
  EXPECT_TRUE(target.empty());
}

TEST(ResolveTarget, TargetOnlyNeedsNoLookup) {
  CliOptions o;
  o.dev_dir = "/nonexistent/btflash";
  o.target = "host:1234";
  std::string target;
  EXPECT_TRUE(resolve_target(o, target).ok());
  EXPECT_EQ(target, "host:1234");
}

TEST(Logger, FiltersByLevelAndWritesToOutput) {
  FILE *out = std::tmpfile();
  ASSERT_NE(out, nullptr);
  int preludes = 0;
  Logger &log = Logger::instance();
  log.set_output(out);
  log.set_prelude([&preludes] { preludes++; });
  log.set_level(LogLevel::WARN);

  log.log(LogLevel::INFO, "hidden %d", 1);
  log.log(LogLevel::WARN, "frame %d of %d", 2, 9);

  log.set_prelude(nullptr);
  log.set_output(nullptr);
  log.set_level(LogLevel::INFO);

  std::rewind(out);
  char buf[256] = {0};
  size_t n = std::fread(buf, 1, sizeof(buf) - 1, out);
  std::fclose(out);
  std::string text(buf, n);
  EXPECT_EQ(preludes, 1);
  EXPECT_EQ(text.find("hidden"), std::string::npos);
  EXPECT_NE(text.find("[WARN ] frame 2 of 9"), std::string::npos);
  EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 1);
}

TEST(Logger, VerbosityMapping) {
  EXPECT_EQ(level_for_verbosity(0), LogLevel::INFO);
  EXPECT_EQ(level_for_verbosity(1), LogLevel::DEBUG);
  EXPECT_EQ(level_for_verbosity(3), LogLevel::TRACE);
}
