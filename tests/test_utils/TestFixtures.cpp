#include "TestFixtures.hpp"

#include <atomic>
#include <fstream>
#include <spdlog/sinks/ostream_sink.h>

namespace fs = std::filesystem;

namespace devinspect {
namespace test {

namespace {
std::shared_ptr<spdlog::logger>
make_stream_logger(const std::shared_ptr<std::ostringstream> &stream) {
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*stream);
  auto logger = std::make_shared<spdlog::logger>("test", sink);
  logger->set_level(spdlog::level::trace);
  return logger;
}
} // namespace

CapturingLogger::CapturingLogger()
    : stream_(std::make_shared<std::ostringstream>()),
      logger_(make_stream_logger(stream_)) {}

std::string CapturingLogger::text() const { return stream_->str(); }

void InspectorTest::SetUp() {
  static std::atomic<int> counter{0};
  const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
  temp_dir_ = fs::temp_directory_path() /
              ("device_inspector_" + std::string(info->test_suite_name()) +
               "_" + info->name() + "_" + std::to_string(counter++));
  fs::remove_all(temp_dir_);
  fs::create_directories(temp_dir_);
}

void InspectorTest::TearDown() {
  std::error_code ec;
  fs::remove_all(temp_dir_, ec);
}

DeviceDescriptor
InspectorTest::make_device(const std::string &host, const std::string &vendor,
                           std::vector<std::string> commands) const {
  DeviceDescriptor d;
  d.host = host;
  d.port = 22;
  d.username = "admin";
  d.password = "s3cret";
  d.vendor_profile = vendor;
  d.login_protocol = LoginProtocol::SSH;
  d.timeout_seconds = 30;
  d.commands = std::move(commands);
  return d;
}

std::vector<fs::path> InspectorTest::files_under(const fs::path &dir) const {
  std::vector<fs::path> files;
  if (!fs::exists(dir))
    return files;
  for (const auto &entry : fs::recursive_directory_iterator(dir)) {
    if (entry.is_regular_file())
      files.push_back(entry.path());
  }
  return files;
}

std::string InspectorTest::read_file(const fs::path &path) const {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace test
} // namespace devinspect
