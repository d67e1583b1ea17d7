#include "exporter/runtime_config.hpp"
#include "utils/logger.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

static std::string read_all_logs(const std::filesystem::path& dir) {
  std::string all;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    std::ifstream in(entry.path());
    std::stringstream ss;
    ss << in.rdbuf();
    all += ss.str();
  }
  return all;
}

// --log_level also applies to the file sink.
static void test_file_sink_honours_level() {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("dsmr-exporter-logtest-" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);

  exporter::RuntimeConfig cfg;
  cfg.log_level = logger::Level::Info;
  cfg.log_dir = dir.string();
  exporter::configure_logging(cfg);

  logger::debug() << "[TEST] per-telegram detail\n";
  logger::info() << "[TEST] port open\n";
  logger::warn() << "[TEST] retrying\n";
  logger::close_logger();

  const std::string text = read_all_logs(dir);
  assert(text.find("per-telegram detail") == std::string::npos);
  assert(text.find("port open") != std::string::npos);
  assert(text.find("[WARN]") != std::string::npos);

  std::filesystem::remove_all(dir);
}

int main() {
  test_file_sink_honours_level();
  return 0;
}
