#include "connection/serial_port.hpp"
#include "exporter/runtime_config.hpp"
#include "utils/backoff.hpp"
#include "utils/logger.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

static exporter::ParseOutcome parse(std::vector<const char*> args, exporter::RuntimeConfig& cfg,
                                    std::string& err) {
  args.insert(args.begin(), "dsmr-exporter");
  return exporter::parse_args(static_cast<int>(args.size()), args.data(), cfg, err);
}

static void test_defaults() {
  exporter::RuntimeConfig cfg;
  std::string err;
  assert(parse({"/dev/ttyUSB0"}, cfg, err) == exporter::ParseOutcome::Run);
  assert(cfg.serial_dev == "/dev/ttyUSB0");
  assert(cfg.serial_baud == 115200);
  assert(cfg.bind_ip == "127.0.0.1");
  assert(cfg.port == 3000);
  assert(cfg.metrics_path == "/metrics");
  assert(cfg.metrics_ttl == 10s);
  assert(cfg.backoff.initial_interval == 500ms);
  assert(cfg.backoff.max_interval == 5000ms);
  assert(cfg.log_level == logger::Level::Info);
  assert(cfg.log_dir.empty());
}

static void test_all_options() {
  exporter::RuntimeConfig cfg;
  std::string err;
  const auto out = parse({"--host", "0.0.0.0", "--port", "9100", "/dev/ttyAMA0", "--baud", "9600",
                          "--log_level", "debug", "--log_dir", "/tmp/logs"},
                         cfg, err);
  assert(out == exporter::ParseOutcome::Run);
  assert(cfg.bind_ip == "0.0.0.0");
  assert(cfg.port == 9100);
  assert(cfg.serial_dev == "/dev/ttyAMA0");
  assert(cfg.serial_baud == 9600);
  assert(cfg.log_level == logger::Level::Debug);
  assert(cfg.log_dir == "/tmp/logs");
}

static void test_errors() {
  std::string err;
  {
    exporter::RuntimeConfig cfg;
    assert(parse({}, cfg, err) == exporter::ParseOutcome::Error);
    assert(err == "missing serial device path");
  }
  {
    exporter::RuntimeConfig cfg;
    assert(parse({"/dev/ttyUSB0", "--port", "70000"}, cfg, err) == exporter::ParseOutcome::Error);
    assert(parse({"/dev/ttyUSB0", "--port", "0"}, cfg, err) == exporter::ParseOutcome::Error);
    assert(parse({"/dev/ttyUSB0", "--port", "80x"}, cfg, err) == exporter::ParseOutcome::Error);
  }
  {
    exporter::RuntimeConfig cfg;
    assert(parse({"/dev/ttyUSB0", "--host", "localhost"}, cfg, err) == exporter::ParseOutcome::Error);
    assert(err.find("--host") != std::string::npos);
  }
  {
    exporter::RuntimeConfig cfg;
    assert(parse({"/dev/ttyUSB0", "--port"}, cfg, err) == exporter::ParseOutcome::Error);
    assert(err == "missing value for --port");
  }
  {
    exporter::RuntimeConfig cfg;
    assert(parse({"/dev/ttyUSB0", "--frobnicate"}, cfg, err) == exporter::ParseOutcome::Error);
    assert(parse({"/dev/ttyUSB0", "/dev/ttyUSB1"}, cfg, err) == exporter::ParseOutcome::Error);
    assert(parse({"/dev/ttyUSB0", "--log_level", "loud"}, cfg, err) == exporter::ParseOutcome::Error);
  }
}

// Only rates the serial port can actually configure are accepted.
static void test_unsupported_baud_rejected() {
  std::string err;
  {
    exporter::RuntimeConfig cfg;
    assert(parse({"/dev/ttyUSB0", "--baud", "12345"}, cfg, err) == exporter::ParseOutcome::Error);
    assert(err.find("--baud") != std::string::npos);
    assert(cfg.serial_baud == 115200);
  }
  {
    exporter::RuntimeConfig cfg;
    assert(parse({"/dev/ttyUSB0", "--baud", "230400"}, cfg, err) == exporter::ParseOutcome::Run);
    assert(cfg.serial_baud == 230400);
  }
  assert(connection::is_supported_baud(115200));
  assert(!connection::is_supported_baud(0));
  assert(!connection::is_supported_baud(14400));

  connection::SerialPort port;
  assert(!port.open("/dev/null", 12345));
  assert(!port.is_open());
}

static void test_help_and_version() {
  exporter::RuntimeConfig cfg;
  std::string err;
  assert(parse({"--help"}, cfg, err) == exporter::ParseOutcome::Help);
  assert(parse({"/dev/ttyUSB0", "-V"}, cfg, err) == exporter::ParseOutcome::Version);
}

static void test_log_level_names() {
  logger::Level l{};
  assert(logger::parse_level("warn", l) && l == logger::Level::Warn);
  assert(logger::parse_level("error", l) && l == logger::Level::Error);
  assert(!logger::parse_level("verbose", l));
}

static void test_backoff_sequence() {
  utils::ExponentialBackoff bo{utils::BackoffParams{}};
  assert(bo.next_delay() == 500ms);
  assert(bo.next_delay() == 750ms);
  assert(bo.next_delay() == 1125ms);

  std::chrono::milliseconds last{0};
  for (int i = 0; i < 20; i++) last = bo.next_delay();
  assert(last == 5000ms);
  assert(bo.attempts() == 23);

  bo.reset();
  assert(bo.attempts() == 0);
  assert(bo.next_delay() == 500ms);
}

int main() {
  test_defaults();
  test_all_options();
  test_errors();
  test_unsupported_baud_rejected();
  test_help_and_version();
  test_log_level_names();
  test_backoff_sequence();
  return 0;
}
