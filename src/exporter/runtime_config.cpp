#include "exporter/runtime_config.hpp"

#include "connection/serial_port.hpp"

#include <arpa/inet.h>

#include <cstdio>
#include <stdexcept>
#include <string_view>

namespace exporter {

namespace {

bool parse_port(std::string_view s, uint16_t& out) {
  try {
    size_t used = 0;
    const int v = std::stoi(std::string(s), &used);
    if (used != s.size() || v < 1 || v > 65535) return false;
    out = static_cast<uint16_t>(v);
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

bool parse_baud(std::string_view s, int& out) {
  try {
    size_t used = 0;
    const int v = std::stoi(std::string(s), &used);
    if (used != s.size() || !connection::is_supported_baud(v)) return false;
    out = v;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

bool is_ipv4(std::string_view s) {
  in_addr addr{};
  return inet_pton(AF_INET, std::string(s).c_str(), &addr) == 1;
}

} // namespace

void print_help(const char* argv0) {
  std::printf(
    "Usage: %s <serial_device_path> [options]\n"
    "  --host 127.0.0.1         bind address for /metrics\n"
    "  --port 3000\n"
    "  --baud 115200            9600|19200|38400|57600|115200|230400\n"
    "  --log_level debug|info|warn|error\n"
    "  --log_dir ./logs         also write log files there\n"
    "  --version\n"
    "  --help\n",
    argv0
  );
}

void configure_logging(const RuntimeConfig& cfg) {
  logger::set_print_level(cfg.log_level);
  logger::set_log_level(cfg.log_level);
  if (!cfg.log_dir.empty()) logger::set_logs_dir(cfg.log_dir);
}

ParseOutcome parse_args(int argc, const char* const* argv, RuntimeConfig& cfg, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];

    std::string_view value;
    auto need = [&](std::string_view name) -> bool {
      if (i + 1 >= argc) {
        error = "missing value for " + std::string(name);
        return false;
      }
      value = argv[++i];
      return true;
    };

    if (a == "--help" || a == "-h") return ParseOutcome::Help;
    if (a == "--version" || a == "-V") return ParseOutcome::Version;

    if (a == "--host") {
      if (!need(a)) return ParseOutcome::Error;
      if (!is_ipv4(value)) {
        error = "invalid --host '" + std::string(value) + "' (expected IPv4 address)";
        return ParseOutcome::Error;
      }
      cfg.bind_ip = std::string(value);
    }
    else if (a == "--port") {
      if (!need(a)) return ParseOutcome::Error;
      if (!parse_port(value, cfg.port)) {
        error = "invalid --port '" + std::string(value) + "'";
        return ParseOutcome::Error;
      }
    }
    else if (a == "--baud") {
      if (!need(a)) return ParseOutcome::Error;
      if (!parse_baud(value, cfg.serial_baud)) {
        error = "invalid --baud '" + std::string(value) + "'";
        return ParseOutcome::Error;
      }
    }
    else if (a == "--log_level") {
      if (!need(a)) return ParseOutcome::Error;
      if (!logger::parse_level(value, cfg.log_level)) {
        error = "invalid --log_level '" + std::string(value) + "'";
        return ParseOutcome::Error;
      }
    }
    else if (a == "--log_dir") {
      if (!need(a)) return ParseOutcome::Error;
      cfg.log_dir = std::string(value);
    }
    else if (a.size() > 1 && a.front() == '-') {
      error = "unknown option " + std::string(a);
      return ParseOutcome::Error;
    }
    else if (cfg.serial_dev.empty()) {
      cfg.serial_dev = std::string(a);
    }
    else {
      error = "unexpected argument " + std::string(a);
      return ParseOutcome::Error;
    }
  }

  if (cfg.serial_dev.empty()) {
    error = "missing serial device path";
    return ParseOutcome::Error;
  }
  return ParseOutcome::Run;
}

} // namespace exporter
