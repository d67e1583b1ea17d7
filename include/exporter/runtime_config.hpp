#pragma once
#include "utils/backoff.hpp"
#include "utils/logger.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace exporter {

inline constexpr const char* kVersion = "0.3.0";

struct RuntimeConfig {
  // Serial (P1 port)
  std::string serial_dev;          // required, positional
  int serial_baud{115200};

  // HTTP
  std::string bind_ip{"127.0.0.1"};
  uint16_t port{3000};
  std::string metrics_path{"/metrics"};
  std::chrono::seconds metrics_ttl{10};

  // Reconnect
  utils::BackoffParams backoff{};
  std::chrono::milliseconds shutdown_grace{3000};

  // Logging
  logger::Level log_level{logger::Level::Info};
  std::string log_dir; // empty: console only
};

enum class ParseOutcome {
  Run,
  Help,
  Version,
  Error
};

/**
 * @brief Fill @p cfg from the command line.
 *
 *   dsmr-exporter <serial_device_path> [--host 127.0.0.1] [--port 3000] [--baud 115200]
 *                 [--log_level info] [--log_dir DIR]
 *
 * On Error, @p error holds a one-line reason.
 */
ParseOutcome parse_args(int argc, const char* const* argv, RuntimeConfig& cfg, std::string& error);

void print_help(const char* argv0);

// Applies log_level to both the console and the file sink, and enables the file sink
// when log_dir is set.
void configure_logging(const RuntimeConfig& cfg);

} // namespace exporter
