#pragma once
#include "connection/serial_port.hpp"
#include "dsmr/telegram_parser.hpp"
#include "exporter/stop_flag.hpp"
#include "metrics/metric_store.hpp"
#include "utils/backoff.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace exporter {

struct SupervisorParams {
  std::string device;
  int baud{115200};
  utils::BackoffParams backoff{};
  std::chrono::milliseconds read_timeout{200}; // how often the stop flag is checked while idle
};

struct SupervisorStats {
  std::atomic<uint64_t> opens{0};
  std::atomic<uint64_t> open_failures{0};
  std::atomic<uint64_t> telegrams{0};
  std::atomic<uint64_t> malformed{0};
  std::atomic<uint64_t> protocol_violations{0};
  std::atomic<uint64_t> stream_ends{0};
};

/**
 * @brief Owns the open / read / reconnect cycle of the P1 serial port.
 *
 * Opening is retried with exponential backoff for as long as it takes. Once open, bytes
 * are fed through a fresh TelegramDecoder and every decoded snapshot is applied to the
 * MetricStore in order. A malformed telegram is only logged; an oversized frame or the
 * stream ending closes the port and starts over. The StopFlag is the only way out.
 *
 * Runs on its own thread: std::thread t(std::ref(supervisor));
 */
class ConnectionSupervisor {
public:
  // Waits for a backoff delay. Returns true if the wait was cut short by a stop request.
  using Sleeper = std::function<bool(std::chrono::milliseconds)>;

  ConnectionSupervisor(connection::ISerialPort& port,
                       const dsmr::ITelegramParser& parser,
                       metrics::MetricStore& store,
                       StopFlag& stop,
                       SupervisorParams p);

  ConnectionSupervisor(const ConnectionSupervisor&) = delete;
  ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

  void run();
  void operator()() { run(); }

  void set_sleeper(Sleeper s) { sleeper_ = std::move(s); }

  const SupervisorStats& stats() const noexcept { return stats_; }

private:
  // Returns when the connection has to be dropped or a stop was requested.
  void read_loop();

  connection::ISerialPort& port_;
  const dsmr::ITelegramParser& parser_;
  metrics::MetricStore& store_;
  StopFlag& stop_;
  SupervisorParams p_;
  Sleeper sleeper_;
  SupervisorStats stats_;
};

} // namespace exporter
