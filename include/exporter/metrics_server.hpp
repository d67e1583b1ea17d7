#pragma once
#include "exporter/stop_flag.hpp"
#include "metrics/metric_store.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace exporter {

struct ServerParams {
  std::string bind_ip{"127.0.0.1"};
  uint16_t port{3000}; // 0: any free port, see MetricsServer::port()
  std::string metrics_path{"/metrics"};
  std::chrono::seconds ttl{metrics::kMetricsTtl};
  std::chrono::milliseconds client_timeout{2000};
};

/**
 * @brief Scrape endpoint.
 *
 * Serves GET <metrics_path> from the shared MetricStore on an httplib::Server. When the
 * last telegram is older than the TTL the body is empty (200), so Prometheus sees no
 * samples instead of stale ones. Requests are handled on httplib's worker pool, one
 * request per connection. Raising the StopFlag stops the listener; requests in flight
 * are completed before run() returns.
 */
class MetricsServer {
public:
  // Renders the exposition body. May throw; the scrape then gets a 500.
  using Encoder = std::function<std::string()>;

  MetricsServer(const metrics::MetricStore& store, StopFlag& stop, ServerParams p);

  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  // Bind the listening socket. Must succeed before run().
  [[nodiscard]] bool start();

  // Serve until the StopFlag is raised.
  void run();
  void operator()() { run(); }

  // Bound port, valid after start().
  uint16_t port() const noexcept { return bound_port_; }

  void set_encoder(Encoder e) { encoder_ = std::move(e); }

  // GET <metrics_path> handler body.
  void serve_metrics(httplib::Response& res,
                     metrics::Clock::time_point now = metrics::Clock::now()) const;

  uint64_t requests_served() const noexcept { return served_.load(); }

private:
  void install_routes();

  const metrics::MetricStore& store_;
  StopFlag& stop_;
  ServerParams p_;
  Encoder encoder_;
  httplib::Server http_;
  uint16_t bound_port_{0};
  std::atomic<uint64_t> served_{0};
};

} // namespace exporter
