#include "exporter/metrics_server.hpp"

#include "utils/logger.hpp"

#include <exception>
#include <thread>

namespace exporter {

namespace {
constexpr auto kStopPoll = std::chrono::milliseconds(200);
constexpr const char* kExpositionType = "text/plain; version=0.0.4; charset=utf-8";
constexpr const char* kTextType = "text/plain; charset=utf-8";

void method_not_allowed(const httplib::Request&, httplib::Response& res) {
  res.status = 405;
  res.set_header("Allow", "GET, HEAD");
}
} // namespace

MetricsServer::MetricsServer(const metrics::MetricStore& store, StopFlag& stop, ServerParams p)
  : store_(store), stop_(stop), p_(std::move(p)) {
  encoder_ = [this] { return store_.encode(); };
  install_routes();
}

void MetricsServer::install_routes() {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(p_.client_timeout);
  const auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(p_.client_timeout - secs);
  http_.set_read_timeout(secs.count(), usecs.count());
  http_.set_write_timeout(secs.count(), usecs.count());
  http_.set_keep_alive_max_count(1);

  http_.Get(p_.metrics_path, [this](const httplib::Request&, httplib::Response& res) {
    serve_metrics(res);
  });
  http_.Post(p_.metrics_path, method_not_allowed);
  http_.Put(p_.metrics_path, method_not_allowed);
  http_.Patch(p_.metrics_path, method_not_allowed);
  http_.Delete(p_.metrics_path, method_not_allowed);
  http_.Options(p_.metrics_path, method_not_allowed);

  http_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", kTextType);
  });

  http_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
    served_.fetch_add(1, std::memory_order_relaxed);
    logger::debug() << "[HTTP] " << req.method << " " << req.path << " -> " << res.status << "\n";
  });
}

bool MetricsServer::start() {
  if (p_.port == 0) {
    const int port = http_.bind_to_any_port(p_.bind_ip);
    if (port > 0) bound_port_ = static_cast<uint16_t>(port);
  } else if (http_.bind_to_port(p_.bind_ip, p_.port)) {
    bound_port_ = p_.port;
  }

  if (bound_port_ == 0) {
    logger::error() << "[HTTP] Failed to bind " << p_.bind_ip << ":" << p_.port << "\n";
    return false;
  }
  logger::info() << "[HTTP] Listening on http://" << p_.bind_ip << ":" << bound_port_
                 << p_.metrics_path << "\n";
  return true;
}

void MetricsServer::serve_metrics(httplib::Response& res, metrics::Clock::time_point now) const {
  res.status = 200;

  // No telegram within the TTL: answer, but with nothing in it.
  if (!store_.is_fresh(now, p_.ttl)) {
    res.set_content("", kExpositionType);
    return;
  }

  try {
    res.set_content(encoder_(), kExpositionType);
  } catch (const std::exception& e) {
    logger::error() << "[HTTP] Error while encoding metrics: " << e.what() << "\n";
    res.status = 500;
    res.set_content("", kTextType);
  }
}

void MetricsServer::run() {
  std::atomic<bool> listen_returned{false};

  // httplib blocks in listen; stop() has to come from another thread.
  std::thread watcher([this, &listen_returned] {
    while (!stop_.wait_for(kStopPoll)) {}
    while (!listen_returned.load()) {
      if (http_.is_running()) {
        http_.stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  });

  const bool ok = http_.listen_after_bind();
  listen_returned.store(true);
  if (!ok && !stop_.stop_requested()) {
    logger::error() << "[HTTP] Listener failed, shutting down\n";
    stop_.request_stop_and_notify();
  }
  watcher.join();

  logger::info() << "[HTTP] Server stopped (" << served_.load() << " requests served)\n";
}

} // namespace exporter
