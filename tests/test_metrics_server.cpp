#include "dsmr/telegram_parser.hpp"
#include "exporter/metrics_server.hpp"
#include "exporter/stop_flag.hpp"
#include "metrics/metric_store.hpp"
#include "telegrams.hpp"

#include <httplib.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static void feed(metrics::MetricStore& store, metrics::Clock::time_point at) {
  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;
  const bool ok = parser.parse(tests::as_bytes(tests::kFullTelegram), s, err);
  assert(ok);
  store.update(s, at);
}

static void test_empty_body_before_first_telegram() {
  metrics::MetricStore store;
  exporter::StopFlag stop;
  exporter::MetricsServer server(store, stop, exporter::ServerParams{});

  httplib::Response res;
  server.serve_metrics(res);
  assert(res.status == 200);
  assert(res.body.empty());
  assert(res.get_header_value("Content-Type").find("version=0.0.4") != std::string::npos);
}

static void test_fresh_and_stale() {
  metrics::MetricStore store;
  exporter::StopFlag stop;
  exporter::MetricsServer server(store, stop, exporter::ServerParams{});

  const auto t0 = metrics::Clock::now();
  feed(store, t0);

  httplib::Response fresh;
  server.serve_metrics(fresh, t0 + 1s);
  assert(fresh.status == 200);
  assert(fresh.body.find("power_delivered_watts 119") != std::string::npos);
  assert(fresh.body.find("gas_delivered_cubic_meters_total") != std::string::npos);

  httplib::Response stale;
  server.serve_metrics(stale, t0 + 11s);
  assert(stale.status == 200);
  assert(stale.body.empty());

  // A new telegram makes the data visible again.
  feed(store, t0 + 20s);
  httplib::Response again;
  server.serve_metrics(again, t0 + 21s);
  assert(!again.body.empty());
}

static void test_encoding_failure_is_500() {
  metrics::MetricStore store;
  exporter::StopFlag stop;
  exporter::MetricsServer server(store, stop, exporter::ServerParams{});
  feed(store, metrics::Clock::now());

  bool fail = true;
  server.set_encoder([&] {
    if (fail) throw std::runtime_error("serializer out of memory");
    return store.encode();
  });

  httplib::Response broken;
  server.serve_metrics(broken);
  assert(broken.status == 500);
  assert(broken.body.empty());

  // One failed encode does not affect later scrapes.
  fail = false;
  httplib::Response ok;
  server.serve_metrics(ok);
  assert(ok.status == 200);
  assert(ok.body.find("energy_tariff") != std::string::npos);
}

namespace {

// Server on an ephemeral loopback port, running on its own thread.
struct LiveServer {
  metrics::MetricStore store;
  exporter::StopFlag stop;
  exporter::MetricsServer server;
  std::thread thread;

  explicit LiveServer(exporter::ServerParams p) : server(store, stop, std::move(p)) {}

  bool start() {
    if (!server.start()) return false;
    thread = std::thread(std::ref(server));
    return true;
  }

  ~LiveServer() {
    stop.request_stop_and_notify();
    if (thread.joinable()) thread.join();
  }
};

exporter::ServerParams loopback_params() {
  exporter::ServerParams p;
  p.bind_ip = "127.0.0.1";
  p.port = 0;
  return p;
}

} // namespace

static void test_loopback_routes() {
  LiveServer live(loopback_params());
  const bool started = live.start();
  assert(started);
  assert(live.server.port() != 0);
  feed(live.store, metrics::Clock::now());

  httplib::Client cli("127.0.0.1", live.server.port());
  cli.set_connection_timeout(2, 0);
  cli.set_read_timeout(5, 0);

  auto ok = cli.Get("/metrics");
  assert(ok);
  assert(ok->status == 200);
  assert(ok->body.find("energy_delivered_joules_total{tariff=\"1\"}") != std::string::npos);
  assert(ok->get_header_value("Content-Type").find("text/plain") == 0);

  auto with_query = cli.Get("/metrics?debug=1");
  assert(with_query && with_query->status == 200);

  auto missing = cli.Get("/nope");
  assert(missing);
  assert(missing->status == 404);
  assert(missing->body == "not found");

  auto post = cli.Post("/metrics", "x", "text/plain");
  assert(post);
  assert(post->status == 405);

  live.stop.request_stop_and_notify();
  live.thread.join();
  assert(live.server.requests_served() == 4);
}

// A connection that never sends a request must not hold up other scrapes.
static void test_idle_client_does_not_block_scrapes() {
  exporter::ServerParams p = loopback_params();
  p.client_timeout = 2000ms;
  LiveServer live(p);
  const bool started = live.start();
  assert(started);
  feed(live.store, metrics::Clock::now());

  const int idle = ::socket(AF_INET, SOCK_STREAM, 0);
  assert(idle >= 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(live.server.port());
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  const int rc = ::connect(idle, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  assert(rc == 0);
  std::this_thread::sleep_for(50ms); // let the server pick it up

  httplib::Client cli("127.0.0.1", live.server.port());
  const auto t0 = std::chrono::steady_clock::now();
  auto res = cli.Get("/metrics");
  const auto took = std::chrono::steady_clock::now() - t0;

  assert(res && res->status == 200);
  assert(took < 1000ms);

  ::close(idle);
}

static void test_stop_flag_stops_listener() {
  LiveServer live(loopback_params());
  const bool started = live.start();
  assert(started);

  const auto t0 = std::chrono::steady_clock::now();
  live.stop.request_stop_and_notify();
  live.thread.join();
  assert(std::chrono::steady_clock::now() - t0 < 3s);
}

int main() {
  test_empty_body_before_first_telegram();
  test_fresh_and_stale();
  test_encoding_failure_is_500();
  test_loopback_routes();
  test_idle_client_does_not_block_scrapes();
  test_stop_flag_stops_listener();
  return 0;
}
