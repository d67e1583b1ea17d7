#include "connection/serial_port.hpp"
#include "dsmr/telegram_parser.hpp"
#include "exporter/connection_supervisor.hpp"
#include "exporter/metrics_server.hpp"
#include "exporter/runtime_config.hpp"
#include "exporter/stop_flag.hpp"
#include "metrics/metric_store.hpp"

#include "utils/logger.hpp"
#include "utils/signal_handler.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <future>
#include <string>
#include <thread>

int main(int argc, char** argv) {
  exporter::RuntimeConfig cfg;
  std::string err;

  switch (exporter::parse_args(argc, argv, cfg, err)) {
    case exporter::ParseOutcome::Help:
      exporter::print_help(argv[0]);
      return 0;
    case exporter::ParseOutcome::Version:
      std::printf("dsmr-exporter %s\n", exporter::kVersion);
      return 0;
    case exporter::ParseOutcome::Error:
      logger::error() << "[MAIN] " << err << "\n";
      exporter::print_help(argv[0]);
      return 2;
    case exporter::ParseOutcome::Run:
      break;
  }

  exporter::configure_logging(cfg);

  exporter::StopFlag stop;
  utils::SignalHandler sig(stop);

  metrics::MetricStore store;
  dsmr::Dsmr5Parser parser;
  connection::SerialPort port;

  exporter::ServerParams sp;
  sp.bind_ip = cfg.bind_ip;
  sp.port = cfg.port;
  sp.metrics_path = cfg.metrics_path;
  sp.ttl = cfg.metrics_ttl;
  exporter::MetricsServer server(store, stop, sp);
  if (!server.start()) {
    logger::close_logger();
    return 1;
  }

  exporter::SupervisorParams rp;
  rp.device = cfg.serial_dev;
  rp.baud = cfg.serial_baud;
  rp.backoff = cfg.backoff;
  exporter::ConnectionSupervisor supervisor(port, parser, store, stop, rp);

  logger::info() << "[MAIN] dsmr-exporter " << exporter::kVersion << " starting\n";

  std::thread t_http(std::ref(server));

  // The reader is abandoned on shutdown; only wait a bounded time for it.
  std::promise<void> reader_done;
  auto reader_finished = reader_done.get_future();
  std::thread t_serial([&supervisor, &reader_done] {
    supervisor.run();
    reader_done.set_value();
  });

  while (!stop.stop_requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  stop.request_stop_and_notify();

  const int signo = utils::SignalHandler::last_signal();
  logger::info() << "[MAIN] Received signal " << signo << ", stopping\n";

  if (t_http.joinable()) t_http.join();

  if (reader_finished.wait_for(cfg.shutdown_grace) == std::future_status::ready) {
    t_serial.join();
  } else {
    logger::warn() << "[MAIN] Serial reader did not stop within "
                   << cfg.shutdown_grace.count() << " ms, exiting anyway\n";
    logger::close_logger();
    // The reader still references objects on this stack.
    std::_Exit(0);
  }

  logger::info() << "[MAIN] Shutdown complete.\n";
  logger::close_logger();
  return 0;
}
