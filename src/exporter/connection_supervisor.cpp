#include "exporter/connection_supervisor.hpp"

#include "dsmr/telegram_decoder.hpp"
#include "utils/logger.hpp"

#include <array>

namespace exporter {

namespace {
constexpr size_t kReadChunk = 512;

void log_snapshot(const dsmr::Snapshot& s) {
  auto line = logger::debug();
  line << "[SERIAL] Telegram";
  if (s.datetime) line << " at " << *s.datetime;
  if (s.power_delivered) line << " delivering " << *s.power_delivered << " kW";
  if (s.power_received) line << " receiving " << *s.power_received << " kW";
  if (s.message && !s.message->empty()) line << " message=" << *s.message;
  line << "\n";
}
} // namespace

ConnectionSupervisor::ConnectionSupervisor(connection::ISerialPort& port,
                                           const dsmr::ITelegramParser& parser,
                                           metrics::MetricStore& store,
                                           StopFlag& stop,
                                           SupervisorParams p)
  : port_(port), parser_(parser), store_(store), stop_(stop), p_(std::move(p)) {
  sleeper_ = [this](std::chrono::milliseconds d) { return stop_.wait_for(d); };
}

void ConnectionSupervisor::run() {
  utils::ExponentialBackoff backoff(p_.backoff);

  logger::info() << "[SERIAL] Supervising " << p_.device << "@" << p_.baud << "\n";

  while (!stop_.stop_requested()) {
    logger::info() << "[SERIAL] Opening serial port " << p_.device << "\n";

    if (port_.open(p_.device, p_.baud)) {
      stats_.opens.fetch_add(1, std::memory_order_relaxed);
      backoff.reset();
      logger::info() << "[SERIAL] Port open\n";

      read_loop();
      port_.close();
      if (stop_.stop_requested()) break;
    } else {
      stats_.open_failures.fetch_add(1, std::memory_order_relaxed);
      logger::warn() << "[SERIAL] Failed to open " << p_.device << "@" << p_.baud << "\n";
    }

    const auto d = backoff.next_delay();
    logger::warn() << "[SERIAL] Retrying in " << d.count() << " ms (attempt "
                   << backoff.attempts() << ")\n";
    if (sleeper_(d)) break;
  }

  port_.close();
  logger::info() << "[SERIAL] Stopped after " << stats_.telegrams.load() << " telegrams ("
                 << stats_.malformed.load() << " malformed, "
                 << stats_.protocol_violations.load() << " oversized, "
                 << stats_.opens.load() << " opens)\n";
}

void ConnectionSupervisor::read_loop() {
  // Buffer state lives for exactly one connection.
  dsmr::TelegramDecoder decoder(parser_);
  std::array<uint8_t, kReadChunk> buf{};
  dsmr::Snapshot snap;
  std::string err;
  uint64_t reported_discarded = 0;

  while (!stop_.stop_requested()) {
    size_t n = 0;
    if (!port_.read_some(buf, n, p_.read_timeout)) {
      stats_.stream_ends.fetch_add(1, std::memory_order_relaxed);
      logger::warn() << "[SERIAL] Serial read stream ended\n";
      return;
    }
    if (n == 0) continue;

    decoder.push_bytes(buf.data(), n);

    for (;;) {
      const auto st = decoder.decode(snap, err);
      if (st == dsmr::DecodeStatus::NeedMoreData) break;

      if (st == dsmr::DecodeStatus::Telegram) {
        stats_.telegrams.fetch_add(1, std::memory_order_relaxed);
        log_snapshot(snap);
        store_.update(snap);
        continue;
      }

      if (st == dsmr::DecodeStatus::Malformed) {
        stats_.malformed.fetch_add(1, std::memory_order_relaxed);
        logger::warn() << "[SERIAL] Error reading frame: " << err << "\n";
        continue;
      }

      stats_.protocol_violations.fetch_add(1, std::memory_order_relaxed);
      logger::error() << "[SERIAL] " << err << ", reconnecting\n";
      return;
    }

    if (decoder.discarded_bytes() != reported_discarded) {
      logger::debug() << "[SERIAL] Skipped " << (decoder.discarded_bytes() - reported_discarded)
                      << " bytes before telegram start\n";
      reported_discarded = decoder.discarded_bytes();
    }
  }
}

} // namespace exporter
