#pragma once
#include "dsmr/snapshot.hpp"

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/metric_family.h>
#include <prometheus/registry.h>

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace metrics {

using Clock = std::chrono::steady_clock;

// Scrapes older than this after the last telegram get an empty body.
constexpr std::chrono::seconds kMetricsTtl{10};

constexpr double kJoulesPerKwh = 3'600'000.0;
constexpr double kWattsPerKw = 1000.0;

/**
 * @brief Owns every exported instrument and folds telegram snapshots into them.
 *
 * The meter reports absolute values. Counters are moved to the reported value by
 * incrementing with the difference to what they currently hold, so an unchanged
 * report is a no-op. A report below the held value leaves the counter where it is
 * (counters never go down) and is logged.
 *
 * One writer (the serial reader) and any number of readers (scrapes). update() takes
 * the lock exclusively, the read side shares it, so a scrape always sees whole
 * telegrams.
 */
class MetricStore {
public:
  MetricStore();

  MetricStore(const MetricStore&) = delete;
  MetricStore& operator=(const MetricStore&) = delete;

  void update(const dsmr::Snapshot& snap, Clock::time_point now = Clock::now());

  [[nodiscard]] std::optional<Clock::time_point> last_update() const;

  // false before the first update as well
  [[nodiscard]] bool is_fresh(Clock::time_point now = Clock::now(),
                              Clock::duration ttl = kMetricsTtl) const;

  /// Prometheus text exposition (0.0.4) of all instruments. Throws on serializer failure.
  [[nodiscard]] std::string encode() const;

  [[nodiscard]] std::vector<prometheus::MetricFamily> collect() const;

  // Number of reports that were lower than the counter already held.
  [[nodiscard]] uint64_t counter_regressions() const;

private:
  void advance(prometheus::Counter& counter, double value, std::string_view name,
               std::string_view label = {});

  std::shared_ptr<prometheus::Registry> registry_;

  prometheus::Family<prometheus::Counter>& energy_delivered_joules_total_;
  prometheus::Family<prometheus::Counter>& energy_received_joules_total_;
  prometheus::Gauge& energy_tariff_;
  prometheus::Gauge& power_delivered_watts_;
  prometheus::Gauge& power_received_watts_;
  prometheus::Counter& power_failures_total_;
  prometheus::Counter& power_long_failures_total_;
  prometheus::Family<prometheus::Counter>& phase_voltage_sags_total_;
  prometheus::Family<prometheus::Counter>& phase_voltage_swells_total_;
  prometheus::Family<prometheus::Gauge>& phase_voltage_volts_;
  prometheus::Family<prometheus::Gauge>& phase_current_amperes_;
  prometheus::Family<prometheus::Gauge>& phase_active_power_positive_watts_;
  prometheus::Family<prometheus::Gauge>& phase_active_power_negative_watts_;
  prometheus::Counter& gas_delivered_cubic_meters_total_;

  mutable std::shared_mutex mtx_;
  std::optional<Clock::time_point> last_update_;
  uint64_t regressions_{0};
};

} // namespace metrics
