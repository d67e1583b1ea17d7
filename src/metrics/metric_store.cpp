#include "metrics/metric_store.hpp"

#include "utils/logger.hpp"

#include <prometheus/text_serializer.h>

#include <mutex>
#include <sstream>

namespace metrics {

namespace {

prometheus::Family<prometheus::Counter>& counter_family(prometheus::Registry& r,
                                                         const std::string& name,
                                                         const std::string& help) {
  return prometheus::BuildCounter().Name(name).Help(help).Register(r);
}

prometheus::Family<prometheus::Gauge>& gauge_family(prometheus::Registry& r,
                                                     const std::string& name,
                                                     const std::string& help) {
  return prometheus::BuildGauge().Name(name).Help(help).Register(r);
}

// Tariff and phase labels are 1-based.
std::string index_label(size_t i) {
  return std::to_string(i + 1);
}

} // namespace

MetricStore::MetricStore()
  : registry_(std::make_shared<prometheus::Registry>()),
    energy_delivered_joules_total_(counter_family(*registry_,
      "energy_delivered_joules_total", "The amount of energy delivered to client in joules")),
    energy_received_joules_total_(counter_family(*registry_,
      "energy_received_joules_total", "The amount of energy delivered by client in joules")),
    energy_tariff_(gauge_family(*registry_,
      "energy_tariff", "The currently active tariff").Add({})),
    power_delivered_watts_(gauge_family(*registry_,
      "power_delivered_watts", "The amount of power that is currently being delivered to client in Watts").Add({})),
    power_received_watts_(gauge_family(*registry_,
      "power_received_watts", "The amount of power that is currently being delivered by client in Watts").Add({})),
    power_failures_total_(counter_family(*registry_,
      "power_failures_total", "Number of power failures in any phase").Add({})),
    power_long_failures_total_(counter_family(*registry_,
      "power_long_failures_total", "Number of long power failures in any phase").Add({})),
    phase_voltage_sags_total_(counter_family(*registry_,
      "phase_voltage_sags_total", "Number of voltage sags in specified phase")),
    phase_voltage_swells_total_(counter_family(*registry_,
      "phase_voltage_swells_total", "Number of voltage swells in specified phase")),
    phase_voltage_volts_(gauge_family(*registry_,
      "phase_voltage_volts", "Instantaneous voltage in specified phase in Volts")),
    phase_current_amperes_(gauge_family(*registry_,
      "phase_current_amperes", "Instantaneous current in specified phase in Amperes")),
    phase_active_power_positive_watts_(gauge_family(*registry_,
      "phase_active_power_positive_watts", "Instantaneous active power (+P) in specified phase in Watts")),
    phase_active_power_negative_watts_(gauge_family(*registry_,
      "phase_active_power_negative_watts", "Instantaneous active power (-P) in specified phase in Watts")),
    gas_delivered_cubic_meters_total_(counter_family(*registry_,
      "gas_delivered_cubic_meters_total", "Amount of natural gas delivered to client in cubic meters").Add({})) {}

void MetricStore::advance(prometheus::Counter& counter, double value, std::string_view name,
                          std::string_view label) {
  const double held = counter.Value();
  const double delta = value - held;
  if (delta < 0.0) {
    // Meter replaced or rolled back: hold the counter until the report catches up.
    ++regressions_;
    logger::warn() << "[METRICS] " << name << (label.empty() ? "" : "{")
                   << label << (label.empty() ? "" : "}") << " reported " << value
                   << " below current " << held << ", keeping " << held << "\n";
    return;
  }
  if (delta > 0.0) counter.Increment(delta);
}

void MetricStore::update(const dsmr::Snapshot& snap, Clock::time_point now) {
  std::unique_lock lk(mtx_);

  for (size_t i = 0; i < snap.meter_readings.size(); ++i) {
    const auto& reading = snap.meter_readings[i];
    const std::string tariff = index_label(i);

    if (reading.to) {
      advance(energy_delivered_joules_total_.Add({{"tariff", tariff}}),
              *reading.to * kJoulesPerKwh, "energy_delivered_joules_total", "tariff=" + tariff);
    }
    if (reading.by) {
      advance(energy_received_joules_total_.Add({{"tariff", tariff}}),
              *reading.by * kJoulesPerKwh, "energy_received_joules_total", "tariff=" + tariff);
    }
  }

  if (snap.tariff_indicator) {
    const auto& raw = *snap.tariff_indicator;
    energy_tariff_.Set(static_cast<double>((static_cast<int>(raw[0]) << 8) | raw[1]));
  }

  if (snap.power_delivered) power_delivered_watts_.Set(*snap.power_delivered * kWattsPerKw);
  if (snap.power_received)  power_received_watts_.Set(*snap.power_received * kWattsPerKw);

  if (snap.power_failures) {
    advance(power_failures_total_, static_cast<double>(*snap.power_failures), "power_failures_total");
  }
  if (snap.long_power_failures) {
    advance(power_long_failures_total_, static_cast<double>(*snap.long_power_failures),
            "power_long_failures_total");
  }

  for (size_t i = 0; i < snap.lines.size(); ++i) {
    const auto& line = snap.lines[i];
    const std::string phase = index_label(i);
    const prometheus::Labels labels{{"phase", phase}};

    if (line.voltage_sags) {
      advance(phase_voltage_sags_total_.Add(labels), static_cast<double>(*line.voltage_sags),
              "phase_voltage_sags_total", "phase=" + phase);
    }
    if (line.voltage_swells) {
      advance(phase_voltage_swells_total_.Add(labels), static_cast<double>(*line.voltage_swells),
              "phase_voltage_swells_total", "phase=" + phase);
    }
    if (line.voltage) phase_voltage_volts_.Add(labels).Set(*line.voltage);
    if (line.current) phase_current_amperes_.Add(labels).Set(static_cast<double>(*line.current));
    if (line.active_power_plus) {
      phase_active_power_positive_watts_.Add(labels).Set(*line.active_power_plus * kWattsPerKw);
    }
    if (line.active_power_neg) {
      phase_active_power_negative_watts_.Add(labels).Set(*line.active_power_neg * kWattsPerKw);
    }
  }

  for (const auto& slave : snap.slaves) {
    if (slave.device_type != dsmr::kDeviceTypeGas) continue;
    if (slave.meter_reading) {
      advance(gas_delivered_cubic_meters_total_, slave.meter_reading->value,
              "gas_delivered_cubic_meters_total");
    }
    break;
  }

  last_update_ = now;
}

std::optional<Clock::time_point> MetricStore::last_update() const {
  std::shared_lock lk(mtx_);
  return last_update_;
}

bool MetricStore::is_fresh(Clock::time_point now, Clock::duration ttl) const {
  std::shared_lock lk(mtx_);
  if (!last_update_) return false;
  return (now - *last_update_) <= ttl;
}

std::vector<prometheus::MetricFamily> MetricStore::collect() const {
  std::shared_lock lk(mtx_);
  return registry_->Collect();
}

std::string MetricStore::encode() const {
  const auto families = collect();
  std::ostringstream out;
  out.exceptions(std::ios::badbit | std::ios::failbit);
  prometheus::TextSerializer serializer;
  serializer.Serialize(out, families);
  return out.str();
}

uint64_t MetricStore::counter_regressions() const {
  std::shared_lock lk(mtx_);
  return regressions_;
}

} // namespace metrics
