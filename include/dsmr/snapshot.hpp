#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace dsmr
{

  constexpr size_t kTariffCount = 2;
  constexpr size_t kPhaseCount = 3;
  constexpr size_t kSlaveCount = 4;

  // M-Bus device type reported in 0-n:24.1.0 for a gas meter
  constexpr uint8_t kDeviceTypeGas = 3;

  // Cumulative readings for one tariff, kWh
  struct MeterReading
  {
    std::optional<double> to; // delivered to client
    std::optional<double> by; // delivered by client
  };

  // One phase (L1..L3)
  struct Line
  {
    std::optional<uint64_t> voltage_sags;
    std::optional<uint64_t> voltage_swells;
    std::optional<double> voltage;           // V
    std::optional<uint64_t> current;         // A, integer on DSMR 5
    std::optional<double> active_power_plus; // kW
    std::optional<double> active_power_neg;  // kW
  };

  struct SlaveReading
  {
    std::string timestamp; // YYMMDDhhmmssX
    double value{0.0};     // m3 for gas
  };

  // Sub-device on the meter's M-Bus (gas, water, heat...)
  struct Slave
  {
    std::optional<uint8_t> device_type;
    std::optional<std::string> equipment_id;
    std::optional<SlaveReading> meter_reading;
  };

  /**
   * @brief Decoded telegram state. Every field is independently optional.
   */
  struct Snapshot
  {
    // Informational, logged only
    std::optional<uint8_t> version;
    std::optional<std::string> datetime;
    std::optional<std::string> equipment_id;
    std::optional<std::string> message;

    std::array<MeterReading, kTariffCount> meter_readings{};
    std::optional<std::array<uint8_t, 2>> tariff_indicator;

    std::optional<double> power_delivered; // kW
    std::optional<double> power_received;  // kW

    std::optional<uint64_t> power_failures;
    std::optional<uint64_t> long_power_failures;

    std::array<Line, kPhaseCount> lines{};
    std::array<Slave, kSlaveCount> slaves{};
  };

} // namespace dsmr
