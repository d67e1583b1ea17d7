#include "dsmr/telegram_parser.hpp"
#include "telegrams.hpp"

#include <cassert>
#include <cmath>
#include <string>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static void test_crc16_known_value() {
  // CRC16/ARC check value
  const std::string s = "123456789";
  assert(dsmr::crc16(tests::as_bytes(s)) == 0xBB3D);
}

static void test_full_telegram() {
  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;

  const bool ok = parser.parse(tests::as_bytes(tests::kFullTelegram), s, err);
  assert(ok);

  assert(s.version && *s.version == 50);
  assert(s.datetime && *s.datetime == "101209113020W");
  assert(s.equipment_id && *s.equipment_id == "4B384547303034303436333935353037");
  assert(s.message && s.message->size() == 160);

  for (const auto& r : s.meter_readings) {
    assert(r.to && near(*r.to, 123456.789));
    assert(r.by && near(*r.by, 123456.789));
  }

  assert(s.tariff_indicator);
  assert((*s.tariff_indicator)[0] == 0x00 && (*s.tariff_indicator)[1] == 0x02);

  assert(s.power_delivered && near(*s.power_delivered, 1.193));
  assert(s.power_received && near(*s.power_received, 0.0));
  assert(s.power_failures && *s.power_failures == 4);
  assert(s.long_power_failures && *s.long_power_failures == 2);

  assert(*s.lines[0].voltage_sags == 2);
  assert(*s.lines[1].voltage_sags == 1);
  assert(*s.lines[2].voltage_sags == 0);
  assert(*s.lines[1].voltage_swells == 3);

  assert(near(*s.lines[0].voltage, 220.1));
  assert(near(*s.lines[2].voltage, 220.3));
  assert(*s.lines[0].current == 1);
  assert(*s.lines[2].current == 3);
  assert(near(*s.lines[1].active_power_plus, 2.222));
  assert(near(*s.lines[2].active_power_neg, 6.666));

  const auto& gas = s.slaves[0];
  assert(gas.device_type && *gas.device_type == dsmr::kDeviceTypeGas);
  assert(gas.equipment_id && *gas.equipment_id == "3232323241424344313233343536373839");
  assert(gas.meter_reading);
  assert(gas.meter_reading->timestamp == "101209112500W");
  assert(near(gas.meter_reading->value, 12785.123));

  assert(!s.slaves[1].device_type);
  assert(!s.slaves[1].meter_reading);
}

// The frame handed over by the extractor is zero padded.
static void test_padded_frame() {
  std::string padded = tests::kFullTelegram;
  padded.resize(2048, '\0');

  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;
  assert(parser.parse(tests::as_bytes(padded), s, err));
  assert(s.power_delivered);
}

static void test_absent_fields_stay_empty() {
  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;

  const std::string t = tests::make_telegram("1-0:1.7.0(01.500*kW)\r\n");
  assert(parser.parse(tests::as_bytes(t), s, err));
  assert(near(*s.power_delivered, 1.5));
  assert(!s.power_received);
  assert(!s.tariff_indicator);
  assert(!s.meter_readings[0].to);
  assert(!s.lines[0].voltage);
  assert(!s.slaves[0].meter_reading);
}

static void test_unknown_obis_ignored() {
  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;

  const std::string t = tests::make_telegram(
    "0-0:96.3.10(1)\r\n"
    "0-0:17.0.0(999.9*kW)\r\n"
    "1-0:2.7.0(00.250*kW)\r\n");
  assert(parser.parse(tests::as_bytes(t), s, err));
  assert(near(*s.power_received, 0.25));
}

static void test_crc_mismatch() {
  std::string t = tests::kFullTelegram;
  t[t.find("01.193")] = '7';

  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;
  assert(!parser.parse(tests::as_bytes(t), s, err));
  assert(err.find("CRC mismatch") != std::string::npos);
}

static void test_bad_unit() {
  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;

  const std::string no_unit = tests::make_telegram("1-0:1.7.0(01.500kW)\r\n");
  assert(!parser.parse(tests::as_bytes(no_unit), s, err));
  assert(err.find("1-0:1.7.0") != std::string::npos);

  const std::string wrong_unit = tests::make_telegram("1-0:1.8.1(000001.000*kW)\r\n");
  assert(!parser.parse(tests::as_bytes(wrong_unit), s, err));
}

static void test_bad_footer_and_header() {
  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;

  assert(!parser.parse(tests::as_bytes(std::string("no start marker!0000\r\n")), s, err));
  assert(!parser.parse(tests::as_bytes(std::string("/ISK5 header without footer\r\n")), s, err));
  assert(!parser.parse(tests::as_bytes(std::string("/ISK5\r\n!ZZZZ\r\n")), s, err));
  assert(err.find("4 hex digits") != std::string::npos);
}

static void test_malformed_values() {
  dsmr::Dsmr5Parser parser;
  dsmr::Snapshot s;
  std::string err;

  assert(!parser.parse(tests::as_bytes(tests::make_telegram("0-0:96.14.0(12)\r\n")), s, err));
  assert(!parser.parse(tests::as_bytes(tests::make_telegram("0-0:1.0.0(1012091130)\r\n")), s, err));
  assert(!parser.parse(tests::as_bytes(tests::make_telegram("1-0:31.7.0(1.5*A)\r\n")), s, err));
  assert(!parser.parse(tests::as_bytes(tests::make_telegram("1-0:32.7.0 220.1*V\r\n")), s, err));
  assert(!parser.parse(tests::as_bytes(tests::make_telegram("0-1:24.2.1(00010.500*m3)\r\n")), s, err));
}

int main() {
  test_crc16_known_value();
  test_full_telegram();
  test_padded_frame();
  test_absent_fields_stay_empty();
  test_unknown_obis_ignored();
  test_crc_mismatch();
  test_bad_unit();
  test_bad_footer_and_header();
  test_malformed_values();
  return 0;
}
