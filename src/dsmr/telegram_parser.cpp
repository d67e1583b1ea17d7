#include "dsmr/telegram_parser.hpp"
#include "dsmr/frame_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <vector>

namespace dsmr {

namespace {

struct Obis {
  int a{0}, b{0}, c{0}, d{0}, e{0};

  bool is(int a_, int b_, int c_, int d_, int e_) const noexcept {
    return a == a_ && b == b_ && c == c_ && d == d_ && e == e_;
  }
};

bool is_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
  });
}

bool is_hex(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char ch) {
    return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
  });
}

bool parse_int_field(std::string_view s, int& out) {
  if (!is_digits(s)) return false;
  const auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

// "A-B:C.D.E"
bool parse_obis(std::string_view s, Obis& out) {
  const auto dash = s.find('-');
  const auto colon = s.find(':');
  if (dash == std::string_view::npos || colon == std::string_view::npos || colon < dash) return false;

  const auto dot1 = s.find('.', colon);
  if (dot1 == std::string_view::npos) return false;
  const auto dot2 = s.find('.', dot1 + 1);
  if (dot2 == std::string_view::npos) return false;

  return parse_int_field(s.substr(0, dash), out.a) &&
         parse_int_field(s.substr(dash + 1, colon - dash - 1), out.b) &&
         parse_int_field(s.substr(colon + 1, dot1 - colon - 1), out.c) &&
         parse_int_field(s.substr(dot1 + 1, dot2 - dot1 - 1), out.d) &&
         parse_int_field(s.substr(dot2 + 1), out.e);
}

// Strip "*unit" and check it. An empty expected unit means no unit allowed.
bool strip_unit(std::string_view value, std::string_view unit, std::string_view& number) {
  const auto star = value.find('*');
  if (unit.empty()) {
    if (star != std::string_view::npos) return false;
    number = value;
    return true;
  }
  if (star == std::string_view::npos || value.substr(star + 1) != unit) return false;
  number = value.substr(0, star);
  return true;
}

bool parse_fixed(std::string_view value, std::string_view unit, double& out) {
  std::string_view number;
  if (!strip_unit(value, unit, number)) return false;

  const auto dot = number.find('.');
  if (dot == std::string_view::npos) {
    if (!is_digits(number)) return false;
  } else if (!is_digits(number.substr(0, dot)) || !is_digits(number.substr(dot + 1))) {
    return false;
  }

  const std::string tmp(number);
  char* end = nullptr;
  out = std::strtod(tmp.c_str(), &end);
  return end == tmp.c_str() + tmp.size();
}

bool parse_count(std::string_view value, std::string_view unit, uint64_t& out) {
  std::string_view number;
  if (!strip_unit(value, unit, number) || !is_digits(number)) return false;
  const auto res = std::from_chars(number.data(), number.data() + number.size(), out);
  return res.ec == std::errc() && res.ptr == number.data() + number.size();
}

// YYMMDDhhmmssX, X = S (summer) or W (winter)
bool is_timestamp(std::string_view v) {
  return v.size() == 13 && is_digits(v.substr(0, 12)) && (v[12] == 'S' || v[12] == 'W');
}

// Splits "(a)(b)(c)" into groups. Parentheses do not nest in P1 telegrams.
bool split_groups(std::string_view rest, std::vector<std::string_view>& groups) {
  groups.clear();
  while (!rest.empty()) {
    if (rest.front() != '(') return false;
    const auto close = rest.find(')');
    if (close == std::string_view::npos) return false;
    groups.push_back(rest.substr(1, close - 1));
    rest.remove_prefix(close + 1);
  }
  return !groups.empty();
}

// Phase index for OBIS C fields laid out as base, base+20, base+40 (L1, L2, L3)
std::optional<size_t> phase_of(int c, int base) {
  for (size_t i = 0; i < kPhaseCount; ++i) {
    if (c == base + static_cast<int>(i) * 20) return i;
  }
  return std::nullopt;
}

class LineParser {
public:
  explicit LineParser(Snapshot& out) : out_(out) {}

  bool parse(std::string_view line, std::string& error) {
    const auto paren = line.find('(');
    if (paren == std::string_view::npos) {
      error = "missing value in line '" + std::string(line) + "'";
      return false;
    }

    Obis id{};
    if (!parse_obis(line.substr(0, paren), id)) {
      error = "bad OBIS reference '" + std::string(line.substr(0, paren)) + "'";
      return false;
    }

    if (!split_groups(line.substr(paren), groups_)) {
      error = "bad value groups in line '" + std::string(line) + "'";
      return false;
    }

    if (!apply(id)) {
      error = "bad value for " + std::string(line.substr(0, paren)) + ": '" + std::string(line.substr(paren)) + "'";
      return false;
    }
    return true;
  }

private:
  std::string_view first() const { return groups_.front(); }

  bool apply(const Obis& id) {
    if (id.a == 1 && id.b == 3 && id.c == 0 && id.d == 2 && id.e == 8) {
      uint64_t v = 0;
      if (!parse_count(first(), "", v) || v > 255) return false;
      out_.version = static_cast<uint8_t>(v);
      return true;
    }

    if (id.a == 0 && id.b == 0) return apply_general(id);
    if (id.a == 0 && id.b >= 1 && id.b <= static_cast<int>(kSlaveCount)) return apply_slave(id);
    if (id.a == 1 && id.b == 0) return apply_electricity(id);
    return true; // not ours
  }

  bool apply_general(const Obis& id) {
    if (id.is(0, 0, 1, 0, 0)) {
      if (!is_timestamp(first())) return false;
      out_.datetime = std::string(first());
      return true;
    }
    if (id.is(0, 0, 96, 1, 1)) {
      if (!is_hex(first())) return false;
      out_.equipment_id = std::string(first());
      return true;
    }
    if (id.is(0, 0, 96, 13, 0)) {
      if (!is_hex(first())) return false;
      out_.message = std::string(first());
      return true;
    }
    if (id.is(0, 0, 96, 14, 0)) {
      const auto v = first();
      if (v.size() != 4 || !is_hex(v)) return false;
      std::array<uint8_t, 2> raw{};
      for (size_t i = 0; i < 2; ++i) {
        unsigned int byte = 0;
        const auto res = std::from_chars(v.data() + i * 2, v.data() + i * 2 + 2, byte, 16);
        if (res.ec != std::errc()) return false;
        raw[i] = static_cast<uint8_t>(byte);
      }
      out_.tariff_indicator = raw;
      return true;
    }
    if (id.is(0, 0, 96, 7, 21)) {
      uint64_t v = 0;
      if (!parse_count(first(), "", v)) return false;
      out_.power_failures = v;
      return true;
    }
    if (id.is(0, 0, 96, 7, 9)) {
      uint64_t v = 0;
      if (!parse_count(first(), "", v)) return false;
      out_.long_power_failures = v;
      return true;
    }
    return true;
  }

  bool apply_slave(const Obis& id) {
    Slave& slave = out_.slaves[static_cast<size_t>(id.b - 1)];

    if (id.c == 24 && id.d == 1 && id.e == 0) {
      uint64_t v = 0;
      if (!parse_count(first(), "", v) || v > 255) return false;
      slave.device_type = static_cast<uint8_t>(v);
      return true;
    }
    if (id.c == 96 && id.d == 1 && id.e == 0) {
      if (!is_hex(first())) return false;
      slave.equipment_id = std::string(first());
      return true;
    }
    if (id.c == 24 && id.d == 2 && id.e == 1) {
      if (groups_.size() != 2 || !is_timestamp(groups_[0])) return false;
      SlaveReading r{};
      r.timestamp = std::string(groups_[0]);
      // DSMR 5 gas meters report m3; other device types may use another unit.
      const auto star = groups_[1].find('*');
      const std::string_view unit = (star == std::string_view::npos) ? std::string_view{} : groups_[1].substr(star + 1);
      if (!parse_fixed(groups_[1], unit, r.value)) return false;
      slave.meter_reading = r;
      return true;
    }
    return true;
  }

  bool apply_electricity(const Obis& id) {
    if (id.d == 8 && (id.c == 1 || id.c == 2) && (id.e == 1 || id.e == 2)) {
      double v = 0.0;
      if (!parse_fixed(first(), "kWh", v)) return false;
      MeterReading& r = out_.meter_readings[static_cast<size_t>(id.e - 1)];
      (id.c == 1 ? r.to : r.by) = v;
      return true;
    }

    if (id.d == 7 && id.e == 0 && (id.c == 1 || id.c == 2)) {
      double v = 0.0;
      if (!parse_fixed(first(), "kW", v)) return false;
      (id.c == 1 ? out_.power_delivered : out_.power_received) = v;
      return true;
    }

    // 1-0:99.97.0 power failure event log: not exported
    if (id.c == 99) return true;

    if (id.d == 32 && id.e == 0) {
      if (auto p = phase_of(id.c, 32)) {
        uint64_t v = 0;
        if (!parse_count(first(), "", v)) return false;
        out_.lines[*p].voltage_sags = v;
      }
      return true;
    }
    if (id.d == 36 && id.e == 0) {
      if (auto p = phase_of(id.c, 32)) {
        uint64_t v = 0;
        if (!parse_count(first(), "", v)) return false;
        out_.lines[*p].voltage_swells = v;
      }
      return true;
    }

    if (id.d == 7 && id.e == 0) {
      const auto volt = phase_of(id.c, 32);
      const auto amp = phase_of(id.c, 31);
      const auto plus = phase_of(id.c, 21);
      const auto neg = phase_of(id.c, 22);

      if (volt) {
        double v = 0.0;
        if (!parse_fixed(first(), "V", v)) return false;
        out_.lines[*volt].voltage = v;
      } else if (amp) {
        uint64_t v = 0;
        if (!parse_count(first(), "A", v)) return false;
        out_.lines[*amp].current = v;
      } else if (plus || neg) {
        double v = 0.0;
        if (!parse_fixed(first(), "kW", v)) return false;
        if (plus) out_.lines[*plus].active_power_plus = v;
        else      out_.lines[*neg].active_power_neg = v;
      }
      return true;
    }

    return true;
  }

  Snapshot& out_;
  std::vector<std::string_view> groups_;
};

} // namespace

uint16_t crc16(std::span<const uint8_t> data) noexcept {
  uint16_t crc = 0x0000;
  for (const uint8_t b : data) {
    crc ^= b;
    for (int j = 0; j < 8; j++) {
      if (crc & 1) crc = static_cast<uint16_t>((crc >> 1) ^ 0xA001);
      else         crc >>= 1;
    }
  }
  return crc;
}

bool Dsmr5Parser::parse(std::span<const uint8_t> frame, Snapshot& out, std::string& error) const {
  out = Snapshot{};

  if (frame.empty() || frame[0] != kStartMarker) {
    error = "telegram does not start with '/'";
    return false;
  }

  const auto bang_it = std::find(frame.begin(), frame.end(), kEndMarker);
  if (bang_it == frame.end()) {
    error = "telegram has no '!' footer";
    return false;
  }
  const size_t bang = static_cast<size_t>(bang_it - frame.begin());
  if (frame.size() < bang + 5) {
    error = "telegram footer truncated";
    return false;
  }

  const std::string_view text(reinterpret_cast<const char*>(frame.data()), frame.size());

  const std::string_view crc_text = text.substr(bang + 1, 4);
  unsigned int expected = 0;
  {
    const auto res = std::from_chars(crc_text.data(), crc_text.data() + crc_text.size(), expected, 16);
    if (res.ec != std::errc() || res.ptr != crc_text.data() + crc_text.size()) {
      error = "telegram CRC is not 4 hex digits";
      return false;
    }
  }

  const uint16_t actual = crc16(frame.first(bang + 1));
  if (actual != expected) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "CRC mismatch (expected %04X, computed %04X)", expected, actual);
    error = buf;
    return false;
  }

  // Header: "/XXX5 identification"
  const std::string_view body = text.substr(0, bang);
  const auto header_end = body.find('\n');
  if (header_end == std::string_view::npos || header_end < 5) {
    error = "telegram header is missing";
    return false;
  }

  LineParser lines(out);
  size_t pos = header_end + 1;
  while (pos < body.size()) {
    auto eol = body.find('\n', pos);
    if (eol == std::string_view::npos) eol = body.size();

    std::string_view line = body.substr(pos, eol - pos);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    pos = eol + 1;

    if (line.empty()) continue;
    if (!lines.parse(line, error)) return false;
  }

  return true;
}

} // namespace dsmr
