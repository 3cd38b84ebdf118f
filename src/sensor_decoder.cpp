#include "roomba_base/sensor_decoder.hpp"

#include <cstdio>
#include <string>

#include "roomba_base/errors.hpp"
#include "roomba_base/oi_protocol.hpp"

namespace roomba_base {

const std::vector<uint8_t> kSensorPackets = {
  7,   // bumps and wheel drops
  8,   // wall
  9,   // cliff left
  10,  // cliff front left
  11,  // cliff front right
  12,  // cliff right
  13,  // virtual wall
  14,  // overcurrents
  15,  // dirt detect
  17,  // IR opcode
  18,  // buttons
  19,  // distance since last read
  20,  // angle since last read
  21,  // charging state
  22,  // voltage
  23,  // current
  24,  // temperature
  25,  // battery charge
  26,  // battery capacity
  27,  // wall signal
  28,  // cliff left signal
  29,  // cliff front left signal
  30,  // cliff front right signal
  31,  // cliff right signal
  34,  // charging sources available
  35,  // OI mode
  39,  // requested velocity
  40,  // requested radius
};

const std::vector<std::string> kChargingStates = {
  "not_charging", "reconditioning", "full_charging",
  "trickle_charging", "waiting", "charging_fault",
};

const std::vector<std::string> kOiModes = {"off", "passive", "safe", "full"};

namespace {

std::string enumName(const std::vector<std::string>& names, uint8_t index) {
  return index < names.size() ? names[index] : std::string("unknown");
}

/**
 * @brief Positional reader over the segments of one query.
 */
class SegmentCursor {
public:
  explicit SegmentCursor(const PacketSegments& segments) : segments_(segments) {}

  uint8_t u8(std::size_t idx) const { return at(idx, 1)[0]; }
  int8_t i8(std::size_t idx) const { return static_cast<int8_t>(u8(idx)); }
  uint16_t u16(std::size_t idx) const { return readUint16BE(at(idx, 2)); }
  int16_t i16(std::size_t idx) const { return readInt16BE(at(idx, 2)); }
  bool bit(std::size_t idx, uint8_t mask) const { return (u8(idx) & mask) != 0; }

private:
  const uint8_t* at(std::size_t idx, std::size_t width) const {
    const auto& seg = segments_.at(idx);
    if (seg.size() != width) {
      throw ProtocolError(ProtocolError::Kind::ShortRead,
        "sensor packet " + std::to_string(kSensorPackets[idx]) + ": expected " +
        std::to_string(width) + " bytes, got " + std::to_string(seg.size()));
    }
    return seg.data();
  }

  const PacketSegments& segments_;
};

}  // namespace

Readings decodeSensors(const PacketSegments& segments) {
  if (segments.size() != kSensorPackets.size()) {
    throw ProtocolError(ProtocolError::Kind::CountMismatch,
      "unexpected sensor data count: got " + std::to_string(segments.size()) +
      ", want " + std::to_string(kSensorPackets.size()));
  }

  const SegmentCursor c(segments);
  Readings r;

  // Packet 7
  r["bump_right"]       = c.bit(0, 0x01);
  r["bump_left"]        = c.bit(0, 0x02);
  r["wheel_drop_right"] = c.bit(0, 0x04);
  r["wheel_drop_left"]  = c.bit(0, 0x08);

  // Packets 8-13
  r["wall"]              = c.bit(1, 0x01);
  r["cliff_left"]        = c.bit(2, 0x01);
  r["cliff_front_left"]  = c.bit(3, 0x01);
  r["cliff_front_right"] = c.bit(4, 0x01);
  r["cliff_right"]       = c.bit(5, 0x01);
  r["virtual_wall"]      = c.bit(6, 0x01);

  // Packet 14: bit 1 is unused on this model.
  r["overcurrent_side_brush"]  = c.bit(7, 0x01);
  r["overcurrent_main_brush"]  = c.bit(7, 0x04);
  r["overcurrent_right_wheel"] = c.bit(7, 0x08);
  r["overcurrent_left_wheel"]  = c.bit(7, 0x10);

  r["dirt_detect"] = static_cast<int>(c.u8(8));
  r["ir_opcode"]   = static_cast<int>(c.u8(9));

  // Packet 18
  r["button_clean"]    = c.bit(10, 0x01);
  r["button_spot"]     = c.bit(10, 0x02);
  r["button_dock"]     = c.bit(10, 0x04);
  r["button_minute"]   = c.bit(10, 0x08);
  r["button_hour"]     = c.bit(10, 0x10);
  r["button_day"]      = c.bit(10, 0x20);
  r["button_schedule"] = c.bit(10, 0x40);
  r["button_clock"]    = c.bit(10, 0x80);

  // Odometry accumulated since the previous query.
  r["distance_mm"] = static_cast<int>(c.i16(11));
  r["angle_deg"]   = static_cast<int>(c.i16(12));

  r["charging_state"] = enumName(kChargingStates, c.u8(13));

  // Battery
  r["voltage_mv"]    = static_cast<int>(c.u16(14));
  r["current_ma"]    = static_cast<int>(c.i16(15));
  r["temperature_c"] = static_cast<int>(c.i8(16));
  const int charge   = c.u16(17);
  const int capacity = c.u16(18);
  r["battery_charge_mah"]   = charge;
  r["battery_capacity_mah"] = capacity;
  if (capacity > 0) {
    r["battery_percent"] = static_cast<double>(charge) / static_cast<double>(capacity) * 100.0;
  }

  // Signal strengths, 0-4095
  r["wall_signal"]              = static_cast<int>(c.u16(19));
  r["cliff_left_signal"]        = static_cast<int>(c.u16(20));
  r["cliff_front_left_signal"]  = static_cast<int>(c.u16(21));
  r["cliff_front_right_signal"] = static_cast<int>(c.u16(22));
  r["cliff_right_signal"]       = static_cast<int>(c.u16(23));

  // Packet 34
  r["charger_internal"] = c.bit(24, 0x01);
  r["charger_homebase"] = c.bit(24, 0x02);

  r["oi_mode"] = enumName(kOiModes, c.u8(25));

  r["requested_velocity_mms"] = static_cast<int>(c.i16(26));
  r["requested_radius_mm"]    = static_cast<int>(c.i16(27));

  return r;
}

std::string toString(const ReadingValue& value) {
  if (const bool* b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  if (const int* i = std::get_if<int>(&value)) {
    return std::to_string(*i);
  }
  if (const double* d = std::get_if<double>(&value)) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", *d);
    return buf;
  }
  return std::get<std::string>(value);
}

}  // namespace roomba_base
