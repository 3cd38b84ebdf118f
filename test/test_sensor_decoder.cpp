#include <gtest/gtest.h>

#include "roomba_base/errors.hpp"
#include "roomba_base/oi_protocol.hpp"
#include "roomba_base/sensor_decoder.hpp"

using roomba_base::PacketSegments;
using roomba_base::ProtocolError;
using roomba_base::Readings;
using roomba_base::decodeSensors;
using roomba_base::kSensorPackets;

namespace {

/** @brief All-zero segments, sized per packet. */
PacketSegments zeroSegments() {
  PacketSegments segs;
  for (uint8_t id : kSensorPackets) {
    segs.emplace_back(roomba_base::packetSize(id), 0);
  }
  return segs;
}

std::size_t indexOf(uint8_t packet_id) {
  for (std::size_t i = 0; i < kSensorPackets.size(); ++i) {
    if (kSensorPackets[i] == packet_id) return i;
  }
  throw std::out_of_range("packet not in kSensorPackets");
}

void setU8(PacketSegments& segs, uint8_t id, uint8_t v) {
  segs[indexOf(id)] = {v};
}

void setU16(PacketSegments& segs, uint8_t id, uint16_t v) {
  segs[indexOf(id)] = {static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v & 0xFF)};
}

bool flag(const Readings& r, const std::string& key) { return std::get<bool>(r.at(key)); }
int num(const Readings& r, const std::string& key) { return std::get<int>(r.at(key)); }
std::string name(const Readings& r, const std::string& key) { return std::get<std::string>(r.at(key)); }

}  // namespace

TEST(SensorDecoder, BatteryPercentFromChargeAndCapacity) {
  auto segs = zeroSegments();
  setU16(segs, 25, 50);
  setU16(segs, 26, 200);

  const Readings r = decodeSensors(segs);

  EXPECT_EQ(num(r, "battery_charge_mah"), 50);
  EXPECT_EQ(num(r, "battery_capacity_mah"), 200);
  EXPECT_DOUBLE_EQ(std::get<double>(r.at("battery_percent")), 25.0);
}

TEST(SensorDecoder, BatteryPercentAbsentWhenCapacityZero) {
  auto segs = zeroSegments();
  setU16(segs, 25, 50);

  const Readings r = decodeSensors(segs);

  EXPECT_EQ(r.count("battery_percent"), 0u);
  EXPECT_EQ(num(r, "battery_capacity_mah"), 0);
}

TEST(SensorDecoder, ChargingStateNamesAndUnknown) {
  auto segs = zeroSegments();
  setU8(segs, 21, 5);
  EXPECT_EQ(name(decodeSensors(segs), "charging_state"), "charging_fault");

  setU8(segs, 21, 6);
  EXPECT_EQ(name(decodeSensors(segs), "charging_state"), "unknown");

  setU8(segs, 21, 0);
  EXPECT_EQ(name(decodeSensors(segs), "charging_state"), "not_charging");
}

TEST(SensorDecoder, OiModeNamesAndUnknown) {
  auto segs = zeroSegments();
  setU8(segs, 35, 3);
  EXPECT_EQ(name(decodeSensors(segs), "oi_mode"), "full");

  setU8(segs, 35, 4);
  EXPECT_EQ(name(decodeSensors(segs), "oi_mode"), "unknown");
}

TEST(SensorDecoder, BumpAndWheelDropBits) {
  auto segs = zeroSegments();
  setU8(segs, 7, 0x05);

  const Readings r = decodeSensors(segs);

  EXPECT_TRUE(flag(r, "bump_right"));
  EXPECT_FALSE(flag(r, "bump_left"));
  EXPECT_TRUE(flag(r, "wheel_drop_right"));
  EXPECT_FALSE(flag(r, "wheel_drop_left"));
}

TEST(SensorDecoder, OvercurrentBitsSkipBitOne) {
  auto segs = zeroSegments();
  setU8(segs, 14, 0x02);
  Readings r = decodeSensors(segs);
  EXPECT_FALSE(flag(r, "overcurrent_side_brush"));
  EXPECT_FALSE(flag(r, "overcurrent_main_brush"));
  EXPECT_FALSE(flag(r, "overcurrent_right_wheel"));
  EXPECT_FALSE(flag(r, "overcurrent_left_wheel"));

  setU8(segs, 14, 0x1D);
  r = decodeSensors(segs);
  EXPECT_TRUE(flag(r, "overcurrent_side_brush"));
  EXPECT_TRUE(flag(r, "overcurrent_main_brush"));
  EXPECT_TRUE(flag(r, "overcurrent_right_wheel"));
  EXPECT_TRUE(flag(r, "overcurrent_left_wheel"));
}

TEST(SensorDecoder, ButtonsEachMapToOneBit) {
  auto segs = zeroSegments();
  setU8(segs, 18, 0x81);

  const Readings r = decodeSensors(segs);

  EXPECT_TRUE(flag(r, "button_clean"));
  EXPECT_FALSE(flag(r, "button_spot"));
  EXPECT_FALSE(flag(r, "button_schedule"));
  EXPECT_TRUE(flag(r, "button_clock"));
}

TEST(SensorDecoder, SignedFields) {
  auto segs = zeroSegments();
  setU16(segs, 19, 0xFFCE);  // -50
  setU16(segs, 20, 0xFFA6);  // -90
  setU16(segs, 23, 0xFC18);  // -1000
  setU8(segs, 24, 0xF6);     // -10
  setU16(segs, 39, 0xFE0C);  // -500
  setU16(segs, 40, 0x7FFF);  // 32767

  const Readings r = decodeSensors(segs);

  EXPECT_EQ(num(r, "distance_mm"), -50);
  EXPECT_EQ(num(r, "angle_deg"), -90);
  EXPECT_EQ(num(r, "current_ma"), -1000);
  EXPECT_EQ(num(r, "temperature_c"), -10);
  EXPECT_EQ(num(r, "requested_velocity_mms"), -500);
  EXPECT_EQ(num(r, "requested_radius_mm"), 32767);
}

TEST(SensorDecoder, UnsignedFields) {
  auto segs = zeroSegments();
  setU16(segs, 22, 0xFFFF);
  setU8(segs, 15, 200);
  setU8(segs, 17, 0xA1);
  setU16(segs, 27, 4095);
  setU16(segs, 31, 12);

  const Readings r = decodeSensors(segs);

  EXPECT_EQ(num(r, "voltage_mv"), 65535);
  EXPECT_EQ(num(r, "dirt_detect"), 200);
  EXPECT_EQ(num(r, "ir_opcode"), 0xA1);
  EXPECT_EQ(num(r, "wall_signal"), 4095);
  EXPECT_EQ(num(r, "cliff_right_signal"), 12);
}

TEST(SensorDecoder, ProximityAndChargerFlags) {
  auto segs = zeroSegments();
  setU8(segs, 8, 1);
  setU8(segs, 10, 1);
  setU8(segs, 13, 1);
  setU8(segs, 34, 0x02);

  const Readings r = decodeSensors(segs);

  EXPECT_TRUE(flag(r, "wall"));
  EXPECT_FALSE(flag(r, "cliff_left"));
  EXPECT_TRUE(flag(r, "cliff_front_left"));
  EXPECT_TRUE(flag(r, "virtual_wall"));
  EXPECT_FALSE(flag(r, "charger_internal"));
  EXPECT_TRUE(flag(r, "charger_homebase"));
}

TEST(SensorDecoder, WrongSegmentCountIsCountMismatch) {
  auto segs = zeroSegments();
  segs.pop_back();

  try {
    decodeSensors(segs);
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError& e) {
    EXPECT_EQ(e.kind(), ProtocolError::Kind::CountMismatch);
  }
}

TEST(SensorDecoder, TruncatedSegmentIsShortRead) {
  auto segs = zeroSegments();
  segs[indexOf(22)] = {0x01};

  try {
    decodeSensors(segs);
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError& e) {
    EXPECT_EQ(e.kind(), ProtocolError::Kind::ShortRead);
  }
}

TEST(SensorDecoder, ToStringRendersEachKind) {
  EXPECT_EQ(roomba_base::toString(roomba_base::ReadingValue(true)), "true");
  EXPECT_EQ(roomba_base::toString(roomba_base::ReadingValue(-7)), "-7");
  EXPECT_EQ(roomba_base::toString(roomba_base::ReadingValue(25.0)), "25.00");
  EXPECT_EQ(roomba_base::toString(roomba_base::ReadingValue(std::string("safe"))), "safe");
}
