#include "roomba_base/oi_protocol.hpp"

#include <stdexcept>
#include <string>

namespace roomba_base {

std::size_t packetSize(uint8_t packet_id) {
  switch (packet_id) {
    case 7:  case 8:  case 9:  case 10: case 11: case 12:
    case 13: case 14: case 15: case 16: case 17: case 18:
    case 21: case 24: case 32: case 34: case 35: case 36:
    case 37: case 38: case 45: case 52: case 53: case 58:
      return 1;
    case 19: case 20: case 22: case 23: case 25: case 26:
    case 27: case 28: case 29: case 30: case 31: case 33:
    case 39: case 40: case 41: case 42: case 43: case 44:
    case 46: case 47: case 48: case 49: case 50: case 51:
    case 54: case 55: case 56: case 57:
      return 2;
    default:
      throw std::out_of_range("unknown OI sensor packet id " + std::to_string(packet_id));
  }
}

std::vector<uint8_t> encodeDrive(int16_t velocity_mmps, int16_t radius_mm) {
  const uint16_t v = static_cast<uint16_t>(velocity_mmps);
  const uint16_t r = static_cast<uint16_t>(radius_mm);
  return {
    static_cast<uint8_t>(Opcode::DRIVE),
    static_cast<uint8_t>((v >> 8) & 0xFF),
    static_cast<uint8_t>(v & 0xFF),
    static_cast<uint8_t>((r >> 8) & 0xFF),
    static_cast<uint8_t>(r & 0xFF),
  };
}

std::vector<uint8_t> encodeQueryList(const std::vector<uint8_t>& packet_ids) {
  if (packet_ids.size() > 255) {
    throw std::out_of_range("encodeQueryList: at most 255 packet ids per query");
  }

  std::vector<uint8_t> frame;
  frame.reserve(2 + packet_ids.size());
  frame.push_back(static_cast<uint8_t>(Opcode::QUERY_LIST));
  frame.push_back(static_cast<uint8_t>(packet_ids.size()));
  frame.insert(frame.end(), packet_ids.begin(), packet_ids.end());
  return frame;
}

}  // namespace roomba_base
