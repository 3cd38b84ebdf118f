#ifndef ROOMBA_BASE_OI_PROTOCOL_HPP__
#define ROOMBA_BASE_OI_PROTOCOL_HPP__
/**
 * @file oi_protocol.hpp
 * @brief Opcodes, packet sizes and frame encoders for the Roomba Open Interface.
 *
 * The OI is a half-duplex binary protocol over a UART (115200 8N1 on the
 * 500/600 series):
 * - Commands are a one-byte opcode followed by a fixed number of data bytes
 * - Multi-byte fields are big-endian
 * - The device never acknowledges a command; only sensor queries produce bytes
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace roomba_base {

/** @brief OI command opcodes used by this driver. */
enum class Opcode : uint8_t {
  START      = 128,  ///< Enter Passive mode, enables the interface.
  SAFE       = 131,
  FULL       = 132,
  CLEAN      = 135,
  DRIVE      = 137,  ///< velocity(int16) radius(int16), both big-endian.
  SEEK_DOCK  = 143,
  QUERY_LIST = 149,  ///< count(uint8) followed by that many packet ids.
};

/** @brief Default OI baud rate after power-on. */
static constexpr int kDefaultBaud = 115200;

/** @brief Largest wheel speed the device accepts, mm/s. */
static constexpr int16_t kMaxVelocityMmps = 500;

/** @brief Largest turn radius the device can represent, mm. */
static constexpr int16_t kMaxRadiusMm = 2000;

/** @brief Radius sentinel for "drive straight". */
static constexpr int16_t kRadiusStraight = 32767;

/** @brief Radius for spinning counter-clockwise in place. */
static constexpr int16_t kRadiusSpinCcw = 1;

/** @brief Radius for spinning clockwise in place. */
static constexpr int16_t kRadiusSpinCw = -1;

/**
 * @brief Size in bytes of a sensor packet's payload.
 *
 * @param packet_id OI sensor packet id (7..58 for single packets).
 * @return Payload size in bytes.
 *
 * @throws std::out_of_range for ids this driver does not know the size of.
 */
std::size_t packetSize(uint8_t packet_id);

/**
 * @brief Encode a DRIVE frame (5 bytes).
 */
std::vector<uint8_t> encodeDrive(int16_t velocity_mmps, int16_t radius_mm);

/**
 * @brief Encode a QUERY_LIST frame for the given packet ids.
 *
 * @throws std::out_of_range if more than 255 ids are requested.
 */
std::vector<uint8_t> encodeQueryList(const std::vector<uint8_t>& packet_ids);

/** @brief Read a big-endian signed 16-bit field. */
inline int16_t readInt16BE(const uint8_t* p) {
  return static_cast<int16_t>(static_cast<uint16_t>((p[0] << 8) | p[1]));
}

/** @brief Read a big-endian unsigned 16-bit field. */
inline uint16_t readUint16BE(const uint8_t* p) {
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

}  // namespace roomba_base

#endif  // ROOMBA_BASE_OI_PROTOCOL_HPP__
