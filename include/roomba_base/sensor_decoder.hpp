/**
 * @file sensor_decoder.hpp
 * @brief Fixed-layout decoding of an OI multi-packet sensor response.
 * @ingroup roomba_base
 */

#ifndef ROOMBA_BASE_SENSOR_DECODER_HPP__
#define ROOMBA_BASE_SENSOR_DECODER_HPP__

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace roomba_base {

/** @brief One decoded value: flag, integer, percentage or enum name. */
using ReadingValue = std::variant<bool, int, double, std::string>;

/** @brief Decoded readings keyed by name. Rebuilt from scratch on every query. */
using Readings = std::map<std::string, ReadingValue>;

/** @brief Raw payload of each queried packet, in request order. */
using PacketSegments = std::vector<std::vector<uint8_t>>;

/**
 * @brief Packet ids requested by a full sensor read, in response order.
 *
 * decodeSensors() extracts fields by position in this list, so the two must
 * change together.
 */
extern const std::vector<uint8_t> kSensorPackets;

/** @brief Names for packet 21, indexed by its value. */
extern const std::vector<std::string> kChargingStates;

/** @brief Names for packet 35, indexed by its value. */
extern const std::vector<std::string> kOiModes;

/**
 * @brief Map the segments of a kSensorPackets query to named readings.
 *
 * `battery_percent` is present only when battery capacity is non-zero; a
 * missing key means unknown, not 0%.
 *
 * @throws ProtocolError (CountMismatch) if the segment count is wrong,
 *         (ShortRead) if a segment has the wrong width.
 */
Readings decodeSensors(const PacketSegments& segments);

/** @brief Render a reading as text, e.g. for diagnostics key/values. */
std::string toString(const ReadingValue& value);

}  // namespace roomba_base

#endif  // ROOMBA_BASE_SENSOR_DECODER_HPP__
