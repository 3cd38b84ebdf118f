/**
 * @file protocol_client.hpp
 * @brief OI command framing and sensor queries over a shared Connection.
 * @ingroup roomba_base
 */

#ifndef ROOMBA_BASE_PROTOCOL_CLIENT_HPP__
#define ROOMBA_BASE_PROTOCOL_CLIENT_HPP__

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "roomba_base/connection_registry.hpp"
#include "roomba_base/oi_protocol.hpp"
#include "roomba_base/sensor_decoder.hpp"

namespace roomba_base {

/**
 * @brief Sends OI commands and queries on one Connection.
 *
 * Every public call takes the Connection lock for its whole exchange, so calls
 * from any number of threads and drivers on the same port are totally
 * ordered. Nothing is retried: OI commands move the robot.
 *
 * @ingroup roomba_base
 */
class ProtocolClient {
public:
  explicit ProtocolClient(std::shared_ptr<Connection> conn);

  /**
   * @brief Send a command that has no data bytes.
   *
   * @throws TransportError on write failure.
   */
  void sendSimpleCommand(Opcode opcode);

  void start() { sendSimpleCommand(Opcode::START); }
  void safe() { sendSimpleCommand(Opcode::SAFE); }
  void full() { sendSimpleCommand(Opcode::FULL); }
  void seekDock() { sendSimpleCommand(Opcode::SEEK_DOCK); }
  void clean() { sendSimpleCommand(Opcode::CLEAN); }

  /**
   * @brief Send DRIVE with the given wire velocity and radius.
   *
   * @param velocity_mmps -500..500 on the device; not range-checked here.
   * @param radius_mm     -2000..2000, or 32767 (straight), or +-1 (spin).
   *
   * @throws TransportError on write failure.
   */
  void drive(int16_t velocity_mmps, int16_t radius_mm);

  /** @brief DRIVE(0, 0). */
  void stop() { drive(0, 0); }

  /**
   * @brief Query several sensor packets in one exchange.
   *
   * Flushes stale receive bytes, writes QUERY_LIST, then reads exactly the
   * summed payload sizes and splits them per packet.
   *
   * @return One segment per requested id, in request order.
   *
   * @throws std::out_of_range for an unknown packet id (before any I/O).
   * @throws TransportError on flush, write or read failure.
   * @throws ProtocolError  (ShortRead) if the device sent too few bytes before
   *         the read timeout. Bytes beyond the expected payload are left in
   *         the receive buffer and discarded by the next query's flush.
   */
  PacketSegments queryList(const std::vector<uint8_t>& packet_ids);

  /**
   * @brief Query every packet in kSensorPackets and decode it.
   */
  Readings readSensors();

  const std::string& port() const { return conn_->port(); }

private:
  void writeLocked(const std::vector<uint8_t>& frame, const char* op);
  std::vector<uint8_t> readExactLocked(std::size_t n, const char* op);

  std::shared_ptr<Connection> conn_;
};

}  // namespace roomba_base

#endif  // ROOMBA_BASE_PROTOCOL_CLIENT_HPP__
