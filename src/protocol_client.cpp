#include "roomba_base/protocol_client.hpp"

#include <mutex>
#include <utility>

#include "roomba_base/errors.hpp"

namespace roomba_base {

ProtocolClient::ProtocolClient(std::shared_ptr<Connection> conn) : conn_(std::move(conn)) {}

void ProtocolClient::sendSimpleCommand(Opcode opcode) {
  std::lock_guard<std::mutex> lk(conn_->mutex());
  writeLocked({static_cast<uint8_t>(opcode)}, "command");
}

void ProtocolClient::drive(int16_t velocity_mmps, int16_t radius_mm) {
  std::lock_guard<std::mutex> lk(conn_->mutex());
  writeLocked(encodeDrive(velocity_mmps, radius_mm), "drive");
}

PacketSegments ProtocolClient::queryList(const std::vector<uint8_t>& packet_ids) {
  std::vector<std::size_t> sizes;
  sizes.reserve(packet_ids.size());
  std::size_t total = 0;
  for (uint8_t id : packet_ids) {
    sizes.push_back(packetSize(id));
    total += sizes.back();
  }
  const std::vector<uint8_t> frame = encodeQueryList(packet_ids);

  std::vector<uint8_t> raw;
  {
    std::lock_guard<std::mutex> lk(conn_->mutex());

    // Bytes left over from an earlier exchange would shift every field.
    try {
      conn_->transport().flushReceiveBuffer();
    } catch (const TransportError& e) {
      throw TransportError(std::string("query_list on ") + conn_->port() + ": " + e.what());
    }

    writeLocked(frame, "query_list");
    raw = readExactLocked(total, "query_list");
  }

  PacketSegments segments;
  segments.reserve(sizes.size());
  std::size_t off = 0;
  for (std::size_t sz : sizes) {
    segments.emplace_back(raw.begin() + off, raw.begin() + off + sz);
    off += sz;
  }

  return segments;
}

Readings ProtocolClient::readSensors() {
  return decodeSensors(queryList(kSensorPackets));
}

void ProtocolClient::writeLocked(const std::vector<uint8_t>& frame, const char* op) {
  try {
    conn_->transport().write(frame.data(), frame.size());
  } catch (const TransportError& e) {
    throw TransportError(std::string(op) + " on " + conn_->port() + ": " + e.what());
  }
}

std::vector<uint8_t> ProtocolClient::readExactLocked(std::size_t n, const char* op) {
  std::vector<uint8_t> buf(n);
  std::size_t got = 0;
  while (got < n) {
    std::size_t r = 0;
    try {
      r = conn_->transport().read(buf.data() + got, n - got);
    } catch (const TransportError& e) {
      throw TransportError(std::string(op) + " on " + conn_->port() + ": " + e.what());
    }
    if (r == 0) {
      throw ProtocolError(ProtocolError::Kind::ShortRead,
        std::string(op) + " on " + conn_->port() + ": expected " + std::to_string(n) +
        " bytes, got " + std::to_string(got) + " before read timeout");
    }
    got += r;
  }
  return buf;
}

}  // namespace roomba_base
