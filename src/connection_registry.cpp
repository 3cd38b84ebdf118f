#include "roomba_base/connection_registry.hpp"

#include <exception>
#include <utility>

#include <rclcpp/logging.hpp>

#include "roomba_base/errors.hpp"
#include "roomba_base/oi_protocol.hpp"

namespace roomba_base {

// -------------------------
// Connection
// -------------------------

Connection::Connection(std::string port, std::unique_ptr<Transport> transport)
: port_(std::move(port)), transport_(std::move(transport)) {}

Connection::~Connection() {
  if (transport_) {
    transport_->close();
  }
}

// -------------------------
// ConnectionRegistry
// -------------------------

ConnectionRegistry::ConnectionRegistry(
  TransportFactory factory,
  std::chrono::milliseconds read_timeout,
  const rclcpp::Logger& logger)
: factory_(std::move(factory)), read_timeout_(read_timeout), logger_(logger) {}

std::shared_ptr<Connection> ConnectionRegistry::acquire(const std::string& port) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = connections_.find(port);
    if (it != connections_.end()) {
      it->second->refs_++;
      RCLCPP_DEBUG(logger_, "Sharing connection on %s (refs=%d)", port.c_str(), it->second->refs_);
      return it->second;
    }
  }

  // Open outside the lock; a slow or hung device must not stall other ports.
  auto fresh = open(port);

  std::lock_guard<std::mutex> lk(mtx_);
  auto it = connections_.find(port);
  if (it != connections_.end()) {
    // Lost the race to another caller; share theirs and let ours close.
    it->second->refs_++;
    RCLCPP_DEBUG(logger_, "Discarding duplicate connection on %s", port.c_str());
    return it->second;
  }

  fresh->refs_ = 1;
  connections_.emplace(port, fresh);
  RCLCPP_INFO(logger_, "Opened OI connection on %s", port.c_str());
  return fresh;
}

std::shared_ptr<Connection> ConnectionRegistry::open(const std::string& port) {
  std::unique_ptr<Transport> transport;
  try {
    transport = factory_(port);
  } catch (const std::exception& e) {
    throw ConnectionError("failed to open serial connection on " + port + ": " + e.what());
  }
  if (!transport) {
    throw ConnectionError("failed to open serial connection on " + port + ": no transport");
  }

  auto conn = std::make_shared<Connection>(port, std::move(transport));
  try {
    const uint8_t start = static_cast<uint8_t>(Opcode::START);
    conn->transport().write(&start, 1);
    conn->transport().setReadTimeout(read_timeout_);
  } catch (const std::exception& e) {
    throw ConnectionError("failed to start OI on " + port + ": " + e.what());
  }
  return conn;
}

bool ConnectionRegistry::release(const std::string& port) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = connections_.find(port);
  if (it == connections_.end()) {
    return false;
  }

  it->second->refs_--;
  if (it->second->refs_ <= 0) {
    connections_.erase(it);
    RCLCPP_INFO(logger_, "Released last reference to %s", port.c_str());
    return true;
  }
  return false;
}

int ConnectionRegistry::refCount(const std::string& port) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = connections_.find(port);
  return it == connections_.end() ? 0 : it->second->refs_;
}

std::size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return connections_.size();
}

void ConnectionRegistry::shutdown() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!connections_.empty()) {
    RCLCPP_INFO(logger_, "Shutting down with %zu open connection(s)", connections_.size());
  }
  connections_.clear();
}

}  // namespace roomba_base
