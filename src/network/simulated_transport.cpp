// Copyright (c) 2025 The Watchtower developers
// Simulated transport implementation for testing

#include "network/simulated_transport.hpp"
#include <vector>

namespace watchtower {
namespace network {

// ============================================================================
// SimulatedTransportConnection
// ============================================================================

SimulatedTransportConnection::SimulatedTransportConnection(
    uint64_t id, bool is_inbound, const std::string &remote_addr,
    uint16_t remote_port, SimulatedTransport *transport)
    : id_(id), is_inbound_(is_inbound), remote_addr_(remote_addr),
      remote_port_(remote_port), transport_(transport) {}

SimulatedTransportConnection::~SimulatedTransportConnection() {
  // Quietly mark closed; callbacks may reference objects already gone
  open_ = false;
}

bool SimulatedTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_)
    return false;
  if (transport_) {
    transport_->route_message(id_, data);
  }
  return true;
}

void SimulatedTransportConnection::close() {
  if (!open_.exchange(false)) {
    return; // Already closed
  }

  DisconnectCallback callback;
  std::shared_ptr<SimulatedTransportConnection> peer;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = std::move(disconnect_callback_);
    receive_callback_ = nullptr;
    disconnect_callback_ = nullptr;
    peer = peer_.lock();
  }

  if (callback) {
    callback();
  }
  if (peer) {
    peer->close();
  }
}

void SimulatedTransportConnection::set_receive_callback(
    ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = std::move(callback);
}

void SimulatedTransportConnection::set_disconnect_callback(
    DisconnectCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  disconnect_callback_ = std::move(callback);
}

void SimulatedTransportConnection::deliver_data(
    const std::vector<uint8_t> &data) {
  ReceiveCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = receive_callback_;
  }
  if (open_ && callback) {
    callback(data);
  }
}

void SimulatedTransportConnection::link(
    std::weak_ptr<SimulatedTransportConnection> peer) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  peer_ = std::move(peer);
}

std::shared_ptr<SimulatedTransportConnection>
SimulatedTransportConnection::linked() const {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  return peer_.lock();
}

// ============================================================================
// SimulatedTransport
// ============================================================================

SimulatedTransport::~SimulatedTransport() { stop(); }

TransportConnectionPtr SimulatedTransport::connect(const std::string &address,
                                                   uint16_t port,
                                                   ConnectCallback callback) {
  uint64_t conn_id = next_connection_id_++;
  auto connection = std::make_shared<SimulatedTransportConnection>(
      conn_id, false, address, port, this);
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_[conn_id] = connection;
  }

  bool success = listen_port_ != 0 && listen_port_ == port && accept_callback_;
  if (!success) {
    connection->close();
    if (callback) {
      callback(false);
    }
    return connection;
  }

  uint64_t peer_conn_id = next_connection_id_++;
  auto peer_connection = std::make_shared<SimulatedTransportConnection>(
      peer_conn_id, true, "simulated_peer", static_cast<uint16_t>(conn_id),
      this);
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_[peer_conn_id] = peer_connection;
  }

  connection->link(peer_connection);
  peer_connection->link(connection);

  // Listener sees the inbound side first, then the dialer learns it connected
  accept_callback_(peer_connection);
  if (callback) {
    callback(true);
  }

  return connection;
}

bool SimulatedTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  listen_port_ = port;
  accept_callback_ = std::move(accept_callback);
  return true;
}

void SimulatedTransport::stop_listening() {
  listen_port_ = 0;
  accept_callback_ = nullptr;
}

void SimulatedTransport::stop() {
  running_ = false;

  std::vector<std::shared_ptr<SimulatedTransportConnection>> open;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto &[id, weak_conn] : connections_) {
      if (auto conn = weak_conn.lock()) {
        open.push_back(conn);
      }
    }
    connections_.clear();
  }

  // Close outside the lock: disconnect callbacks may call back into us
  for (auto &conn : open) {
    conn->close();
  }
}

std::shared_ptr<SimulatedTransportConnection>
SimulatedTransport::find(uint64_t id) {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second.lock();
}

void SimulatedTransport::route_message(uint64_t from_conn_id,
                                       const std::vector<uint8_t> &data) {
  auto from_conn = find(from_conn_id);
  if (!from_conn)
    return;

  auto peer = from_conn->linked();
  if (!peer)
    return;

  std::lock_guard<std::mutex> lock(messages_mutex_);
  in_flight_.push(
      {current_time_ms_ + latency_ms_, peer->connection_id(), data});
}

size_t SimulatedTransport::pending_count() const {
  std::lock_guard<std::mutex> lock(messages_mutex_);
  return in_flight_.size();
}

void SimulatedTransport::advance_time(uint64_t ms) {
  current_time_ms_ += ms;

  // Deliveries may trigger sends; keep going until nothing due is left
  for (;;) {
    std::vector<InFlight> ready;
    {
      std::lock_guard<std::mutex> lock(messages_mutex_);
      while (!in_flight_.empty() &&
             in_flight_.front().delivery_time_ms <= current_time_ms_) {
        ready.push_back(std::move(in_flight_.front()));
        in_flight_.pop();
      }
    }
    if (ready.empty()) {
      return;
    }

    for (const auto &msg : ready) {
      if (auto conn = find(msg.to_conn_id)) {
        conn->deliver_data(msg.data);
      }
    }
  }
}

} // namespace network
} // namespace watchtower
