// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_SIMULATED_TRANSPORT_HPP
#define WATCHTOWER_SIMULATED_TRANSPORT_HPP

#include "network/transport.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <queue>

namespace watchtower {
namespace network {

class SimulatedTransport;

/**
 * SimulatedTransportConnection - in-memory connection for tests
 *
 * Sent data is queued on the owning SimulatedTransport and delivered to the
 * linked connection when simulated time advances. Closing one end closes the
 * other.
 */
class SimulatedTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<SimulatedTransportConnection> {
public:
  SimulatedTransportConnection(uint64_t id, bool is_inbound,
                               const std::string &remote_addr,
                               uint16_t remote_port,
                               SimulatedTransport *transport);
  ~SimulatedTransportConnection() override;

  void start() override {}
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

  // Called by SimulatedTransport
  void deliver_data(const std::vector<uint8_t> &data);
  void link(std::weak_ptr<SimulatedTransportConnection> peer);
  std::shared_ptr<SimulatedTransportConnection> linked() const;

private:
  uint64_t id_;
  bool is_inbound_;
  std::string remote_addr_;
  uint16_t remote_port_;
  SimulatedTransport *transport_;
  std::atomic<bool> open_{true};

  mutable std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  std::weak_ptr<SimulatedTransportConnection> peer_;
};

/**
 * SimulatedTransport - in-memory transport for tests
 *
 * A single instance hosts both ends: connect() to the port passed to
 * listen() creates a linked inbound/outbound pair. Nothing is delivered
 * until advance_time() is called, which makes delivery order and timing
 * fully deterministic.
 */
class SimulatedTransport : public Transport {
public:
  SimulatedTransport() = default;
  ~SimulatedTransport() override;

  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override { running_ = true; }
  void stop() override;
  bool is_running() const override { return running_; }

  void set_latency_ms(uint64_t latency_ms) { latency_ms_ = latency_ms; }

  // Advance simulated time and deliver everything that is due
  void advance_time(uint64_t ms);
  uint64_t current_time_ms() const { return current_time_ms_; }
  size_t pending_count() const;

  // Queue data from one connection to its linked peer
  void route_message(uint64_t from_conn_id, const std::vector<uint8_t> &data);

private:
  struct InFlight {
    uint64_t delivery_time_ms;
    uint64_t to_conn_id;
    std::vector<uint8_t> data;
  };

  std::shared_ptr<SimulatedTransportConnection> find(uint64_t id);

  std::atomic<bool> running_{false};
  uint64_t current_time_ms_ = 0;
  uint64_t latency_ms_ = 0;

  uint16_t listen_port_ = 0;
  AcceptCallback accept_callback_;

  std::mutex connections_mutex_;
  std::map<uint64_t, std::weak_ptr<SimulatedTransportConnection>> connections_;
  std::atomic<uint64_t> next_connection_id_{1};

  mutable std::mutex messages_mutex_;
  std::queue<InFlight> in_flight_;
};

} // namespace network
} // namespace watchtower

#endif // WATCHTOWER_SIMULATED_TRANSPORT_HPP
