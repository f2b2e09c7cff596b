// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_TRANSPORT_HPP
#define WATCHTOWER_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace watchtower {
namespace network {

/**
 * Byte-stream transport seam
 *
 * The custom message relay only needs to push and receive bytes per
 * connection. Implementations:
 * - RealTransport: TCP sockets via boost::asio
 * - SimulatedTransport: in-memory delivery for tests
 */

class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

using ConnectCallback = std::function<void(bool success)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

/**
 * TransportConnection - one open byte stream to a remote node
 */
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Begin delivering received data to the receive callback
  virtual void start() = 0;

  /**
   * Send data over this connection
   * Returns true if queued successfully, false if connection is closed
   */
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

/**
 * Transport - creates outbound connections and accepts inbound ones
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * Initiate an outbound connection
   *
   * @param address Target IP address or hostname
   * @param port Target port
   * @param callback Called when connection succeeds or fails
   * @return Connection object (may not be connected yet)
   */
  virtual TransportConnectionPtr connect(const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) = 0;

  // Start accepting inbound connections; false if the port is unavailable
  virtual bool listen(uint16_t port, AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;

  // Start the event loop (non-blocking for RealTransport)
  virtual void run() = 0;

  // Close all connections and stop the event loop
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace watchtower

#endif // WATCHTOWER_TRANSPORT_HPP
