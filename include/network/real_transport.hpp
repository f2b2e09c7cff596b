// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_REAL_TRANSPORT_HPP
#define WATCHTOWER_REAL_TRANSPORT_HPP

#include "network/transport.hpp"
#include <atomic>
#include <utility>  // before boost/asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace watchtower {
namespace network {

/**
 * RealTransportConnection - TCP connection on a boost::asio socket
 *
 * Writes are queued and drained one async_write at a time. Callbacks are
 * cleared in close(), so pending async operations never call into a closed
 * connection's owner.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  static TransportConnectionPtr create_outbound(boost::asio::io_context &io,
                                                const std::string &address,
                                                uint16_t port,
                                                ConnectCallback callback);
  static TransportConnectionPtr
  create_inbound(boost::asio::io_context &io,
                 boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override;

  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  RealTransportConnection(boost::asio::io_context &io, bool is_inbound);

  void do_connect(const std::string &address, uint16_t port,
                  ConnectCallback callback);
  void start_read();
  void do_write();
  // Close and fire the disconnect callback once
  void close_with_notify();

  static constexpr size_t RECV_BUFFER_SIZE = 16 * 1024;
  static std::atomic<uint64_t> next_id_;

  boost::asio::io_context &io_;
  boost::asio::ip::tcp::socket socket_;
  bool is_inbound_;
  uint64_t id_;
  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;

  std::vector<uint8_t> recv_buffer_;

  std::mutex send_mutex_;
  std::queue<std::vector<uint8_t>> send_queue_;
  size_t send_queue_bytes_ = 0;
  bool writing_ = false;

  std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
};

/**
 * RealTransport - boost::asio TCP transport with its own IO threads
 */
class RealTransport : public Transport {
public:
  explicit RealTransport(size_t io_threads = 1);
  ~RealTransport() override;

  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  // Executor for timers that must run on the IO threads
  boost::asio::io_context &io_context() { return io_context_; }

private:
  void start_accept();

  size_t io_thread_count_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
};

} // namespace network
} // namespace watchtower

#endif // WATCHTOWER_REAL_TRANSPORT_HPP
