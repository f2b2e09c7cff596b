// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_CUSTOM_MESSAGE_RELAY_HPP
#define WATCHTOWER_NETWORK_CUSTOM_MESSAGE_RELAY_HPP

#include "network/custom_message_handler.hpp"
#include "network/protocol.hpp"
#include "network/public_key.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace watchtower {
namespace network {

/**
 * CustomMessageRelay - host-side peer loop for custom messages
 *
 * Owns the connections it is given and, for each one:
 * - frames traffic as [length u16][type u16][payload]
 * - exchanges HELLO (node ids) so that frames can be attributed to a PeerId
 * - hands custom payloads to CustomMessageHandler::Read() and
 *   HandleCustomMessage(), applying the returned ErrorAction
 * - on every poll, transmits what GetAndClearPendingMessages() returns
 *
 * Peer policy:
 * - malformed payload for a known custom type: disconnect
 * - unknown type: ignore if odd, disconnect if even (BOLT #1)
 * - anything but HELLO before HELLO: disconnect
 * - queued messages for peers without a connection are dropped
 *
 * Thread-safety: receive callbacks, PollOnce() and the public accessors may
 * run concurrently. The handler is called without the relay's lock held.
 * Start() and Stop() may be called from any thread while the io_context is
 * running. Stop() waits for an in-progress timed poll to finish, so peer
 * callbacks reached from a poll must not call Stop().
 */
class CustomMessageRelay {
public:
  struct Config {
    PeerId local_id;
    std::chrono::milliseconds poll_interval{protocol::DEFAULT_POLL_INTERVAL_MS};
  };

  struct Stats {
    uint64_t frames_received = 0;
    uint64_t messages_handled = 0;
    uint64_t messages_sent = 0;
    uint64_t decode_failures = 0;
    uint64_t handler_errors = 0;
    uint64_t unknown_ignored = 0;
    uint64_t dropped_unroutable = 0;
    uint64_t dropped_unencodable = 0;
    uint64_t peers_disconnected = 0;
  };

  using PeerCallback = std::function<void(const PeerId &peer)>;

  CustomMessageRelay(boost::asio::io_context &io, CustomMessageHandler &handler,
                     const Config &config);
  ~CustomMessageRelay();

  CustomMessageRelay(const CustomMessageRelay &) = delete;
  CustomMessageRelay &operator=(const CustomMessageRelay &) = delete;

  // Take ownership of a connected stream: sends HELLO and starts reading
  void AddConnection(TransportConnectionPtr conn);

  // Start/stop the polling timer. Stop() also closes every connection.
  void Start();
  void Stop();

  /**
   * One polling cycle: drain the handler and transmit every entry
   * @return number of messages handed to the transport
   */
  size_t PollOnce();

  bool IsPeerConnected(const PeerId &peer) const;
  std::vector<PeerId> GetConnectedPeers() const;
  size_t ConnectionCount() const;
  Stats GetStats() const;

  // Called (outside the relay lock) once a connection identified itself
  void SetPeerConnectedCallback(PeerCallback callback);
  void SetPeerDisconnectedCallback(PeerCallback callback);

  // [length][type][payload]; nullopt if the payload does not fit a frame
  static std::optional<std::vector<uint8_t>>
  FrameMessage(protocol::WireTypeId type, const std::vector<uint8_t> &payload);

private:
  struct ConnectionState {
    TransportConnectionPtr conn;
    std::vector<uint8_t> recv_buffer;
    std::optional<PeerId> peer;
  };

  struct Frame {
    protocol::WireTypeId type;
    std::vector<uint8_t> payload;
  };

  void OnReceive(uint64_t conn_id, const std::vector<uint8_t> &data);
  void OnDisconnect(uint64_t conn_id);

  // Returns false once the connection has been dropped
  bool ProcessFrame(uint64_t conn_id, const Frame &frame);
  bool ProcessHello(uint64_t conn_id, const Frame &frame);
  void ProcessWarning(uint64_t conn_id, const Frame &frame);
  bool ProcessCustom(uint64_t conn_id, const PeerId &peer, const Frame &frame);
  bool ProcessUnknown(uint64_t conn_id, protocol::WireTypeId type);
  bool ApplyHandlerError(uint64_t conn_id, const PeerId &peer,
                         const HandlerError &error);

  bool SendFrame(uint64_t conn_id, protocol::WireTypeId type,
                 const std::vector<uint8_t> &payload);
  void SendWarning(uint64_t conn_id, const std::string &text);
  void Disconnect(uint64_t conn_id, const std::string &reason);

  std::optional<PeerId> PeerOf(uint64_t conn_id) const;
  TransportConnectionPtr ConnectionOf(uint64_t conn_id) const;

  void SchedulePoll();

  boost::asio::io_context &io_;
  CustomMessageHandler &handler_;
  Config config_;
  boost::asio::steady_timer poll_timer_;

  // Guards poll_timer_ and the running flag. Timer handlers hold a reference
  // so a handler dequeued after Stop() never touches the relay.
  struct PollState {
    std::mutex mutex;
    bool running = false;
  };
  std::shared_ptr<PollState> poll_state_ = std::make_shared<PollState>();

  mutable std::mutex mutex_;
  std::map<uint64_t, ConnectionState> connections_;
  std::map<PeerId, uint64_t> peers_;
  PeerCallback on_peer_connected_;
  PeerCallback on_peer_disconnected_;

  std::atomic<uint64_t> frames_received_{0};
  std::atomic<uint64_t> messages_handled_{0};
  std::atomic<uint64_t> messages_sent_{0};
  std::atomic<uint64_t> decode_failures_{0};
  std::atomic<uint64_t> handler_errors_{0};
  std::atomic<uint64_t> unknown_ignored_{0};
  std::atomic<uint64_t> dropped_unroutable_{0};
  std::atomic<uint64_t> dropped_unencodable_{0};
  std::atomic<uint64_t> peers_disconnected_{0};
};

} // namespace network
} // namespace watchtower

#endif // WATCHTOWER_NETWORK_CUSTOM_MESSAGE_RELAY_HPP
