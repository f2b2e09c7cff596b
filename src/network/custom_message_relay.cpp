// Copyright (c) 2025 The Watchtower developers

#include "network/custom_message_relay.hpp"
#include "network/wire.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/error.hpp>
#include <string>
#include <utility>

namespace watchtower {
namespace network {

CustomMessageRelay::CustomMessageRelay(boost::asio::io_context &io,
                                       CustomMessageHandler &handler,
                                       const Config &config)
    : io_(io), handler_(handler), config_(config), poll_timer_(io) {}

CustomMessageRelay::~CustomMessageRelay() { Stop(); }

// ============================================================================
// Connection management
// ============================================================================

void CustomMessageRelay::AddConnection(TransportConnectionPtr conn) {
  if (!conn) {
    return;
  }
  uint64_t id = conn->connection_id();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_[id] = ConnectionState{conn, {}, std::nullopt};
  }

  conn->set_receive_callback(
      [this, id](const std::vector<uint8_t> &data) { OnReceive(id, data); });
  conn->set_disconnect_callback([this, id]() { OnDisconnect(id); });

  LOG_NET_DEBUG("relay: new {} connection {} ({}:{})",
                conn->is_inbound() ? "inbound" : "outbound", id,
                conn->remote_address(), conn->remote_port());

  message::WireSerializer hello;
  hello.write_public_key(config_.local_id);
  SendFrame(id, protocol::host_types::HELLO, hello.data());

  conn->start();
}

void CustomMessageRelay::OnDisconnect(uint64_t conn_id) {
  std::optional<PeerId> peer;
  PeerCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(conn_id);
    if (it == connections_.end()) {
      return; // Already removed by Disconnect()
    }
    peer = it->second.peer;
    if (peer) {
      auto pit = peers_.find(*peer);
      if (pit != peers_.end() && pit->second == conn_id) {
        peers_.erase(pit);
        callback = on_peer_disconnected_;
      }
    }
    connections_.erase(it);
  }

  LOG_NET_DEBUG("relay: connection {} closed by remote", conn_id);
  // Only when no newer connection took over the peer
  if (callback) {
    callback(*peer);
  }
}

void CustomMessageRelay::Disconnect(uint64_t conn_id,
                                    const std::string &reason) {
  TransportConnectionPtr conn;
  std::optional<PeerId> peer;
  PeerCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(conn_id);
    if (it == connections_.end()) {
      return;
    }
    conn = it->second.conn;
    peer = it->second.peer;
    if (peer) {
      auto pit = peers_.find(*peer);
      if (pit != peers_.end() && pit->second == conn_id) {
        peers_.erase(pit);
        callback = on_peer_disconnected_;
      }
    }
    connections_.erase(it);
  }

  peers_disconnected_.fetch_add(1, std::memory_order_relaxed);
  LOG_NET_WARN("relay: disconnecting connection {} (peer {}): {}", conn_id,
               peer ? peer->ToShortString() : std::string("unknown"), reason);

  // Outside the lock. The entry is already erased, so a transport that
  // reports the close back through OnDisconnect finds nothing to do.
  conn->close();
  if (callback) {
    callback(*peer);
  }
}

std::optional<PeerId> CustomMessageRelay::PeerOf(uint64_t conn_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(conn_id);
  if (it == connections_.end()) {
    return std::nullopt;
  }
  return it->second.peer;
}

TransportConnectionPtr CustomMessageRelay::ConnectionOf(uint64_t conn_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(conn_id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second.conn;
}

// ============================================================================
// Receive path
// ============================================================================

void CustomMessageRelay::OnReceive(uint64_t conn_id,
                                   const std::vector<uint8_t> &data) {
  std::vector<Frame> frames;
  std::string violation;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(conn_id);
    if (it == connections_.end()) {
      return;
    }
    auto &buffer = it->second.recv_buffer;
    buffer.insert(buffer.end(), data.begin(), data.end());

    if (buffer.size() > protocol::DEFAULT_RECV_FLOOD_SIZE) {
      violation = "receive buffer flood";
    }

    size_t offset = 0;
    while (violation.empty() &&
           buffer.size() - offset >= protocol::FRAME_LENGTH_SIZE) {
      size_t length = (static_cast<size_t>(buffer[offset]) << 8) |
                      buffer[offset + 1];
      if (length < protocol::TYPE_ID_SIZE) {
        violation = "frame shorter than its type id";
        break;
      }
      if (buffer.size() - offset < protocol::FRAME_LENGTH_SIZE + length) {
        break; // Wait for the rest
      }

      const uint8_t *body = buffer.data() + offset + protocol::FRAME_LENGTH_SIZE;
      Frame frame;
      frame.type = static_cast<protocol::WireTypeId>((body[0] << 8) | body[1]);
      frame.payload.assign(body + protocol::TYPE_ID_SIZE, body + length);
      frames.push_back(std::move(frame));
      offset += protocol::FRAME_LENGTH_SIZE + length;
    }
    buffer.erase(buffer.begin(), buffer.begin() + offset);
  }

  for (const auto &frame : frames) {
    frames_received_.fetch_add(1, std::memory_order_relaxed);
    if (!ProcessFrame(conn_id, frame)) {
      return;
    }
  }

  if (!violation.empty()) {
    Disconnect(conn_id, violation);
  }
}

bool CustomMessageRelay::ProcessFrame(uint64_t conn_id, const Frame &frame) {
  if (frame.type == protocol::host_types::HELLO) {
    return ProcessHello(conn_id, frame);
  }

  auto peer = PeerOf(conn_id);
  if (!peer) {
    Disconnect(conn_id, "message type " + std::to_string(frame.type) +
                            " before HELLO");
    return false;
  }

  if (frame.type == protocol::host_types::WARNING) {
    ProcessWarning(conn_id, frame);
    return true;
  }

  return ProcessCustom(conn_id, *peer, frame);
}

bool CustomMessageRelay::ProcessHello(uint64_t conn_id, const Frame &frame) {
  message::WireDeserializer d(frame.payload);
  PeerId peer = d.read_public_key();
  if (d.has_error()) {
    Disconnect(conn_id, std::string("malformed HELLO: ") +
                            message::DecodeErrorString(d.error()));
    return false;
  }
  if (peer == config_.local_id) {
    Disconnect(conn_id, "connected to self");
    return false;
  }

  uint64_t replaced = 0;
  PeerCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(conn_id);
    if (it == connections_.end()) {
      return false;
    }
    if (it->second.peer) {
      // Fall through to the disconnect below, outside the lock
      replaced = conn_id;
    } else {
      it->second.peer = peer;
      auto pit = peers_.find(peer);
      if (pit != peers_.end()) {
        replaced = pit->second;
      }
      peers_[peer] = conn_id;
      callback = on_peer_connected_;
    }
  }

  if (replaced == conn_id) {
    Disconnect(conn_id, "duplicate HELLO");
    return false;
  }
  if (replaced != 0) {
    // Newest connection wins
    Disconnect(replaced, "superseded by connection " + std::to_string(conn_id));
  }

  LOG_NET_INFO("relay: connection {} is peer {}", conn_id, peer.ToShortString());
  if (callback) {
    callback(peer);
  }
  return true;
}

void CustomMessageRelay::ProcessWarning(uint64_t conn_id, const Frame &frame) {
  message::WireDeserializer d(frame.payload);
  uint8_t channel_id[protocol::CHANNEL_ID_SIZE];
  d.read_bytes(channel_id, sizeof(channel_id));
  uint16_t len = d.read_uint16();
  std::string text(len, '\0');
  if (!d.has_error() && len > 0) {
    d.read_bytes(reinterpret_cast<uint8_t *>(text.data()), len);
  }
  if (d.has_error()) {
    LOG_NET_DEBUG("relay: malformed warning from connection {}", conn_id);
    return;
  }
  LOG_NET_WARN("relay: peer on connection {} warns: {}", conn_id, text);
}

bool CustomMessageRelay::ProcessCustom(uint64_t conn_id, const PeerId &peer,
                                       const Frame &frame) {
  auto result =
      handler_.Read(frame.type, frame.payload.data(), frame.payload.size());

  if (result.unknown()) {
    return ProcessUnknown(conn_id, frame.type);
  }

  if (result.failed()) {
    decode_failures_.fetch_add(1, std::memory_order_relaxed);
    Disconnect(conn_id, "malformed message type " + std::to_string(frame.type) +
                            ": " + message::DecodeErrorString(result.error()));
    return false;
  }

  auto msg = result.take_message();
  LOG_NET_DEBUG("relay: received {} from {}", message::GetMessageName(*msg),
                peer.ToShortString());

  auto error = handler_.HandleCustomMessage(*msg, peer);
  messages_handled_.fetch_add(1, std::memory_order_relaxed);
  if (error) {
    handler_errors_.fetch_add(1, std::memory_order_relaxed);
    return ApplyHandlerError(conn_id, peer, *error);
  }
  return true;
}

bool CustomMessageRelay::ProcessUnknown(uint64_t conn_id,
                                        protocol::WireTypeId type) {
  if (protocol::IsOddType(type)) {
    unknown_ignored_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_DEBUG("relay: ignoring unknown odd message type {} on connection {}",
                  type, conn_id);
    return true;
  }
  Disconnect(conn_id, "unknown even message type " + std::to_string(type));
  return false;
}

bool CustomMessageRelay::ApplyHandlerError(uint64_t conn_id, const PeerId &peer,
                                           const HandlerError &error) {
  LOG_NET_WARN("relay: handler rejected message from {} ({}): {}",
               peer.ToShortString(), ErrorActionString(error.action),
               error.reason);

  switch (error.action) {
  case ErrorAction::IGNORE_AND_LOG:
    return true;
  case ErrorAction::SEND_WARNING:
    SendWarning(conn_id, error.warning.empty() ? error.reason : error.warning);
    return true;
  case ErrorAction::DISCONNECT_PEER:
    Disconnect(conn_id, error.reason);
    return false;
  }
  return true;
}

// ============================================================================
// Send path
// ============================================================================

std::optional<std::vector<uint8_t>>
CustomMessageRelay::FrameMessage(protocol::WireTypeId type,
                                 const std::vector<uint8_t> &payload) {
  size_t length = protocol::TYPE_ID_SIZE + payload.size();
  if (length > protocol::MAX_MESSAGE_SIZE) {
    return std::nullopt;
  }

  message::WireSerializer s;
  s.write_uint16(static_cast<uint16_t>(length));
  s.write_uint16(type);
  s.write_bytes(payload.data(), payload.size());
  return s.release();
}

bool CustomMessageRelay::SendFrame(uint64_t conn_id, protocol::WireTypeId type,
                                   const std::vector<uint8_t> &payload) {
  auto frame = FrameMessage(type, payload);
  if (!frame) {
    LOG_NET_ERROR("relay: message type {} too large ({} bytes)", type,
                  payload.size());
    return false;
  }
  auto conn = ConnectionOf(conn_id);
  if (!conn) {
    return false;
  }
  return conn->send(*frame);
}

void CustomMessageRelay::SendWarning(uint64_t conn_id,
                                     const std::string &text) {
  message::WireSerializer s;
  uint8_t channel_id[protocol::CHANNEL_ID_SIZE] = {};
  s.write_bytes(channel_id, sizeof(channel_id));
  size_t len = std::min<size_t>(text.size(), 1024);
  s.write_uint16(static_cast<uint16_t>(len));
  s.write_bytes(reinterpret_cast<const uint8_t *>(text.data()), len);
  SendFrame(conn_id, protocol::host_types::WARNING, s.data());
}

size_t CustomMessageRelay::PollOnce() {
  auto pending = handler_.GetAndClearPendingMessages();
  size_t sent = 0;

  for (const auto &entry : pending) {
    std::vector<uint8_t> payload;
    if (message::Encode(entry.message, payload) !=
        message::EncodeStatus::OK) {
      dropped_unencodable_.fetch_add(1, std::memory_order_relaxed);
      LOG_NET_ERROR("relay: {} is receive-only, not sending to {}",
                    message::GetMessageName(entry.message),
                    entry.peer.ToShortString());
      continue;
    }

    std::optional<uint64_t> conn_id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = peers_.find(entry.peer);
      if (it != peers_.end()) {
        conn_id = it->second;
      }
    }
    if (!conn_id) {
      dropped_unroutable_.fetch_add(1, std::memory_order_relaxed);
      LOG_NET_WARN("relay: no connection to {}, dropping {}",
                   entry.peer.ToShortString(),
                   message::GetMessageName(entry.message));
      continue;
    }

    if (SendFrame(*conn_id, message::GetTypeId(entry.message), payload)) {
      ++sent;
      messages_sent_.fetch_add(1, std::memory_order_relaxed);
      LOG_NET_DEBUG("relay: sent {} to {}",
                    message::GetMessageName(entry.message),
                    entry.peer.ToShortString());
    } else {
      dropped_unroutable_.fetch_add(1, std::memory_order_relaxed);
    }
  }
  return sent;
}

// ============================================================================
// Polling timer
// ============================================================================

void CustomMessageRelay::Start() {
  std::lock_guard<std::mutex> lock(poll_state_->mutex);
  if (poll_state_->running) {
    return;
  }
  poll_state_->running = true;
  LOG_NET_INFO("relay: polling every {} ms", config_.poll_interval.count());
  SchedulePoll();
}

// Requires poll_state_->mutex
void CustomMessageRelay::SchedulePoll() {
  poll_timer_.expires_after(config_.poll_interval);
  poll_timer_.async_wait(
      [this, state = poll_state_](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->running) {
          return;
        }
        PollOnce();
        SchedulePoll();
      });
}

void CustomMessageRelay::Stop() {
  {
    std::lock_guard<std::mutex> lock(poll_state_->mutex);
    poll_state_->running = false;
    poll_timer_.cancel();
  }

  std::vector<TransportConnectionPtr> open;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[id, state] : connections_) {
      open.push_back(state.conn);
    }
    connections_.clear();
    peers_.clear();
  }
  for (auto &conn : open) {
    conn->close();
  }
}

// ============================================================================
// Accessors
// ============================================================================

bool CustomMessageRelay::IsPeerConnected(const PeerId &peer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.count(peer) > 0;
}

std::vector<PeerId> CustomMessageRelay::GetConnectedPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerId> result;
  result.reserve(peers_.size());
  for (const auto &[peer, id] : peers_) {
    result.push_back(peer);
  }
  return result;
}

size_t CustomMessageRelay::ConnectionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

CustomMessageRelay::Stats CustomMessageRelay::GetStats() const {
  Stats s;
  s.frames_received = frames_received_.load(std::memory_order_relaxed);
  s.messages_handled = messages_handled_.load(std::memory_order_relaxed);
  s.messages_sent = messages_sent_.load(std::memory_order_relaxed);
  s.decode_failures = decode_failures_.load(std::memory_order_relaxed);
  s.handler_errors = handler_errors_.load(std::memory_order_relaxed);
  s.unknown_ignored = unknown_ignored_.load(std::memory_order_relaxed);
  s.dropped_unroutable = dropped_unroutable_.load(std::memory_order_relaxed);
  s.dropped_unencodable = dropped_unencodable_.load(std::memory_order_relaxed);
  s.peers_disconnected = peers_disconnected_.load(std::memory_order_relaxed);
  return s;
}

void CustomMessageRelay::SetPeerConnectedCallback(PeerCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_peer_connected_ = std::move(callback);
}

void CustomMessageRelay::SetPeerDisconnectedCallback(PeerCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_peer_disconnected_ = std::move(callback);
}

} // namespace network
} // namespace watchtower
