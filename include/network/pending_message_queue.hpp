// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_PENDING_MESSAGE_QUEUE_HPP
#define WATCHTOWER_NETWORK_PENDING_MESSAGE_QUEUE_HPP

#include "network/public_key.hpp"
#include "network/tower_messages.hpp"
#include <mutex>
#include <vector>

namespace watchtower {
namespace network {

// "Send this message to this peer"
struct PendingMessage {
  PeerId peer;
  message::TowerMessage message;
};

/**
 * PendingMessageQueue - outbound custom messages waiting for the host
 *
 * Written by message handlers and application code, read by the host's
 * polling loop through DrainAndClear(). Insertion order is preserved across
 * all peers and entries are never merged.
 *
 * Thread-safety: every method takes the internal mutex for the append or
 * the swap only. A mutex failure surfaces as std::system_error.
 *
 * One queue per node, created at startup and shared with the handler:
 *   auto queue = std::make_shared<PendingMessageQueue>();
 *   TowerMessageHandler handler(queue, config);
 */
class PendingMessageQueue {
public:
  PendingMessageQueue() = default;

  // Non-copyable
  PendingMessageQueue(const PendingMessageQueue &) = delete;
  PendingMessageQueue &operator=(const PendingMessageQueue &) = delete;

  void Enqueue(const PeerId &peer, message::TowerMessage msg);

  /**
   * Remove and return every queued entry, oldest first
   *
   * Entries enqueued after the swap belong to the next drain.
   */
  std::vector<PendingMessage> DrainAndClear();

  size_t Size() const;
  bool Empty() const;

private:
  mutable std::mutex mutex_;
  std::vector<PendingMessage> pending_;
};

} // namespace network
} // namespace watchtower

#endif // WATCHTOWER_NETWORK_PENDING_MESSAGE_QUEUE_HPP
