// Copyright (c) 2025 The Watchtower developers

#include "network/pending_message_queue.hpp"
#include <utility>

namespace watchtower {
namespace network {

void PendingMessageQueue::Enqueue(const PeerId &peer,
                                  message::TowerMessage msg) {
  PendingMessage entry{peer, std::move(msg)};
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.push_back(std::move(entry));
}

std::vector<PendingMessage> PendingMessageQueue::DrainAndClear() {
  std::vector<PendingMessage> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(pending_);
  }
  return drained;
}

size_t PendingMessageQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool PendingMessageQueue::Empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.empty();
}

} // namespace network
} // namespace watchtower
