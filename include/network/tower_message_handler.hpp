// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_TOWER_MESSAGE_HANDLER_HPP
#define WATCHTOWER_NETWORK_TOWER_MESSAGE_HANDLER_HPP

#include "network/custom_message_handler.hpp"
#include "network/pending_message_queue.hpp"
#include "network/protocol.hpp"
#include <atomic>
#include <cstdint>
#include <memory>

namespace watchtower {
namespace network {

/**
 * TowerMessageHandler - tower side of the registration exchange
 *
 * Register             -> queue SubscriptionDetails for the sender
 * SubscriptionDetails  -> rejected (towers never register with anyone)
 * UserHeartbeat        -> no reaction
 *
 * The fee quoted in SubscriptionDetails is appointment_slots *
 * subscription_period msat (storage * time).
 */
class TowerMessageHandler : public CustomMessageHandler {
public:
  struct Config {
    uint16_t appointment_max_size = protocol::DEFAULT_APPOINTMENT_MAX_SIZE;
  };

  struct Stats {
    uint64_t registrations_accepted = 0;
    uint64_t registrations_rejected = 0;
    uint64_t unexpected_messages = 0;
    uint64_t heartbeats = 0;
  };

  explicit TowerMessageHandler(std::shared_ptr<PendingMessageQueue> queue);
  TowerMessageHandler(std::shared_ptr<PendingMessageQueue> queue,
                      const Config &config);

  std::optional<HandlerError>
  HandleCustomMessage(const message::TowerMessage &msg,
                      const PeerId &sender) override;

  std::vector<PendingMessage> GetAndClearPendingMessages() override;

  // Schedule a message outside of any received-message reaction
  void SendMessage(const PeerId &peer, message::TowerMessage msg);

  Stats GetStats() const;
  const Config &config() const { return config_; }

private:
  std::optional<HandlerError> OnRegister(const message::Register &msg,
                                         const PeerId &sender);
  std::optional<HandlerError>
  OnSubscriptionDetails(const message::SubscriptionDetails &msg,
                        const PeerId &sender);
  std::optional<HandlerError> OnHeartbeat(const message::UserHeartbeat &msg,
                                          const PeerId &sender);

  std::shared_ptr<PendingMessageQueue> queue_;
  Config config_;

  std::atomic<uint64_t> registrations_accepted_{0};
  std::atomic<uint64_t> registrations_rejected_{0};
  std::atomic<uint64_t> unexpected_messages_{0};
  std::atomic<uint64_t> heartbeats_{0};
};

} // namespace network
} // namespace watchtower

#endif // WATCHTOWER_NETWORK_TOWER_MESSAGE_HANDLER_HPP
