// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_USER_MESSAGE_HANDLER_HPP
#define WATCHTOWER_NETWORK_USER_MESSAGE_HANDLER_HPP

#include "network/custom_message_handler.hpp"
#include "network/pending_message_queue.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

namespace watchtower {
namespace network {

/**
 * UserMessageHandler - registerer side of the exchange
 *
 * Sends Register to towers and records the SubscriptionDetails they answer
 * with. Details from a tower we never registered with are rejected, and a
 * Register sent to a user is a protocol violation.
 */
class UserMessageHandler : public CustomMessageHandler {
public:
  explicit UserMessageHandler(std::shared_ptr<PendingMessageQueue> queue);

  std::optional<HandlerError>
  HandleCustomMessage(const message::TowerMessage &msg,
                      const PeerId &sender) override;

  std::vector<PendingMessage> GetAndClearPendingMessages() override;

  // Queue a Register for `tower` and remember that we are waiting on it
  void RegisterWithTower(const PeerId &tower, const PublicKey &user_key,
                         uint32_t appointment_slots,
                         uint32_t subscription_period);

  std::optional<message::SubscriptionDetails>
  GetSubscription(const PeerId &tower) const;
  bool IsPending(const PeerId &tower) const;
  std::map<PeerId, message::SubscriptionDetails> GetSubscriptions() const;

private:
  std::optional<HandlerError> OnRegister(const message::Register &msg,
                                         const PeerId &sender);
  std::optional<HandlerError>
  OnSubscriptionDetails(const message::SubscriptionDetails &msg,
                        const PeerId &sender);

  std::shared_ptr<PendingMessageQueue> queue_;

  mutable std::mutex mutex_;
  std::set<PeerId> pending_towers_;
  std::map<PeerId, message::SubscriptionDetails> subscriptions_;
};

} // namespace network
} // namespace watchtower

#endif // WATCHTOWER_NETWORK_USER_MESSAGE_HANDLER_HPP
