// Copyright (c) 2025 The Watchtower developers

#include "network/user_message_handler.hpp"
#include "util/logging.hpp"
#include <stdexcept>
#include <utility>
#include <variant>

namespace watchtower {
namespace network {

static_assert(std::variant_size_v<message::TowerMessage> == 3,
              "UserMessageHandler must handle every TowerMessage kind");

UserMessageHandler::UserMessageHandler(
    std::shared_ptr<PendingMessageQueue> queue)
    : queue_(std::move(queue)) {
  if (!queue_) {
    throw std::invalid_argument("UserMessageHandler requires a queue");
  }
}

std::optional<HandlerError>
UserMessageHandler::HandleCustomMessage(const message::TowerMessage &msg,
                                        const PeerId &sender) {
  struct Reaction {
    UserMessageHandler &self;
    const PeerId &sender;

    std::optional<HandlerError> operator()(const message::Register &m) {
      return self.OnRegister(m, sender);
    }
    std::optional<HandlerError>
    operator()(const message::SubscriptionDetails &m) {
      return self.OnSubscriptionDetails(m, sender);
    }
    std::optional<HandlerError> operator()(const message::UserHeartbeat &) {
      // Heartbeats are addressed to towers; nothing to do
      return std::nullopt;
    }
  };

  return std::visit(Reaction{*this, sender}, msg);
}

std::optional<HandlerError>
UserMessageHandler::OnRegister(const message::Register &msg,
                               const PeerId &sender) {
  LOG_TOWER_WARN("Peer {} sent {} to a user node", sender.ToShortString(),
                 msg.ToString());
  return HandlerError{"register received by a user node",
                      ErrorAction::DISCONNECT_PEER, ""};
}

std::optional<HandlerError> UserMessageHandler::OnSubscriptionDetails(
    const message::SubscriptionDetails &msg, const PeerId &sender) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_towers_.find(sender);
  if (it == pending_towers_.end()) {
    return HandlerError{"unsolicited SubscriptionDetails from " +
                            sender.ToShortString(),
                        ErrorAction::SEND_WARNING,
                        "You sent me SubscriptionDetails but I didn't register!"};
  }

  pending_towers_.erase(it);
  subscriptions_[sender] = msg;
  LOG_TOWER_INFO("Subscribed to tower {}: {}", sender.ToShortString(),
                 msg.ToString());
  return std::nullopt;
}

void UserMessageHandler::RegisterWithTower(const PeerId &tower,
                                           const PublicKey &user_key,
                                           uint32_t appointment_slots,
                                           uint32_t subscription_period) {
  message::Register reg;
  reg.pubkey = user_key;
  reg.appointment_slots = appointment_slots;
  reg.subscription_period = subscription_period;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_towers_.insert(tower);
  }

  LOG_TOWER_INFO("Registering with tower {}: {}", tower.ToShortString(),
                 reg.ToString());
  queue_->Enqueue(tower, reg);
}

std::optional<message::SubscriptionDetails>
UserMessageHandler::GetSubscription(const PeerId &tower) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscriptions_.find(tower);
  if (it == subscriptions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool UserMessageHandler::IsPending(const PeerId &tower) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_towers_.count(tower) > 0;
}

std::map<PeerId, message::SubscriptionDetails>
UserMessageHandler::GetSubscriptions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_;
}

std::vector<PendingMessage> UserMessageHandler::GetAndClearPendingMessages() {
  return queue_->DrainAndClear();
}

} // namespace network
} // namespace watchtower
