// Copyright (c) 2025 The Watchtower developers

#include "network/tower_message_handler.hpp"
#include "util/logging.hpp"
#include <limits>
#include <stdexcept>
#include <utility>
#include <variant>

namespace watchtower {
namespace network {

// Adding a TowerMessage kind must come with a decision here
static_assert(std::variant_size_v<message::TowerMessage> == 3,
              "TowerMessageHandler must handle every TowerMessage kind");

TowerMessageHandler::TowerMessageHandler(
    std::shared_ptr<PendingMessageQueue> queue)
    : TowerMessageHandler(std::move(queue), Config{}) {}

TowerMessageHandler::TowerMessageHandler(
    std::shared_ptr<PendingMessageQueue> queue, const Config &config)
    : queue_(std::move(queue)), config_(config) {
  if (!queue_) {
    throw std::invalid_argument("TowerMessageHandler requires a queue");
  }
}

std::optional<HandlerError>
TowerMessageHandler::HandleCustomMessage(const message::TowerMessage &msg,
                                         const PeerId &sender) {
  struct Reaction {
    TowerMessageHandler &self;
    const PeerId &sender;

    std::optional<HandlerError> operator()(const message::Register &m) {
      return self.OnRegister(m, sender);
    }
    std::optional<HandlerError>
    operator()(const message::SubscriptionDetails &m) {
      return self.OnSubscriptionDetails(m, sender);
    }
    std::optional<HandlerError> operator()(const message::UserHeartbeat &m) {
      return self.OnHeartbeat(m, sender);
    }
  };

  return std::visit(Reaction{*this, sender}, msg);
}

std::optional<HandlerError>
TowerMessageHandler::OnRegister(const message::Register &msg,
                                const PeerId &sender) {
  LOG_TOWER_DEBUG("Received {} from peer {}", msg.ToString(),
                  sender.ToShortString());

  if (msg.appointment_slots == 0 || msg.subscription_period == 0) {
    registrations_rejected_.fetch_add(1, std::memory_order_relaxed);
    return HandlerError{
        "register with empty subscription from " + sender.ToShortString(),
        ErrorAction::SEND_WARNING,
        "Register needs non-zero appointment_slots and subscription_period"};
  }

  // Pay for storage * time
  uint64_t amount = static_cast<uint64_t>(msg.appointment_slots) *
                    static_cast<uint64_t>(msg.subscription_period);
  if (amount > std::numeric_limits<uint32_t>::max()) {
    registrations_rejected_.fetch_add(1, std::memory_order_relaxed);
    return HandlerError{"register fee overflows u32 msat from " +
                            sender.ToShortString(),
                        ErrorAction::SEND_WARNING,
                        "Requested subscription is too large"};
  }

  message::SubscriptionDetails reply;
  reply.appointment_max_size = config_.appointment_max_size;
  reply.amount_msat = static_cast<uint32_t>(amount);

  LOG_TOWER_INFO("Registering user {} ({} slots, {} blocks), responding with {}",
                 msg.pubkey.ToShortString(), msg.appointment_slots,
                 msg.subscription_period, reply.ToString());

  queue_->Enqueue(sender, reply);
  registrations_accepted_.fetch_add(1, std::memory_order_relaxed);
  return std::nullopt;
}

std::optional<HandlerError> TowerMessageHandler::OnSubscriptionDetails(
    const message::SubscriptionDetails &msg, const PeerId &sender) {
  LOG_TOWER_DEBUG("Received unexpected {} from peer {}", msg.ToString(),
                  sender.ToShortString());
  unexpected_messages_.fetch_add(1, std::memory_order_relaxed);
  return HandlerError{
      "A SubscriptionDetails message wasn't expected!",
      ErrorAction::SEND_WARNING,
      "You sent me a SubscriptionDetails message but I didn't register!"};
}

std::optional<HandlerError>
TowerMessageHandler::OnHeartbeat(const message::UserHeartbeat &msg,
                                 const PeerId &sender) {
  // No reaction
  LOG_TOWER_TRACE("Heartbeat from {} (user {}, t={})", sender.ToShortString(),
                  msg.pubkey.ToShortString(), msg.timestamp);
  heartbeats_.fetch_add(1, std::memory_order_relaxed);
  return std::nullopt;
}

std::vector<PendingMessage> TowerMessageHandler::GetAndClearPendingMessages() {
  return queue_->DrainAndClear();
}

void TowerMessageHandler::SendMessage(const PeerId &peer,
                                      message::TowerMessage msg) {
  queue_->Enqueue(peer, std::move(msg));
}

TowerMessageHandler::Stats TowerMessageHandler::GetStats() const {
  Stats stats;
  stats.registrations_accepted =
      registrations_accepted_.load(std::memory_order_relaxed);
  stats.registrations_rejected =
      registrations_rejected_.load(std::memory_order_relaxed);
  stats.unexpected_messages = unexpected_messages_.load(std::memory_order_relaxed);
  stats.heartbeats = heartbeats_.load(std::memory_order_relaxed);
  return stats;
}

} // namespace network
} // namespace watchtower
