// Copyright (c) 2025 The Watchtower developers

#include "network/tower_messages.hpp"
#include <fmt/format.h>
#include <type_traits>

namespace watchtower {
namespace message {

// ============================================================================
// Register
// ============================================================================

void Register::serialize(WireSerializer &s) const {
  s.write_public_key(pubkey);
  s.write_uint32(appointment_slots);
  s.write_uint32(subscription_period);
}

DecodeError Register::deserialize(const uint8_t *data, size_t size) {
  WireDeserializer d(data, size);
  pubkey = d.read_public_key();
  appointment_slots = d.read_uint32();
  subscription_period = d.read_uint32();
  return d.error();
}

std::string Register::ToString() const {
  return fmt::format(
      "Register(pubkey={}, appointment_slots={}, subscription_period={})",
      pubkey.ToHex(), appointment_slots, subscription_period);
}

// ============================================================================
// SubscriptionDetails
// ============================================================================

void SubscriptionDetails::serialize(WireSerializer &s) const {
  s.write_uint16(appointment_max_size);
  s.write_uint32(amount_msat);
}

DecodeError SubscriptionDetails::deserialize(const uint8_t *data,
                                             size_t size) {
  WireDeserializer d(data, size);
  appointment_max_size = d.read_uint16();
  amount_msat = d.read_uint32();
  return d.error();
}

std::string SubscriptionDetails::ToString() const {
  return fmt::format(
      "SubscriptionDetails(appointment_max_size={}, amount_msat={})",
      appointment_max_size, amount_msat);
}

// ============================================================================
// UserHeartbeat
// ============================================================================

DecodeError UserHeartbeat::deserialize(const uint8_t *data, size_t size) {
  WireDeserializer d(data, size);
  pubkey = d.read_public_key();
  timestamp = d.read_uint32();
  return d.error();
}

std::string UserHeartbeat::ToString() const {
  return fmt::format("UserHeartbeat(pubkey={}, timestamp={})", pubkey.ToHex(),
                     timestamp);
}

// ============================================================================
// TowerMessage
// ============================================================================

protocol::WireTypeId GetTypeId(const TowerMessage &msg) {
  return std::visit([](const auto &m) { return std::decay_t<decltype(m)>::TYPE; },
                    msg);
}

const char *GetMessageName(const TowerMessage &msg) {
  return std::visit([](const auto &m) { return std::decay_t<decltype(m)>::NAME; },
                    msg);
}

std::string ToString(const TowerMessage &msg) {
  return std::visit([](const auto &m) { return m.ToString(); }, msg);
}

bool CanEncode(const TowerMessage &msg) {
  return std::visit(
      [](const auto &m) { return std::decay_t<decltype(m)>::CAN_ENCODE; }, msg);
}

EncodeStatus Encode(const TowerMessage &msg, std::vector<uint8_t> &out) {
  return std::visit(
      [&out](const auto &m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (T::CAN_ENCODE) {
          WireSerializer s;
          m.serialize(s);
          out = s.release();
          return EncodeStatus::OK;
        } else {
          return EncodeStatus::UNSUPPORTED;
        }
      },
      msg);
}

} // namespace message
} // namespace watchtower
