// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_TOWER_MESSAGES_HPP
#define WATCHTOWER_NETWORK_TOWER_MESSAGES_HPP

#include "network/protocol.hpp"
#include "network/public_key.hpp"
#include "network/wire.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace watchtower {
namespace message {

// Each message kind declares its wire type id and which directions this
// node supports. The field order in serialize()/deserialize() is part of the
// wire contract and must not change once a message kind is released.

/**
 * Register - sent by a user to a tower to subscribe to the watching service
 */
struct Register {
  static constexpr protocol::WireTypeId TYPE = protocol::types::REGISTER;
  static constexpr const char *NAME = "register";
  static constexpr bool CAN_ENCODE = true;
  static constexpr bool CAN_DECODE = true;

  network::PublicKey pubkey;
  uint32_t appointment_slots = 0;
  uint32_t subscription_period = 0;

  void serialize(WireSerializer &s) const;
  DecodeError deserialize(const uint8_t *data, size_t size);
  std::string ToString() const;

  bool operator==(const Register &other) const {
    return pubkey == other.pubkey &&
           appointment_slots == other.appointment_slots &&
           subscription_period == other.subscription_period;
  }
};

/**
 * SubscriptionDetails - a tower's reply to Register: maximum appointment
 * size and the subscription fee in millisatoshi
 */
struct SubscriptionDetails {
  static constexpr protocol::WireTypeId TYPE =
      protocol::types::SUBSCRIPTION_DETAILS;
  static constexpr const char *NAME = "subscription_details";
  static constexpr bool CAN_ENCODE = true;
  static constexpr bool CAN_DECODE = true;

  uint16_t appointment_max_size = 0;
  uint32_t amount_msat = 0;

  void serialize(WireSerializer &s) const;
  DecodeError deserialize(const uint8_t *data, size_t size);
  std::string ToString() const;

  bool operator==(const SubscriptionDetails &other) const {
    return appointment_max_size == other.appointment_max_size &&
           amount_msat == other.amount_msat;
  }
};

/**
 * UserHeartbeat - liveness notice from a light client. Receive-only on this
 * node: it is decoded but never encoded. Odd type, so peers that do not
 * know it may ignore it.
 */
struct UserHeartbeat {
  static constexpr protocol::WireTypeId TYPE = protocol::types::USER_HEARTBEAT;
  static constexpr const char *NAME = "user_heartbeat";
  static constexpr bool CAN_ENCODE = false;
  static constexpr bool CAN_DECODE = true;

  network::PublicKey pubkey;
  uint32_t timestamp = 0;

  DecodeError deserialize(const uint8_t *data, size_t size);
  std::string ToString() const;

  bool operator==(const UserHeartbeat &other) const {
    return pubkey == other.pubkey && timestamp == other.timestamp;
  }
};

// All custom messages this node can send or receive
using TowerMessage = std::variant<Register, SubscriptionDetails, UserHeartbeat>;

protocol::WireTypeId GetTypeId(const TowerMessage &msg);
const char *GetMessageName(const TowerMessage &msg);
std::string ToString(const TowerMessage &msg);

// Whether this node can put the message on the wire
bool CanEncode(const TowerMessage &msg);

/**
 * Encode the payload of a message (without its type id)
 *
 * @param msg Message to encode
 * @param out Receives the payload; untouched unless OK is returned
 * @return OK, or UNSUPPORTED for receive-only message kinds
 */
EncodeStatus Encode(const TowerMessage &msg, std::vector<uint8_t> &out);

namespace detail {

template <typename Variant> struct MessageTypeIds;

template <typename... Ts> struct MessageTypeIds<std::variant<Ts...>> {
  static constexpr std::array<protocol::WireTypeId, sizeof...(Ts)> value{
      Ts::TYPE...};
};

template <size_t N>
constexpr bool AllDistinct(const std::array<protocol::WireTypeId, N> &ids) {
  for (size_t i = 0; i < N; ++i) {
    for (size_t j = i + 1; j < N; ++j) {
      if (ids[i] == ids[j])
        return false;
    }
  }
  return true;
}

template <size_t N>
constexpr bool AllCustom(const std::array<protocol::WireTypeId, N> &ids) {
  for (size_t i = 0; i < N; ++i) {
    if (!protocol::IsCustomType(ids[i]))
      return false;
  }
  return true;
}

} // namespace detail

static_assert(detail::AllDistinct(detail::MessageTypeIds<TowerMessage>::value),
              "two TowerMessage kinds share a wire type id");
static_assert(detail::AllCustom(detail::MessageTypeIds<TowerMessage>::value),
              "TowerMessage type ids must be in the custom message range");

} // namespace message
} // namespace watchtower

#endif // WATCHTOWER_NETWORK_TOWER_MESSAGES_HPP
