// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_PROTOCOL_HPP
#define WATCHTOWER_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>

namespace watchtower {
namespace protocol {

// Wire type identifier: 16-bit tag in front of every message payload
using WireTypeId = uint16_t;

// Application-specific (custom) message range. Ids below CUSTOM_TYPE_MIN
// belong to the host protocol's standardized message set.
constexpr WireTypeId CUSTOM_TYPE_MIN = 32768;
constexpr WireTypeId CUSTOM_TYPE_MAX = 65535;

constexpr bool IsCustomType(WireTypeId type) {
  return type >= CUSTOM_TYPE_MIN;
}

// BOLT #1: unknown odd messages may be ignored, unknown even messages
// must fail the connection
constexpr bool IsOddType(WireTypeId type) { return (type & 1) != 0; }

// Custom message types (BOLT #13 draft numbering)
namespace types {
constexpr WireTypeId REGISTER = 45768;
constexpr WireTypeId SUBSCRIPTION_DETAILS = 45770;
constexpr WireTypeId USER_HEARTBEAT = 45773;
} // namespace types

// Standardized host-protocol messages the relay itself understands
namespace host_types {
constexpr WireTypeId WARNING = 1;
constexpr WireTypeId HELLO = 16;
} // namespace host_types

// Default port for watchtower nodes (BOLT #13)
constexpr uint16_t DEFAULT_PORT = 9814;

// Host framing: [length u16][type u16][payload], length counts type+payload
constexpr size_t FRAME_LENGTH_SIZE = 2;
constexpr size_t TYPE_ID_SIZE = 2;
constexpr size_t MAX_MESSAGE_SIZE = 65535;

// Compressed secp256k1 public key
constexpr size_t PUBLIC_KEY_SIZE = 33;

// WARNING message channel id (all zeros: not channel specific)
constexpr size_t CHANNEL_ID_SIZE = 32;

// Per-connection receive buffer cap before the peer is dropped
constexpr size_t DEFAULT_RECV_FLOOD_SIZE = 4 * MAX_MESSAGE_SIZE;

// Per-connection send queue cap (RealTransport)
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 5 * 1000 * 1000;

// Polling cadence for outbound custom messages
constexpr int DEFAULT_POLL_INTERVAL_MS = 100;

// Tower business defaults
constexpr uint16_t DEFAULT_APPOINTMENT_MAX_SIZE = 30;

} // namespace protocol
} // namespace watchtower

#endif // WATCHTOWER_PROTOCOL_HPP
