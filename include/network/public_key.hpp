// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_PUBLIC_KEY_HPP
#define WATCHTOWER_NETWORK_PUBLIC_KEY_HPP

#include "network/protocol.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace watchtower {
namespace network {

/**
 * PublicKey - 33-byte compressed secp256k1 public key
 *
 * Immutable value type. Used both as a message field and as the peer
 * identifier (node id). Only the encoding prefix is checked here; curve
 * validation belongs to the cryptography layer.
 */
class PublicKey {
public:
  using Bytes = std::array<uint8_t, protocol::PUBLIC_KEY_SIZE>;

  PublicKey() { bytes_.fill(0); }
  explicit PublicKey(const Bytes &bytes) : bytes_(bytes) {}

  // Parse 66 hex characters, nullopt on bad length/characters/prefix
  static std::optional<PublicKey> FromHex(const std::string &hex);

  // Random key with a valid compressed prefix (node ids, tests)
  static PublicKey Random();

  const Bytes &bytes() const { return bytes_; }
  const uint8_t *data() const { return bytes_.data(); }
  static constexpr size_t size() { return protocol::PUBLIC_KEY_SIZE; }

  // True if the first byte is a compressed point prefix (0x02 / 0x03)
  bool IsValid() const { return IsValidPrefix(bytes_[0]); }
  static bool IsValidPrefix(uint8_t prefix) {
    return prefix == 0x02 || prefix == 0x03;
  }

  std::string ToHex() const;
  // Abbreviated form for logs: first 8 hex chars
  std::string ToShortString() const { return ToHex().substr(0, 8); }

  bool operator==(const PublicKey &other) const {
    return bytes_ == other.bytes_;
  }
  bool operator!=(const PublicKey &other) const { return !(*this == other); }
  bool operator<(const PublicKey &other) const { return bytes_ < other.bytes_; }

private:
  Bytes bytes_;
};

// Remote participants are identified by their node public key
using PeerId = PublicKey;

} // namespace network
} // namespace watchtower

namespace std {
template <> struct hash<watchtower::network::PublicKey> {
  size_t operator()(const watchtower::network::PublicKey &key) const noexcept {
    // Skip the prefix byte, the rest is uniformly distributed
    size_t h = 0;
    for (size_t i = 1; i < 1 + sizeof(size_t); ++i) {
      h = (h << 8) | key.bytes()[i];
    }
    return h;
  }
};
} // namespace std

#endif // WATCHTOWER_NETWORK_PUBLIC_KEY_HPP
