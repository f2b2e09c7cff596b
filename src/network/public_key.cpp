// Copyright (c) 2025 The Watchtower developers

#include "network/public_key.hpp"
#include <random>

namespace watchtower {
namespace network {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::optional<PublicKey> PublicKey::FromHex(const std::string &hex) {
  if (hex.size() != 2 * protocol::PUBLIC_KEY_SIZE) {
    return std::nullopt;
  }

  Bytes bytes;
  for (size_t i = 0; i < bytes.size(); ++i) {
    int hi = HexValue(hex[2 * i]);
    int lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
  }

  if (!IsValidPrefix(bytes[0])) {
    return std::nullopt;
  }
  return PublicKey(bytes);
}

PublicKey PublicKey::Random() {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_int_distribution<int> byte_dist(0, 255);

  Bytes bytes;
  bytes[0] = (gen() & 1) ? 0x03 : 0x02;
  for (size_t i = 1; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(byte_dist(gen));
  }
  return PublicKey(bytes);
}

std::string PublicKey::ToHex() const {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(2 * bytes_.size());
  for (uint8_t b : bytes_) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

} // namespace network
} // namespace watchtower
