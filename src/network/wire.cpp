// Copyright (c) 2025 The Watchtower developers

#include "network/wire.hpp"
#include <cstring>

namespace watchtower {
namespace message {

const char *DecodeErrorString(DecodeError error) {
  switch (error) {
  case DecodeError::NONE:
    return "none";
  case DecodeError::SHORT_READ:
    return "short read";
  case DecodeError::INVALID_VALUE:
    return "invalid value";
  }
  return "unknown";
}

// ============================================================================
// WireSerializer
// ============================================================================

void WireSerializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void WireSerializer::write_uint16(uint16_t value) {
  buffer_.push_back(static_cast<uint8_t>(value >> 8));
  buffer_.push_back(static_cast<uint8_t>(value));
}

void WireSerializer::write_uint32(uint32_t value) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    buffer_.push_back(static_cast<uint8_t>(value >> shift));
  }
}

void WireSerializer::write_uint64(uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    buffer_.push_back(static_cast<uint8_t>(value >> shift));
  }
}

void WireSerializer::write_bytes(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void WireSerializer::write_public_key(const network::PublicKey &key) {
  write_bytes(key.data(), key.size());
}

// ============================================================================
// WireDeserializer
// ============================================================================

WireDeserializer::WireDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(data ? size : 0) {}

WireDeserializer::WireDeserializer(const std::vector<uint8_t> &buffer)
    : data_(buffer.data()), size_(buffer.size()) {}

bool WireDeserializer::check_available(size_t len) {
  if (has_error()) {
    return false;
  }
  if (len > bytes_remaining()) {
    error_ = DecodeError::SHORT_READ;
    return false;
  }
  return true;
}

uint8_t WireDeserializer::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

uint16_t WireDeserializer::read_uint16() {
  if (!check_available(2))
    return 0;
  uint16_t value = static_cast<uint16_t>((data_[position_] << 8) |
                                         data_[position_ + 1]);
  position_ += 2;
  return value;
}

uint32_t WireDeserializer::read_uint32() {
  if (!check_available(4))
    return 0;
  uint32_t value = 0;
  for (size_t i = 0; i < 4; ++i) {
    value = (value << 8) | data_[position_ + i];
  }
  position_ += 4;
  return value;
}

uint64_t WireDeserializer::read_uint64() {
  if (!check_available(8))
    return 0;
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value = (value << 8) | data_[position_ + i];
  }
  position_ += 8;
  return value;
}

bool WireDeserializer::read_bytes(uint8_t *out, size_t len) {
  if (!check_available(len))
    return false;
  std::memcpy(out, data_ + position_, len);
  position_ += len;
  return true;
}

network::PublicKey WireDeserializer::read_public_key() {
  network::PublicKey::Bytes bytes;
  if (!read_bytes(bytes.data(), bytes.size())) {
    return network::PublicKey();
  }
  if (!network::PublicKey::IsValidPrefix(bytes[0])) {
    error_ = DecodeError::INVALID_VALUE;
    return network::PublicKey();
  }
  return network::PublicKey(bytes);
}

} // namespace message
} // namespace watchtower
