// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_WIRE_HPP
#define WATCHTOWER_NETWORK_WIRE_HPP

#include "network/public_key.hpp"
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace watchtower {
namespace message {

/**
 * Structural wire-format failures. A DecodeError always means the bytes do
 * not form a valid instance of a known message; it never carries business
 * meaning and is never used for unrecognized type ids.
 */
enum class DecodeError {
  NONE = 0,
  SHORT_READ,    // Payload ended before the last declared field
  INVALID_VALUE, // A field holds a value its type does not allow
};

const char *DecodeErrorString(DecodeError error);

// Result of encoding one message. UNSUPPORTED: the variant is receive-only.
enum class EncodeStatus {
  OK = 0,
  UNSUPPORTED,
};

/**
 * WireSerializer - appends big-endian fields to a byte buffer
 */
class WireSerializer {
public:
  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_bytes(const uint8_t *data, size_t len);
  void write_public_key(const network::PublicKey &key);

  const std::vector<uint8_t> &data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * WireDeserializer - reads big-endian fields from a byte range
 *
 * The first failure is sticky: later reads return zero values and leave the
 * recorded error unchanged, so a decoder can read every field and check
 * error() once at the end.
 */
class WireDeserializer {
public:
  WireDeserializer(const uint8_t *data, size_t size);
  explicit WireDeserializer(const std::vector<uint8_t> &buffer);

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  bool read_bytes(uint8_t *out, size_t len);
  network::PublicKey read_public_key();

  bool has_error() const { return error_ != DecodeError::NONE; }
  DecodeError error() const { return error_; }
  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }

private:
  bool check_available(size_t len);

  const uint8_t *data_;
  size_t size_;
  size_t position_ = 0;
  DecodeError error_ = DecodeError::NONE;
};

} // namespace message
} // namespace watchtower

#endif // WATCHTOWER_NETWORK_WIRE_HPP
