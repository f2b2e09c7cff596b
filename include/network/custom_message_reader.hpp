// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_CUSTOM_MESSAGE_READER_HPP
#define WATCHTOWER_NETWORK_CUSTOM_MESSAGE_READER_HPP

#include "network/protocol.hpp"
#include "network/tower_messages.hpp"
#include <optional>
#include <variant>
#include <utility>

namespace watchtower {
namespace message {

/**
 * BasicReadResult - outcome of reading one custom message
 *
 * Three distinct cases:
 * - message():  the type id is ours and the payload decoded
 * - unknown():  the type id is not one of ours (not an error - the id space
 *               is shared with the host protocol and other extensions)
 * - failed():   the type id is ours but the payload is malformed
 */
template <typename Variant> class BasicReadResult {
public:
  static BasicReadResult Message(Variant msg) {
    BasicReadResult r;
    r.message_ = std::move(msg);
    return r;
  }
  static BasicReadResult Unknown() { return BasicReadResult(); }
  static BasicReadResult Error(DecodeError error) {
    BasicReadResult r;
    r.error_ = error;
    return r;
  }

  bool failed() const { return error_ != DecodeError::NONE; }
  bool unknown() const { return !failed() && !message_.has_value(); }
  bool has_message() const { return message_.has_value(); }

  DecodeError error() const { return error_; }
  const std::optional<Variant> &message() const { return message_; }
  std::optional<Variant> take_message() { return std::move(message_); }

private:
  BasicReadResult() = default;

  std::optional<Variant> message_;
  DecodeError error_ = DecodeError::NONE;
};

using ReadResult = BasicReadResult<TowerMessage>;

namespace detail {

template <typename T, typename Variant>
bool TryDecode(protocol::WireTypeId type_id, const uint8_t *data, size_t size,
               BasicReadResult<Variant> &result) {
  if constexpr (!T::CAN_DECODE) {
    return false;
  } else {
    if (type_id != T::TYPE) {
      return false;
    }
    T msg;
    DecodeError err = msg.deserialize(data, size);
    result = err == DecodeError::NONE
                 ? BasicReadResult<Variant>::Message(std::move(msg))
                 : BasicReadResult<Variant>::Error(err);
    return true;
  }
}

// Tries every alternative in declaration order, so a new message kind is
// dispatched as soon as it joins the variant
template <typename Variant> struct Dispatcher;

template <typename... Ts> struct Dispatcher<std::variant<Ts...>> {
  using Result = BasicReadResult<std::variant<Ts...>>;

  static Result Read(protocol::WireTypeId type_id, const uint8_t *data,
                     size_t size) {
    Result result = Result::Unknown();
    (TryDecode<Ts>(type_id, data, size, result) || ...);
    return result;
  }

  static bool Knows(protocol::WireTypeId type_id) {
    return ((Ts::CAN_DECODE && Ts::TYPE == type_id) || ...);
  }
};

} // namespace detail

/**
 * Decode a payload into one of the kinds of a message set
 *
 * Ids outside the custom range are never decoded.
 */
template <typename Variant>
BasicReadResult<Variant> ReadMessageAs(protocol::WireTypeId type_id,
                                       const uint8_t *data, size_t size) {
  static_assert(detail::AllDistinct(detail::MessageTypeIds<Variant>::value),
                "two message kinds share a wire type id");
  if (!protocol::IsCustomType(type_id)) {
    return BasicReadResult<Variant>::Unknown();
  }
  return detail::Dispatcher<Variant>::Read(type_id, data, size);
}

/**
 * Map a wire type id to its TowerMessage decoder
 *
 * @param type_id Wire type id that preceded the payload
 * @param data Payload bytes (may be null when size is 0)
 * @param size Payload length
 */
ReadResult ReadCustomMessage(protocol::WireTypeId type_id, const uint8_t *data,
                             size_t size);

// True if type_id names one of the TowerMessage kinds
bool IsKnownCustomType(protocol::WireTypeId type_id);

} // namespace message
} // namespace watchtower

#endif // WATCHTOWER_NETWORK_CUSTOM_MESSAGE_READER_HPP
