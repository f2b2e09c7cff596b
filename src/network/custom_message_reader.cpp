// Copyright (c) 2025 The Watchtower developers

#include "network/custom_message_reader.hpp"

namespace watchtower {
namespace message {

ReadResult ReadCustomMessage(protocol::WireTypeId type_id, const uint8_t *data,
                             size_t size) {
  return ReadMessageAs<TowerMessage>(type_id, data, size);
}

bool IsKnownCustomType(protocol::WireTypeId type_id) {
  return detail::Dispatcher<TowerMessage>::Knows(type_id);
}

} // namespace message
} // namespace watchtower
