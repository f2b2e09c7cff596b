// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_NETWORK_CUSTOM_MESSAGE_HANDLER_HPP
#define WATCHTOWER_NETWORK_CUSTOM_MESSAGE_HANDLER_HPP

#include "network/custom_message_reader.hpp"
#include "network/pending_message_queue.hpp"
#include "network/public_key.hpp"
#include "network/tower_messages.hpp"
#include <optional>
#include <string>
#include <vector>

namespace watchtower {
namespace network {

// What the host should do about a peer whose message was rejected
enum class ErrorAction {
  IGNORE_AND_LOG,  // Drop the message, keep the peer
  SEND_WARNING,    // Reply with a host-level warning, keep the peer
  DISCONNECT_PEER, // Protocol violation, drop the connection
};

const char *ErrorActionString(ErrorAction action);

/**
 * HandlerError - business-logic rejection of a well-formed message
 *
 * Never used for "nothing to do": a handler that has no reaction returns
 * success.
 */
struct HandlerError {
  std::string reason;  // For our logs
  ErrorAction action = ErrorAction::IGNORE_AND_LOG;
  std::string warning; // Text sent to the peer with SEND_WARNING
};

/**
 * CustomMessageHandler - the interface the host's peer loop drives
 *
 * The host calls Read() and HandleCustomMessage() on its receive path and
 * GetAndClearPendingMessages() on its polling cycle, possibly from different
 * threads. Implementations keep outbound messages in a PendingMessageQueue.
 */
class CustomMessageHandler {
public:
  virtual ~CustomMessageHandler() = default;

  // Decode a payload for type_id (defaults to the TowerMessage dispatcher)
  virtual message::ReadResult Read(protocol::WireTypeId type_id,
                                   const uint8_t *data, size_t size) const {
    return message::ReadCustomMessage(type_id, data, size);
  }

  /**
   * React to a decoded message
   *
   * @return nullopt on success, otherwise the rejection for the host
   */
  virtual std::optional<HandlerError>
  HandleCustomMessage(const message::TowerMessage &msg,
                      const PeerId &sender) = 0;

  // Hand every queued outbound message to the host
  virtual std::vector<PendingMessage> GetAndClearPendingMessages() = 0;
};

} // namespace network
} // namespace watchtower

#endif // WATCHTOWER_NETWORK_CUSTOM_MESSAGE_HANDLER_HPP
