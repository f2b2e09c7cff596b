// Copyright (c) 2025 The Watchtower developers

#include "network/custom_message_handler.hpp"

namespace watchtower {
namespace network {

const char *ErrorActionString(ErrorAction action) {
  switch (action) {
  case ErrorAction::IGNORE_AND_LOG:
    return "ignore";
  case ErrorAction::SEND_WARNING:
    return "send-warning";
  case ErrorAction::DISCONNECT_PEER:
    return "disconnect";
  }
  return "unknown";
}

} // namespace network
} // namespace watchtower
