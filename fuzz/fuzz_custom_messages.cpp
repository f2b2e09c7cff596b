// Copyright (c) 2025 The Watchtower developers
// Fuzz target for custom message decoding
// Feeds untrusted payloads through the type dispatcher for every type id

#include "network/custom_message_reader.hpp"
#include "network/protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace watchtower::message;

    if (size < 2) return 0;

    // First two bytes select the type id, the rest is the payload
    auto type_id = static_cast<watchtower::protocol::WireTypeId>((data[0] << 8) | data[1]);
    const uint8_t *payload = data + 2;
    size_t payload_size = size - 2;

    ReadResult result = ReadCustomMessage(type_id, payload, payload_size);

    // Exactly one outcome
    int outcomes = (result.has_message() ? 1 : 0) + (result.unknown() ? 1 : 0) +
                   (result.failed() ? 1 : 0);
    if (outcomes != 1) __builtin_trap();

    if (result.unknown() && IsKnownCustomType(type_id)) __builtin_trap();

    if (result.has_message()) {
        const TowerMessage &msg = *result.message();
        if (GetTypeId(msg) != type_id) __builtin_trap();

        // Re-encoding a decoded message gives a prefix of the input
        std::vector<uint8_t> encoded;
        if (Encode(msg, encoded) == EncodeStatus::OK) {
            if (encoded.size() > payload_size) __builtin_trap();
            for (size_t i = 0; i < encoded.size(); ++i) {
                if (encoded[i] != payload[i]) __builtin_trap();
            }
        }
    }

    return 0;
}
