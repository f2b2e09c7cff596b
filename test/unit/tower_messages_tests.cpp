// Copyright (c) 2025 The Watchtower developers
// Unit tests for the custom message set: wire layout, encode and decode

#include <catch2/catch_test_macros.hpp>
#include "network/tower_messages.hpp"
#include <string>
#include <vector>

using namespace watchtower::message;
using watchtower::network::PublicKey;
namespace types = watchtower::protocol::types;

namespace {

PublicKey MakeKey(uint8_t prefix, uint8_t fill) {
    PublicKey::Bytes raw;
    raw.fill(fill);
    raw[0] = prefix;
    return PublicKey(raw);
}

std::vector<uint8_t> EncodeOk(const TowerMessage& msg) {
    std::vector<uint8_t> out;
    REQUIRE(Encode(msg, out) == EncodeStatus::OK);
    return out;
}

} // namespace

TEST_CASE("TowerMessage - type ids and names", "[messages][unit]") {
    CHECK(Register::TYPE == 45768);
    CHECK(SubscriptionDetails::TYPE == 45770);
    CHECK(UserHeartbeat::TYPE == 45773);

    CHECK(GetTypeId(TowerMessage{Register{}}) == types::REGISTER);
    CHECK(GetTypeId(TowerMessage{SubscriptionDetails{}}) == types::SUBSCRIPTION_DETAILS);
    CHECK(GetTypeId(TowerMessage{UserHeartbeat{}}) == types::USER_HEARTBEAT);

    CHECK(std::string(GetMessageName(TowerMessage{Register{}})) == "register");
    CHECK(std::string(GetMessageName(TowerMessage{SubscriptionDetails{}})) ==
          "subscription_details");
    CHECK(std::string(GetMessageName(TowerMessage{UserHeartbeat{}})) == "user_heartbeat");
}

TEST_CASE("Register - wire layout", "[messages][unit]") {
    Register reg;
    reg.pubkey = MakeKey(0x02, 0x11);
    reg.appointment_slots = 10;
    reg.subscription_period = 4320;

    auto bytes = EncodeOk(reg);
    REQUIRE(bytes.size() == 33 + 4 + 4);

    CHECK(bytes[0] == 0x02);
    for (size_t i = 1; i < 33; ++i) {
        CHECK(bytes[i] == 0x11);
    }
    // appointment_slots = 10
    CHECK(bytes[33] == 0x00);
    CHECK(bytes[34] == 0x00);
    CHECK(bytes[35] == 0x00);
    CHECK(bytes[36] == 0x0A);
    // subscription_period = 4320 = 0x10E0
    CHECK(bytes[37] == 0x00);
    CHECK(bytes[38] == 0x00);
    CHECK(bytes[39] == 0x10);
    CHECK(bytes[40] == 0xE0);
}

TEST_CASE("SubscriptionDetails - wire layout", "[messages][unit]") {
    SubscriptionDetails details;
    details.appointment_max_size = 30;
    details.amount_msat = 43200;

    const std::vector<uint8_t> expected = {0x00, 0x1E, 0x00, 0x00, 0xA8, 0xC0};
    CHECK(EncodeOk(details) == expected);
}

TEST_CASE("TowerMessage - decode reproduces the encoded message", "[messages][unit]") {
    SECTION("Register") {
        Register reg;
        reg.pubkey = MakeKey(0x03, 0x7F);
        reg.appointment_slots = 0xFFFFFFFF;
        reg.subscription_period = 1;

        auto bytes = EncodeOk(reg);
        Register decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()) == DecodeError::NONE);
        CHECK(decoded == reg);
    }

    SECTION("SubscriptionDetails") {
        SubscriptionDetails details;
        details.appointment_max_size = 65535;
        details.amount_msat = 0;

        auto bytes = EncodeOk(details);
        SubscriptionDetails decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()) == DecodeError::NONE);
        CHECK(decoded == details);
    }
}

TEST_CASE("TowerMessage - encode of a decoded payload gives back the same bytes", "[messages][unit]") {
    SECTION("Register") {
        std::vector<uint8_t> bytes(33, 0x5A);
        bytes[0] = 0x03;
        bytes.insert(bytes.end(), {0x00, 0x00, 0x01, 0x2C,    // appointment_slots = 300
                                   0x80, 0x00, 0x00, 0x01});  // subscription_period
        Register decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()) == DecodeError::NONE);
        CHECK(EncodeOk(decoded) == bytes);
    }

    SECTION("SubscriptionDetails") {
        const std::vector<uint8_t> bytes = {0xFF, 0xFE, 0xDE, 0xAD, 0xBE, 0xEF};
        SubscriptionDetails decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()) == DecodeError::NONE);
        CHECK(decoded.appointment_max_size == 0xFFFE);
        CHECK(decoded.amount_msat == 0xDEADBEEF);
        CHECK(EncodeOk(decoded) == bytes);
    }

    SECTION("Trailing bytes are not reproduced") {
        std::vector<uint8_t> bytes = {0x00, 0x1E, 0x00, 0x00, 0xA8, 0xC0};
        std::vector<uint8_t> padded = bytes;
        padded.insert(padded.end(), {0x01, 0x02});
        SubscriptionDetails decoded;
        REQUIRE(decoded.deserialize(padded.data(), padded.size()) == DecodeError::NONE);
        CHECK(EncodeOk(decoded) == bytes);
    }
}

TEST_CASE("TowerMessage - encoding is deterministic", "[messages][unit]") {
    Register reg;
    reg.pubkey = MakeKey(0x02, 0x42);
    reg.appointment_slots = 7;
    reg.subscription_period = 99;

    CHECK(EncodeOk(reg) == EncodeOk(reg));
}

TEST_CASE("UserHeartbeat - receive only", "[messages][unit]") {
    UserHeartbeat hb;
    hb.pubkey = MakeKey(0x02, 0x01);
    hb.timestamp = 1700000000;

    CHECK_FALSE(CanEncode(TowerMessage{hb}));
    CHECK(CanEncode(TowerMessage{Register{}}));
    CHECK(CanEncode(TowerMessage{SubscriptionDetails{}}));

    std::vector<uint8_t> out = {0xAA};
    CHECK(Encode(TowerMessage{hb}, out) == EncodeStatus::UNSUPPORTED);
    // Output buffer untouched on failure
    REQUIRE(out.size() == 1);
    CHECK(out[0] == 0xAA);

    SECTION("Decodes from wire bytes") {
        std::vector<uint8_t> bytes(hb.pubkey.bytes().begin(), hb.pubkey.bytes().end());
        bytes.insert(bytes.end(), {0x65, 0x53, 0xF1, 0x00});

        UserHeartbeat decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()) == DecodeError::NONE);
        CHECK(decoded == hb);
    }
}

TEST_CASE("TowerMessage - malformed payloads", "[messages][unit]") {
    Register reg;
    reg.pubkey = MakeKey(0x02, 0x33);
    reg.appointment_slots = 1;
    reg.subscription_period = 2;
    auto bytes = EncodeOk(reg);

    SECTION("Every truncation is SHORT_READ") {
        for (size_t len = 0; len < bytes.size(); ++len) {
            Register decoded;
            CHECK(decoded.deserialize(bytes.data(), len) == DecodeError::SHORT_READ);
        }
    }

    SECTION("Bad key prefix is INVALID_VALUE") {
        bytes[0] = 0x05;
        Register decoded;
        CHECK(decoded.deserialize(bytes.data(), bytes.size()) == DecodeError::INVALID_VALUE);
    }

    SECTION("Trailing bytes are ignored") {
        bytes.push_back(0xFF);
        bytes.push_back(0xEE);
        Register decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()) == DecodeError::NONE);
        CHECK(decoded == reg);
    }

    SECTION("SubscriptionDetails one byte short") {
        const std::vector<uint8_t> short_details = {0x00, 0x1E, 0x00, 0x00, 0xA8};
        SubscriptionDetails decoded;
        CHECK(decoded.deserialize(short_details.data(), short_details.size()) ==
              DecodeError::SHORT_READ);
    }
}

TEST_CASE("TowerMessage - ToString", "[messages][unit]") {
    SubscriptionDetails details;
    details.appointment_max_size = 30;
    details.amount_msat = 43200;

    CHECK(ToString(TowerMessage{details}) ==
          "SubscriptionDetails(appointment_max_size=30, amount_msat=43200)");
}
