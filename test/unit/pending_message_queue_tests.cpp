// Copyright (c) 2025 The Watchtower developers
// Unit tests for the outbound message queue

#include <catch2/catch_test_macros.hpp>
#include "network/pending_message_queue.hpp"
#include <atomic>
#include <thread>
#include <variant>
#include <vector>

using namespace watchtower::network;
using namespace watchtower::message;

namespace {

SubscriptionDetails Details(uint32_t amount) {
    SubscriptionDetails d;
    d.appointment_max_size = 30;
    d.amount_msat = amount;
    return d;
}

} // namespace

TEST_CASE("PendingMessageQueue - basic operations", "[queue][unit]") {
    PendingMessageQueue queue;

    SECTION("Starts empty") {
        CHECK(queue.Empty());
        CHECK(queue.Size() == 0);
        CHECK(queue.DrainAndClear().empty());
    }

    SECTION("Drain returns entries in insertion order across peers") {
        auto a = PublicKey::Random();
        auto b = PublicKey::Random();

        queue.Enqueue(a, Details(1));
        queue.Enqueue(b, Details(2));
        queue.Enqueue(a, Details(3));
        CHECK(queue.Size() == 3);
        CHECK_FALSE(queue.Empty());

        auto drained = queue.DrainAndClear();
        REQUIRE(drained.size() == 3);
        CHECK(drained[0].peer == a);
        CHECK(drained[1].peer == b);
        CHECK(drained[2].peer == a);
        CHECK(std::get<SubscriptionDetails>(drained[0].message).amount_msat == 1);
        CHECK(std::get<SubscriptionDetails>(drained[1].message).amount_msat == 2);
        CHECK(std::get<SubscriptionDetails>(drained[2].message).amount_msat == 3);

        // Drained entries are gone
        CHECK(queue.Empty());
        CHECK(queue.DrainAndClear().empty());
    }

    SECTION("Identical entries are not merged") {
        auto peer = PublicKey::Random();
        queue.Enqueue(peer, Details(7));
        queue.Enqueue(peer, Details(7));
        CHECK(queue.DrainAndClear().size() == 2);
    }

    SECTION("Enqueue after drain lands in the next drain") {
        auto peer = PublicKey::Random();
        queue.Enqueue(peer, Details(1));
        REQUIRE(queue.DrainAndClear().size() == 1);

        queue.Enqueue(peer, Details(2));
        auto next = queue.DrainAndClear();
        REQUIRE(next.size() == 1);
        CHECK(std::get<SubscriptionDetails>(next[0].message).amount_msat == 2);
    }
}

TEST_CASE("PendingMessageQueue - concurrent producers and a drainer", "[queue][unit][threading]") {
    PendingMessageQueue queue;
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 2000;

    std::atomic<bool> done{false};
    std::vector<PendingMessage> collected;

    std::thread drainer([&] {
        while (!done.load()) {
            auto batch = queue.DrainAndClear();
            collected.insert(collected.end(), batch.begin(), batch.end());
            std::this_thread::yield();
        }
    });

    std::vector<std::thread> producers;
    std::vector<PublicKey> keys;
    for (int p = 0; p < kProducers; ++p) {
        keys.push_back(PublicKey::Random());
    }
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.Enqueue(keys[p], Details(static_cast<uint32_t>(i)));
            }
        });
    }
    for (auto& t : producers) t.join();
    done = true;
    drainer.join();

    auto rest = queue.DrainAndClear();
    collected.insert(collected.end(), rest.begin(), rest.end());

    // Nothing lost, nothing duplicated, per-producer order preserved
    REQUIRE(collected.size() == static_cast<size_t>(kProducers * kPerProducer));
    for (int p = 0; p < kProducers; ++p) {
        uint32_t expected = 0;
        for (const auto& entry : collected) {
            if (entry.peer != keys[p]) continue;
            CHECK(std::get<SubscriptionDetails>(entry.message).amount_msat == expected);
            ++expected;
        }
        CHECK(expected == static_cast<uint32_t>(kPerProducer));
    }
}
