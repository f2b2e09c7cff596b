// Copyright (c) 2025 The Watchtower developers
// Loopback tests for the boost::asio TCP transport and the relay on top of it

#include <catch2/catch_test_macros.hpp>
#include "network/custom_message_relay.hpp"
#include "network/real_transport.hpp"
#include "network/tower_message_handler.hpp"
#include "network/user_message_handler.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

using namespace watchtower::network;

namespace {
// Pick an available high-range port; try a small range to avoid flakiness.
static uint16_t pick_listen_port(RealTransport& t,
                                 std::function<void(TransportConnectionPtr)> accept_cb,
                                 uint16_t start = 42000,
                                 uint16_t end = 42100) {
    for (uint16_t p = start; p < end; ++p) {
        if (t.listen(p, accept_cb)) return p;
    }
    return 0;
}
}

TEST_CASE("RealTransport lifecycle is idempotent", "[network][transport][real]") {
    RealTransport t(1);

    // Not running before run()
    CHECK_FALSE(t.is_running());

    // stop() without run() should be safe
    t.stop();

    // run() starts, second run() is no-op
    t.run();
    CHECK(t.is_running());
    t.run();
    CHECK(t.is_running());

    // stop() is idempotent
    t.stop();
    t.stop();

    // Can be started again after stop
    t.run();
    CHECK(t.is_running());
    t.stop();
}

TEST_CASE("RealTransport listen/connect echo roundtrip", "[network][transport][real]") {
    RealTransport server(1);
    RealTransport client(1);

    server.run();
    client.run();

    std::shared_ptr<TransportConnection> inbound_conn;
    std::mutex m;
    std::condition_variable cv;
    bool accepted = false;
    bool connected = false;
    bool echoed = false;

    auto accept_cb = [&](TransportConnectionPtr c){
        {
            std::lock_guard<std::mutex> lk(m);
            inbound_conn = c;
            accepted = true;
        }
        // Echo server: read and write back
        inbound_conn->set_receive_callback([&](const std::vector<uint8_t>& data){
            inbound_conn->send(data);
        });
        inbound_conn->start();
        cv.notify_all();
    };

    // Try to bind
    uint16_t port = pick_listen_port(server, accept_cb);
    REQUIRE(port != 0);

    // Connect client
    std::shared_ptr<TransportConnection> client_conn;
    client_conn = client.connect("127.0.0.1", port, [&](bool ok){
        {
            std::lock_guard<std::mutex> lk(m);
            connected = ok;
        }
        if (ok && client_conn) {
            client_conn->start();
        }
        cv.notify_all();
    });
    REQUIRE(client_conn);

    // Prepare to receive echo
    std::vector<uint8_t> received;
    client_conn->set_receive_callback([&](const std::vector<uint8_t>& data){
        {
            std::lock_guard<std::mutex> lk(m);
            received = data;
            echoed = true;
        }
        cv.notify_all();
    });

    // Wait for accept+connect
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3), [&]{ return accepted && connected; });
    }
    REQUIRE(accepted);
    REQUIRE(connected);

    // Verify canonical remote addresses are non-empty and look like IPs
    CHECK(!client_conn->remote_address().empty());
    CHECK(!inbound_conn->remote_address().empty());

    // Send payload and expect echo
    const std::string payload = "hello";
    std::vector<uint8_t> bytes(payload.begin(), payload.end());
    CHECK(client_conn->send(bytes));

    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, std::chrono::seconds(3), [&]{ return echoed; });
    }
    REQUIRE(echoed);
    std::string echoed_str(received.begin(), received.end());
    CHECK(echoed_str == payload);

    // Close and ensure further sends fail
    client_conn->close();
    CHECK_FALSE(client_conn->send(bytes));

    client.stop();
    server.stop();
}
namespace {
// Poll `pred` until it holds or `timeout` passes
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
}

TEST_CASE("RealTransport send queue rejects writes after close", "[network][transport][real]") {
    RealTransport server(1);
    server.run();

    std::atomic<bool> accepted{false};
    TransportConnectionPtr inbound;
    std::mutex m;
    uint16_t port = pick_listen_port(server, [&](TransportConnectionPtr c) {
        std::lock_guard<std::mutex> lk(m);
        inbound = c;
        inbound->start();
        accepted = true;
    });
    REQUIRE(port != 0);

    RealTransport client(1);
    client.run();
    std::atomic<bool> connected{false};
    auto conn = client.connect("127.0.0.1", port, [&](bool ok) { connected = ok; });
    REQUIRE(wait_until([&] { return accepted.load() && connected.load(); }));

    CHECK(conn->is_open());
    CHECK_FALSE(conn->is_inbound());
    {
        std::lock_guard<std::mutex> lk(m);
        CHECK(inbound->is_inbound());
        CHECK(inbound->connection_id() != conn->connection_id());
    }

    conn->close();
    CHECK_FALSE(conn->is_open());
    CHECK_FALSE(conn->send({0x01}));

    client.stop();
    server.stop();
}

TEST_CASE("CustomMessageRelay over RealTransport", "[network][relay][real]") {
    RealTransport tower_net(1);
    RealTransport user_net(1);

    auto tower_queue = std::make_shared<PendingMessageQueue>();
    TowerMessageHandler tower_handler(tower_queue);
    PeerId tower_id = PublicKey::Random();
    CustomMessageRelay tower_relay(tower_net.io_context(), tower_handler,
                                   CustomMessageRelay::Config{tower_id, std::chrono::milliseconds(10)});

    auto user_queue = std::make_shared<PendingMessageQueue>();
    UserMessageHandler user_handler(user_queue);
    PeerId user_id = PublicKey::Random();
    CustomMessageRelay user_relay(user_net.io_context(), user_handler,
                                  CustomMessageRelay::Config{user_id, std::chrono::milliseconds(10)});

    user_relay.SetPeerConnectedCallback([&](const PeerId& tower) {
        user_handler.RegisterWithTower(tower, user_id, 10, 4320);
    });

    tower_net.run();
    user_net.run();
    tower_relay.Start();
    user_relay.Start();

    uint16_t port = pick_listen_port(tower_net, [&](TransportConnectionPtr c) {
        tower_relay.AddConnection(std::move(c));
    });
    REQUIRE(port != 0);

    std::atomic<bool> connected{false};
    auto conn = user_net.connect("127.0.0.1", port, [&](bool ok) { connected = ok; });
    REQUIRE(wait_until([&] { return connected.load(); }));
    user_relay.AddConnection(conn);

    REQUIRE(wait_until([&] { return user_handler.GetSubscription(tower_id).has_value(); }));
    auto terms = user_handler.GetSubscription(tower_id);
    CHECK(terms->appointment_max_size == 30);
    CHECK(terms->amount_msat == 43200);
    CHECK(tower_relay.IsPeerConnected(user_id));

    // Stop the relays before the IO threads so no callback outlives them
    user_relay.Stop();
    tower_relay.Stop();
    user_net.stop();
    tower_net.stop();
}

TEST_CASE("CustomMessageRelay start/stop with a live IO thread", "[network][relay][real]") {
    RealTransport net(1);
    net.run();

    auto queue = std::make_shared<PendingMessageQueue>();
    TowerMessageHandler handler(queue);
    PeerId nobody = PublicKey::Random();

    SECTION("Repeated start/stop while the timer is firing") {
        for (int i = 0; i < 200; ++i) {
            auto relay = std::make_unique<CustomMessageRelay>(
                net.io_context(), handler,
                CustomMessageRelay::Config{PublicKey::Random(), std::chrono::milliseconds(0)});
            relay->Start();
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            relay->Stop();
        }
    }

    SECTION("No polls run after Stop returns") {
        CustomMessageRelay relay(net.io_context(), handler,
                                 CustomMessageRelay::Config{PublicKey::Random(), std::chrono::milliseconds(1)});
        relay.Start();

        // Nothing is connected, so each drained entry counts as unroutable
        handler.SendMessage(nobody, watchtower::message::SubscriptionDetails{30, 43200});
        REQUIRE(wait_until([&] { return relay.GetStats().dropped_unroutable == 1; }));

        relay.Stop();
        relay.Stop();
        handler.SendMessage(nobody, watchtower::message::SubscriptionDetails{30, 43200});
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        CHECK(relay.GetStats().dropped_unroutable == 1);
        CHECK(queue->Size() == 1);

        // Restart picks the queue up again
        relay.Start();
        REQUIRE(wait_until([&] { return relay.GetStats().dropped_unroutable == 2; }));
        relay.Stop();
    }

    net.stop();
}
