// Copyright (c) 2025 The Watchtower developers

#ifndef WATCHTOWER_APPLICATION_HPP
#define WATCHTOWER_APPLICATION_HPP

#include "network/custom_message_handler.hpp"
#include "network/custom_message_relay.hpp"
#include "network/pending_message_queue.hpp"
#include "network/protocol.hpp"
#include "network/public_key.hpp"
#include "network/real_transport.hpp"
#include "network/user_message_handler.hpp"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace watchtower {
namespace app {

enum class Role { TOWER, USER };

const char *RoleName(Role role);
std::optional<Role> ParseRole(const std::string &name);

struct TowerConfig {
  uint16_t appointment_max_size = protocol::DEFAULT_APPOINTMENT_MAX_SIZE;
};

struct RelayConfig {
  uint16_t listen_port = protocol::DEFAULT_PORT;
  bool listen_enabled = true;
  size_t io_threads = 1;
  uint32_t poll_interval_ms = protocol::DEFAULT_POLL_INTERVAL_MS;
};

// Only used with Role::USER
struct UserConfig {
  std::string tower_address;
  uint16_t tower_port = protocol::DEFAULT_PORT;
  uint32_t appointment_slots = 100;
  uint32_t subscription_period = 4320;
};

/**
 * Application configuration
 *
 * Defaults, then an optional JSON file (--conf), then command line flags.
 * Every setter path ends in Validate().
 */
struct AppConfig {
  Role role = Role::TOWER;
  TowerConfig tower;
  RelayConfig relay;
  UserConfig user;

  // Hex-encoded 33-byte key; empty means a random id per run
  std::string node_id;

  std::string log_level = "info";
  std::string log_file;
  bool verbose = false;

  // Overwrite fields present in `j`. Throws std::runtime_error naming the
  // offending key on unknown keys or out-of-range values.
  void ApplyJson(const nlohmann::json &j);

  // Throws std::runtime_error if the file cannot be read or parsed
  static AppConfig LoadFromFile(const std::filesystem::path &path);

  // Cross-field checks; throws std::runtime_error
  void Validate() const;

  // node_id parsed, or a fresh random key if node_id is empty
  network::PublicKey ResolveNodeId() const;
};

/**
 * Application - main watchtower application
 * Owns the transport, the role's message handler and the relay.
 */
class Application {
public:
  explicit Application(const AppConfig &config);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  bool initialize();
  bool start();
  void stop();

  // Block until SIGINT/SIGTERM or request_shutdown()
  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  const network::PeerId &node_id() const { return node_id_; }
  network::CustomMessageRelay *relay() { return relay_.get(); }

  static Application *instance();

private:
  void setup_signal_handlers();
  static void signal_handler(int signal);

  bool init_network();
  bool start_tower();
  bool start_user();
  void shutdown();

  AppConfig config_;
  network::PeerId node_id_;

  std::unique_ptr<network::RealTransport> transport_;
  std::shared_ptr<network::PendingMessageQueue> queue_;
  std::unique_ptr<network::CustomMessageHandler> handler_;
  // Non-owning view of handler_ in the user role
  network::UserMessageHandler *user_handler_ = nullptr;
  std::unique_ptr<network::CustomMessageRelay> relay_;
  network::TransportConnectionPtr tower_connection_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application *instance_;
};

} // namespace app
} // namespace watchtower

#endif // WATCHTOWER_APPLICATION_HPP
