// Copyright (c) 2025 The Watchtower developers

#include "application.hpp"
#include "network/tower_message_handler.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <fmt/format.h>
#include <fstream>
#include <iostream> // Keep for signal handler and banner before logger setup
#include <limits>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace watchtower {
namespace app {

// ============================================================================
// Configuration
// ============================================================================

const char *RoleName(Role role) {
  switch (role) {
  case Role::TOWER:
    return "tower";
  case Role::USER:
    return "user";
  }
  return "unknown";
}

std::optional<Role> ParseRole(const std::string &name) {
  if (name == "tower")
    return Role::TOWER;
  if (name == "user")
    return Role::USER;
  return std::nullopt;
}

namespace {

uint64_t ReadUnsigned(const json &value, const std::string &key, uint64_t min,
                      uint64_t max) {
  // Parsed text yields unsigned numbers, json literals in code signed ones
  if (!value.is_number_integer() ||
      (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
    throw std::runtime_error(
        fmt::format("config: '{}' must be a non-negative integer", key));
  }
  uint64_t v = value.get<uint64_t>();
  if (v < min || v > max) {
    throw std::runtime_error(fmt::format(
        "config: '{}' = {} is out of range [{}, {}]", key, v, min, max));
  }
  return v;
}

std::string ReadString(const json &value, const std::string &key) {
  if (!value.is_string()) {
    throw std::runtime_error(fmt::format("config: '{}' must be a string", key));
  }
  return value.get<std::string>();
}

bool ReadBool(const json &value, const std::string &key) {
  if (!value.is_boolean()) {
    throw std::runtime_error(
        fmt::format("config: '{}' must be true or false", key));
  }
  return value.get<bool>();
}

constexpr uint64_t U16_MAX = std::numeric_limits<uint16_t>::max();
constexpr uint64_t U32_MAX = std::numeric_limits<uint32_t>::max();

} // namespace

void AppConfig::ApplyJson(const json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("config: top level must be a JSON object");
  }

  for (const auto &[key, value] : j.items()) {
    if (key == "role") {
      auto parsed = ParseRole(ReadString(value, key));
      if (!parsed) {
        throw std::runtime_error(
            "config: 'role' must be \"tower\" or \"user\"");
      }
      role = *parsed;
    } else if (key == "listen_port") {
      relay.listen_port =
          static_cast<uint16_t>(ReadUnsigned(value, key, 1, U16_MAX));
    } else if (key == "listen_enabled") {
      relay.listen_enabled = ReadBool(value, key);
    } else if (key == "io_threads") {
      relay.io_threads = static_cast<size_t>(ReadUnsigned(value, key, 1, 64));
    } else if (key == "poll_interval_ms") {
      relay.poll_interval_ms =
          static_cast<uint32_t>(ReadUnsigned(value, key, 1, 60 * 1000));
    } else if (key == "appointment_max_size") {
      tower.appointment_max_size =
          static_cast<uint16_t>(ReadUnsigned(value, key, 1, U16_MAX));
    } else if (key == "node_id") {
      node_id = ReadString(value, key);
    } else if (key == "tower_address") {
      user.tower_address = ReadString(value, key);
    } else if (key == "tower_port") {
      user.tower_port =
          static_cast<uint16_t>(ReadUnsigned(value, key, 1, U16_MAX));
    } else if (key == "appointment_slots") {
      user.appointment_slots =
          static_cast<uint32_t>(ReadUnsigned(value, key, 1, U32_MAX));
    } else if (key == "subscription_period") {
      user.subscription_period =
          static_cast<uint32_t>(ReadUnsigned(value, key, 1, U32_MAX));
    } else if (key == "log_level") {
      log_level = ReadString(value, key);
    } else if (key == "log_file") {
      log_file = ReadString(value, key);
    } else {
      throw std::runtime_error(fmt::format("config: unknown key '{}'", key));
    }
  }
}

AppConfig AppConfig::LoadFromFile(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(
        fmt::format("config: cannot open {}", path.string()));
  }

  json j;
  try {
    file >> j;
  } catch (const json::parse_error &e) {
    throw std::runtime_error(
        fmt::format("config: failed to parse {}: {}", path.string(), e.what()));
  }

  AppConfig config;
  config.ApplyJson(j);
  return config;
}

void AppConfig::Validate() const {
  if (!node_id.empty() && !network::PublicKey::FromHex(node_id)) {
    throw std::runtime_error(
        "config: 'node_id' must be 66 hex chars starting with 02 or 03");
  }
  if (relay.poll_interval_ms == 0) {
    throw std::runtime_error("config: 'poll_interval_ms' must be positive");
  }
  if (relay.io_threads == 0) {
    throw std::runtime_error("config: 'io_threads' must be positive");
  }
  if (role == Role::USER) {
    if (user.tower_address.empty()) {
      throw std::runtime_error("config: user role requires 'tower_address'");
    }
    if (user.appointment_slots == 0 || user.subscription_period == 0) {
      throw std::runtime_error(
          "config: 'appointment_slots' and 'subscription_period' must be "
          "positive");
    }
    uint64_t amount = static_cast<uint64_t>(user.appointment_slots) *
                      user.subscription_period;
    if (amount > U32_MAX) {
      throw std::runtime_error(
          "config: 'appointment_slots' * 'subscription_period' overflows the "
          "subscription amount");
    }
  }
}

network::PublicKey AppConfig::ResolveNodeId() const {
  if (node_id.empty()) {
    return network::PublicKey::Random();
  }
  auto key = network::PublicKey::FromHex(node_id);
  if (!key) {
    throw std::runtime_error("config: invalid 'node_id'");
  }
  return *key;
}

// ============================================================================
// Application
// ============================================================================

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(RoleName(config_.role)) << std::endl;

  LOG_APP_INFO("Initializing watchtower ({} role)...", RoleName(config_.role));

  try {
    config_.Validate();
    node_id_ = config_.ResolveNodeId();
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Invalid configuration: {}", e.what());
    return false;
  }
  LOG_APP_INFO("Node id: {}", node_id_.ToHex());

  if (!init_network()) {
    LOG_APP_ERROR("Failed to initialize network");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::init_network() {
  transport_ = std::make_unique<network::RealTransport>(config_.relay.io_threads);
  queue_ = std::make_shared<network::PendingMessageQueue>();

  if (config_.role == Role::TOWER) {
    network::TowerMessageHandler::Config tower_config;
    tower_config.appointment_max_size = config_.tower.appointment_max_size;
    handler_ =
        std::make_unique<network::TowerMessageHandler>(queue_, tower_config);
  } else {
    auto user = std::make_unique<network::UserMessageHandler>(queue_);
    user_handler_ = user.get();
    handler_ = std::move(user);
  }

  network::CustomMessageRelay::Config relay_config;
  relay_config.local_id = node_id_;
  relay_config.poll_interval =
      std::chrono::milliseconds(config_.relay.poll_interval_ms);
  relay_ = std::make_unique<network::CustomMessageRelay>(
      transport_->io_context(), *handler_, relay_config);

  relay_->SetPeerDisconnectedCallback([](const network::PeerId &peer) {
    LOG_APP_INFO("Peer {} disconnected", peer.ToShortString());
  });
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting watchtower...");

  setup_signal_handlers();

  transport_->run();
  relay_->Start();
  running_ = true;

  bool ok = config_.role == Role::TOWER ? start_tower() : start_user();
  if (!ok) {
    shutdown();
    return false;
  }

  LOG_APP_INFO("Watchtower started successfully");
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

bool Application::start_tower() {
  if (!config_.relay.listen_enabled) {
    LOG_APP_INFO("Inbound connections disabled");
    return true;
  }

  bool listening = transport_->listen(
      config_.relay.listen_port, [this](network::TransportConnectionPtr conn) {
        relay_->AddConnection(std::move(conn));
      });
  if (!listening) {
    LOG_APP_ERROR("Failed to listen on port {}", config_.relay.listen_port);
    return false;
  }
  LOG_APP_INFO("Listening on port: {}", config_.relay.listen_port);
  return true;
}

bool Application::start_user() {
  const auto user = config_.user;
  network::PeerId local_id = node_id_;

  // Register as soon as the tower has identified itself
  relay_->SetPeerConnectedCallback(
      [this, user, local_id](const network::PeerId &tower) {
        LOG_APP_INFO("Connected to tower {}, registering {} slots for {} blocks",
                     tower.ToShortString(), user.appointment_slots,
                     user.subscription_period);
        user_handler_->RegisterWithTower(tower, local_id,
                                         user.appointment_slots,
                                         user.subscription_period);
      });

  LOG_APP_INFO("Connecting to tower at {}:{}", user.tower_address,
               user.tower_port);

  // The callback runs on an IO thread; the lock keeps it waiting until
  // connect() has returned the connection it refers to
  struct ConnectSlot {
    std::mutex mutex;
    network::TransportConnectionPtr conn;
  };
  auto slot = std::make_shared<ConnectSlot>();
  {
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->conn = transport_->connect(
        user.tower_address, user.tower_port, [this, slot, user](bool success) {
          network::TransportConnectionPtr conn;
          {
            std::lock_guard<std::mutex> lock(slot->mutex);
            conn = std::move(slot->conn);
          }
          if (!success || !conn) {
            LOG_APP_ERROR("Could not connect to tower at {}:{}",
                          user.tower_address, user.tower_port);
            request_shutdown();
            return;
          }
          relay_->AddConnection(std::move(conn));
        });
    tower_connection_ = slot->conn;
  }
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down watchtower...");

  if (transport_) {
    transport_->stop_listening();
  }

  // Closes every connection; queued messages not yet polled are discarded
  if (relay_) {
    auto stats = relay_->GetStats();
    LOG_APP_INFO("Relay: {} frames received, {} messages handled, {} sent, "
                 "{} peers disconnected",
                 stats.frames_received, stats.messages_handled,
                 stats.messages_sent, stats.peers_disconnected);
    relay_->Stop();
  }

  if (transport_) {
    LOG_APP_INFO("Stopping network...");
    transport_->stop();
  }

  if (user_handler_ && tower_connection_) {
    for (const auto &[tower, terms] : user_handler_->GetSubscriptions()) {
      LOG_APP_INFO("Subscription with {}: {}", tower.ToShortString(),
                   terms.ToString());
    }
  }

  tower_connection_.reset();
  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    std::cout << "\nReceived signal " << signal << std::endl;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace watchtower
