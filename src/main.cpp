// Copyright (c) 2025 The Watchtower developers

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <cstdint>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <stdexcept>
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --conf=<path>        Read settings from a JSON file (flags override it)\n"
      << "  --role=<role>        tower or user (default: tower)\n"
      << "  --nodeid=<hex>       Node id, 33-byte compressed key (default: random)\n"
      << "  --port=<port>        Listen port (default: 9814)\n"
      << "  --listen             Enable inbound connections (default)\n"
      << "  --nolisten           Disable inbound connections\n"
      << "  --threads=<n>        Number of IO threads (default: 1)\n"
      << "  --poll-interval=<ms> Outbound queue polling interval (default: 100)\n"
      << "\n"
      << "Tower:\n"
      << "  --maxsize=<n>        appointment_max_size offered to users (default: 30)\n"
      << "\n"
      << "User:\n"
      << "  --connect=<host:port> Tower to register with\n"
      << "  --slots=<n>          Appointment slots to request (default: 100)\n"
      << "  --period=<n>         Subscription period in blocks (default: 4320)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --logfile=<path>     Write the log to a file instead of the console\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, tower, app, all\n"
      << "                       Can be comma-separated: --debug=network,tower\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

namespace {

uint32_t parse_uint(const std::string &value, const std::string &option,
                    uint32_t max) {
  size_t used = 0;
  unsigned long v = std::stoul(value, &used);
  if (used != value.size() || v > max) {
    throw std::runtime_error("invalid value for " + option + ": " + value);
  }
  return static_cast<uint32_t>(v);
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    namespace app = watchtower::app;

    // First pass: the config file supplies the base values
    app::AppConfig config;
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.find("--conf=") == 0) {
        config = app::AppConfig::LoadFromFile(arg.substr(7));
      }
    }

    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << watchtower::GetFullVersionString() << std::endl;
        std::cout << watchtower::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--conf=") == 0) {
        // Handled above
      } else if (arg.find("--role=") == 0) {
        auto role = app::ParseRole(arg.substr(7));
        if (!role) {
          std::cerr << "Unknown role: " << arg.substr(7) << std::endl;
          return 1;
        }
        config.role = *role;
      } else if (arg.find("--nodeid=") == 0) {
        config.node_id = arg.substr(9);
      } else if (arg.find("--port=") == 0) {
        config.relay.listen_port =
            static_cast<uint16_t>(parse_uint(arg.substr(7), "--port", 65535));
      } else if (arg == "--listen") {
        config.relay.listen_enabled = true;
      } else if (arg == "--nolisten") {
        config.relay.listen_enabled = false;
      } else if (arg.find("--threads=") == 0) {
        config.relay.io_threads = parse_uint(arg.substr(10), "--threads", 64);
      } else if (arg.find("--poll-interval=") == 0) {
        config.relay.poll_interval_ms =
            parse_uint(arg.substr(16), "--poll-interval", 60 * 1000);
      } else if (arg.find("--maxsize=") == 0) {
        config.tower.appointment_max_size = static_cast<uint16_t>(
            parse_uint(arg.substr(10), "--maxsize", 65535));
      } else if (arg.find("--connect=") == 0) {
        std::string target = arg.substr(10);
        size_t colon = target.rfind(':');
        if (colon == std::string::npos) {
          config.user.tower_address = target;
        } else {
          config.user.tower_address = target.substr(0, colon);
          config.user.tower_port = static_cast<uint16_t>(
              parse_uint(target.substr(colon + 1), "--connect", 65535));
        }
      } else if (arg.find("--slots=") == 0) {
        config.user.appointment_slots =
            parse_uint(arg.substr(8), "--slots", UINT32_MAX);
      } else if (arg.find("--period=") == 0) {
        config.user.subscription_period =
            parse_uint(arg.substr(9), "--period", UINT32_MAX);
      } else if (arg == "--verbose") {
        config.verbose = true;
        config.log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        config.log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,tower
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    watchtower::util::LogManager::Initialize(
        config.log_level, !config.log_file.empty(), config.log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        watchtower::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        watchtower::util::LogManager::SetComponentLevel("network", "trace");
      } else if (!watchtower::util::LogManager::SetComponentLevel(component,
                                                                 "trace")) {
        LOG_WARN("Unknown debug component: {}", component);
      }
    }

    app::Application application(config);

    if (!application.initialize()) {
      LOG_ERROR("Failed to initialize application");
      watchtower::util::LogManager::Shutdown();
      return 1;
    }

    if (!application.start()) {
      LOG_ERROR("Failed to start application");
      watchtower::util::LogManager::Shutdown();
      return 1;
    }

    // Run until shutdown requested
    application.wait_for_shutdown();

    watchtower::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    watchtower::util::LogManager::Shutdown();
    return 1;
  }
}
