// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    watchtower::util::LogManager::Initialize(level, false, "");

    // "trace" must reach every component logger, not only the default one
    if (level == "trace") {
        watchtower::util::LogManager::SetComponentLevel("network", "trace");
        watchtower::util::LogManager::SetComponentLevel("tower", "trace");
        watchtower::util::LogManager::SetComponentLevel("app", "trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    watchtower::util::LogManager::Shutdown();
}
