// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license
// Catch2 entry point: sets up logging before any test runs

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    // Quiet by default; WATCHTOWER_TEST_LOGLEVEL=debug to see relay traffic
    const char* env = std::getenv("WATCHTOWER_TEST_LOGLEVEL");
    InitializeTestLogging(env ? env : "off");

    Catch::Session session;
    int rc = session.applyCommandLine(argc, argv);
    if (rc != 0) {
        ShutdownTestLogging();
        return rc;
    }

    int result = session.run();
    ShutdownTestLogging();
    return result;
}
