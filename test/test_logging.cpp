// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    nodeguard::util::LogManager::Initialize(level, false, "");

    // "trace" also opens up every component logger
    if (level == "trace") {
        nodeguard::util::LogManager::SetLogLevel("trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    nodeguard::util::LogManager::Shutdown();
}
