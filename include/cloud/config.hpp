// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace nodeguard {
namespace cloud {

// Bounded retry with exponential backoff for registry writes
struct RetryPolicy {
  int max_attempts = 5;
  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{2000};

  // Backoff before attempt `attempt` (1-based, attempt 1 has none)
  std::chrono::milliseconds BackoffFor(int attempt) const;
};

/**
 * Cloud provider configuration
 *
 * File format (JSON, unknown keys ignored):
 * {
 *   "global": {
 *     "clusterName": "prod",
 *     "endpoints": ["10.0.0.1"],
 *     "preferIPv6": false,
 *     "approveNodeCSR": true
 *   },
 *   "retry": { "maxAttempts": 5, "initialBackoffMs": 100, "maxBackoffMs": 2000 },
 *   "requestTimeoutMs": 10000
 * }
 */
struct CloudConfig {
  std::string cluster_name;
  std::vector<std::string> endpoints;
  bool prefer_ipv6 = false;
  bool approve_node_csr = false;

  RetryPolicy retry;
  std::chrono::milliseconds request_timeout{10000};
};

// Returns false and sets `error` when a known key has the wrong type or an
// out-of-range value
bool ParseCloudConfig(const nlohmann::json &j, CloudConfig &out, std::string &error);

bool LoadCloudConfig(const std::filesystem::path &path, CloudConfig &out,
                     std::string &error);

} // namespace cloud
} // namespace nodeguard
