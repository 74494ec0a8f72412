// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cloud/config.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nodeguard {
namespace cloud {

namespace {

constexpr int MAX_RETRY_ATTEMPTS = 100;
constexpr int64_t MAX_BACKOFF_MS = 5 * 60 * 1000;
constexpr int64_t MAX_TIMEOUT_MS = 10 * 60 * 1000;

bool ReadBool(const json &obj, const char *key, bool &out, std::string &error) {
  if (!obj.contains(key)) {
    return true;
  }
  if (!obj[key].is_boolean()) {
    error = std::string("'") + key + "' must be a boolean";
    return false;
  }
  out = obj[key].get<bool>();
  return true;
}

bool ReadInt(const json &obj, const char *key, int64_t min, int64_t max,
             int64_t &out, std::string &error) {
  if (!obj.contains(key)) {
    return true;
  }
  if (!obj[key].is_number_integer()) {
    error = std::string("'") + key + "' must be an integer";
    return false;
  }
  int64_t value = obj[key].get<int64_t>();
  if (value < min || value > max) {
    error = std::string("'") + key + "' must be between " + std::to_string(min) +
            " and " + std::to_string(max);
    return false;
  }
  out = value;
  return true;
}

} // namespace

std::chrono::milliseconds RetryPolicy::BackoffFor(int attempt) const {
  if (attempt <= 1) {
    return std::chrono::milliseconds(0);
  }
  auto backoff = initial_backoff;
  for (int i = 2; i < attempt && backoff < max_backoff; ++i) {
    backoff *= 2;
  }
  return std::min(backoff, max_backoff);
}

bool ParseCloudConfig(const json &j, CloudConfig &out, std::string &error) {
  if (!j.is_object()) {
    error = "config must be a JSON object";
    return false;
  }

  CloudConfig config;

  if (j.contains("global")) {
    const auto &global = j["global"];
    if (!global.is_object()) {
      error = "'global' must be an object";
      return false;
    }
    if (global.contains("clusterName")) {
      if (!global["clusterName"].is_string()) {
        error = "'clusterName' must be a string";
        return false;
      }
      config.cluster_name = global["clusterName"].get<std::string>();
    }
    if (global.contains("endpoints")) {
      if (!global["endpoints"].is_array()) {
        error = "'endpoints' must be an array";
        return false;
      }
      for (const auto &endpoint : global["endpoints"]) {
        if (!endpoint.is_string()) {
          error = "'endpoints' entries must be strings";
          return false;
        }
        config.endpoints.push_back(endpoint.get<std::string>());
      }
    }
    if (!ReadBool(global, "preferIPv6", config.prefer_ipv6, error) ||
        !ReadBool(global, "approveNodeCSR", config.approve_node_csr, error)) {
      return false;
    }
  }

  if (j.contains("retry")) {
    const auto &retry = j["retry"];
    if (!retry.is_object()) {
      error = "'retry' must be an object";
      return false;
    }
    int64_t attempts = config.retry.max_attempts;
    int64_t initial = config.retry.initial_backoff.count();
    int64_t max = config.retry.max_backoff.count();
    if (!ReadInt(retry, "maxAttempts", 1, MAX_RETRY_ATTEMPTS, attempts, error) ||
        !ReadInt(retry, "initialBackoffMs", 0, MAX_BACKOFF_MS, initial, error) ||
        !ReadInt(retry, "maxBackoffMs", 0, MAX_BACKOFF_MS, max, error)) {
      return false;
    }
    if (max < initial) {
      error = "'maxBackoffMs' must not be below 'initialBackoffMs'";
      return false;
    }
    config.retry.max_attempts = static_cast<int>(attempts);
    config.retry.initial_backoff = std::chrono::milliseconds(initial);
    config.retry.max_backoff = std::chrono::milliseconds(max);
  }

  int64_t timeout = config.request_timeout.count();
  if (!ReadInt(j, "requestTimeoutMs", 1, MAX_TIMEOUT_MS, timeout, error)) {
    return false;
  }
  config.request_timeout = std::chrono::milliseconds(timeout);

  for (const auto &endpoint : config.endpoints) {
    if (!util::IsValidIPAddress(endpoint)) {
      LOG_WARN("Config: endpoint '{}' is not an IP address, treating it as a hostname", endpoint);
    }
  }

  out = std::move(config);
  return true;
}

bool LoadCloudConfig(const std::filesystem::path &path, CloudConfig &out,
                     std::string &error) {
  auto contents = util::read_file_string(path);
  if (!contents) {
    error = "cannot read config file " + path.string();
    return false;
  }

  try {
    json j = json::parse(*contents);
    if (!ParseCloudConfig(j, out, error)) {
      error = path.string() + ": " + error;
      return false;
    }
  } catch (const json::parse_error &e) {
    error = path.string() + ": " + e.what();
    return false;
  }

  LOG_INFO("Loaded config from {} (cluster '{}', preferIPv6={}, approveNodeCSR={})",
           path.string(), out.cluster_name, out.prefer_ipv6, out.approve_node_csr);
  return true;
}

} // namespace cloud
} // namespace nodeguard
