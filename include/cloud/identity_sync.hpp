// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "cloud/config.hpp"
#include "node/node.hpp"
#include "node/node_registry.hpp"
#include "util/context.hpp"
#include "util/status.hpp"
#include <string>

namespace nodeguard {
namespace cloud {

// What the platform-metadata backend reports for a node
struct PlatformMetadata {
  std::string platform;
  std::string hostname;
  bool spot = false;
};

struct NodeIdentity {
  std::string cluster_name;
  std::string platform;
  std::string hostname;
  bool is_spot_instance = false;
};

NodeIdentity MakeNodeIdentity(const CloudConfig &config, const PlatformMetadata &metadata);

/**
 * Minimal patch that brings the managed labels of `node` in line with
 * `identity`. Only cluster-name, platform and lifecycle keys ever appear.
 * Empty when the node already matches.
 */
node::LabelPatch ComputeIdentityPatch(const node::Node &node, const NodeIdentity &identity);

/**
 * Apply identity labels to a node snapshot
 *
 * The patch is computed against `node` and guarded by its resource version,
 * so a concurrent writer turns into CONFLICT rather than a lost update.
 * No registry call is made when nothing would change.
 *
 * @return OK, NOT_FOUND, CONFLICT or TRANSIENT
 */
util::Status SyncIdentity(const util::Context &ctx, node::NodeRegistry &registry,
                          const node::Node &node, const NodeIdentity &identity);

/**
 * Read-then-patch loop around SyncIdentity
 *
 * Re-reads the node before every attempt; CONFLICT and TRANSIENT failures
 * are retried up to policy.max_attempts with exponential backoff, anything
 * else is returned immediately. Returns the last failure when attempts run
 * out, or TRANSIENT if ctx ends while backing off.
 */
util::Status SyncIdentityWithRetry(const util::Context &ctx,
                                   node::NodeRegistry &registry,
                                   const std::string &node_name,
                                   const NodeIdentity &identity,
                                   const RetryPolicy &policy);

} // namespace cloud
} // namespace nodeguard
