// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cloud/identity_sync.hpp"
#include "util/logging.hpp"

namespace nodeguard {
namespace cloud {

namespace {

// Queue a set/remove for `key` only if the current value differs
void Reconcile(const std::map<std::string, std::string> &labels,
               const std::string &key, const std::string *desired,
               node::LabelPatch &patch) {
  auto it = labels.find(key);
  if (desired) {
    if (it == labels.end() || it->second != *desired) {
      patch.Set(key, *desired);
    }
  } else if (it != labels.end()) {
    patch.Remove(key);
  }
}

} // namespace

NodeIdentity MakeNodeIdentity(const CloudConfig &config, const PlatformMetadata &metadata) {
  NodeIdentity identity;
  identity.cluster_name = config.cluster_name;
  identity.platform = metadata.platform;
  identity.hostname = metadata.hostname;
  identity.is_spot_instance = metadata.spot;
  return identity;
}

node::LabelPatch ComputeIdentityPatch(const node::Node &node, const NodeIdentity &identity) {
  node::LabelPatch patch;
  const std::string spot = node::kLifecycleSpot;

  Reconcile(node.labels, node::kClusterNameLabel,
            identity.cluster_name.empty() ? nullptr : &identity.cluster_name, patch);
  Reconcile(node.labels, node::kPlatformLabel,
            identity.platform.empty() ? nullptr : &identity.platform, patch);
  Reconcile(node.labels, node::kLifecycleLabel,
            identity.is_spot_instance ? &spot : nullptr, patch);

  return patch;
}

util::Status SyncIdentity(const util::Context &ctx, node::NodeRegistry &registry,
                          const node::Node &node, const NodeIdentity &identity) {
  node::LabelPatch patch = ComputeIdentityPatch(node, identity);
  if (patch.Empty()) {
    LOG_IDENT_TRACE("SyncIdentity: node {} already up to date", node.name);
    return util::Status::Ok();
  }

  node::Node updated;
  auto status = registry.Patch(ctx, node.name, patch, node.resource_version, updated);
  if (!status.IsOk()) {
    LOG_IDENT_DEBUG("SyncIdentity: patch of node {} failed: {}", node.name, status.ToString());
    return status;
  }

  LOG_IDENT_INFO("SyncIdentity: updated labels of node {} [{}]", node.name, patch.ToString());
  return util::Status::Ok();
}

util::Status SyncIdentityWithRetry(const util::Context &ctx,
                                   node::NodeRegistry &registry,
                                   const std::string &node_name,
                                   const NodeIdentity &identity,
                                   const RetryPolicy &policy) {
  util::Status last = util::Status::Transient("no attempt made");
  const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    auto backoff = policy.BackoffFor(attempt);
    if (backoff.count() > 0 && !ctx.SleepFor(backoff)) {
      return ctx.Err().Wrap("failed to sync labels of node " + node_name);
    }

    node::Node current;
    last = registry.Get(ctx, node_name, current);
    if (last.IsOk()) {
      last = SyncIdentity(ctx, registry, current, identity);
    }

    if (last.IsOk()) {
      return last;
    }
    if (!last.IsRetryable()) {
      LOG_IDENT_ERROR("SyncIdentity: node {}: {}", node_name, last.message());
      return last;
    }

    LOG_IDENT_WARN("SyncIdentity: attempt {}/{} for node {} failed: {}", attempt,
                   attempts, node_name, last.message());
  }

  LOG_IDENT_ERROR("SyncIdentity: giving up on node {} after {} attempts", node_name, attempts);
  return last;
}

} // namespace cloud
} // namespace nodeguard
