// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "node/node_registry.hpp"
#include "util/logging.hpp"

namespace nodeguard {
namespace node {

std::string NodeNotFoundMessage(const std::string &name) {
  return "nodes \"" + name + "\" not found";
}

MemoryNodeRegistry::MemoryNodeRegistry(const std::vector<Node> &nodes) {
  for (const auto &node : nodes) {
    Upsert(node);
  }
}

util::Status MemoryNodeRegistry::Get(const util::Context &ctx,
                                     const std::string &name, Node &out) {
  auto err = ctx.Err();
  if (!err.IsOk()) {
    return err;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(name);
  if (it == nodes_.end()) {
    return util::Status::NotFound(NodeNotFoundMessage(name));
  }
  out = it->second;
  return util::Status::Ok();
}

util::Status MemoryNodeRegistry::Patch(const util::Context &ctx,
                                       const std::string &name,
                                       const LabelPatch &patch,
                                       uint64_t expected_version, Node &out) {
  auto err = ctx.Err();
  if (!err.IsOk()) {
    return err;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(name);
  if (it == nodes_.end()) {
    return util::Status::NotFound(NodeNotFoundMessage(name));
  }

  Node &stored = it->second;
  if (expected_version != 0 && stored.resource_version != expected_version) {
    return util::Status::Conflict(
        "Operation cannot be fulfilled on nodes \"" + name +
        "\": the object has been modified; please apply your changes to the latest version and try again");
  }

  if (patch.ApplyTo(stored.labels)) {
    stored.resource_version = next_version_++;
    ++patch_count_;
    LOG_REG_DEBUG("MemoryNodeRegistry: patched node {} [{}] -> version {}", name,
                  patch.ToString(), stored.resource_version);
  }
  out = stored;
  return util::Status::Ok();
}

util::Status MemoryNodeRegistry::List(const util::Context &ctx,
                                      std::vector<Node> &out) {
  auto err = ctx.Err();
  if (!err.IsOk()) {
    return err;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  out.clear();
  out.reserve(nodes_.size());
  for (const auto &[name, node] : nodes_) {
    out.push_back(node);
  }
  return util::Status::Ok();
}

void MemoryNodeRegistry::Upsert(const Node &node) {
  std::lock_guard<std::mutex> lock(mutex_);
  Node stored = node;
  stored.resource_version = next_version_++;
  nodes_[node.name] = std::move(stored);
}

bool MemoryNodeRegistry::Remove(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.erase(name) > 0;
}

util::Status MemoryNodeRegistry::SetAddresses(const std::string &name,
                                              const std::vector<NodeAddress> &addresses) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(name);
  if (it == nodes_.end()) {
    return util::Status::NotFound(NodeNotFoundMessage(name));
  }
  it->second.addresses = addresses;
  it->second.resource_version = next_version_++;
  return util::Status::Ok();
}

uint64_t MemoryNodeRegistry::GetPatchCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return patch_count_;
}

} // namespace node
} // namespace nodeguard
