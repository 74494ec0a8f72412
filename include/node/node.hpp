// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Node object model

 A cluster-visible node as the registry stores it: metadata (labels,
 annotations), recorded status addresses, and the resource version the
 registry uses for optimistic concurrency.

 Labels and annotations are ordered maps so serialized output and patch
 application are deterministic.
*/

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nodeguard {
namespace node {

// Labels owned by the identity synchronizer; nothing else is ever written
inline constexpr const char *kClusterNameLabel = "node.cloudprovider.kubernetes.io/clustername";
inline constexpr const char *kPlatformLabel = "node.cloudprovider.kubernetes.io/platform";
inline constexpr const char *kLifecycleLabel = "node.cloudprovider.kubernetes.io/lifecycle";
inline constexpr const char *kLifecycleSpot = "spot";

// Address the kubelet was told to use, recorded by the node at registration
inline constexpr const char *kProvidedIPAnnotation = "alpha.kubernetes.io/provided-node-ip";

enum class NodeAddressType {
  INTERNAL_IP,
  EXTERNAL_IP,
  HOSTNAME
};

const char *NodeAddressTypeName(NodeAddressType type);
std::optional<NodeAddressType> ParseNodeAddressType(const std::string &name);

struct NodeAddress {
  NodeAddressType type{NodeAddressType::INTERNAL_IP};
  std::string address;

  bool operator==(const NodeAddress &other) const {
    return type == other.type && address == other.address;
  }
};

struct Node {
  std::string name;
  std::map<std::string, std::string> labels;
  std::map<std::string, std::string> annotations;
  std::vector<NodeAddress> addresses;
  uint64_t resource_version{0};

  bool operator==(const Node &other) const = default;
};

/**
 * LabelPatch - minimal label delta
 *
 * Each entry either sets a key to a value or (nullopt) removes it. Keys not
 * present in the patch are left alone when applied.
 */
class LabelPatch {
public:
  void Set(const std::string &key, const std::string &value) { ops_[key] = value; }
  void Remove(const std::string &key) { ops_[key] = std::nullopt; }

  bool Empty() const { return ops_.empty(); }
  size_t Size() const { return ops_.size(); }

  const std::map<std::string, std::optional<std::string>> &Operations() const {
    return ops_;
  }

  // Apply to a label map; returns true if anything changed
  bool ApplyTo(std::map<std::string, std::string> &labels) const;

  // "+key=value -key" form for logs
  std::string ToString() const;

private:
  std::map<std::string, std::optional<std::string>> ops_;
};

} // namespace node
} // namespace nodeguard
