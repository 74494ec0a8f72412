// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "node/node.hpp"

namespace nodeguard {
namespace node {

const char *NodeAddressTypeName(NodeAddressType type) {
  switch (type) {
  case NodeAddressType::INTERNAL_IP:
    return "InternalIP";
  case NodeAddressType::EXTERNAL_IP:
    return "ExternalIP";
  case NodeAddressType::HOSTNAME:
    return "Hostname";
  }
  return "Unknown";
}

std::optional<NodeAddressType> ParseNodeAddressType(const std::string &name) {
  if (name == "InternalIP") {
    return NodeAddressType::INTERNAL_IP;
  }
  if (name == "ExternalIP") {
    return NodeAddressType::EXTERNAL_IP;
  }
  if (name == "Hostname") {
    return NodeAddressType::HOSTNAME;
  }
  return std::nullopt;
}

bool LabelPatch::ApplyTo(std::map<std::string, std::string> &labels) const {
  bool changed = false;
  for (const auto &[key, value] : ops_) {
    if (value) {
      auto it = labels.find(key);
      if (it == labels.end() || it->second != *value) {
        labels[key] = *value;
        changed = true;
      }
    } else if (labels.erase(key) > 0) {
      changed = true;
    }
  }
  return changed;
}

std::string LabelPatch::ToString() const {
  std::string out;
  for (const auto &[key, value] : ops_) {
    if (!out.empty()) {
      out += ' ';
    }
    if (value) {
      out += "+" + key + "=" + *value;
    } else {
      out += "-" + key;
    }
  }
  return out;
}

} // namespace node
} // namespace nodeguard
