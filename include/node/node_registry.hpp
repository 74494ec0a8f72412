// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "node/node.hpp"
#include "util/context.hpp"
#include "util/status.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace nodeguard {
namespace node {

// Abstract node store, passed explicitly into every operation that needs it.
// Implementations:
// - MemoryNodeRegistry: in-process store (tests, command-line tool)
// - an API-server client (not part of this library)
//
// Every call is blocking and must honor ctx: a canceled or expired context
// yields a TRANSIENT status without touching the store.
class NodeRegistry {
public:
  virtual ~NodeRegistry() = default;

  // NOT_FOUND with message `nodes "<name>" not found` if absent
  virtual util::Status Get(const util::Context &ctx, const std::string &name,
                           Node &out) = 0;

  // Apply a label patch if the stored resource version still equals
  // expected_version (0 skips the precondition). CONFLICT on mismatch.
  // On success `out` receives the updated node.
  virtual util::Status Patch(const util::Context &ctx, const std::string &name,
                             const LabelPatch &patch, uint64_t expected_version,
                             Node &out) = 0;

  virtual util::Status List(const util::Context &ctx, std::vector<Node> &out) = 0;
};

// Message the registry uses for an absent node
std::string NodeNotFoundMessage(const std::string &name);

// Thread-safe in-memory registry. The mutex is held only for the duration of
// a single call.
class MemoryNodeRegistry : public NodeRegistry {
public:
  MemoryNodeRegistry() = default;
  explicit MemoryNodeRegistry(const std::vector<Node> &nodes);

  MemoryNodeRegistry(const MemoryNodeRegistry &) = delete;
  MemoryNodeRegistry &operator=(const MemoryNodeRegistry &) = delete;

  util::Status Get(const util::Context &ctx, const std::string &name,
                   Node &out) override;
  util::Status Patch(const util::Context &ctx, const std::string &name,
                     const LabelPatch &patch, uint64_t expected_version,
                     Node &out) override;
  util::Status List(const util::Context &ctx, std::vector<Node> &out) override;

  // Insert or replace a node, bumping its resource version
  void Upsert(const Node &node);
  bool Remove(const std::string &name);

  // Replace recorded status addresses (what the address publisher does)
  util::Status SetAddresses(const std::string &name,
                            const std::vector<NodeAddress> &addresses);

  // Number of patches that actually changed a node
  uint64_t GetPatchCount() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, Node> nodes_;
  uint64_t next_version_{1};
  uint64_t patch_count_{0};
};

} // namespace node
} // namespace nodeguard
