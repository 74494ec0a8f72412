#pragma once

/*
 JSON codec for node files used by the command-line tool:

 {
   "nodes": [
     {
       "name": "node-int-ext",
       "labels": { "k": "v" },
       "annotations": { "k": "v" },
       "addresses": [ { "type": "InternalIP", "address": "1.2.3.4" } ]
     }
   ]
 }

 Resource versions are registry-internal and not persisted.
*/

#include "node/node.hpp"
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace nodeguard {
namespace node {

nlohmann::json NodeToJson(const Node &node);

// Returns false and sets `error` on malformed input
bool NodeFromJson(const nlohmann::json &j, Node &out, std::string &error);

bool LoadNodesFile(const std::filesystem::path &path, std::vector<Node> &out,
                   std::string &error);

bool SaveNodesFile(const std::filesystem::path &path, const std::vector<Node> &nodes);

} // namespace node
} // namespace nodeguard
