#include "node/node_json.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nodeguard {
namespace node {

namespace {

bool ReadStringMap(const json &j, const char *field,
                   std::map<std::string, std::string> &out, std::string &error) {
  if (!j.contains(field)) {
    return true;
  }
  const auto &obj = j.at(field);
  if (!obj.is_object()) {
    error = std::string("'") + field + "' must be an object";
    return false;
  }
  for (const auto &[key, value] : obj.items()) {
    if (!value.is_string()) {
      error = std::string("'") + field + "." + key + "' must be a string";
      return false;
    }
    out[key] = value.get<std::string>();
  }
  return true;
}

} // namespace

json NodeToJson(const Node &node) {
  json addresses = json::array();
  for (const auto &addr : node.addresses) {
    addresses.push_back({{"type", NodeAddressTypeName(addr.type)},
                         {"address", addr.address}});
  }

  json j = {{"name", node.name},
            {"labels", json::object()},
            {"annotations", json::object()},
            {"addresses", addresses}};
  for (const auto &[key, value] : node.labels) {
    j["labels"][key] = value;
  }
  for (const auto &[key, value] : node.annotations) {
    j["annotations"][key] = value;
  }
  return j;
}

bool NodeFromJson(const json &j, Node &out, std::string &error) {
  if (!j.is_object()) {
    error = "node entry must be an object";
    return false;
  }
  if (!j.contains("name") || !j["name"].is_string() ||
      j["name"].get<std::string>().empty()) {
    error = "node entry needs a non-empty 'name'";
    return false;
  }

  Node node;
  node.name = j["name"].get<std::string>();

  if (!ReadStringMap(j, "labels", node.labels, error) ||
      !ReadStringMap(j, "annotations", node.annotations, error)) {
    error = "node " + node.name + ": " + error;
    return false;
  }

  if (j.contains("addresses")) {
    const auto &addresses = j["addresses"];
    if (!addresses.is_array()) {
      error = "node " + node.name + ": 'addresses' must be an array";
      return false;
    }
    for (const auto &entry : addresses) {
      if (!entry.is_object() || !entry.value("type", json()).is_string() ||
          !entry.value("address", json()).is_string()) {
        error = "node " + node.name + ": address entries need string 'type' and 'address'";
        return false;
      }
      auto type = ParseNodeAddressType(entry["type"].get<std::string>());
      if (!type) {
        error = "node " + node.name + ": unknown address type '" +
                entry["type"].get<std::string>() + "'";
        return false;
      }
      node.addresses.push_back({*type, entry["address"].get<std::string>()});
    }
  }

  out = std::move(node);
  return true;
}

bool LoadNodesFile(const std::filesystem::path &path, std::vector<Node> &out,
                   std::string &error) {
  auto contents = util::read_file_string(path);
  if (!contents) {
    error = "cannot read " + path.string();
    return false;
  }

  try {
    json j = json::parse(*contents);
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) {
      error = path.string() + ": expected an object with a 'nodes' array";
      return false;
    }

    std::vector<Node> nodes;
    for (const auto &entry : j["nodes"]) {
      Node node;
      if (!NodeFromJson(entry, node, error)) {
        error = path.string() + ": " + error;
        return false;
      }
      nodes.push_back(std::move(node));
    }
    out = std::move(nodes);
    return true;
  } catch (const json::exception &e) {
    error = path.string() + ": " + e.what();
    return false;
  }
}

bool SaveNodesFile(const std::filesystem::path &path, const std::vector<Node> &nodes) {
  json list = json::array();
  for (const auto &node : nodes) {
    list.push_back(NodeToJson(node));
  }
  json j = {{"nodes", list}};

  if (!util::atomic_write_file(path, j.dump(2) + "\n", 0644)) {
    LOG_ERROR("Failed to write node file {}", path.string());
    return false;
  }
  return true;
}

} // namespace node
} // namespace nodeguard
