//
// Created by nodesync on 2026/10/18.
//

#include "config.hh"

#include <yaml-cpp/yaml.h>

#include <ostream>

#include "util/error.hh"

namespace YAML {

template <>
struct convert<nodesync::config> {
  static Node encode(const nodesync::config& cfg) {
    Node node;
    node["nodes_path"] = cfg.nodes_path;
    node["nodes_link"] = cfg.nodes_link;
    node["cluster_meta_uri"] = cfg.cluster_meta_uri;
    if (!cfg.nodes_json.empty()) {
      node["nodes_json"] = cfg.nodes_json;
    }
    node["reload_command"] = cfg.reload_command;
    node["max_errors"] = cfg.max_errors;
    node["wait_interval_ms"] = cfg.wait_interval_ms;
    node["wait_max_interval_ms"] = cfg.wait_max_interval_ms;
    node["wait_backoff_factor"] = cfg.wait_backoff_factor;
    node["watch_timeout_ms"] = cfg.watch_timeout_ms;
    return node;
  }
  static bool decode(const Node& node, nodesync::config& cfg) {
    if (!node.IsMap()) {
      return false;
    }
    if (node["nodes_path"]) {
      cfg.nodes_path = node["nodes_path"].as<std::string>();
    }
    if (node["nodes_link"]) {
      cfg.nodes_link = node["nodes_link"].as<std::string>();
    }
    if (node["cluster_meta_uri"]) {
      cfg.cluster_meta_uri = node["cluster_meta_uri"].as<std::string>();
    }
    if (node["nodes_json"]) {
      cfg.nodes_json = node["nodes_json"].as<std::string>();
    }
    if (node["reload_command"]) {
      cfg.reload_command =
          node["reload_command"].as<std::vector<std::string>>();
    }
    if (node["max_errors"]) {
      cfg.max_errors = node["max_errors"].as<uint64_t>();
    }
    if (node["wait_interval_ms"]) {
      cfg.wait_interval_ms = node["wait_interval_ms"].as<uint64_t>();
    }
    if (node["wait_max_interval_ms"]) {
      cfg.wait_max_interval_ms = node["wait_max_interval_ms"].as<uint64_t>();
    }
    if (node["wait_backoff_factor"]) {
      cfg.wait_backoff_factor = node["wait_backoff_factor"].as<double>();
    }
    if (node["watch_timeout_ms"]) {
      cfg.watch_timeout_ms = node["watch_timeout_ms"].as<uint64_t>();
    }
    return true;
  }
};

}  // namespace YAML

namespace nodesync {

void config::validate() const {
  if (nodes_path.empty()) {
    throw util::configuration_error("nodes_path", "empty");
  }
  if (cluster_meta_uri.empty() && nodes_json.empty()) {
    throw util::configuration_error("cluster_meta_uri", "empty");
  }
  if (reload_command.empty()) {
    throw util::configuration_error("reload_command", "empty");
  }
  if (reload_command.front().empty() || reload_command.front()[0] != '/') {
    throw util::configuration_error("reload_command", "not an absolute path");
  }
  if (wait_interval_ms == 0) {
    throw util::configuration_error("wait_interval_ms", "invalid");
  }
  if (wait_max_interval_ms < wait_interval_ms) {
    throw util::configuration_error("wait_max_interval_ms", "too small");
  }
  if (wait_backoff_factor < 1.0) {
    throw util::configuration_error("wait_backoff_factor", "less than 1.0");
  }
  if (watch_timeout_ms == 0) {
    throw util::configuration_error("watch_timeout_ms", "invalid");
  }
}

config config::read_from(std::istream& input) {
  try {
    auto node = YAML::Load(input);
    if (node.IsNull()) {
      return config{};
    }
    return node.as<config>();
  } catch (const YAML::Exception& e) {
    throw util::configuration_error("config", e.what());
  }
}

void config::write_to(std::ostream& output) const {
  YAML::Node node;
  node = *this;
  output << YAML::Dump(node);
}

std::ostream& operator<<(std::ostream& os, const config& cfg) {
  os << "nodes_path: " << cfg.nodes_path << ", "
     << "nodes_link: " << cfg.nodes_link << ", "
     << "cluster_meta_uri: " << cfg.cluster_meta_uri << ", "
     << "nodes_json: " << cfg.nodes_json << ", "
     << "reload_command: [";
  for (size_t i = 0; i < cfg.reload_command.size(); ++i) {
    os << (i == 0 ? "" : " ") << cfg.reload_command[i];
  }
  os << "], "
     << "max_errors: " << cfg.max_errors << ", "
     << "wait_interval_ms: " << cfg.wait_interval_ms << ", "
     << "wait_max_interval_ms: " << cfg.wait_max_interval_ms << ", "
     << "wait_backoff_factor: " << cfg.wait_backoff_factor << ", "
     << "watch_timeout_ms: " << cfg.watch_timeout_ms;
  return os;
}

}  // namespace nodesync
