//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <memory>
#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <string>

#include "meta/cluster_meta.hh"
#include "monitor/waiter.hh"
#include "nodes/nodes_file.hh"
#include "nodesync/config.hh"
#include "util/seastarx.hh"

namespace nodesync {

// the node related command line options, empty means not given
struct node_options {
  static constexpr std::string_view AFTER_LAST_DASH = "after-last-dash";

  std::string hostname;
  std::optional<int64_t> node_number;
  std::string take_node_number_from_hostname;
  std::string ip;
  std::string persistent_path;
  std::string metadata_source;
};

// node_params combines the command line options with the config file and
// derives everything a command needs to know about the local node
class node_params {
 public:
  node_params(const config& cfg, node_options opts);

  std::optional<uint64_t> node_number() const noexcept { return _number; }
  uint64_t pnn() const noexcept { return _number.value_or(0); }
  const std::string& hostname() const noexcept { return _opts.hostname; }
  const std::string& persistent_path() const noexcept { return _nodes_path; }

  // the hostname, or node-<number>, or "-unknown-" which is never a valid
  // DNS name
  std::string identity() const;

  // command line first, then nodes_json and cluster_meta_uri from the config
  std::string cluster_meta_uri() const;

  // the ip option, or the first non-loopback address of the hostname
  future<std::string> address() const;

  nodes::nodes_file make_nodes_file() const;

  static std::optional<uint64_t> parse_node_number(const node_options& opts);

 private:
  const config& _cfg;
  node_options _opts;
  std::optional<uint64_t> _number;
  std::string _nodes_path;
};

// a file_watcher for file locations, a sleeper otherwise
future<std::unique_ptr<monitor::waiter>> make_waiter(
    const meta::location& loc, const config& cfg, abort_source& as);

}  // namespace nodesync
