//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace nodesync {

struct config {
  // the path of the nodes list owned by nodesync, usually on shared storage
  // that survives a container restart
  std::string nodes_path = "/var/lib/ctdb/shared/nodes";

  // the path the ctdb daemon reads the nodes list from, it is maintained as a
  // symlink to nodes_path. Empty disables the link.
  std::string nodes_link = "/etc/ctdb/nodes";

  // the location of the membership document, a path, a file:// URI or a
  // rados:// URI
  std::string cluster_meta_uri = "/var/lib/ctdb/shared/ctdb-nodes.json";

  // older configs name the membership document path nodes_json, when set it
  // takes precedence over cluster_meta_uri
  std::string nodes_json;

  // the command asking the ctdb daemon to reload its nodes list, executed
  // without a shell, the first element must be an absolute path
  std::vector<std::string> reload_command = {"/usr/bin/ctdb", "reloadnodes"};

  // the number of consecutive failed passes tolerated by manage-nodes
  uint64_t max_errors = 10;

  // the interval between two passes when the document cannot be watched,
  // grows by wait_backoff_factor after a failed pass up to wait_max_interval_ms
  uint64_t wait_interval_ms = 1000;
  uint64_t wait_max_interval_ms = 30000;
  double wait_backoff_factor = 2.0;

  // the longest time to wait for a change of a watched document before
  // running a pass anyway
  uint64_t watch_timeout_ms = 30000;

  void validate() const;

  static config read_from(std::istream& input);
  void write_to(std::ostream& output) const;
};

std::ostream& operator<<(std::ostream& os, const config& cfg);

}  // namespace nodesync
