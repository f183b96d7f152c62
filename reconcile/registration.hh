//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/core/future.hh>
#include <string_view>

#include "meta/cluster_meta.hh"
#include "nodes/nodes_file.hh"
#include "util/seastarx.hh"

namespace nodesync::reconcile {

// registration records the intent of a node to join the cluster.
//
// Only an explicitly claimed pnn 0 is admitted directly: it is written into
// the nodes list and marked in_nodes right away. Any other entry, including
// the pnn 0 of a node started without a number, is recorded as desired and
// waits for the engine driven by a member to confirm it.
class registration {
 public:
  registration(meta::cluster_meta& meta, const nodes::nodes_file& nodes);

  // succeed if the node is registered with the same identity and address,
  // throws node_not_present if pnn has no entry at all
  future<> refresh(
      std::string_view identity, std::string_view address, uint64_t pnn);

  // append a new entry, throws duplicate_pnn_error if pnn is taken. claimed
  // is false when the pnn is a fallback rather than the node's own number
  future<> add(
      std::string_view identity,
      std::string_view address,
      uint64_t pnn,
      bool claimed = true);

  // refresh, falling back to add for an unregistered node
  future<> register_or_refresh(
      std::string_view identity,
      std::string_view address,
      uint64_t pnn,
      bool claimed = true);

 private:
  meta::cluster_meta& _meta;
  const nodes::nodes_file& _nodes;
};

}  // namespace nodesync::reconcile
