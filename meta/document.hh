//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace nodesync::meta {

struct node_entry {
  // network address of the node as written into the nodes list
  std::string node;

  // the position of the node in the nodes list
  uint64_t pnn = 0;

  // false: desired but not yet applied to the nodes list
  // true: confirmed applied, never flipped back
  bool in_nodes = false;

  // the registering host, empty for entries written without one
  std::string identity;

  bool operator==(const node_entry&) const = default;
};

// the cluster membership document shared by all nodes of a fleet, encoded as
//   {"nodes": [{"node": "10.0.0.10", "pnn": 0, "in_nodes": true}, ...]}
struct document {
  std::vector<node_entry> nodes;

  const node_entry* find(uint64_t pnn) const;
  node_entry* find(uint64_t pnn);

  // entries sorted by ascending pnn
  std::vector<node_entry> sorted() const;

  // throws serialization_error if pnns are not unique
  void validate() const;

  bool operator==(const document&) const = default;

  static document read_from(std::string_view json);
  std::string write_to() const;
};

std::ostream& operator<<(std::ostream& os, const node_entry& entry);

}  // namespace nodesync::meta
