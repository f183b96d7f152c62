//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <span>
#include <string>
#include <vector>

#include "meta/document.hh"

namespace nodesync::reconcile {

// plan is the outcome of comparing the membership document with the nodes
// list, it is a pure function of the two and carries no side effect
struct plan {
  // the nodes list after applying the plan, the old list is always a prefix
  std::vector<std::string> nodes;

  // number of addresses appended to the old list
  size_t appended = 0;

  // pnns whose in_nodes flag should become true once the plan is applied
  std::vector<uint64_t> confirm;

  bool empty() const noexcept { return appended == 0 && confirm.empty(); }
};

// Entries are visited in ascending pnn order:
//  1. in_nodes && nodes[pnn] == node, nothing to do
//  2. pnn == nodes.size(), node is appended (and confirmed if !in_nodes)
//  3. !in_nodes && nodes[pnn] == node, confirmed only
//  4. pnn > nodes.size(), out_of_order_error
//  5. nodes[pnn] != node, inconsistency_error
plan make_plan(const meta::document& doc, std::span<const std::string> nodes);

}  // namespace nodesync::reconcile
