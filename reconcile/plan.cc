//
// Created by nodesync on 2026/10/18.
//

#include "plan.hh"

#include <fmt/format.h>

#include "util/error.hh"

namespace nodesync::reconcile {

plan make_plan(const meta::document& doc, std::span<const std::string> nodes) {
  plan p;
  p.nodes.assign(nodes.begin(), nodes.end());
  for (const auto& entry : doc.sorted()) {
    if (entry.pnn < p.nodes.size()) {
      if (p.nodes[entry.pnn] != entry.node) {
        throw util::inconsistency_error(fmt::format(
            "pnn {} is {} in document but {} in nodes",
            entry.pnn,
            entry.node,
            p.nodes[entry.pnn]));
      }
      if (!entry.in_nodes) {
        p.confirm.push_back(entry.pnn);
      }
      continue;
    }
    if (entry.pnn != p.nodes.size()) {
      throw util::out_of_order_error(entry.pnn, p.nodes.size());
    }
    p.nodes.push_back(entry.node);
    p.appended++;
    if (!entry.in_nodes) {
      p.confirm.push_back(entry.pnn);
    }
  }
  return p;
}

}  // namespace nodesync::reconcile
