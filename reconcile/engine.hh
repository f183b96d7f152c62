//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/core/future.hh>

#include "meta/cluster_meta.hh"
#include "nodes/nodes_file.hh"
#include "reconcile/control.hh"
#include "reconcile/plan.hh"
#include "util/seastarx.hh"

namespace nodesync::reconcile {

// engine reconciles the membership document with the nodes list.
//
// The nodes list is only written while the document lock is held, and the
// document is only updated after both the nodes list write and the daemon
// reload succeeded. A failed reload leaves the document untouched so that the
// next pass retries the reload without appending again.
class engine {
 public:
  engine(
      meta::cluster_meta& meta, const nodes::nodes_file& nodes, control& ctl);

  // lock-free check that pnn is registered and already a member of the nodes
  // list, only a member is allowed to drive changes
  future<bool> can_update(uint64_t pnn);

  // one reconciliation pass, returns true if anything was committed
  future<bool> reconcile();

  uint64_t commits() const noexcept { return _commits; }

 private:
  // the critical section, returns true if doc was changed and needs to be
  // persisted
  future<bool> commit(meta::document& doc, bool& committed);

  meta::cluster_meta& _meta;
  const nodes::nodes_file& _nodes;
  control& _control;
  uint64_t _commits = 0;
};

}  // namespace nodesync::reconcile
