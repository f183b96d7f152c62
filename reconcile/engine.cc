//
// Created by nodesync on 2026/10/18.
//

#include "engine.hh"

#include <algorithm>
#include <seastar/core/coroutine.hh>

#include "reconcile/logger.hh"

namespace nodesync::reconcile {

engine::engine(
    meta::cluster_meta& meta, const nodes::nodes_file& nodes, control& ctl)
  : _meta(meta), _nodes(nodes), _control(ctl) {}

future<bool> engine::can_update(uint64_t pnn) {
  auto doc = co_await _meta.load(true);
  auto* self = doc.find(pnn);
  if (self == nullptr) {
    l.info("pnn {} not found in {}", pnn, _meta.name());
    co_return false;
  }
  if (self->in_nodes) {
    co_return true;
  }
  auto nodes = co_await _nodes.read();
  co_return std::find(nodes.begin(), nodes.end(), self->node) != nodes.end();
}

future<bool> engine::reconcile() {
  // optimistic check without the lock, if we are wrong the locked re-check
  // below or the next pass will tell
  {
    auto doc = co_await _meta.load(true);
    auto nodes = co_await _nodes.read();
    if (make_plan(doc, nodes).empty()) {
      l.debug("examined nodes state - no changes");
      co_return false;
    }
  }
  bool committed = false;
  co_await _meta.with_lock([this, &committed](meta::document& doc) {
    return commit(doc, committed);
  });
  co_return committed;
}

future<bool> engine::commit(meta::document& doc, bool& committed) {
  auto current = co_await _nodes.read();
  auto p = make_plan(doc, current);
  if (p.empty()) {
    l.info("reexamined nodes state - no changes");
    co_return false;
  }
  l.info(
      "writing {} nodes ({} appended) to {}",
      p.nodes.size(),
      p.appended,
      _nodes.real_path());
  co_await _nodes.write(p.nodes);
  co_await _control.reload_nodes();
  for (auto pnn : p.confirm) {
    auto* entry = doc.find(pnn);
    entry->in_nodes = true;
    l.info("pnn {} ({}) is now in nodes", pnn, entry->node);
  }
  _commits++;
  committed = true;
  // an unchanged document does not need to be rewritten
  co_return !p.confirm.empty();
}

}  // namespace nodesync::reconcile
