//
// Created by nodesync on 2026/10/18.
//

#include "registration.hh"

#include <seastar/core/coroutine.hh>

#include "reconcile/logger.hh"
#include "util/error.hh"

namespace nodesync::reconcile {

namespace {

// an entry written without identity matches anyone
bool same_identity(const meta::node_entry& e, std::string_view identity) {
  return e.identity.empty() || e.identity == identity;
}

}  // namespace

registration::registration(
    meta::cluster_meta& meta, const nodes::nodes_file& nodes)
  : _meta(meta), _nodes(nodes) {}

future<> registration::refresh(
    std::string_view identity, std::string_view address, uint64_t pnn) {
  co_await _meta.with_lock([&](meta::document& doc) -> future<bool> {
    auto* entry = doc.find(pnn);
    if (entry == nullptr) {
      throw util::node_not_present(identity, pnn);
    }
    if (!same_identity(*entry, identity)) {
      throw util::duplicate_pnn_error(pnn, entry->identity);
    }
    if (entry->node != address) {
      throw util::inconsistency_error(fmt::format(
          "pnn {} is registered with address {}, not {}",
          pnn,
          entry->node,
          address));
    }
    l.info("pnn {} ({}) already registered as {}", pnn, identity, address);
    co_return false;
  });
}

future<> registration::add(
    std::string_view identity,
    std::string_view address,
    uint64_t pnn,
    bool claimed) {
  co_await _meta.with_lock([&](meta::document& doc) -> future<bool> {
    if (auto* entry = doc.find(pnn); entry != nullptr) {
      throw util::duplicate_pnn_error(
          pnn, entry->identity.empty() ? entry->node : entry->identity);
    }
    bool bootstrap = claimed && pnn == 0;
    doc.nodes.emplace_back(meta::node_entry{
        .node = std::string(address),
        .pnn = pnn,
        .in_nodes = bootstrap,
        .identity = std::string(identity)});
    if (bootstrap) {
      // the first node admits itself, nobody else could
      co_await _nodes.ensure_present(address, pnn);
    }
    l.info(
        "registered pnn {} ({}) as {}, in_nodes:{}",
        pnn,
        identity,
        address,
        bootstrap);
    co_return true;
  });
}

future<> registration::register_or_refresh(
    std::string_view identity,
    std::string_view address,
    uint64_t pnn,
    bool claimed) {
  bool present = true;
  try {
    co_await refresh(identity, address, pnn);
  } catch (const util::node_not_present&) {
    present = false;
  }
  if (!present) {
    co_await add(identity, address, pnn, claimed);
  }
}

}  // namespace nodesync::reconcile
