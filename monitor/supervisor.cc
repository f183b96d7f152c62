//
// Created by nodesync on 2026/10/18.
//

#include "supervisor.hh"

#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>

#include "monitor/logger.hh"

namespace nodesync::monitor {

supervisor::supervisor(
    reconcile::engine& eng,
    meta::cluster_meta& meta,
    waiter& w,
    uint64_t pnn,
    uint64_t max_errors)
  : _engine(eng)
  , _meta(meta)
  , _waiter(w)
  , _pnn(pnn)
  , _max_errors(max_errors) {}

future<bool> supervisor::pass() {
  ++_passes;
  l.debug("supervisor::pass: checking if node {} can make updates", _pnn);
  if (!co_await _engine.can_update(_pnn)) {
    l.info("supervisor::pass: node {} can not make updates", _pnn);
    co_return false;
  }
  auto committed = co_await _engine.reconcile();
  if (committed) {
    l.info("supervisor::pass: updated nodes");
  }
  co_return committed;
}

future<> supervisor::manage() {
  l.info(
      "supervisor::manage: managing {} as node {}, max_errors:{}",
      _meta.name(),
      _pnn,
      _max_errors);
  while (true) {
    try {
      co_await pass();
      _errors = 0;
      _waiter.reset();
    } catch (const abort_requested_exception&) {
      throw;
    } catch (const sleep_aborted&) {
      throw;
    } catch (const std::exception& e) {
      l.error(
          "supervisor::manage: error during pass: {}, count:{}",
          e.what(),
          _errors);
      ++_errors;
      if (_errors > _max_errors) {
        l.error(
            "supervisor::manage: too many retries ({}), giving up", _errors);
        throw;
      }
    }
    co_await _waiter.wait();
  }
}

future<bool> supervisor::admitted() {
  auto doc = co_await _meta.load(false);
  const auto* e = doc.find(_pnn);
  co_return e != nullptr && e->in_nodes;
}

future<> supervisor::wait_until_admitted() {
  while (!co_await admitted()) {
    l.info("supervisor::wait_until_admitted: node {} not yet ready", _pnn);
    co_await _waiter.wait();
  }
  l.info("supervisor::wait_until_admitted: node {} is ready", _pnn);
}

}  // namespace nodesync::monitor
