//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/core/future.hh>

#include "meta/cluster_meta.hh"
#include "monitor/waiter.hh"
#include "reconcile/engine.hh"
#include "util/seastarx.hh"

namespace nodesync::monitor {

class supervisor {
 public:
  static constexpr uint64_t DEFAULT_MAX_ERRORS = 10;

  supervisor(
      reconcile::engine& eng,
      meta::cluster_meta& meta,
      waiter& w,
      uint64_t pnn,
      uint64_t max_errors = DEFAULT_MAX_ERRORS);

  // run passes until aborted, or until more than max_errors consecutive
  // passes failed in which case the last error is propagated
  future<> manage();

  // block until the local pnn is marked in_nodes in the document
  future<> wait_until_admitted();

  // a single pass, returns true if the engine committed anything
  future<bool> pass();

  uint64_t errors() const noexcept { return _errors; }
  uint64_t passes() const noexcept { return _passes; }

 private:
  future<bool> admitted();

  reconcile::engine& _engine;
  meta::cluster_meta& _meta;
  waiter& _waiter;
  const uint64_t _pnn;
  const uint64_t _max_errors;
  uint64_t _errors = 0;
  uint64_t _passes = 0;
};

}  // namespace nodesync::monitor
