//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <functional>
#include <memory>
#include <seastar/core/future.hh>
#include <string>
#include <vector>

#include "meta/document.hh"
#include "monitor/waiter.hh"
#include "reconcile/control.hh"

namespace nodesync::test {

class util {
 public:
  // a fresh directory under the system temporary directory
  static std::string make_temp_dir(std::string_view prefix);
  static void remove_dir(const std::string& dir);

  static meta::document make_document(std::vector<meta::node_entry> entries);
  static std::vector<std::string> make_nodes(size_t num);
  // the address of the node with pnn
  static std::string address(uint64_t pnn);
};

// a reload command that only counts, optionally failing
class fake_control final : public reconcile::control {
 public:
  future<> reload_nodes() override;

  uint64_t calls = 0;
  bool fail = false;
  std::function<void()> on_reload;
};

// a waiter that never blocks, it throws abort_requested_exception on the
// limit-th wait and runs the hook (if any) before every wait
class counting_waiter final : public monitor::waiter {
 public:
  explicit counting_waiter(uint64_t limit) : _limit(limit) {}

  future<> wait() override;
  void reset() override { ++resets; }

  uint64_t waits = 0;
  uint64_t resets = 0;
  std::function<future<>()> hook;

 private:
  uint64_t _limit;
};

}  // namespace nodesync::test
