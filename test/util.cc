//
// Created by nodesync on 2026/10/18.
//

#include "util.hh"

#include <filesystem>
#include <random>
#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>

#include "util/error.hh"

namespace nodesync::test {

using namespace seastar;
using namespace std;

string util::make_temp_dir(string_view prefix) {
  static thread_local mt19937_64 rng{random_device{}()};
  auto dir = filesystem::temp_directory_path() /
             fmt::format("nodesync_{}_{:016x}", prefix, rng());
  filesystem::create_directories(dir);
  return dir.string();
}

void util::remove_dir(const string& dir) {
  error_code ec;
  filesystem::remove_all(dir, ec);
}

meta::document util::make_document(vector<meta::node_entry> entries) {
  meta::document doc;
  doc.nodes = std::move(entries);
  return doc;
}

vector<string> util::make_nodes(size_t num) {
  vector<string> nodes;
  for (size_t i = 0; i < num; ++i) {
    nodes.emplace_back(address(i));
  }
  return nodes;
}

string util::address(uint64_t pnn) {
  return fmt::format("10.0.0.{}", pnn + 10);
}

future<> fake_control::reload_nodes() {
  ++calls;
  if (on_reload) {
    on_reload();
  }
  if (fail) {
    return make_exception_future<>(
        nodesync::util::control_error("fake reloadnodes", "exit code 1"));
  }
  return make_ready_future<>();
}

future<> counting_waiter::wait() {
  ++waits;
  if (hook) {
    co_await hook();
  }
  if (waits >= _limit) {
    throw abort_requested_exception();
  }
}

}  // namespace nodesync::test
