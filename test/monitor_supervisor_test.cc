//
// Created by nodesync on 2026/10/18.
//

#include "monitor/supervisor.hh"

#include <seastar/core/abort_source.hh>

#include "meta/memory_cluster_meta.hh"
#include "test/base.hh"
#include "test/util.hh"
#include "util/error.hh"

using namespace nodesync;
using namespace nodesync::monitor;
using namespace seastar;

using nodesync::test::l;
using helper = nodesync::test::util;

namespace {

meta::node_entry entry(uint64_t pnn, bool in_nodes) {
  return {.node = helper::address(pnn), .pnn = pnn, .in_nodes = in_nodes};
}

class supervisor_test : public ::testing::Test {
 protected:
  void SetUp() override {
    _dir = helper::make_temp_dir("supervisor");
    _nodes = std::make_unique<nodes::nodes_file>(_dir + "/nodes", "");
  }

  void TearDown() override { helper::remove_dir(_dir); }

  // the list conflicts with the document, every pass fails
  future<> make_inconsistent(meta::memory_cluster_meta& meta) {
    meta.reset(helper::make_document({entry(0, true), entry(1, false)})
                   .write_to());
    std::vector<std::string> listed = {helper::address(0), "192.168.0.1"};
    co_await _nodes->write(listed);
  }

  std::string _dir;
  std::unique_ptr<nodes::nodes_file> _nodes;
  test::fake_control _control;
};

NODESYNC_TEST_F(supervisor_test, gives_up_after_max_errors) {
  meta::memory_cluster_meta meta{"threshold"};
  co_await make_inconsistent(meta);
  reconcile::engine eng{meta, *_nodes, _control};
  test::counting_waiter waiter{100};
  supervisor sup{eng, meta, waiter, 0};
  bool thrown = false;
  try {
    co_await sup.manage();
  } catch (const util::inconsistency_error&) {
    thrown = true;
  }
  EXPECT_TRUE(thrown);
  EXPECT_EQ(sup.errors(), supervisor::DEFAULT_MAX_ERRORS + 1);
  EXPECT_EQ(sup.passes(), supervisor::DEFAULT_MAX_ERRORS + 1);
  EXPECT_EQ(waiter.waits, supervisor::DEFAULT_MAX_ERRORS);
  EXPECT_EQ(waiter.resets, 0);
}

NODESYNC_TEST_F(supervisor_test, custom_max_errors) {
  meta::memory_cluster_meta meta{"custom"};
  co_await make_inconsistent(meta);
  reconcile::engine eng{meta, *_nodes, _control};
  test::counting_waiter waiter{100};
  supervisor sup{eng, meta, waiter, 0, 2};
  bool thrown = false;
  try {
    co_await sup.manage();
  } catch (const util::inconsistency_error&) {
    thrown = true;
  }
  EXPECT_TRUE(thrown);
  EXPECT_EQ(sup.passes(), 3);
}

NODESYNC_TEST_F(supervisor_test, success_resets_errors) {
  meta::memory_cluster_meta meta{"reset"};
  meta.reset(
      helper::make_document({entry(0, true), entry(1, false)}).write_to());
  co_await _nodes->write(helper::make_nodes(1));
  reconcile::engine eng{meta, *_nodes, _control};
  _control.fail = true;
  test::counting_waiter waiter{20};
  waiter.hook = [&]() -> future<> {
    // the reload recovers after a few failed passes
    if (waiter.waits == 8) {
      _control.fail = false;
    }
    return make_ready_future<>();
  };
  supervisor sup{eng, meta, waiter, 0};
  bool aborted = false;
  try {
    co_await sup.manage();
  } catch (const abort_requested_exception&) {
    aborted = true;
  }
  EXPECT_TRUE(aborted);
  EXPECT_EQ(sup.errors(), 0);
  EXPECT_EQ(sup.passes(), 20);
  EXPECT_EQ(_control.calls, 9);
  EXPECT_EQ(eng.commits(), 1);
  EXPECT_EQ(waiter.resets, 12);
  EXPECT_TRUE((co_await meta.load(true)).find(1)->in_nodes);
}

NODESYNC_TEST_F(supervisor_test, abort_is_not_counted) {
  meta::memory_cluster_meta meta{"abort"};
  meta.reset(
      helper::make_document({entry(0, true), entry(1, false)}).write_to());
  co_await _nodes->write(helper::make_nodes(1));
  reconcile::engine eng{meta, *_nodes, _control};
  _control.on_reload = [] { throw abort_requested_exception(); };
  test::counting_waiter waiter{100};
  supervisor sup{eng, meta, waiter, 0};
  bool aborted = false;
  try {
    co_await sup.manage();
  } catch (const abort_requested_exception&) {
    aborted = true;
  }
  EXPECT_TRUE(aborted);
  EXPECT_EQ(sup.errors(), 0);
  EXPECT_EQ(sup.passes(), 1);
  EXPECT_EQ(waiter.waits, 0);
}

NODESYNC_TEST_F(supervisor_test, ineligible_node_does_nothing) {
  meta::memory_cluster_meta meta{"ineligible"};
  meta.reset(
      helper::make_document({entry(0, true), entry(1, false)}).write_to());
  reconcile::engine eng{meta, *_nodes, _control};
  test::counting_waiter waiter{3};
  supervisor sup{eng, meta, waiter, 1};
  bool aborted = false;
  try {
    co_await sup.manage();
  } catch (const abort_requested_exception&) {
    aborted = true;
  }
  EXPECT_TRUE(aborted);
  EXPECT_EQ(sup.errors(), 0);
  EXPECT_EQ(sup.passes(), 3);
  EXPECT_EQ(_control.calls, 0);
  EXPECT_TRUE((co_await _nodes->read()).empty());
}

NODESYNC_TEST_F(supervisor_test, wait_until_admitted) {
  meta::memory_cluster_meta meta{"admitted"};
  meta.reset(
      helper::make_document({entry(0, true), entry(1, false)}).write_to());
  reconcile::engine eng{meta, *_nodes, _control};
  test::counting_waiter waiter{100};
  waiter.hook = [&]() -> future<> {
    if (waiter.waits == 2) {
      meta.reset(
          helper::make_document({entry(0, true), entry(1, true)}).write_to());
    }
    return make_ready_future<>();
  };
  supervisor sup{eng, meta, waiter, 1};
  co_await sup.wait_until_admitted();
  EXPECT_EQ(waiter.waits, 2);
  EXPECT_EQ(meta.writes(), 0);

  // already admitted
  supervisor first{eng, meta, waiter, 0};
  co_await first.wait_until_admitted();
  EXPECT_EQ(waiter.waits, 2);
}

NODESYNC_TEST_F(supervisor_test, wait_until_admitted_without_document) {
  meta::memory_cluster_meta meta{"nothing"};
  reconcile::engine eng{meta, *_nodes, _control};
  test::counting_waiter waiter{3};
  supervisor sup{eng, meta, waiter, 0};
  bool aborted = false;
  try {
    co_await sup.wait_until_admitted();
  } catch (const abort_requested_exception&) {
    aborted = true;
  }
  EXPECT_TRUE(aborted);
  EXPECT_EQ(waiter.waits, 3);
  EXPECT_FALSE(meta.content().has_value());
}

}  // namespace
