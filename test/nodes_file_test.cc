//
// Created by nodesync on 2026/10/18.
//

#include "nodes/nodes_file.hh"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "test/base.hh"
#include "test/util.hh"
#include "util/error.hh"

using namespace nodesync;
using namespace nodesync::nodes;
using namespace seastar;

using nodesync::test::l;

namespace {

class nodes_file_test : public ::testing::Test {
 protected:
  void SetUp() override {
    _dir = test::util::make_temp_dir("nodes");
    _real = _dir + "/shared/nodes";
    _link = _dir + "/etc/nodes";
    std::filesystem::create_directories(_dir + "/shared");
    std::filesystem::create_directories(_dir + "/etc");
  }

  void TearDown() override { test::util::remove_dir(_dir); }

  std::string content(const std::string& path) {
    std::ifstream ifs{path};
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
  }

  std::string _dir;
  std::string _real;
  std::string _link;
};

NODESYNC_TEST_F(nodes_file_test, parse) {
  using nodes = std::vector<std::string>;
  EXPECT_EQ(nodes_file::parse(""), nodes{});
  EXPECT_EQ(nodes_file::parse("10.0.0.10\n"), nodes{"10.0.0.10"});
  EXPECT_EQ(
      nodes_file::parse(" 10.0.0.10 \n10.0.0.11"),
      (nodes{"10.0.0.10", "10.0.0.11"}));
  // a blank line keeps the positions of the following nodes
  EXPECT_EQ(
      nodes_file::parse("10.0.0.10\n\n10.0.0.12\n"),
      (nodes{"10.0.0.10", "", "10.0.0.12"}));
  co_return;
}

NODESYNC_TEST_F(nodes_file_test, read_missing) {
  nodes_file f{_real, _link};
  auto nodes = co_await f.read();
  EXPECT_TRUE(nodes.empty());
}

NODESYNC_TEST_F(nodes_file_test, write_and_read) {
  nodes_file f{_real, _link};
  auto expected = test::util::make_nodes(3);
  co_await f.write(expected);
  EXPECT_EQ(content(_real), "10.0.0.10\n10.0.0.11\n10.0.0.12\n");
  EXPECT_FALSE(std::filesystem::exists(_real + ".tmp"));
  EXPECT_EQ(co_await f.read(), expected);
}

NODESYNC_TEST_F(nodes_file_test, ensure_link) {
  nodes_file f{_real, _link};
  f.ensure_link();
  EXPECT_TRUE(std::filesystem::is_symlink(_link));
  EXPECT_EQ(std::filesystem::read_symlink(_link).string(), _real);
  // idempotent, and a regular file in the way is replaced
  f.ensure_link();
  EXPECT_EQ(std::filesystem::read_symlink(_link).string(), _real);
  std::filesystem::remove(_link);
  {
    std::ofstream ofs{_link};
    ofs << "stale\n";
  }
  f.ensure_link();
  EXPECT_TRUE(std::filesystem::is_symlink(_link));
  co_return;
}

NODESYNC_TEST_F(nodes_file_test, ensure_link_noop) {
  nodes_file same{_real, _real};
  same.ensure_link();
  EXPECT_FALSE(std::filesystem::exists(_real));
  nodes_file none{_real, ""};
  none.ensure_link();
  EXPECT_FALSE(std::filesystem::exists(_link));
  co_return;
}

NODESYNC_TEST_F(nodes_file_test, ensure_present) {
  nodes_file f{_real, _link};
  co_await f.ensure_present("10.0.0.10", 0);
  EXPECT_EQ(content(_link), "10.0.0.10\n");
  // already present at the expected position
  co_await f.ensure_present("10.0.0.10", 0);
  EXPECT_EQ(co_await f.read(), test::util::make_nodes(1));
  co_await f.ensure_present("10.0.0.11", std::nullopt);
  EXPECT_EQ(co_await f.read(), test::util::make_nodes(2));
  bool thrown = false;
  try {
    co_await f.ensure_present("10.0.0.12", 5);
  } catch (const util::inconsistency_error&) {
    thrown = true;
  }
  EXPECT_TRUE(thrown);
  EXPECT_EQ(co_await f.read(), test::util::make_nodes(2));
}

}  // namespace
