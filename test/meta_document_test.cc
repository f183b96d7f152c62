//
// Created by nodesync on 2026/10/18.
//

#include "meta/document.hh"

#include "test/base.hh"
#include "util/error.hh"

using namespace nodesync;
using namespace nodesync::meta;

using nodesync::test::l;

namespace {

class document_test : public ::testing::Test {};

NODESYNC_TEST_F(document_test, read_from_empty) {
  EXPECT_TRUE(document::read_from("").nodes.empty());
  EXPECT_TRUE(document::read_from(" \n").nodes.empty());
  EXPECT_TRUE(document::read_from("{}").nodes.empty());
  EXPECT_TRUE(document::read_from(R"({"nodes": []})").nodes.empty());
  co_return;
}

NODESYNC_TEST_F(document_test, read_from) {
  auto doc = document::read_from(
      R"({"nodes": [)"
      R"({"node": "10.0.0.11", "pnn": 1, "in_nodes": false},)"
      R"({"pnn": 0, "in_nodes": true, "node": "10.0.0.10",)"
      R"( "identity": "smb-0", "extra": [1, 2]}]})");
  ASSERT_EQ(doc.nodes.size(), 2);
  EXPECT_EQ(doc.nodes[0].node, "10.0.0.11");
  EXPECT_EQ(doc.nodes[0].pnn, 1);
  EXPECT_FALSE(doc.nodes[0].in_nodes);
  EXPECT_TRUE(doc.nodes[0].identity.empty());
  EXPECT_EQ(doc.nodes[1].node, "10.0.0.10");
  EXPECT_EQ(doc.nodes[1].pnn, 0);
  EXPECT_TRUE(doc.nodes[1].in_nodes);
  EXPECT_EQ(doc.nodes[1].identity, "smb-0");
  auto sorted = doc.sorted();
  EXPECT_EQ(sorted[0].pnn, 0);
  EXPECT_EQ(sorted[1].pnn, 1);
  co_return;
}

NODESYNC_TEST_F(document_test, write_then_read) {
  document doc;
  doc.nodes = {
      {.node = "10.0.0.10", .pnn = 0, .in_nodes = true, .identity = "a\"b"},
      {.node = "10.0.0.11", .pnn = 1, .in_nodes = false},
  };
  auto json = doc.write_to();
  EXPECT_EQ(json.find("\"identity\": \"\""), std::string::npos) << json;
  EXPECT_EQ(document::read_from(json), doc) << json;
  co_return;
}

NODESYNC_TEST_F(document_test, malformed) {
  const char* tests[] = {
      "{",
      "[]",
      R"({"nodes": {}})",
      R"({"nodes": [{"pnn": 0}]})",
      R"({"nodes": [{"node": "10.0.0.10"}]})",
      R"({"nodes": [{"node": 10, "pnn": 0}]})",
      R"({"nodes": [{"node": "10.0.0.10", "pnn": -1}]})",
      R"({"nodes": [{"node": "a", "pnn": 0}, {"node": "b", "pnn": 0}]})",
  };
  for (const auto& t : tests) {
    EXPECT_THROW(document::read_from(t), util::serialization_error)
        << CASE_INDEX(t, tests);
  }
  co_return;
}

NODESYNC_TEST_F(document_test, find) {
  document doc;
  doc.nodes = {{.node = "10.0.0.12", .pnn = 2}};
  EXPECT_EQ(doc.find(1), nullptr);
  ASSERT_NE(doc.find(2), nullptr);
  doc.find(2)->in_nodes = true;
  EXPECT_TRUE(doc.nodes[0].in_nodes);
  co_return;
}

}  // namespace
