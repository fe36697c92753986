#include "sme/structures/participant_graph.h"

#include "support/fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace sme;

namespace {

core::ParticipantId pid(const char* id) {
  return core::ParticipantId{id};
}

}  // namespace

TEST_CASE("ParticipantGraph stores undirected weighted edges", "[structures][graph]") {
  structures::ParticipantGraph graph;
  graph.add_edge(pid("a"), pid("b"), 0.5);
  graph.add_edge(pid("a"), pid("c"));

  CHECK(graph.node_count() == 3);
  CHECK(graph.edge_count() == 2);
  REQUIRE(graph.weight(pid("b"), pid("a")).has_value());
  CHECK(*graph.weight(pid("b"), pid("a")) == 0.5);
  CHECK_FALSE(graph.weight(pid("b"), pid("c")).has_value());

  const auto neighbors = graph.neighbors(pid("a"));
  REQUIRE(neighbors.size() == 2);
  CHECK(neighbors[0].id == pid("b"));
  CHECK(neighbors[1].id == pid("c"));

  SECTION("self loops are ignored") {
    graph.add_edge(pid("a"), pid("a"));
    CHECK(graph.edge_count() == 2);
  }

  SECTION("unknown nodes have no neighbours") {
    CHECK_FALSE(graph.has_node(pid("zzz")));
    CHECK(graph.neighbors(pid("zzz")).empty());
  }
}

TEST_CASE("ParticipantGraph finds study circles", "[structures][graph][circles]") {
  auto a = testing::make_participant("a", {"math"});
  auto b = testing::make_participant("b", {"math"});
  auto c = testing::make_participant("c", {"math"});
  auto d = testing::make_participant("d", {"cs"});
  auto e = testing::make_participant("e", {"cs"});
  auto f = testing::make_participant("f", {"art"});

  // a-b, b-c (recorded on one side only), d-e, and f partnered with someone outside the pool
  a.partner_ids = {pid("b")};
  c.partner_ids = {pid("b")};
  d.partner_ids = {pid("e")};
  e.partner_ids = {pid("d")};
  f.partner_ids = {pid("outsider")};

  const auto graph = structures::build_partnership_graph({f, e, d, c, b, a});
  CHECK(graph.node_count() == 6);
  CHECK(graph.edge_count() == 3);
  CHECK_FALSE(graph.has_node(pid("outsider")));

  const auto circles = graph.connected_components();
  REQUIRE(circles.size() == 3);
  CHECK(circles[0] == std::vector<core::ParticipantId>{pid("a"), pid("b"), pid("c")});
  CHECK(circles[1] == std::vector<core::ParticipantId>{pid("d"), pid("e")});
  CHECK(circles[2] == std::vector<core::ParticipantId>{pid("f")});
}
