// Tester for PathSearch

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "rxmap/core/Errors.hpp"
#include "rxmap/topology/PathSearch.hpp"
#include "test_structures.h"

namespace {

using rxmap::StructureGraph;
using rxmap_test::Atoms;
using rxmap_test::Chain;
using rxmap_test::MakeGraph;
using testing::ElementsAre;

TEST(TestPathSearch, ChainPath) {
  const StructureGraph g = MakeGraph(Atoms(1, 5), Chain(1, 5));
  const auto p = rxmap::find_path(g, 1, 5);
  ASSERT_TRUE(p.has_value());
  EXPECT_THAT(*p, ElementsAre(1, 2, 3, 4, 5));
  EXPECT_THAT(rxmap::shortest_path(g, 4, 2), ElementsAre(4, 3, 2));
}

TEST(TestPathSearch, SameAtom) {
  const StructureGraph g = MakeGraph(Atoms(1, 2), {{1, 2}});
  EXPECT_THAT(rxmap::shortest_path(g, 2, 2), ElementsAre(2));
}

TEST(TestPathSearch, TieBreakLowestIds) {
  // Square 1-2-4-3-1: both 1-2-4 and 1-3-4 are shortest.
  const StructureGraph g = MakeGraph(Atoms(1, 4), {{1, 2}, {1, 3}, {2, 4}, {3, 4}});
  EXPECT_THAT(rxmap::shortest_path(g, 1, 4), ElementsAre(1, 2, 4));
}

TEST(TestPathSearch, TieBreakIgnoresBondOrder) {
  const StructureGraph g = MakeGraph(Atoms(1, 4), {{3, 4}, {2, 4}, {1, 3}, {1, 2}});
  EXPECT_THAT(rxmap::shortest_path(g, 1, 4), ElementsAre(1, 2, 4));
}

TEST(TestPathSearch, DisconnectedReturnsNothing) {
  const StructureGraph g = MakeGraph(Atoms(1, 4), {{1, 2}, {3, 4}}, "pre");
  EXPECT_FALSE(rxmap::find_path(g, 1, 4).has_value());
  try {
    rxmap::shortest_path(g, 1, 4);
    FAIL() << "expected NoPathFound";
  } catch (const rxmap::NoPathFound& e) {
    EXPECT_EQ(e.start(), 1);
    EXPECT_EQ(e.goal(), 4);
  }
}

TEST(TestPathSearch, AvoidingBondGoesAroundRing) {
  auto bonds = Chain(1, 6);
  bonds.emplace_back(6, 1);
  const StructureGraph g = MakeGraph(Atoms(1, 6), bonds);
  const auto p = rxmap::find_path_avoiding_bond(g, 1, 2, 1, 2);
  ASSERT_TRUE(p.has_value());
  EXPECT_THAT(*p, ElementsAre(1, 6, 5, 4, 3, 2));
}

TEST(TestPathSearch, AvoidingBridgeDisconnects) {
  const StructureGraph g = MakeGraph(Atoms(1, 4), Chain(1, 4));
  EXPECT_FALSE(rxmap::find_path_avoiding_bond(g, 2, 3, 2, 3).has_value());
  EXPECT_FALSE(rxmap::find_path_avoiding_bond(g, 1, 4, 3, 2).has_value());
}

}  // namespace
