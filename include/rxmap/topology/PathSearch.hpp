#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rxmap/alg/graph/ShortestPaths.hpp"
#include "rxmap/core/Errors.hpp"
#include "rxmap/topology/StructureGraph.hpp"

namespace rxmap {

// Id-level breadth-first path search over a StructureGraph.
//
// Neighbours are expanded in ascending atom id order, so when several shortest
// paths exist the result is the lexicographically smallest one by discovery.
// Callers rely on the path length and membership only.

// Shortest bond path start -> goal (both inclusive), or nullopt if disconnected.
inline std::optional<std::vector<AtomId>> find_path(const StructureGraph& g, AtomId start, AtomId goal) {
  auto p = alg::graph::shortest_path(g.view(), g.index_of(start), g.index_of(goal));
  if (!p) return std::nullopt;
  return g.to_ids(*p);
}

// As find_path, but the direct bond (cut_a, cut_b) is treated as absent.
inline std::optional<std::vector<AtomId>> find_path_avoiding_bond(const StructureGraph& g, AtomId start, AtomId goal,
                                                                  AtomId cut_a, AtomId cut_b) {
  const auto gv = g.view().without_edge(g.index_of(cut_a), g.index_of(cut_b));
  auto p = alg::graph::shortest_path(gv, g.index_of(start), g.index_of(goal));
  if (!p) return std::nullopt;
  return g.to_ids(*p);
}

// Shortest bond path; throws NoPathFound if the atoms are disconnected.
inline std::vector<AtomId> shortest_path(const StructureGraph& g, AtomId start, AtomId goal) {
  auto p = find_path(g, start, goal);
  if (!p) throw NoPathFound(start, goal, g.label());
  return std::move(*p);
}

} // namespace rxmap
