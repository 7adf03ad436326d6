#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>
#include <stdexcept>
#include <vector>

#include "rxmap/alg/graph/GraphView.hpp"

namespace rxmap::alg::graph {

// Unweighted BFS distances from multiple sources.
// Returns dist[i] = number of edges to the nearest source, or -1 if unreachable
// (or farther than max_depth when max_depth >= 0).
inline std::vector<int> multi_source_dist(const GraphView& g, const std::vector<NodeId>& sources,
                                          int max_depth = -1) {
  const std::size_t n = g.node_count();

  std::vector<int> dist(n, -1);
  std::deque<NodeId> q;
  for (NodeId s : sources) {
    if (s >= n) throw std::runtime_error("multi_source_dist: source out of range");
    if (!g.visible(s)) throw std::runtime_error("multi_source_dist: source is masked out");
    if (dist[s] == 0) continue;
    dist[s] = 0;
    q.push_back(s);
  }

  while (!q.empty()) {
    const NodeId u = q.front();
    q.pop_front();
    const int du = dist[u];
    if (max_depth >= 0 && du >= max_depth) continue;
    g.for_each_neighbor(u, [&](NodeId v) {
      if (dist[v] == -1) {
        dist[v] = du + 1;
        q.push_back(v);
      }
    });
  }

  return dist;
}

inline std::vector<int> single_source_dist(const GraphView& g, NodeId source, int max_depth = -1) {
  return multi_source_dist(g, std::vector<NodeId>{source}, max_depth);
}

// Shortest path source -> target (inclusive), or nullopt if unreachable.
//
// Neighbours are expanded in adjacency order and each node is discovered once,
// so among several shortest paths the one through the lowest-index neighbours
// at each level is returned.
inline std::optional<std::vector<NodeId>> shortest_path(const GraphView& g, NodeId source, NodeId target) {
  const std::size_t n = g.node_count();
  if (source >= n || target >= n) throw std::runtime_error("shortest_path: node out of range");
  if (!g.visible(source) || !g.visible(target)) return std::nullopt;

  if (source == target) return std::vector<NodeId>{source};

  std::vector<NodeId> parent(n, kNoNode);
  std::vector<char> seen(n, 0);
  std::deque<NodeId> q;
  seen[source] = 1;
  q.push_back(source);

  bool found = false;
  while (!q.empty() && !found) {
    const NodeId u = q.front();
    q.pop_front();
    g.for_each_neighbor(u, [&](NodeId v) {
      if (found || seen[v]) return;
      seen[v] = 1;
      parent[v] = u;
      if (v == target) {
        found = true;
        return;
      }
      q.push_back(v);
    });
  }
  if (!found) return std::nullopt;

  std::vector<NodeId> path;
  for (NodeId v = target; v != kNoNode; v = parent[v]) {
    path.push_back(v);
    if (v == source) break;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

} // namespace rxmap::alg::graph
