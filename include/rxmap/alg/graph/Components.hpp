#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rxmap/alg/graph/GraphView.hpp"

namespace rxmap::alg::graph {

// Disjoint-set / union-find for undirected connectivity.
class UnionFind {
public:
  explicit UnionFind(std::size_t n = 0) { reset(n); }

  void reset(std::size_t n) {
    parent_.resize(n);
    rank_.assign(n, 0);
    std::iota(parent_.begin(), parent_.end(), 0);
  }

  std::size_t find(std::size_t x) {
    if (x >= parent_.size()) throw std::runtime_error("UnionFind: find() out of range");
    while (parent_[x] != x) {
      parent_[x] = parent_[parent_[x]];
      x = parent_[x];
    }
    return x;
  }

  void unite(std::size_t a, std::size_t b) {
    a = find(a);
    b = find(b);
    if (a == b) return;
    if (rank_[a] < rank_[b]) std::swap(a, b);
    parent_[b] = a;
    if (rank_[a] == rank_[b]) ++rank_[a];
  }

private:
  std::vector<std::size_t> parent_;
  std::vector<unsigned char> rank_;
};

struct ComponentsResult {
  std::vector<std::size_t> component_id;    // size = n_nodes; kNoNode for masked-out nodes
  std::vector<std::size_t> component_sizes; // indexed by component_id

  std::size_t n_components() const { return component_sizes.size(); }
};

// Connected components of the visible part of g.
// Component ids are assigned in order of the lowest node index they contain.
inline ComponentsResult compute_components(const GraphView& g) {
  const std::size_t n = g.node_count();
  UnionFind uf(n);

  g.for_each_edge([&](NodeId u, NodeId v) { uf.unite(u, v); });

  std::unordered_map<std::size_t, std::size_t> root_to_cid;
  root_to_cid.reserve(n);

  ComponentsResult r;
  r.component_id.assign(n, kNoNode);

  for (std::size_t i = 0; i < n; ++i) {
    if (!g.visible(i)) continue;
    const std::size_t root = uf.find(i);
    auto [it, inserted] = root_to_cid.emplace(root, r.component_sizes.size());
    if (inserted) r.component_sizes.push_back(0);
    r.component_id[i] = it->second;
    ++r.component_sizes[it->second];
  }

  return r;
}

} // namespace rxmap::alg::graph
