#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rxmap::alg::graph {

using NodeId = std::size_t;
inline constexpr NodeId kNoNode = static_cast<NodeId>(-1);

// Adjacency list representation expected to be an undirected simple graph
// with sorted neighbour lists (StructureGraph guarantees both).
using Adjacency = std::vector<std::vector<NodeId>>;

// A lightweight, non-owning graph view.
//
// Two optional restrictions can be layered on the underlying adjacency:
//  - a node mask: only nodes with mask[i] != 0 are visible (working-set subgraphs)
//  - one cut edge: the undirected edge (u,v) is treated as absent (ring tests)
//
// Restrictions return a new view; the adjacency and mask must outlive it.
class GraphView {
public:
  GraphView() = default;

  explicit GraphView(const Adjacency& adj) : adj_(&adj) {}

  GraphView restricted_to(const std::vector<char>& mask) const {
    if (!adj_) throw std::runtime_error("GraphView: restricted_to() on an empty view");
    if (mask.size() != adj_->size()) {
      throw std::runtime_error("GraphView: node mask size does not match node count");
    }
    GraphView v = *this;
    v.mask_ = &mask;
    return v;
  }

  GraphView without_edge(NodeId u, NodeId w) const {
    GraphView v = *this;
    v.cut_u_ = u;
    v.cut_w_ = w;
    return v;
  }

  std::size_t node_count() const { return adj_ ? adj_->size() : 0; }

  const Adjacency& adjacency() const {
    if (!adj_) throw std::runtime_error("GraphView: adjacency() requested on an empty view");
    return *adj_;
  }

  bool visible(NodeId u) const {
    if (u >= node_count()) return false;
    return !mask_ || (*mask_)[u] != 0;
  }

  bool is_cut(NodeId u, NodeId w) const {
    return (u == cut_u_ && w == cut_w_) || (u == cut_w_ && w == cut_u_);
  }

  // Visit visible neighbours of u in adjacency (ascending) order.
  template <class F>
  void for_each_neighbor(NodeId u, F&& f) const {
    if (!visible(u)) return;
    for (const NodeId w : (*adj_)[u]) {
      if (!visible(w) || is_cut(u, w)) continue;
      f(w);
    }
  }

  // Iterate each visible undirected edge once.
  template <class F>
  void for_each_edge(F&& f) const {
    const std::size_t n = node_count();
    for (NodeId u = 0; u < n; ++u) {
      if (!visible(u)) continue;
      for (const NodeId w : (*adj_)[u]) {
        if (u < w && visible(w) && !is_cut(u, w)) f(u, w);
      }
    }
  }

private:
  const Adjacency* adj_ = nullptr;
  const std::vector<char>* mask_ = nullptr;
  NodeId cut_u_ = kNoNode;
  NodeId cut_w_ = kNoNode;
};

} // namespace rxmap::alg::graph
