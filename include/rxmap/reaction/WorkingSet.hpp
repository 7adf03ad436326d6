#pragma once

#include <cstddef>
#include <vector>

#include "rxmap/core/Atom.hpp"
#include "rxmap/topology/StructureGraph.hpp"

namespace rxmap {

// Atoms retained in one template.
//
// Stored as a per-index mask over the owning graph, so it can be handed to
// alg::graph::GraphView::restricted_to() directly. The set only grows.
class WorkingSet {
public:
  explicit WorkingSet(const StructureGraph& g) : g_(&g), mask_(g.size(), 0) {}

  const StructureGraph& graph() const { return *g_; }

  bool contains(AtomId id) const {
    if (!g_->contains(id)) return false;
    return mask_[g_->index_of(id)] != 0;
  }

  // Returns true if the atom was not yet retained.
  bool insert(AtomId id) {
    const std::size_t i = g_->index_of(id);
    if (mask_[i]) return false;
    mask_[i] = 1;
    ++count_;
    return true;
  }

  template <class It>
  std::size_t insert(It first, It last) {
    std::size_t added = 0;
    for (; first != last; ++first) {
      if (insert(*first)) ++added;
    }
    return added;
  }

  std::size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }

  // Ascending atom ids.
  std::vector<AtomId> ids() const {
    std::vector<AtomId> out;
    out.reserve(count_);
    for (std::size_t i = 0; i < mask_.size(); ++i) {
      if (mask_[i]) out.push_back(g_->id_at(i));
    }
    return out;
  }

  const std::vector<char>& mask() const { return mask_; }

private:
  const StructureGraph* g_ = nullptr;
  std::vector<char> mask_;
  std::size_t count_ = 0;
};

} // namespace rxmap
