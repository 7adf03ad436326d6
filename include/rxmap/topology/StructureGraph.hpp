#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "rxmap/alg/graph/GraphView.hpp"
#include "rxmap/core/Atom.hpp"
#include "rxmap/topology/StructureData.hpp"

namespace rxmap {

// Bond graph of one structure (pre- or post-reaction).
//
// Atoms are stored in ascending id order and addressed by a dense index; the
// adjacency is index-based so the generic alg::graph layer can traverse it.
// Bonds never hold references to atoms, only ids/indices.
//
// Neighbour shells (atoms at exactly 1, 2 or 3 bonds) are computed on first
// request and cached. The graph is immutable after construction.
class StructureGraph {
public:
  static constexpr int kMaxShell = 3;

  StructureGraph() = default;

  // Build from loaded atoms + bonds. Throws DanglingBondError if a bond
  // references an atom id not present in `atoms`.
  StructureGraph(std::vector<Atom> atoms, const std::vector<StructureData::BondId>& bonds,
                 std::string label = "structure");

  explicit StructureGraph(const StructureData& data);

  const std::string& label() const { return label_; }

  std::size_t size() const { return atoms_.size(); }
  bool contains(AtomId id) const { return id2idx_.find(id) != id2idx_.end(); }

  const Atom& atom(AtomId id) const { return atoms_[index_of(id)]; }
  const Atom& atom_at(std::size_t idx) const { return atoms_[idx]; }
  const std::vector<Atom>& atoms() const { return atoms_; }
  int type_of(AtomId id) const { return atom(id).type; }

  std::size_t index_of(AtomId id) const;
  AtomId id_at(std::size_t idx) const { return atoms_[idx].id; }

  // Ascending list of all atom ids.
  std::vector<AtomId> ids() const;

  const std::vector<AtomId>& neighbors(AtomId id) const { return atom(id).bonded; }
  bool bonded(AtomId a, AtomId b) const;

  // Atoms at exactly `hops` bonds from `id` (1 <= hops <= kMaxShell), ascending.
  const std::vector<AtomId>& neighbor_shell(AtomId id, int hops) const;

  // Atoms within `radius` bonds of `id`, origin excluded, ascending.
  std::vector<AtomId> neighbors_within(AtomId id, int radius) const;

  const alg::graph::Adjacency& adjacency() const { return adjacency_; }
  alg::graph::GraphView view() const { return alg::graph::GraphView(adjacency_); }

  std::vector<alg::graph::NodeId> to_indices(const std::vector<AtomId>& ids) const;
  std::vector<AtomId> to_ids(const std::vector<alg::graph::NodeId>& idx) const;

private:
  std::string label_;
  std::vector<Atom> atoms_;
  std::unordered_map<AtomId, std::size_t> id2idx_;
  alg::graph::Adjacency adjacency_;

  mutable std::array<std::unordered_map<AtomId, std::vector<AtomId>>, kMaxShell> shell_cache_;
};

} // namespace rxmap
