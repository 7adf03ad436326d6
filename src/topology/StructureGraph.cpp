#include "rxmap/topology/StructureGraph.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "rxmap/alg/graph/ShortestPaths.hpp"

namespace rxmap {

namespace {

inline std::runtime_error die(const std::string& label, const std::string& msg) {
  return std::runtime_error("StructureGraph[" + label + "]: " + msg);
}

} // namespace

StructureGraph::StructureGraph(std::vector<Atom> atoms, const std::vector<StructureData::BondId>& bonds,
                               std::string label)
    : label_(std::move(label)), atoms_(std::move(atoms)) {
  std::sort(atoms_.begin(), atoms_.end(), [](const Atom& a, const Atom& b) { return a.id < b.id; });

  const std::size_t n = atoms_.size();
  id2idx_.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    atoms_[i].bonded.clear();
    auto [it, ok] = id2idx_.emplace(atoms_[i].id, i);
    if (!ok) throw die(label_, "duplicate atom id " + std::to_string(atoms_[i].id));
  }

  adjacency_.assign(n, {});
  for (const auto& b : bonds) {
    auto it_i = id2idx_.find(b.ai);
    auto it_j = id2idx_.find(b.aj);
    if (it_i == id2idx_.end()) throw DanglingBondError(label_, b.ai, b.aj, b.ai);
    if (it_j == id2idx_.end()) throw DanglingBondError(label_, b.ai, b.aj, b.aj);
    const std::size_t i = it_i->second;
    const std::size_t j = it_j->second;
    if (i == j) continue;
    adjacency_[i].push_back(j);
    adjacency_[j].push_back(i);
  }

  // Duplicate bond records collapse to one edge; sorted lists make every
  // traversal deterministic (ascending id, since indices follow id order).
  for (std::size_t i = 0; i < n; ++i) {
    auto& nbrs = adjacency_[i];
    std::sort(nbrs.begin(), nbrs.end());
    nbrs.erase(std::unique(nbrs.begin(), nbrs.end()), nbrs.end());
    atoms_[i].bonded.reserve(nbrs.size());
    for (const auto j : nbrs) atoms_[i].bonded.push_back(atoms_[j].id);
  }
}

StructureGraph::StructureGraph(const StructureData& data)
    : StructureGraph(data.atoms, data.bonds, data.source.empty() ? std::string("structure") : data.source) {}

std::size_t StructureGraph::index_of(AtomId id) const {
  auto it = id2idx_.find(id);
  if (it == id2idx_.end()) throw die(label_, "unknown atom id " + std::to_string(id));
  return it->second;
}

std::vector<AtomId> StructureGraph::ids() const {
  std::vector<AtomId> out;
  out.reserve(atoms_.size());
  for (const auto& a : atoms_) out.push_back(a.id);
  return out;
}

bool StructureGraph::bonded(AtomId a, AtomId b) const {
  const auto& nbrs = neighbors(a);
  return std::binary_search(nbrs.begin(), nbrs.end(), b);
}

const std::vector<AtomId>& StructureGraph::neighbor_shell(AtomId id, int hops) const {
  if (hops < 1 || hops > kMaxShell) {
    throw die(label_, "neighbor_shell: hops must be in [1, " + std::to_string(kMaxShell) + "], got " +
                          std::to_string(hops));
  }
  auto& cache = shell_cache_[static_cast<std::size_t>(hops - 1)];
  auto it = cache.find(id);
  if (it != cache.end()) return it->second;

  const std::size_t src = index_of(id);
  const auto dist = alg::graph::single_source_dist(view(), src, hops);

  std::vector<AtomId> shell;
  for (std::size_t i = 0; i < dist.size(); ++i) {
    if (dist[i] == hops) shell.push_back(atoms_[i].id);
  }
  return cache.emplace(id, std::move(shell)).first->second;
}

std::vector<AtomId> StructureGraph::neighbors_within(AtomId id, int radius) const {
  if (radius < 0) throw die(label_, "neighbors_within: negative radius");
  const std::size_t src = index_of(id);
  const auto dist = alg::graph::single_source_dist(view(), src, radius);

  std::vector<AtomId> out;
  for (std::size_t i = 0; i < dist.size(); ++i) {
    if (dist[i] > 0) out.push_back(atoms_[i].id);
  }
  return out;
}

std::vector<alg::graph::NodeId> StructureGraph::to_indices(const std::vector<AtomId>& ids) const {
  std::vector<alg::graph::NodeId> out;
  out.reserve(ids.size());
  for (const auto id : ids) out.push_back(index_of(id));
  return out;
}

std::vector<AtomId> StructureGraph::to_ids(const std::vector<alg::graph::NodeId>& idx) const {
  std::vector<AtomId> out;
  out.reserve(idx.size());
  for (const auto i : idx) out.push_back(atoms_.at(i).id);
  return out;
}

} // namespace rxmap
