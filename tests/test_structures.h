#ifndef RXMAP_TESTS_TEST_STRUCTURES_H_
#define RXMAP_TESTS_TEST_STRUCTURES_H_

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rxmap/core/Atom.hpp"
#include "rxmap/core/ElementTable.hpp"
#include "rxmap/reaction/Correspondence.hpp"
#include "rxmap/reaction/ReactionContext.hpp"
#include "rxmap/reaction/ReactionSpec.hpp"
#include "rxmap/topology/StructureData.hpp"
#include "rxmap/topology/StructureGraph.hpp"

namespace rxmap_test {

using rxmap::AtomId;

// (id, type) pairs.
using AtomList = std::vector<std::pair<AtomId, int>>;
using BondList = std::vector<std::pair<AtomId, AtomId>>;

inline rxmap::StructureData MakeData(const AtomList& atoms, const BondList& bonds,
                                     const std::string& label = "test") {
  rxmap::StructureData d;
  d.source = label;
  d.atom_style = "full";
  d.has_charges = true;
  d.has_mol = true;
  for (const auto& [id, type] : atoms) {
    rxmap::Atom a;
    a.id = id;
    a.mol = 1;
    a.type = type;
    a.pos = {static_cast<double>(id), 0.0, 0.0};
    d.atoms.push_back(a);
  }
  for (const auto& [i, j] : bonds) {
    d.bonds.push_back(rxmap::StructureData::BondId{1, i, j});
  }
  return d;
}

inline rxmap::StructureGraph MakeGraph(const AtomList& atoms, const BondList& bonds,
                                       const std::string& label = "test") {
  return rxmap::StructureGraph(MakeData(atoms, bonds, label));
}

// Atoms first..last, all of `type`.
inline AtomList Atoms(AtomId first, AtomId last, int type = 1) {
  AtomList out;
  for (AtomId id = first; id <= last; ++id) out.emplace_back(id, type);
  return out;
}

// Bonds first-(first+1)-...-last.
inline BondList Chain(AtomId first, AtomId last) {
  BondList out;
  for (AtomId id = first; id < last; ++id) out.emplace_back(id, id + 1);
  return out;
}

inline AtomList& SetType(AtomList& atoms, AtomId id, int type) {
  for (auto& a : atoms) {
    if (a.first == id) a.second = type;
  }
  return atoms;
}

inline BondList Join(BondList a, const BondList& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

// Owns everything a ReactionContext refers to. Call Finish() after setting
// the graphs, elements and spec; the correspondence is the identity.
class ReactionFixture {
 public:
  rxmap::StructureGraph pre;
  rxmap::StructureGraph post;
  rxmap::ElementTable elements = rxmap::ElementTable::from_list({"C", "C"});
  rxmap::ReactionSpec spec;
  rxmap::Correspondence corr;
  std::unique_ptr<rxmap::ReactionContext> ctx;

  void SetBonding(AtomId a, AtomId b) {
    spec.pre_bonding = {a, b};
    spec.post_bonding = {a, b};
  }

  const rxmap::ReactionContext& Finish() {
    corr = rxmap::Correspondence::identity(pre, post, spec.create_atoms);
    ctx = std::make_unique<rxmap::ReactionContext>(pre, post, elements, corr, spec);
    return *ctx;
  }
};

inline bool WriteText(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return static_cast<bool>(out);
}

inline std::string ReadText(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Fresh, empty directory under the system temp dir.
inline std::filesystem::path ScratchDir(const std::string& name) {
  auto path = std::filesystem::temp_directory_path();
  path.append(name);
  std::filesystem::remove_all(path);
  std::filesystem::create_directories(path);
  return path;
}

}  // namespace rxmap_test

#endif  // RXMAP_TESTS_TEST_STRUCTURES_H_
