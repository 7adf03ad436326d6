#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "rxmap/core/ElementTable.hpp"
#include "rxmap/reaction/ReactionContext.hpp"
#include "rxmap/reaction/ReactionSpec.hpp"
#include "rxmap/reaction/WorkingSet.hpp"
#include "rxmap/topology/StructureGraph.hpp"

namespace rxmap {

// Ring membership of the reacting bond / atoms on one side.
struct RingStatus {
  bool bond_present = false;
  bool bond_in_ring = false;
  std::optional<std::vector<AtomId>> bond_cycle;               // atoms of the cycle through the bond
  std::array<std::optional<std::vector<AtomId>>, 2> atom_cycle; // smallest cycle through each reacting atom

  bool atom_in_ring(int k) const { return atom_cycle[static_cast<std::size_t>(k)].has_value(); }
  bool ring_associated() const { return bond_in_ring || atom_in_ring(0) || atom_in_ring(1); }
};

RingStatus detect_rings(const StructureGraph& g, AtomId a, AtomId b);

struct RingAnalysis {
  RingStatus pre;
  RingStatus post;
  bool ring_opening = false;
  // Cycle atoms whose status changed plus their first neighbours, per side.
  std::vector<AtomId> pre_ring_atoms;
  std::vector<AtomId> post_ring_atoms;

  const RingStatus& status(Side s) const { return s == Side::Pre ? pre : post; }
  const std::vector<AtomId>& ring_atoms(Side s) const { return s == Side::Pre ? pre_ring_atoms : post_ring_atoms; }
};

RingAnalysis analyze_rings(const ReactionContext& ctx);

// Shortest bond path between the reacting atoms on each side.
//
// A side on which the reacting atoms are disconnected (e.g. two molecules
// before a coupling) has no path; its anchor is the two reacting atoms.
struct ReactingPaths {
  std::optional<std::vector<AtomId>> pre;
  std::optional<std::vector<AtomId>> post;
  std::vector<AtomId> pre_anchor;
  std::vector<AtomId> post_anchor;

  const std::vector<AtomId>& anchor(Side s) const { return s == Side::Pre ? pre_anchor : post_anchor; }
};

// Throws NoPathFound if the reacting atoms are disconnected on both sides.
ReactingPaths find_reacting_paths(const ReactionContext& ctx);

struct TemplateSets {
  WorkingSet pre;
  WorkingSet post;

  TemplateSets(const StructureGraph& pre_graph, const StructureGraph& post_graph) : pre(pre_graph), post(post_graph) {}

  WorkingSet& side(Side s) { return s == Side::Pre ? pre : post; }
  const WorkingSet& side(Side s) const { return s == Side::Pre ? pre : post; }
};

enum class EdgeCause { OwnType, FirstShell, SecondShell };

inline const char* edge_cause_name(EdgeCause c) {
  switch (c) {
    case EdgeCause::OwnType: return "own_type";
    case EdgeCause::FirstShell: return "first_shell";
    case EdgeCause::SecondShell: return "second_shell";
  }
  return "?";
}

struct ExpansionRequest {
  Side side = Side::Pre;
  AtomId atom = 0;
  int hops = 0;
  EdgeCause cause = EdgeCause::OwnType;
};

struct StabilizeReport {
  int passes = 0;
  std::size_t requests = 0;
  std::size_t atoms_added = 0; // summed over both sides
};

// Atoms of `set` that are not hydrogen, not exempt, and have at least one
// bonded neighbour outside `set`. Ascending ids.
std::vector<AtomId> find_edge_atoms(const WorkingSet& set, const ElementTable& elements,
                                    const std::unordered_set<AtomId>& exempt = {});

// Grows the pre/post working sets until no edge atom sees a type change.
class BoundaryClassifier {
public:
  BoundaryClassifier(const ReactionContext& ctx, BoundaryOptions opt, bool debug = false);

  const BoundaryOptions& options() const { return opt_; }

  TemplateSets initial_retention(const ReactingPaths& paths, const RingAnalysis& rings) const;

  std::vector<AtomId> find_edge_atoms(const TemplateSets& sets, Side s) const;

  // One request per edge atom (either side) whose environment changed type.
  std::vector<ExpansionRequest> verify_edges(const TemplateSets& sets) const;

  // Applies the requests, then closes the sets under the correspondence.
  // Returns the number of atoms added over both sides.
  std::size_t expand(TemplateSets& sets, const std::vector<ExpansionRequest>& requests) const;

  // Adds the partner of every retained atom. Returns the number added.
  std::size_t close_under_correspondence(TemplateSets& sets) const;

  // Repeats edge detection + verification until a pass yields no request.
  // Throws std::runtime_error if a pass requests expansions but adds no atom.
  StabilizeReport stabilize(TemplateSets& sets) const;

private:
  const ReactionContext& ctx_;
  BoundaryOptions opt_;
  bool debug_ = false;

  std::optional<EdgeCause> classify_edge_(Side s, AtomId edge, AtomId partner) const;
  std::size_t insert_ball_(WorkingSet& set, AtomId center, int hops) const;
};

} // namespace rxmap
