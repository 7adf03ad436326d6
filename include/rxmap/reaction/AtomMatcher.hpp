#pragma once

#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "rxmap/core/ElementTable.hpp"
#include "rxmap/reaction/Correspondence.hpp"
#include "rxmap/reaction/ReactionSpec.hpp"
#include "rxmap/topology/StructureGraph.hpp"

namespace rxmap {

struct MatchReport {
  int rounds = 0;                                   // missing-atom rounds run
  std::vector<std::pair<AtomId, AtomId>> inferred;  // pairs assigned by inference
  std::vector<AtomId> unmatched_deletions;          // declared deletions left without a post partner
};

// Builds a pre/post correspondence for structures whose atom ids differ.
//
// Starting from the reacting pairs (and declared deletion pairs), mapped
// heavy atoms are propagated breadth-first: unmapped neighbours are grouped by
// element and paired when the assignment is unambiguous, using neighbour-shell
// element fingerprints for symmetric candidates. What remains is resolved by a
// global missing-atom pass, which may fall back to inference.
class AtomMatcher {
public:
  AtomMatcher(const StructureGraph& pre, const StructureGraph& post, const ElementTable& elements,
              const ReactionSpec& spec, MatchOptions opt);

  // Throws AtomMatchError if pre atoms (other than declared deletions) stay unmatched.
  Correspondence match(MatchReport* report = nullptr) const;

  // Sorted element symbols of the atoms exactly `level` bonds away, reacting
  // (and, on the post side, created) atoms excluded. Joined without separator.
  std::string fingerprint(bool pre_side, AtomId id, int level) const;

private:
  const StructureGraph& pre_;
  const StructureGraph& post_;
  const ElementTable& elements_;
  const ReactionSpec& spec_;
  MatchOptions opt_;

  std::unordered_set<AtomId> pre_excluded_;
  std::unordered_set<AtomId> post_excluded_;
  std::unordered_set<AtomId> created_;

  struct State;

  std::string element_(bool pre_side, AtomId id) const;
  bool is_h_(bool pre_side, AtomId id) const;

  void pair_(State& st, AtomId pre, AtomId post) const;
  void run_queue_(State& st) const;
  std::optional<AtomId> resolve_symmetric_(AtomId pre, const std::vector<AtomId>& candidates) const;
  bool missing_round_(State& st, bool inference, MatchReport* report) const;
};

} // namespace rxmap
