#pragma once

#include <cstddef>
#include <vector>

#include "rxmap/core/ElementTable.hpp"
#include "rxmap/reaction/AtomMatcher.hpp"
#include "rxmap/reaction/BoundaryClassifier.hpp"
#include "rxmap/reaction/ByproductResolver.hpp"
#include "rxmap/reaction/Correspondence.hpp"
#include "rxmap/reaction/MappingEmitter.hpp"
#include "rxmap/reaction/ReactionSpec.hpp"
#include "rxmap/topology/StructureGraph.hpp"

namespace rxmap {

struct ReactionResult {
  Correspondence correspondence;
  MatchReport match;

  RingAnalysis rings;
  ReactingPaths paths;

  std::size_t initial_pre = 0;
  std::size_t initial_post = 0;
  StabilizeReport stabilize;
  ByproductReport byproducts;

  // Final retained atoms (ascending ids) and pre-side edge atoms.
  std::vector<AtomId> pre_atoms;
  std::vector<AtomId> post_atoms;
  std::vector<AtomId> edge_atoms;

  MappingRecord mapping;
};

// Full pipeline for one reaction:
// correspondence -> ring test -> initial retention -> stabilization ->
// byproducts -> mapping record. Nothing is written; see app::Runner.
ReactionResult map_reaction(const StructureGraph& pre, const StructureGraph& post, const ElementTable& elements,
                            const ReactionSpec& spec, const MappingOptions& opt);

} // namespace rxmap
