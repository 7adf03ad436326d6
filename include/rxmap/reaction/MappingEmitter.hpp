#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "rxmap/reaction/BoundaryClassifier.hpp"
#include "rxmap/reaction/ByproductResolver.hpp"
#include "rxmap/reaction/ReactionContext.hpp"

namespace rxmap {

// One row of the template mapping. Local ids are 1-based template indices.
struct MappingEntry {
  std::optional<AtomId> pre_id;
  std::optional<AtomId> post_id;
  std::optional<int> pre_local;
  std::optional<int> post_local;
  bool deleted = false;
  bool created = false;
  bool byproduct = false;

  bool paired() const { return pre_id.has_value() && post_id.has_value(); }
};

struct MappingRecord {
  // Paired entries (ascending pre id), then pre-only deletions, then creations.
  std::vector<MappingEntry> entries;

  std::array<int, 2> initiators{0, 0}; // pre local ids of the reacting atoms
  std::vector<int> edges;              // pre local ids
  std::vector<int> deletes;            // pre local ids
  std::vector<int> creates;            // post local ids

  std::size_t pre_count = 0;
  std::size_t post_count = 0;

  std::size_t paired_count() const {
    std::size_t n = 0;
    for (const auto& e : entries) n += e.paired() ? 1 : 0;
    return n;
  }

  // Template atom ids in local-id order (index 0 is local id 1).
  std::vector<AtomId> pre_atoms_by_local() const;
  std::vector<AtomId> post_atoms_by_local() const;

  std::unordered_map<AtomId, int> pre_local_ids() const;
  std::unordered_map<AtomId, int> post_local_ids() const;
};

// Reconciles the stabilized sets into a MappingRecord.
//
// Throws CountMismatchError when, after removing pre-only deletions and
// creations, the two sets differ in size or an undeclared atom is unpaired.
MappingRecord emit_mapping(const ReactionContext& ctx, const TemplateSets& sets, const ByproductReport& byproducts,
                           const std::vector<AtomId>& pre_edge_atoms);

} // namespace rxmap
