#pragma once

#include <vector>

#include "rxmap/reaction/BoundaryClassifier.hpp"
#include "rxmap/reaction/ReactionContext.hpp"

namespace rxmap {

struct ByproductReport {
  std::vector<AtomId> disconnected_post; // post atoms pulled in because they leave the reacting molecule
  bool restabilized = false;
  StabilizeReport restabilize;

  // Retained atoms not reachable from the reacting path through retained bonds.
  std::vector<AtomId> pre;
  std::vector<AtomId> post;

  const std::vector<AtomId>& tagged(Side s) const { return s == Side::Pre ? pre : post; }
};

// Folds eliminated molecules (water, HCl, ...) into the templates and tags
// every retained atom that is cut off from the reacting path.
class ByproductResolver {
public:
  ByproductResolver(const ReactionContext& ctx, const BoundaryClassifier& classifier, bool include_disconnected = true)
      : ctx_(ctx), classifier_(classifier), include_disconnected_(include_disconnected) {}

  // Post atoms in a component (full post graph) holding neither reacting atom.
  std::vector<AtomId> disconnected_post_atoms() const;

  // Retained atoms of side `s` unreachable from `anchor` inside the set.
  std::vector<AtomId> tag(const TemplateSets& sets, Side s, const std::vector<AtomId>& anchor) const;

  ByproductReport resolve(TemplateSets& sets, const ReactingPaths& paths) const;

private:
  const ReactionContext& ctx_;
  const BoundaryClassifier& classifier_;
  bool include_disconnected_ = true;
};

} // namespace rxmap
