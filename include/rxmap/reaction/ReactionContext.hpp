#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "rxmap/core/ElementTable.hpp"
#include "rxmap/core/Errors.hpp"
#include "rxmap/reaction/Correspondence.hpp"
#include "rxmap/reaction/ReactionSpec.hpp"
#include "rxmap/topology/StructureGraph.hpp"

namespace rxmap {

// Read-only bundle of everything the mapping stages share for one reaction.
//
// Exempt atoms are retained unconditionally and never treated as edge atoms:
// declared deletions (pre side) and their post partners, and declared
// creations (post side).
class ReactionContext {
public:
  ReactionContext(const StructureGraph& pre, const StructureGraph& post, const ElementTable& elements,
                  const Correspondence& corr, const ReactionSpec& spec)
      : pre_(pre), post_(post), elements_(elements), corr_(corr), spec_(spec) {
    for (int i = 0; i < 2; ++i) {
      const AtomId a = spec.pre_bonding[i];
      const AtomId b = spec.post_bonding[i];
      if (!pre.contains(a)) throw die_("bonding atom " + std::to_string(a) + " not found in " + pre.label());
      if (!post.contains(b)) throw die_("bonding atom " + std::to_string(b) + " not found in " + post.label());
      const auto partner = corr.post_of(a);
      if (!partner || *partner != b) {
        throw die_("pre bonding atom " + std::to_string(a) + " does not correspond to post bonding atom " +
                   std::to_string(b));
      }
    }
    if (spec.pre_bonding[0] == spec.pre_bonding[1]) throw die_("the two bonding atoms must differ");

    for (const auto id : spec.delete_atoms) {
      if (!pre.contains(id)) throw die_("delete atom " + std::to_string(id) + " not found in " + pre.label());
      deleted_pre_.insert(id);
      if (const auto p = corr.post_of(id)) deleted_post_.insert(*p);
    }
    for (const auto id : spec.create_atoms) {
      if (!post.contains(id)) throw die_("create atom " + std::to_string(id) + " not found in " + post.label());
      if (corr.has_post(id)) {
        throw die_("create atom " + std::to_string(id) + " has a pre-reaction partner " +
                   std::to_string(*corr.pre_of(id)));
      }
      created_post_.insert(id);
    }
  }

  const StructureGraph& graph(Side s) const { return s == Side::Pre ? pre_ : post_; }
  const StructureGraph& pre() const { return pre_; }
  const StructureGraph& post() const { return post_; }
  const ElementTable& elements() const { return elements_; }
  const Correspondence& correspondence() const { return corr_; }
  const ReactionSpec& spec() const { return spec_; }

  const std::array<AtomId, 2>& bonding(Side s) const { return spec_.bonding(s); }

  std::optional<AtomId> partner(Side s, AtomId id) const { return corr_.partner(s, id); }

  bool is_deleted(Side s, AtomId id) const {
    return s == Side::Pre ? deleted_pre_.count(id) != 0 : deleted_post_.count(id) != 0;
  }
  bool is_created(Side s, AtomId id) const { return s == Side::Post && created_post_.count(id) != 0; }
  bool is_exempt(Side s, AtomId id) const { return is_deleted(s, id) || is_created(s, id); }

  // Pre-reaction deletions with no post-reaction counterpart.
  bool is_pre_only_deletion(AtomId pre_id) const { return deleted_pre_.count(pre_id) && !corr_.has_pre(pre_id); }

  bool is_hydrogen(Side s, AtomId id) const { return elements_.is_hydrogen(graph(s).type_of(id)); }

private:
  const StructureGraph& pre_;
  const StructureGraph& post_;
  const ElementTable& elements_;
  const Correspondence& corr_;
  const ReactionSpec& spec_;

  std::unordered_set<AtomId> deleted_pre_;
  std::unordered_set<AtomId> deleted_post_;
  std::unordered_set<AtomId> created_post_;

  static std::runtime_error die_(const std::string& msg) { return std::runtime_error("ReactionContext: " + msg); }
};

} // namespace rxmap
