#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "rxmap/core/Errors.hpp"
#include "rxmap/reaction/ReactionSpec.hpp"
#include "rxmap/topology/StructureGraph.hpp"

namespace rxmap {

// Bijective partial map between pre and post atom ids ("same physical atom").
class Correspondence {
public:
  void add(AtomId pre, AtomId post) {
    if (pre_to_post_.count(pre)) {
      throw std::runtime_error("Correspondence: pre atom " + std::to_string(pre) + " already paired with post atom " +
                               std::to_string(pre_to_post_.at(pre)));
    }
    if (post_to_pre_.count(post)) {
      throw std::runtime_error("Correspondence: post atom " + std::to_string(post) + " already paired with pre atom " +
                               std::to_string(post_to_pre_.at(post)));
    }
    pre_to_post_.emplace(pre, post);
    post_to_pre_.emplace(post, pre);
  }

  std::optional<AtomId> post_of(AtomId pre) const {
    auto it = pre_to_post_.find(pre);
    if (it == pre_to_post_.end()) return std::nullopt;
    return it->second;
  }

  std::optional<AtomId> pre_of(AtomId post) const {
    auto it = post_to_pre_.find(post);
    if (it == post_to_pre_.end()) return std::nullopt;
    return it->second;
  }

  // Partner on the other side of an atom that lives on side `from`.
  std::optional<AtomId> partner(Side from, AtomId id) const { return from == Side::Pre ? post_of(id) : pre_of(id); }

  bool has_pre(AtomId pre) const { return pre_to_post_.count(pre) != 0; }
  bool has_post(AtomId post) const { return post_to_pre_.count(post) != 0; }

  std::size_t size() const { return pre_to_post_.size(); }

  // Ordered by pre id.
  const std::map<AtomId, AtomId>& pairs() const { return pre_to_post_; }

  // Pair every id present in both graphs, except declared creations.
  static Correspondence identity(const StructureGraph& pre, const StructureGraph& post,
                                 const std::vector<AtomId>& created = {}) {
    const std::unordered_set<AtomId> created_set(created.begin(), created.end());
    Correspondence c;
    for (const auto& a : pre.atoms()) {
      if (created_set.count(a.id)) continue;
      if (post.contains(a.id)) c.add(a.id, a.id);
    }
    return c;
  }

private:
  std::map<AtomId, AtomId> pre_to_post_;
  std::map<AtomId, AtomId> post_to_pre_;
};

} // namespace rxmap
