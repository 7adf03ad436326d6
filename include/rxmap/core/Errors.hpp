#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rxmap {

using AtomId = std::int64_t;

namespace detail_err {
inline std::string join_ids(const std::vector<AtomId>& ids) {
  std::string out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i) out += ", ";
    out += std::to_string(ids[i]);
  }
  return out;
}
} // namespace detail_err

// A bond in a structure references an atom id that the structure does not define.
class DanglingBondError : public std::runtime_error {
public:
  DanglingBondError(std::string structure, AtomId ai, AtomId aj, AtomId missing)
      : std::runtime_error("StructureGraph[" + structure + "]: bond (" + std::to_string(ai) + ", " +
                           std::to_string(aj) + ") references unknown atom id " + std::to_string(missing)),
        structure_(std::move(structure)), ai_(ai), aj_(aj), missing_(missing) {}

  const std::string& structure() const { return structure_; }
  AtomId atom_i() const { return ai_; }
  AtomId atom_j() const { return aj_; }
  AtomId missing_id() const { return missing_; }

private:
  std::string structure_;
  AtomId ai_ = 0;
  AtomId aj_ = 0;
  AtomId missing_ = 0;
};

// The two atoms lie in disconnected components.
class NoPathFound : public std::runtime_error {
public:
  NoPathFound(AtomId start, AtomId goal, const std::string& where = "")
      : std::runtime_error("PathSearch" + (where.empty() ? std::string() : "[" + where + "]") +
                           ": no bond path between atoms " + std::to_string(start) + " and " +
                           std::to_string(goal)),
        start_(start), goal_(goal) {}

  AtomId start() const { return start_; }
  AtomId goal() const { return goal_; }

private:
  AtomId start_ = 0;
  AtomId goal_ = 0;
};

// Pre and post templates cannot be put in one-to-one correspondence.
//
// delta = (pre atoms - pre-only deletions) - (post atoms - creations).
// unmatched_pre / unmatched_post list retained atoms left without a partner.
class CountMismatchError : public std::runtime_error {
public:
  CountMismatchError(std::int64_t delta, std::vector<AtomId> unmatched_pre, std::vector<AtomId> unmatched_post)
      : std::runtime_error(make_message_(delta, unmatched_pre, unmatched_post)),
        delta_(delta), unmatched_pre_(std::move(unmatched_pre)), unmatched_post_(std::move(unmatched_post)) {}

  std::int64_t delta() const { return delta_; }
  const std::vector<AtomId>& unmatched_pre() const { return unmatched_pre_; }
  const std::vector<AtomId>& unmatched_post() const { return unmatched_post_; }

private:
  std::int64_t delta_ = 0;
  std::vector<AtomId> unmatched_pre_;
  std::vector<AtomId> unmatched_post_;

  static std::string make_message_(std::int64_t delta, const std::vector<AtomId>& pre,
                                   const std::vector<AtomId>& post) {
    std::string msg = "MappingEmitter: pre/post template atom counts differ by " + std::to_string(delta) +
                      " after removing declared deletions and creations";
    if (!pre.empty()) msg += "\n  unmatched pre atoms:  " + detail_err::join_ids(pre);
    if (!post.empty()) msg += "\n  unmatched post atoms: " + detail_err::join_ids(post);
    return msg;
  }
};

// The neighbourhood matcher could not find a post partner for some pre atoms.
class AtomMatchError : public std::runtime_error {
public:
  explicit AtomMatchError(std::vector<AtomId> unmatched_pre)
      : std::runtime_error("AtomMatcher: no post-reaction partner found for pre atoms: " +
                           detail_err::join_ids(unmatched_pre) +
                           " (check bonding atoms, deletions and elements_by_type)"),
        unmatched_pre_(std::move(unmatched_pre)) {}

  const std::vector<AtomId>& unmatched_pre() const { return unmatched_pre_; }

private:
  std::vector<AtomId> unmatched_pre_;
};

} // namespace rxmap
