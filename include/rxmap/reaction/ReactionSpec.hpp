#pragma once

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

#include "rxmap/core/Errors.hpp"

namespace rxmap {

enum class Side { Pre, Post };

inline const char* side_name(Side s) { return s == Side::Pre ? "pre" : "post"; }
inline Side other_side(Side s) { return s == Side::Pre ? Side::Post : Side::Pre; }

// What the caller knows about one reaction.
//
// pre_bonding[i] and post_bonding[i] are the same physical atom.
// delete_atoms are pre ids; create_atoms are post ids.
// post_delete_atoms (optional, same length as delete_atoms) name the post
// counterparts of deleted atoms when the files do not share atom ids.
struct ReactionSpec {
  std::array<AtomId, 2> pre_bonding{0, 0};
  std::array<AtomId, 2> post_bonding{0, 0};
  std::vector<AtomId> delete_atoms;
  std::vector<AtomId> post_delete_atoms;
  std::vector<AtomId> create_atoms;

  const std::array<AtomId, 2>& bonding(Side s) const { return s == Side::Pre ? pre_bonding : post_bonding; }
};

enum class CorrespondenceMode { Identity, Neighbourhood };

inline CorrespondenceMode parse_correspondence_mode(const std::string& s) {
  if (s == "identity" || s == "id") return CorrespondenceMode::Identity;
  if (s == "neighbourhood" || s == "neighborhood" || s == "search") return CorrespondenceMode::Neighbourhood;
  throw std::runtime_error("unknown correspondence mode '" + s + "' (expected identity|neighbourhood)");
}

inline const char* correspondence_mode_name(CorrespondenceMode m) {
  return m == CorrespondenceMode::Identity ? "identity" : "neighbourhood";
}

// Bond radii used while growing the retained atom sets.
struct BoundaryOptions {
  int initial_radius = 3;     // retain atoms up to this many bonds from the reacting path
  int expand_hops_self = 3;   // edge atom's own type changed
  int expand_hops_first = 2;  // a first-shell neighbour's type changed
  int expand_hops_second = 1; // a second-shell neighbour's type changed

  void validate() const {
    if (initial_radius < 0) throw std::runtime_error("mapping.initial_radius must be >= 0");
    if (expand_hops_self < 1 || expand_hops_first < 1 || expand_hops_second < 1) {
      throw std::runtime_error("mapping.expand_hops_* must be >= 1 (an edge expansion must add atoms)");
    }
  }
};

struct MatchOptions {
  bool allow_inference = true;
  int max_rounds = 10;
  bool debug = false;
};

struct MappingOptions {
  CorrespondenceMode correspondence = CorrespondenceMode::Identity;
  BoundaryOptions boundary;
  MatchOptions match;
  bool disconnected_byproducts = true;
  bool debug = false;

  void validate() const {
    boundary.validate();
    if (match.max_rounds < 1) throw std::runtime_error("mapping.max_match_rounds must be >= 1");
  }
};

} // namespace rxmap
