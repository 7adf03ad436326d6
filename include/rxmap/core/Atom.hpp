#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "rxmap/core/Errors.hpp"

namespace rxmap {

using Vec3 = std::array<double, 3>;

// One atom of a pre- or post-reaction structure.
//
// Identity is the LAMMPS atom id. The same id on both sides denotes the same
// physical atom only under the identity correspondence.
struct Atom {
  AtomId id = 0;
  std::int64_t mol = 0;
  int type = 0;
  double charge = 0.0;
  Vec3 pos{0.0, 0.0, 0.0};

  // Directly bonded atom ids, ascending, unique. Filled by StructureGraph.
  std::vector<AtomId> bonded;
};

} // namespace rxmap
