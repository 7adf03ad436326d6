#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "rxmap/core/Atom.hpp"

namespace rxmap {

// Raw, id-based content of one LAMMPS data or molecule file.
//
// This is the reader's output and the template writer's input. Atom ids are
// the file's ids; nothing here is canonicalized. StructureGraph is built from
// `atoms` + `bonds`; angles/dihedrals/impropers are only carried through to
// the extracted templates.
struct StructureData {
  std::string source; // file path or caller label, used in diagnostics

  // LAMMPS atom_style of the Atoms section ("molecule" for molecule files).
  std::string atom_style = "full";
  bool has_charges = false;
  bool has_mol = false;

  struct BondId {
    int type = 0;
    AtomId ai = 0;
    AtomId aj = 0;
  };
  struct AngleId {
    int type = 0;
    AtomId ai = 0;
    AtomId aj = 0;
    AtomId ak = 0;
  };
  struct DihedralId {
    int type = 0;
    AtomId ai = 0;
    AtomId aj = 0;
    AtomId ak = 0;
    AtomId al = 0;
  };
  using ImproperId = DihedralId;

  std::vector<Atom> atoms; // file order; Atom::bonded is left empty
  std::vector<BondId> bonds;
  std::vector<AngleId> angles;
  std::vector<DihedralId> dihedrals;
  std::vector<ImproperId> impropers;

  // LAMMPS Masses section: 1-indexed type -> mass (index 0 unused, 0.0 = not given).
  std::vector<double> mass_by_type;

  std::size_t natoms() const { return atoms.size(); }

  int max_atom_type() const {
    int m = 0;
    for (const auto& a : atoms) {
      if (a.type > m) m = a.type;
    }
    return m;
  }
};

} // namespace rxmap
