#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "rxmap/reaction/MappingEmitter.hpp"
#include "rxmap/topology/StructureData.hpp"

namespace rxmap {

// Sub-structure of `full` holding `atoms_by_local` (index 0 becomes id 1, ...).
// Bonds, angles, dihedrals and impropers are kept only when every atom they
// reference is retained; ids are rewritten to local ids.
StructureData extract_template(const StructureData& full, const std::vector<AtomId>& atoms_by_local);

// Writers produce text only; callers decide how files are replaced
// (see util::AtomicFileSet).

// LAMMPS molecule file: counts header, Coords, Types, Charges (when the
// source carried charges), Molecules (when it carried molecule ids), then the
// topology sections that are non-empty.
void write_molecule(std::ostream& os, const StructureData& tpl, const std::string& title);

// LAMMPS fix bond/react map file.
void write_map(std::ostream& os, const MappingRecord& rec, const std::string& title);

} // namespace rxmap
