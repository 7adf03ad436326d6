#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "rxmap/topology/StructureData.hpp"

namespace rxmap {
namespace fs = std::filesystem;

// Readers for the two LAMMPS text formats a reaction can be described in.
//
// Data file ("read_data" format): first line is a title; header counts are
// informational; sections Masses, Atoms, Bonds, Angles, Dihedrals and
// Impropers are loaded, everything else (Velocities, *Coeffs, ...) is skipped.
// The Atoms column layout follows the style hint ("Atoms # full"); without a
// hint it is inferred from the column count.
//
// Molecule file ("molecule" command format): sections Coords, Types, Charges,
// Molecules, Bonds, Angles, Dihedrals, Impropers.
//
// Every malformed line throws std::runtime_error naming the source, the line
// number and the offending field.

StructureData read_lammps_data(std::istream& is, const std::string& source);
StructureData read_lammps_data(const fs::path& path);

StructureData read_lammps_molecule(std::istream& is, const std::string& source);
StructureData read_lammps_molecule(const fs::path& path);

// Dispatches on content: a file with a "Coords" or "Types" section header is a
// molecule file, anything else a data file.
StructureData read_structure(const fs::path& path);

} // namespace rxmap
