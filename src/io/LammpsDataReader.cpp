#include "rxmap/io/LammpsDataReader.hpp"

#include <cstddef>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rxmap/util/Parse.hpp"

namespace rxmap {

namespace {

// Field conversion with "<source>: line N: ..." diagnostics.
class LineContext {
public:
  LineContext(std::string tag, std::string source) : tag_(std::move(tag)), source_(std::move(source)) {}

  void advance() { ++lineno_; }
  std::size_t lineno() const { return lineno_; }
  const std::string& source() const { return source_; }

  std::runtime_error error(const std::string& msg) const {
    return std::runtime_error(tag_ + "[" + source_ + "]: line " + std::to_string(lineno_) + ": " + msg);
  }

  std::int64_t to_i64(std::string_view tok, const char* what) const {
    std::int64_t v = 0;
    if (!parse_int(tok, v)) throw error(std::string("invalid integer for ") + what + ": '" + std::string(tok) + "'");
    return v;
  }

  int to_int(std::string_view tok, const char* what) const {
    const auto v = to_i64(tok, what);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
      throw error(std::string("integer overflow for ") + what + ": '" + std::string(tok) + "'");
    }
    return static_cast<int>(v);
  }

  // Atom, mass and template types are 1-based.
  int to_type(std::string_view tok, const char* what) const {
    const int v = to_int(tok, what);
    if (v < 1) throw error(std::string(what) + " must be >= 1 (got " + std::to_string(v) + ")");
    return v;
  }

  double to_f64(std::string_view tok, const char* what) const {
    double v = 0.0;
    if (!parse_double(tok, v)) throw error(std::string("invalid number for ") + what + ": '" + std::string(tok) + "'");
    return v;
  }

  void need(const std::vector<std::string_view>& toks, std::size_t n, const char* section) const {
    if (toks.size() < n) {
      throw error(std::string("malformed ") + section + " line (need >= " + std::to_string(n) + " columns, got " +
                  std::to_string(toks.size()) + ")");
    }
  }

private:
  std::string tag_;
  std::string source_;
  std::size_t lineno_ = 0;
};

enum class Sec { None, Masses, Atoms, Bonds, Angles, Dihedrals, Impropers, Coords, Types, Charges, Molecules, Other };

Sec classify(const std::string& header) {
  std::vector<std::string_view> toks;
  split_ws(header, toks);
  if (toks.empty()) return Sec::Other;
  if (toks.size() > 1) return Sec::Other; // "Pair Coeffs", "Special Bond Counts", ...
  const auto& w = toks[0];
  if (w == "Masses") return Sec::Masses;
  if (w == "Atoms") return Sec::Atoms;
  if (w == "Bonds") return Sec::Bonds;
  if (w == "Angles") return Sec::Angles;
  if (w == "Dihedrals") return Sec::Dihedrals;
  if (w == "Impropers") return Sec::Impropers;
  if (w == "Coords") return Sec::Coords;
  if (w == "Types") return Sec::Types;
  if (w == "Charges") return Sec::Charges;
  if (w == "Molecules") return Sec::Molecules;
  return Sec::Other;
}

// Style hint after '#' on an "Atoms" header line, or empty.
std::string atoms_style_hint(const std::string& line) {
  const auto pos = line.find('#');
  if (pos == std::string::npos) return {};
  std::vector<std::string_view> toks;
  split_ws(std::string_view(line).substr(pos + 1), toks);
  if (toks.empty()) return {};
  return std::string(toks[0]);
}

// Trailing image flags add three columns. Six (or nine) columns fit both
// molecular (id mol type x y z) and charge (id type q x y z), so those need
// a hint.
std::string style_from_columns(std::size_t ncols) {
  switch (ncols) {
    case 7: case 10: return "full";
    case 5: case 8: return "atomic";
    default: return {};
  }
}

void parse_topology_line(const LineContext& ctx, Sec sec, const std::vector<std::string_view>& toks, StructureData& out) {
  switch (sec) {
    case Sec::Bonds: {
      ctx.need(toks, 4, "Bonds");
      out.bonds.push_back(StructureData::BondId{ctx.to_int(toks[1], "Bonds.type"), ctx.to_i64(toks[2], "Bonds.atom1"),
                                                ctx.to_i64(toks[3], "Bonds.atom2")});
      break;
    }
    case Sec::Angles: {
      ctx.need(toks, 5, "Angles");
      out.angles.push_back(StructureData::AngleId{ctx.to_int(toks[1], "Angles.type"), ctx.to_i64(toks[2], "Angles.atom1"),
                                                  ctx.to_i64(toks[3], "Angles.atom2"),
                                                  ctx.to_i64(toks[4], "Angles.atom3")});
      break;
    }
    case Sec::Dihedrals:
    case Sec::Impropers: {
      const char* name = sec == Sec::Dihedrals ? "Dihedrals" : "Impropers";
      ctx.need(toks, 6, name);
      StructureData::DihedralId d{ctx.to_int(toks[1], "type"), ctx.to_i64(toks[2], "atom1"), ctx.to_i64(toks[3], "atom2"),
                                  ctx.to_i64(toks[4], "atom3"), ctx.to_i64(toks[5], "atom4")};
      (sec == Sec::Dihedrals ? out.dihedrals : out.impropers).push_back(d);
      break;
    }
    default:
      break;
  }
}

void parse_mass_line(const LineContext& ctx, const std::vector<std::string_view>& toks, StructureData& out) {
  ctx.need(toks, 2, "Masses");
  const int type = ctx.to_type(toks[0], "Masses.type");
  const double m = ctx.to_f64(toks[1], "Masses.mass");
  if (static_cast<std::size_t>(type) >= out.mass_by_type.size()) {
    out.mass_by_type.resize(static_cast<std::size_t>(type) + 1, 0.0);
  }
  out.mass_by_type[static_cast<std::size_t>(type)] = m;
}

void parse_atom_line(const LineContext& ctx, std::string& style, const std::vector<std::string_view>& toks,
                     StructureData& out) {
  if (style.empty()) {
    style = style_from_columns(toks.size());
    if (style.empty() && (toks.size() == 6 || toks.size() == 9)) {
      throw ctx.error("ambiguous atom style for " + std::to_string(toks.size()) +
                      " columns (molecular or charge); add a style hint such as 'Atoms # molecular'");
    }
    if (style.empty()) {
      throw ctx.error("cannot infer atom style from " + std::to_string(toks.size()) +
                      " columns; add a style hint such as 'Atoms # full'");
    }
    out.atom_style = style;
  }

  Atom a;
  std::size_t c = 0;
  if (style == "full") {
    ctx.need(toks, 7, "Atoms (full)");
    a.id = ctx.to_i64(toks[c++], "Atoms.id");
    a.mol = ctx.to_i64(toks[c++], "Atoms.mol");
    a.type = ctx.to_type(toks[c++], "Atoms.type");
    a.charge = ctx.to_f64(toks[c++], "Atoms.q");
  } else if (style == "molecular" || style == "bond" || style == "angle") {
    ctx.need(toks, 6, "Atoms (molecular)");
    a.id = ctx.to_i64(toks[c++], "Atoms.id");
    a.mol = ctx.to_i64(toks[c++], "Atoms.mol");
    a.type = ctx.to_type(toks[c++], "Atoms.type");
  } else if (style == "charge") {
    ctx.need(toks, 6, "Atoms (charge)");
    a.id = ctx.to_i64(toks[c++], "Atoms.id");
    a.type = ctx.to_type(toks[c++], "Atoms.type");
    a.charge = ctx.to_f64(toks[c++], "Atoms.q");
  } else if (style == "atomic") {
    ctx.need(toks, 5, "Atoms (atomic)");
    a.id = ctx.to_i64(toks[c++], "Atoms.id");
    a.type = ctx.to_type(toks[c++], "Atoms.type");
  } else {
    throw ctx.error("unsupported atom style '" + style + "' (expected full|molecular|bond|angle|charge|atomic)");
  }
  a.pos[0] = ctx.to_f64(toks[c++], "Atoms.x");
  a.pos[1] = ctx.to_f64(toks[c++], "Atoms.y");
  a.pos[2] = ctx.to_f64(toks[c++], "Atoms.z");
  out.atoms.push_back(a);
}

} // namespace

StructureData read_lammps_data(std::istream& is, const std::string& source) {
  LineContext ctx("LammpsData", source);
  StructureData out;
  out.source = source;
  out.atom_style.clear();

  std::string line;
  std::string style;
  Sec cur = Sec::None;
  std::vector<std::string_view> toks;

  // Title line.
  if (std::getline(is, line)) ctx.advance();

  while (std::getline(is, line)) {
    ctx.advance();
    const std::string raw = trim(strip_comment(line));
    if (raw.empty()) continue;

    if (starts_with_alpha(raw)) {
      cur = classify(raw);
      if (cur == Sec::Atoms) {
        style = atoms_style_hint(line);
        out.atom_style = style;
      }
      continue;
    }

    split_ws(raw, toks);
    switch (cur) {
      case Sec::None:
        break; // header counts and box bounds
      case Sec::Masses:
        parse_mass_line(ctx, toks, out);
        break;
      case Sec::Atoms:
        parse_atom_line(ctx, style, toks, out);
        break;
      case Sec::Bonds:
      case Sec::Angles:
      case Sec::Dihedrals:
      case Sec::Impropers:
        parse_topology_line(ctx, cur, toks, out);
        break;
      default:
        break;
    }
  }

  if (out.atoms.empty()) throw std::runtime_error("LammpsData[" + source + "]: no Atoms section found");
  out.has_mol = out.atom_style == "full" || out.atom_style == "molecular" || out.atom_style == "bond" ||
                out.atom_style == "angle";
  out.has_charges = out.atom_style == "full" || out.atom_style == "charge";
  return out;
}

StructureData read_lammps_data(const fs::path& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("LammpsData: failed to open data file: " + path.string());
  return read_lammps_data(ifs, path.string());
}

StructureData read_lammps_molecule(std::istream& is, const std::string& source) {
  LineContext ctx("LammpsMolecule", source);
  StructureData out;
  out.source = source;
  out.atom_style = "molecule";

  // Per-id columns are collected separately and joined at the end.
  std::map<AtomId, Vec3> coords;
  std::map<AtomId, int> types;
  std::map<AtomId, double> charges;
  std::map<AtomId, std::int64_t> mols;

  std::string line;
  Sec cur = Sec::None;
  std::vector<std::string_view> toks;

  if (std::getline(is, line)) ctx.advance();

  while (std::getline(is, line)) {
    ctx.advance();
    const std::string raw = trim(strip_comment(line));
    if (raw.empty()) continue;

    if (starts_with_alpha(raw)) {
      cur = classify(raw);
      continue;
    }

    split_ws(raw, toks);
    switch (cur) {
      case Sec::Coords: {
        ctx.need(toks, 4, "Coords");
        const AtomId id = ctx.to_i64(toks[0], "Coords.id");
        coords[id] = Vec3{ctx.to_f64(toks[1], "Coords.x"), ctx.to_f64(toks[2], "Coords.y"),
                          ctx.to_f64(toks[3], "Coords.z")};
        break;
      }
      case Sec::Types: {
        ctx.need(toks, 2, "Types");
        types[ctx.to_i64(toks[0], "Types.id")] = ctx.to_type(toks[1], "Types.type");
        break;
      }
      case Sec::Charges: {
        ctx.need(toks, 2, "Charges");
        charges[ctx.to_i64(toks[0], "Charges.id")] = ctx.to_f64(toks[1], "Charges.q");
        break;
      }
      case Sec::Molecules: {
        ctx.need(toks, 2, "Molecules");
        mols[ctx.to_i64(toks[0], "Molecules.id")] = ctx.to_i64(toks[1], "Molecules.mol");
        break;
      }
      case Sec::Bonds:
      case Sec::Angles:
      case Sec::Dihedrals:
      case Sec::Impropers:
        parse_topology_line(ctx, cur, toks, out);
        break;
      default:
        break; // header counts, Special Bonds, Shake ...
    }
  }

  if (types.empty()) throw std::runtime_error("LammpsMolecule[" + source + "]: no Types section found");
  for (const auto& [id, type] : types) {
    Atom a;
    a.id = id;
    a.type = type;
    if (auto it = coords.find(id); it != coords.end()) a.pos = it->second;
    if (auto it = charges.find(id); it != charges.end()) a.charge = it->second;
    if (auto it = mols.find(id); it != mols.end()) a.mol = it->second;
    out.atoms.push_back(a);
  }
  out.has_charges = !charges.empty();
  out.has_mol = !mols.empty();
  return out;
}

StructureData read_lammps_molecule(const fs::path& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("LammpsMolecule: failed to open molecule file: " + path.string());
  return read_lammps_molecule(ifs, path.string());
}

StructureData read_structure(const fs::path& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("LammpsData: failed to open structure file: " + path.string());
  std::ostringstream buf;
  buf << ifs.rdbuf();
  const std::string text = buf.str();

  bool molecule = false;
  std::istringstream scan(text);
  std::string line;
  std::getline(scan, line); // title
  while (std::getline(scan, line)) {
    const std::string raw = trim(strip_comment(line));
    if (raw.empty() || !starts_with_alpha(raw)) continue;
    const Sec s = classify(raw);
    if (s == Sec::Coords || s == Sec::Types) {
      molecule = true;
      break;
    }
    if (s == Sec::Atoms) break;
  }

  std::istringstream iss(text);
  return molecule ? read_lammps_molecule(iss, path.string()) : read_lammps_data(iss, path.string());
}

} // namespace rxmap
