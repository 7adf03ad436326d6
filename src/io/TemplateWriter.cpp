#include "rxmap/io/TemplateWriter.hpp"

#include <initializer_list>
#include <iomanip>
#include <stdexcept>
#include <unordered_map>


namespace rxmap {

namespace {

class LocalIds {
public:
  explicit LocalIds(const std::vector<AtomId>& atoms_by_local) {
    for (std::size_t i = 0; i < atoms_by_local.size(); ++i) {
      const auto [it, ok] = map_.emplace(atoms_by_local[i], static_cast<AtomId>(i + 1));
      if (!ok) throw std::runtime_error("extract_template: atom " + std::to_string(atoms_by_local[i]) + " listed twice");
    }
  }

  // Returns false if any id is not retained.
  bool remap(std::initializer_list<AtomId*> ids) const {
    for (const AtomId* id : ids) {
      if (!map_.count(*id)) return false;
    }
    for (AtomId* id : ids) *id = map_.at(*id);
    return true;
  }

  AtomId at(AtomId id) const { return map_.at(id); }

private:
  std::unordered_map<AtomId, AtomId> map_;
};

template <class T, class F>
void write_section(std::ostream& os, const char* name, const std::vector<T>& rows, F&& row) {
  if (rows.empty()) return;
  os << "\n" << name << "\n\n";
  for (std::size_t i = 0; i < rows.size(); ++i) {
    os << (i + 1);
    row(rows[i]);
    os << "\n";
  }
}

void write_ids(std::ostream& os, const char* name, const std::vector<int>& ids) {
  if (ids.empty()) return;
  os << "\n" << name << "\n\n";
  for (const int id : ids) os << id << "\n";
}

} // namespace

StructureData extract_template(const StructureData& full, const std::vector<AtomId>& atoms_by_local) {
  const LocalIds ids(atoms_by_local);

  std::unordered_map<AtomId, const Atom*> by_id;
  for (const auto& a : full.atoms) by_id.emplace(a.id, &a);

  StructureData tpl;
  tpl.source = full.source;
  tpl.atom_style = full.atom_style;
  tpl.has_charges = full.has_charges;
  tpl.has_mol = full.has_mol;
  tpl.mass_by_type = full.mass_by_type;

  for (const AtomId id : atoms_by_local) {
    auto it = by_id.find(id);
    if (it == by_id.end()) {
      throw std::runtime_error("extract_template[" + full.source + "]: unknown atom id " + std::to_string(id));
    }
    Atom a = *it->second;
    a.id = ids.at(id);
    a.bonded.clear();
    tpl.atoms.push_back(a);
  }

  for (auto b : full.bonds) {
    if (ids.remap({&b.ai, &b.aj})) tpl.bonds.push_back(b);
  }
  for (auto a : full.angles) {
    if (ids.remap({&a.ai, &a.aj, &a.ak})) tpl.angles.push_back(a);
  }
  for (auto d : full.dihedrals) {
    if (ids.remap({&d.ai, &d.aj, &d.ak, &d.al})) tpl.dihedrals.push_back(d);
  }
  for (auto d : full.impropers) {
    if (ids.remap({&d.ai, &d.aj, &d.ak, &d.al})) tpl.impropers.push_back(d);
  }
  return tpl;
}

void write_molecule(std::ostream& os, const StructureData& tpl, const std::string& title) {
  os << "# " << title << "\n\n";
  os << tpl.atoms.size() << " atoms\n";
  if (!tpl.bonds.empty()) os << tpl.bonds.size() << " bonds\n";
  if (!tpl.angles.empty()) os << tpl.angles.size() << " angles\n";
  if (!tpl.dihedrals.empty()) os << tpl.dihedrals.size() << " dihedrals\n";
  if (!tpl.impropers.empty()) os << tpl.impropers.size() << " impropers\n";

  const auto prec = os.precision();
  os << std::setprecision(10);

  os << "\nCoords\n\n";
  for (const auto& a : tpl.atoms) os << a.id << " " << a.pos[0] << " " << a.pos[1] << " " << a.pos[2] << "\n";

  os << "\nTypes\n\n";
  for (const auto& a : tpl.atoms) os << a.id << " " << a.type << "\n";

  if (tpl.has_charges) {
    os << "\nCharges\n\n";
    for (const auto& a : tpl.atoms) os << a.id << " " << a.charge << "\n";
  }
  if (tpl.has_mol) {
    os << "\nMolecules\n\n";
    for (const auto& a : tpl.atoms) os << a.id << " " << a.mol << "\n";
  }
  os.precision(prec);

  write_section(os, "Bonds", tpl.bonds, [&](const StructureData::BondId& b) {
    os << " " << b.type << " " << b.ai << " " << b.aj;
  });
  write_section(os, "Angles", tpl.angles, [&](const StructureData::AngleId& a) {
    os << " " << a.type << " " << a.ai << " " << a.aj << " " << a.ak;
  });
  write_section(os, "Dihedrals", tpl.dihedrals, [&](const StructureData::DihedralId& d) {
    os << " " << d.type << " " << d.ai << " " << d.aj << " " << d.ak << " " << d.al;
  });
  write_section(os, "Impropers", tpl.impropers, [&](const StructureData::ImproperId& d) {
    os << " " << d.type << " " << d.ai << " " << d.aj << " " << d.ak << " " << d.al;
  });
}

void write_map(std::ostream& os, const MappingRecord& rec, const std::string& title) {
  os << "# " << title << "\n\n";
  os << rec.paired_count() << " equivalences\n";
  os << rec.edges.size() << " edgeIDs\n";
  os << rec.deletes.size() << " deleteIDs\n";
  os << rec.creates.size() << " createIDs\n";

  os << "\nInitiatorIDs\n\n";
  os << rec.initiators[0] << "\n" << rec.initiators[1] << "\n";

  write_ids(os, "EdgeIDs", rec.edges);
  write_ids(os, "DeleteIDs", rec.deletes);
  write_ids(os, "CreateIDs", rec.creates);

  os << "\nEquivalences\n\n";
  for (const auto& e : rec.entries) {
    if (!e.paired()) continue;
    os << *e.pre_local << "\t" << *e.post_local << "\n";
  }
}

} // namespace rxmap
