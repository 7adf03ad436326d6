#include "rxmap/app/Runner.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "rxmap/core/ElementTable.hpp"
#include "rxmap/io/LammpsDataReader.hpp"
#include "rxmap/io/TemplateWriter.hpp"
#include "rxmap/reaction/ReactionMapper.hpp"
#include "rxmap/topology/StructureGraph.hpp"
#include "rxmap/util/AtomicFile.hpp"
#include "rxmap/util/Hash.hpp"
#include "rxmap/util/Timer.hpp"

namespace fs = std::filesystem;

namespace {

fs::path resolve_path(const fs::path& base_dir, const std::string& p) {
  fs::path path(p);
  if (path.is_absolute()) return path;
  return (base_dir / path).lexically_normal();
}

const std::set<std::string>& known_keys() {
  static const std::set<std::string> keys = {
      "input.pre_data",
      "input.post_data",
      "reaction.bonding_atoms",
      "reaction.post_bonding_atoms",
      "reaction.delete_atoms",
      "reaction.post_delete_atoms",
      "reaction.create_atoms",
      "reaction.elements_by_type",
      "mapping.correspondence",
      "mapping.initial_radius",
      "mapping.expand_hops_self",
      "mapping.expand_hops_first",
      "mapping.expand_hops_second",
      "mapping.disconnected_byproducts",
      "mapping.allow_inference",
      "mapping.max_match_rounds",
      "output.directory",
      "output.pre_template",
      "output.post_template",
      "output.map",
      "log.debug",
  };
  return keys;
}

std::array<rxmap::AtomId, 2> bonding_pair(const rxmap::IniConfig& cfg, const std::string& key,
                                          const std::vector<rxmap::AtomId>& def = {}) {
  const auto ids = cfg.get_id_list("reaction", key, def);
  if (ids.size() != 2) {
    throw std::runtime_error("Runner: reaction." + key + " must list exactly two atom ids (got " +
                             std::to_string(ids.size()) + ")");
  }
  if (ids[0] == ids[1]) throw std::runtime_error("Runner: reaction." + key + " lists the same atom twice");
  return {ids[0], ids[1]};
}

rxmap::ElementTable build_elements(const rxmap::RunConfig& rc, const rxmap::StructureData& pre,
                                   const rxmap::StructureData& post) {
  if (!rc.elements_by_type.empty()) {
    const auto t = rxmap::ElementTable::from_list(rc.elements_by_type);
    const int need = std::max(pre.max_atom_type(), post.max_atom_type());
    if (t.max_type() < need) {
      throw std::runtime_error("Runner: reaction.elements_by_type lists " + std::to_string(t.max_type()) +
                               " types but the structures use type " + std::to_string(need));
    }
    return t;
  }
  const auto& masses = pre.mass_by_type.size() >= post.mass_by_type.size() ? pre.mass_by_type : post.mass_by_type;
  if (masses.empty()) {
    std::cerr << "[RXMAP] warning: no elements_by_type and no Masses section; hydrogens cannot be recognised\n";
  }
  return rxmap::ElementTable::from_masses(masses);
}

void print_ids(std::ostream& os, const std::vector<rxmap::AtomId>& ids) {
  for (std::size_t i = 0; i < ids.size(); ++i) os << (i ? "," : "") << ids[i];
}

} // namespace

namespace rxmap {

RunConfig RunConfig::from_ini(const IniConfig& cfg) {
  RunConfig rc;
  const fs::path base = cfg.base_dir();

  rc.pre_data = resolve_path(base, cfg.get_string("input", "pre_data"));
  rc.post_data = resolve_path(base, cfg.get_string("input", "post_data"));

  rc.spec.pre_bonding = bonding_pair(cfg, "bonding_atoms");
  const std::vector<AtomId> pre_pair = {rc.spec.pre_bonding[0], rc.spec.pre_bonding[1]};
  rc.spec.post_bonding = bonding_pair(cfg, "post_bonding_atoms", pre_pair);
  rc.spec.delete_atoms = cfg.get_id_list("reaction", "delete_atoms");
  rc.spec.post_delete_atoms = cfg.get_id_list("reaction", "post_delete_atoms");
  rc.spec.create_atoms = cfg.get_id_list("reaction", "create_atoms");
  if (!rc.spec.post_delete_atoms.empty() && rc.spec.post_delete_atoms.size() != rc.spec.delete_atoms.size()) {
    throw std::runtime_error("Runner: reaction.post_delete_atoms must have as many entries as reaction.delete_atoms");
  }
  if (cfg.has_key("reaction", "elements_by_type")) rc.elements_by_type = cfg.get_list("reaction", "elements_by_type");

  auto& o = rc.options;
  o.correspondence = parse_correspondence_mode(cfg.get_string("mapping", "correspondence", std::string("identity")));
  o.boundary.initial_radius = cfg.get_int("mapping", "initial_radius", 3);
  o.boundary.expand_hops_self = cfg.get_int("mapping", "expand_hops_self", 3);
  o.boundary.expand_hops_first = cfg.get_int("mapping", "expand_hops_first", 2);
  o.boundary.expand_hops_second = cfg.get_int("mapping", "expand_hops_second", 1);
  o.disconnected_byproducts = cfg.get_bool("mapping", "disconnected_byproducts", true);
  o.match.allow_inference = cfg.get_bool("mapping", "allow_inference", true);
  o.match.max_rounds = cfg.get_int("mapping", "max_match_rounds", 10);

  rc.debug = cfg.get_bool("log", "debug", false);
  o.debug = rc.debug;
  o.match.debug = rc.debug;
  o.validate();

  rc.out_dir = resolve_path(base, cfg.get_string("output", "directory", std::string(".")));
  rc.pre_template = resolve_path(rc.out_dir, cfg.get_string("output", "pre_template", std::string("pre-molecule.data")));
  rc.post_template =
      resolve_path(rc.out_dir, cfg.get_string("output", "post_template", std::string("post-molecule.data")));
  rc.map = resolve_path(rc.out_dir, cfg.get_string("output", "map", std::string("automap.data")));
  return rc;
}

Runner::Runner(const IniConfig& cfg, bool force_debug) : cfg_(cfg), rc_(RunConfig::from_ini(cfg)) {
  if (force_debug) {
    rc_.debug = true;
    rc_.options.debug = true;
    rc_.options.match.debug = true;
  }
  for (const auto& k : cfg_.unknown_keys(known_keys())) {
    std::cerr << "[RXMAP] warning: unknown config key " << k << " (ignored)\n";
  }
}

int Runner::run() { return run_impl_(false); }

int Runner::validate_config() { return run_impl_(true); }

int Runner::run_impl_(bool validate_only) {
  WallTimer timer;

  const StructureData pre_data = read_structure(rc_.pre_data);
  const StructureData post_data = read_structure(rc_.post_data);
  const StructureGraph pre(pre_data);
  const StructureGraph post(post_data);
  const ElementTable elements = build_elements(rc_, pre_data, post_data);

  if (rc_.debug) {
    std::cerr << "[RXMAP] pre:  " << rc_.pre_data.string() << " atoms=" << pre.size()
              << " bonds=" << pre_data.bonds.size() << " style=" << pre_data.atom_style << "\n";
    std::cerr << "[RXMAP] post: " << rc_.post_data.string() << " atoms=" << post.size()
              << " bonds=" << post_data.bonds.size() << " style=" << post_data.atom_style << "\n";
  }

  for (int k = 0; k < 2; ++k) {
    const auto i = static_cast<std::size_t>(k);
    if (!pre.contains(rc_.spec.pre_bonding[i])) {
      throw std::runtime_error("Runner: bonding atom " + std::to_string(rc_.spec.pre_bonding[i]) + " not in " +
                               rc_.pre_data.string());
    }
    if (!post.contains(rc_.spec.post_bonding[i])) {
      throw std::runtime_error("Runner: bonding atom " + std::to_string(rc_.spec.post_bonding[i]) + " not in " +
                               rc_.post_data.string());
    }
  }
  for (const AtomId id : rc_.spec.delete_atoms) {
    if (!pre.contains(id)) throw std::runtime_error("Runner: delete atom " + std::to_string(id) + " not in pre structure");
  }
  for (const AtomId id : rc_.spec.post_delete_atoms) {
    if (!post.contains(id)) {
      throw std::runtime_error("Runner: post delete atom " + std::to_string(id) + " not in post structure");
    }
  }
  for (const AtomId id : rc_.spec.create_atoms) {
    if (!post.contains(id)) throw std::runtime_error("Runner: create atom " + std::to_string(id) + " not in post structure");
  }

  if (validate_only) {
    std::cerr << "[RXMAP] validation OK (no mapping performed)\n"
              << "         pre=" << rc_.pre_data.string() << " atoms=" << pre.size() << "\n"
              << "         post=" << rc_.post_data.string() << " atoms=" << post.size() << "\n"
              << "         correspondence=" << correspondence_mode_name(rc_.options.correspondence)
              << " initial_radius=" << rc_.options.boundary.initial_radius << "\n";
    return 0;
  }

  const ReactionResult res = map_reaction(pre, post, elements, rc_.spec, rc_.options);

  for (const AtomId id : rc_.spec.delete_atoms) {
    if (!res.correspondence.has_pre(id)) {
      std::cerr << "[RXMAP] warning: delete atom " << id
                << " has no post-reaction counterpart; it is listed in DeleteIDs but not in Equivalences\n";
    }
  }
  if (!res.byproducts.pre.empty() || !res.byproducts.post.empty()) {
    std::cerr << "[RXMAP] byproduct atoms: pre=";
    print_ids(std::cerr, res.byproducts.pre);
    std::cerr << " post=";
    print_ids(std::cerr, res.byproducts.post);
    std::cerr << "\n";
  }

  const StructureData pre_tpl = extract_template(pre_data, res.mapping.pre_atoms_by_local());
  const StructureData post_tpl = extract_template(post_data, res.mapping.post_atoms_by_local());

  std::uint64_t h = fnv1a64_file(rc_.pre_data.string());
  h = fnv1a64_file(rc_.post_data.string(), h);
  const std::string stamp = std::string("rxmap ") + RXMAP_VERSION_STR + " inputs_fnv1a64=" + hex_u64(h);

  std::error_code ec;
  fs::create_directories(rc_.out_dir, ec);
  if (ec) throw std::runtime_error("Runner: failed to create output directory " + rc_.out_dir.string() + " (" + ec.message() + ")");

  // The three files are replaced together or not at all.
  util::AtomicFileSet outputs;
  outputs.stage(rc_.pre_template, [&](std::ostream& os) {
    write_molecule(os, pre_tpl, "pre-reaction template from " + rc_.pre_data.filename().string() + ", " + stamp);
  });
  outputs.stage(rc_.post_template, [&](std::ostream& os) {
    write_molecule(os, post_tpl, "post-reaction template from " + rc_.post_data.filename().string() + ", " + stamp);
  });
  outputs.stage(rc_.map, [&](std::ostream& os) { write_map(os, res.mapping, "map generated by " + stamp); });
  outputs.commit();

  std::cerr << "[RXMAP] mapped " << rc_.pre_data.filename().string() << " -> " << rc_.post_data.filename().string()
            << ": atoms pre=" << res.mapping.pre_count << " post=" << res.mapping.post_count
            << " equivalences=" << res.mapping.paired_count() << " edges=" << res.mapping.edges.size()
            << " deletes=" << res.mapping.deletes.size() << " creates=" << res.mapping.creates.size()
            << " passes=" << res.stabilize.passes << " ring_opening=" << (res.rings.ring_opening ? "yes" : "no")
            << " wall=" << std::fixed << std::setprecision(3) << timer.elapsed_seconds() << "s\n";
  std::cerr << "         map=" << rc_.map.string() << "\n";
  return 0;
}

} // namespace rxmap
