#include "rxmap/reaction/BoundaryClassifier.hpp"

#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "rxmap/alg/graph/ShortestPaths.hpp"
#include "rxmap/topology/PathSearch.hpp"

namespace rxmap {

namespace {

// Smallest cycle through `x`: for each neighbour n, the shortest path n -> x
// that does not use the bond n-x. Ties keep the lowest neighbour id.
std::optional<std::vector<AtomId>> cycle_through(const StructureGraph& g, AtomId x) {
  std::optional<std::vector<AtomId>> best;
  for (const AtomId n : g.neighbors(x)) {
    auto p = find_path_avoiding_bond(g, n, x, n, x);
    if (!p) continue;
    if (!best || p->size() < best->size()) best = std::move(p);
  }
  return best;
}

void append_with_neighbors(const StructureGraph& g, const std::vector<AtomId>& cycle, std::vector<AtomId>& out) {
  for (const AtomId id : cycle) {
    out.push_back(id);
    const auto& nbrs = g.neighbors(id);
    out.insert(out.end(), nbrs.begin(), nbrs.end());
  }
}

void sort_unique(std::vector<AtomId>& v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
}

void join_ids(std::ostream& os, const std::vector<AtomId>& ids) {
  for (std::size_t i = 0; i < ids.size(); ++i) os << (i ? "," : "") << ids[i];
}

} // namespace

RingStatus detect_rings(const StructureGraph& g, AtomId a, AtomId b) {
  RingStatus st;
  st.bond_present = g.bonded(a, b);
  if (st.bond_present) {
    st.bond_cycle = find_path_avoiding_bond(g, a, b, a, b);
    st.bond_in_ring = st.bond_cycle.has_value();
  }
  st.atom_cycle[0] = cycle_through(g, a);
  st.atom_cycle[1] = cycle_through(g, b);
  return st;
}

RingAnalysis analyze_rings(const ReactionContext& ctx) {
  RingAnalysis ra;
  ra.pre = detect_rings(ctx.pre(), ctx.bonding(Side::Pre)[0], ctx.bonding(Side::Pre)[1]);
  ra.post = detect_rings(ctx.post(), ctx.bonding(Side::Post)[0], ctx.bonding(Side::Post)[1]);

  const bool bond_changed = ra.pre.bond_in_ring != ra.post.bond_in_ring;
  const bool atom_changed[2] = {ra.pre.atom_in_ring(0) != ra.post.atom_in_ring(0),
                                ra.pre.atom_in_ring(1) != ra.post.atom_in_ring(1)};
  ra.ring_opening = bond_changed || atom_changed[0] || atom_changed[1];
  if (!ra.ring_opening) return ra;

  for (const Side s : {Side::Pre, Side::Post}) {
    const RingStatus& st = ra.status(s);
    const StructureGraph& g = ctx.graph(s);
    std::vector<AtomId>& out = (s == Side::Pre) ? ra.pre_ring_atoms : ra.post_ring_atoms;
    if (bond_changed && st.bond_cycle) append_with_neighbors(g, *st.bond_cycle, out);
    for (int k = 0; k < 2; ++k) {
      const auto& cyc = st.atom_cycle[static_cast<std::size_t>(k)];
      if (atom_changed[k] && cyc) append_with_neighbors(g, *cyc, out);
    }
    sort_unique(out);
  }
  return ra;
}

ReactingPaths find_reacting_paths(const ReactionContext& ctx) {
  ReactingPaths rp;
  const auto& pb = ctx.bonding(Side::Pre);
  const auto& qb = ctx.bonding(Side::Post);
  rp.pre = find_path(ctx.pre(), pb[0], pb[1]);
  rp.post = find_path(ctx.post(), qb[0], qb[1]);
  if (!rp.pre && !rp.post) throw NoPathFound(pb[0], pb[1], "pre and post");

  rp.pre_anchor = rp.pre ? *rp.pre : std::vector<AtomId>{pb[0], pb[1]};
  rp.post_anchor = rp.post ? *rp.post : std::vector<AtomId>{qb[0], qb[1]};
  return rp;
}

std::vector<AtomId> find_edge_atoms(const WorkingSet& set, const ElementTable& elements,
                                    const std::unordered_set<AtomId>& exempt) {
  const StructureGraph& g = set.graph();
  std::vector<AtomId> out;
  for (const AtomId id : set.ids()) {
    if (elements.is_hydrogen(g.type_of(id))) continue;
    if (exempt.count(id)) continue;
    const auto& nbrs = g.neighbors(id);
    const bool open = std::any_of(nbrs.begin(), nbrs.end(), [&](AtomId n) { return !set.contains(n); });
    if (open) out.push_back(id);
  }
  return out;
}

BoundaryClassifier::BoundaryClassifier(const ReactionContext& ctx, BoundaryOptions opt, bool debug)
    : ctx_(ctx), opt_(opt), debug_(debug) {
  opt_.validate();
}

TemplateSets BoundaryClassifier::initial_retention(const ReactingPaths& paths, const RingAnalysis& rings) const {
  TemplateSets sets(ctx_.pre(), ctx_.post());

  for (const Side s : {Side::Pre, Side::Post}) {
    const StructureGraph& g = ctx_.graph(s);
    WorkingSet& ws = sets.side(s);

    const auto dist = alg::graph::multi_source_dist(g.view(), g.to_indices(paths.anchor(s)), opt_.initial_radius);
    for (std::size_t i = 0; i < dist.size(); ++i) {
      if (dist[i] >= 0) ws.insert(g.id_at(i));
    }
    const auto& ring_atoms = rings.ring_atoms(s);
    ws.insert(ring_atoms.begin(), ring_atoms.end());
  }

  const auto& del = ctx_.spec().delete_atoms;
  const auto& cre = ctx_.spec().create_atoms;
  sets.pre.insert(del.begin(), del.end());
  sets.post.insert(cre.begin(), cre.end());

  close_under_correspondence(sets);

  if (debug_) {
    std::cerr << "[RXMAP] initial retention: pre=" << sets.pre.size() << " post=" << sets.post.size()
              << " radius=" << opt_.initial_radius << "\n";
  }
  return sets;
}

std::vector<AtomId> BoundaryClassifier::find_edge_atoms(const TemplateSets& sets, Side s) const {
  const WorkingSet& ws = sets.side(s);
  std::unordered_set<AtomId> exempt;
  for (const AtomId id : ws.ids()) {
    if (ctx_.is_exempt(s, id)) exempt.insert(id);
  }
  return rxmap::find_edge_atoms(ws, ctx_.elements(), exempt);
}

std::optional<EdgeCause> BoundaryClassifier::classify_edge_(Side s, AtomId edge, AtomId partner) const {
  const StructureGraph& g = ctx_.graph(s);
  const StructureGraph& h = ctx_.graph(other_side(s));

  if (g.type_of(edge) != h.type_of(partner)) return EdgeCause::OwnType;

  auto shell_changed = [&](int hops) {
    for (const AtomId n : g.neighbor_shell(edge, hops)) {
      const auto pn = ctx_.partner(s, n);
      if (!pn) continue;
      if (g.type_of(n) != h.type_of(*pn)) return true;
    }
    return false;
  };
  if (shell_changed(1)) return EdgeCause::FirstShell;
  if (shell_changed(2)) return EdgeCause::SecondShell;
  return std::nullopt;
}

std::vector<ExpansionRequest> BoundaryClassifier::verify_edges(const TemplateSets& sets) const {
  std::vector<ExpansionRequest> out;
  for (const Side s : {Side::Pre, Side::Post}) {
    for (const AtomId e : find_edge_atoms(sets, s)) {
      const auto p = ctx_.partner(s, e);
      if (!p) continue;
      const auto cause = classify_edge_(s, e, *p);
      if (!cause) continue;

      ExpansionRequest r;
      r.side = s;
      r.atom = e;
      r.cause = *cause;
      switch (*cause) {
        case EdgeCause::OwnType: r.hops = opt_.expand_hops_self; break;
        case EdgeCause::FirstShell: r.hops = opt_.expand_hops_first; break;
        case EdgeCause::SecondShell: r.hops = opt_.expand_hops_second; break;
      }
      out.push_back(r);
    }
  }
  return out;
}

std::size_t BoundaryClassifier::insert_ball_(WorkingSet& set, AtomId center, int hops) const {
  std::size_t added = set.insert(center) ? 1 : 0;
  const auto ball = set.graph().neighbors_within(center, hops);
  return added + set.insert(ball.begin(), ball.end());
}

std::size_t BoundaryClassifier::expand(TemplateSets& sets, const std::vector<ExpansionRequest>& requests) const {
  std::size_t added = 0;
  for (const auto& r : requests) {
    std::size_t n = insert_ball_(sets.side(r.side), r.atom, r.hops);
    if (const auto p = ctx_.partner(r.side, r.atom)) n += insert_ball_(sets.side(other_side(r.side)), *p, r.hops);
    if (debug_) {
      std::cerr << "[RXMAP]   expand " << side_name(r.side) << " atom " << r.atom << " by " << r.hops
                << " (" << edge_cause_name(r.cause) << "): +" << n << "\n";
    }
    added += n;
  }
  return added + close_under_correspondence(sets);
}

std::size_t BoundaryClassifier::close_under_correspondence(TemplateSets& sets) const {
  std::size_t added = 0;
  // The correspondence is a bijection, so one pass per direction reaches the closure.
  for (const AtomId id : sets.pre.ids()) {
    if (const auto p = ctx_.partner(Side::Pre, id)) added += sets.post.insert(*p) ? 1 : 0;
  }
  for (const AtomId id : sets.post.ids()) {
    if (const auto p = ctx_.partner(Side::Post, id)) added += sets.pre.insert(*p) ? 1 : 0;
  }
  return added;
}

StabilizeReport BoundaryClassifier::stabilize(TemplateSets& sets) const {
  StabilizeReport rep;
  for (;;) {
    const auto requests = verify_edges(sets);
    if (requests.empty()) break;
    ++rep.passes;
    rep.requests += requests.size();
    const std::size_t added = expand(sets, requests);
    if (added == 0) {
      throw std::runtime_error("BoundaryClassifier: stabilization pass " + std::to_string(rep.passes) + " made " +
                               std::to_string(requests.size()) + " expansion request(s) but retained no new atom");
    }
    rep.atoms_added += added;
  }

  if (debug_) {
    std::cerr << "[RXMAP] stabilized after " << rep.passes << " pass(es): pre=" << sets.pre.size()
              << " post=" << sets.post.size() << " edges(pre)=";
    join_ids(std::cerr, find_edge_atoms(sets, Side::Pre));
    std::cerr << "\n";
  }
  return rep;
}

} // namespace rxmap
