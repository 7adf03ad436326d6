#include "rxmap/reaction/ByproductResolver.hpp"

#include <cstddef>

#include "rxmap/alg/graph/Components.hpp"
#include "rxmap/alg/graph/ShortestPaths.hpp"

namespace rxmap {

std::vector<AtomId> ByproductResolver::disconnected_post_atoms() const {
  const StructureGraph& g = ctx_.post();
  const auto comps = alg::graph::compute_components(g.view());
  const auto& b = ctx_.bonding(Side::Post);
  const auto c0 = comps.component_id[g.index_of(b[0])];
  const auto c1 = comps.component_id[g.index_of(b[1])];

  std::vector<AtomId> out;
  for (std::size_t i = 0; i < g.size(); ++i) {
    const auto c = comps.component_id[i];
    if (c != c0 && c != c1) out.push_back(g.id_at(i));
  }
  return out;
}

std::vector<AtomId> ByproductResolver::tag(const TemplateSets& sets, Side s, const std::vector<AtomId>& anchor) const {
  const WorkingSet& ws = sets.side(s);
  const StructureGraph& g = ws.graph();

  std::vector<alg::graph::NodeId> sources;
  for (const AtomId id : anchor) {
    if (ws.contains(id)) sources.push_back(g.index_of(id));
  }
  const auto dist = alg::graph::multi_source_dist(g.view().restricted_to(ws.mask()), sources);

  std::vector<AtomId> out;
  for (std::size_t i = 0; i < dist.size(); ++i) {
    if (ws.mask()[i] && dist[i] < 0) out.push_back(g.id_at(i));
  }
  return out;
}

ByproductReport ByproductResolver::resolve(TemplateSets& sets, const ReactingPaths& paths) const {
  ByproductReport rep;

  if (include_disconnected_) {
    rep.disconnected_post = disconnected_post_atoms();
    std::size_t grown = sets.post.insert(rep.disconnected_post.begin(), rep.disconnected_post.end());
    grown += classifier_.close_under_correspondence(sets);
    if (grown > 0) {
      rep.restabilized = true;
      rep.restabilize = classifier_.stabilize(sets);
    }
  }

  rep.pre = tag(sets, Side::Pre, paths.anchor(Side::Pre));
  rep.post = tag(sets, Side::Post, paths.anchor(Side::Post));
  return rep;
}

} // namespace rxmap
