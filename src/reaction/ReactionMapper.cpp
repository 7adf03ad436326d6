#include "rxmap/reaction/ReactionMapper.hpp"

#include <iostream>

#include "rxmap/reaction/ReactionContext.hpp"

namespace rxmap {

ReactionResult map_reaction(const StructureGraph& pre, const StructureGraph& post, const ElementTable& elements,
                            const ReactionSpec& spec, const MappingOptions& opt) {
  opt.validate();

  ReactionResult res;
  if (opt.correspondence == CorrespondenceMode::Identity) {
    res.correspondence = Correspondence::identity(pre, post, spec.create_atoms);
  } else {
    MatchOptions mo = opt.match;
    mo.debug = mo.debug || opt.debug;
    AtomMatcher matcher(pre, post, elements, spec, mo);
    res.correspondence = matcher.match(&res.match);
  }

  const ReactionContext ctx(pre, post, elements, res.correspondence, spec);

  res.rings = analyze_rings(ctx);
  res.paths = find_reacting_paths(ctx);
  if (opt.debug) {
    std::cerr << "[RXMAP] ring test: pre=" << (res.rings.pre.ring_associated() ? "ring" : "chain")
              << " post=" << (res.rings.post.ring_associated() ? "ring" : "chain")
              << " ring_opening=" << (res.rings.ring_opening ? "yes" : "no") << "\n";
  }

  const BoundaryClassifier classifier(ctx, opt.boundary, opt.debug);
  TemplateSets sets = classifier.initial_retention(res.paths, res.rings);
  res.initial_pre = sets.pre.size();
  res.initial_post = sets.post.size();

  res.stabilize = classifier.stabilize(sets);

  const ByproductResolver resolver(ctx, classifier, opt.disconnected_byproducts);
  res.byproducts = resolver.resolve(sets, res.paths);

  res.edge_atoms = classifier.find_edge_atoms(sets, Side::Pre);
  res.mapping = emit_mapping(ctx, sets, res.byproducts, res.edge_atoms);

  res.pre_atoms = sets.pre.ids();
  res.post_atoms = sets.post.ids();
  return res;
}

} // namespace rxmap
