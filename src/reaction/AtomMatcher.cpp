#include "rxmap/reaction/AtomMatcher.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <map>
#include <stdexcept>

#include "rxmap/core/Errors.hpp"

namespace rxmap {

struct AtomMatcher::State {
  Correspondence corr;
  std::deque<std::pair<AtomId, AtomId>> queue;
};

namespace {

std::string join(const std::vector<AtomId>& ids) {
  std::string out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i) out += ",";
    out += std::to_string(ids[i]);
  }
  return out;
}

} // namespace

AtomMatcher::AtomMatcher(const StructureGraph& pre, const StructureGraph& post, const ElementTable& elements,
                         const ReactionSpec& spec, MatchOptions opt)
    : pre_(pre), post_(post), elements_(elements), spec_(spec), opt_(opt) {
  for (int i = 0; i < 2; ++i) {
    const auto k = static_cast<std::size_t>(i);
    if (!pre_.contains(spec_.pre_bonding[k])) {
      throw std::runtime_error("AtomMatcher: bonding atom " + std::to_string(spec_.pre_bonding[k]) + " not found in " +
                               pre_.label());
    }
    if (!post_.contains(spec_.post_bonding[k])) {
      throw std::runtime_error("AtomMatcher: bonding atom " + std::to_string(spec_.post_bonding[k]) +
                               " not found in " + post_.label());
    }
    pre_excluded_.insert(spec_.pre_bonding[k]);
    post_excluded_.insert(spec_.post_bonding[k]);
  }
  for (const AtomId id : spec_.create_atoms) {
    created_.insert(id);
    post_excluded_.insert(id);
  }
  if (!spec_.post_delete_atoms.empty() && spec_.post_delete_atoms.size() != spec_.delete_atoms.size()) {
    throw std::runtime_error("AtomMatcher: delete_atoms and post_delete_atoms have different lengths (" +
                             std::to_string(spec_.delete_atoms.size()) + " vs " +
                             std::to_string(spec_.post_delete_atoms.size()) + ")");
  }
}

std::string AtomMatcher::element_(bool pre_side, AtomId id) const {
  return elements_.element((pre_side ? pre_ : post_).type_of(id));
}

bool AtomMatcher::is_h_(bool pre_side, AtomId id) const {
  return elements_.is_hydrogen((pre_side ? pre_ : post_).type_of(id));
}

std::string AtomMatcher::fingerprint(bool pre_side, AtomId id, int level) const {
  const StructureGraph& g = pre_side ? pre_ : post_;
  const auto& excluded = pre_side ? pre_excluded_ : post_excluded_;

  std::vector<std::string> els;
  for (const AtomId n : g.neighbor_shell(id, level)) {
    if (excluded.count(n)) continue;
    els.push_back(element_(pre_side, n));
  }
  std::sort(els.begin(), els.end());
  std::string fp;
  for (const auto& e : els) fp += e;
  return fp;
}

void AtomMatcher::pair_(State& st, AtomId pre, AtomId post) const {
  st.corr.add(pre, post);
  if (opt_.debug) std::cerr << "[RXMAP]   match pre " << pre << " -> post " << post << "\n";
  if (!is_h_(true, pre)) st.queue.emplace_back(pre, post);
}

std::optional<AtomId> AtomMatcher::resolve_symmetric_(AtomId pre, const std::vector<AtomId>& candidates) const {
  for (int level = 1; level <= StructureGraph::kMaxShell; ++level) {
    std::vector<std::string> fps;
    fps.reserve(candidates.size());
    std::map<std::string, int> counts;
    for (const AtomId c : candidates) {
      fps.push_back(fingerprint(false, c, level));
      ++counts[fps.back()];
    }

    bool empty_unique = false;
    for (std::size_t i = 0; i < fps.size(); ++i) {
      if (counts[fps[i]] == 1 && fps[i].empty()) empty_unique = true;
    }
    if (empty_unique) continue;

    const std::string want = fingerprint(true, pre, level);
    for (std::size_t i = 0; i < fps.size(); ++i) {
      if (counts[fps[i]] == 1 && fps[i] == want) return candidates[i];
    }
  }
  return std::nullopt;
}

void AtomMatcher::run_queue_(State& st) const {
  while (!st.queue.empty()) {
    const auto [p, q] = st.queue.front();
    st.queue.pop_front();

    std::map<std::string, std::vector<AtomId>> pre_groups;
    std::map<std::string, std::vector<AtomId>> post_groups;
    for (const AtomId n : pre_.neighbors(p)) {
      if (!st.corr.has_pre(n)) pre_groups[element_(true, n)].push_back(n);
    }
    for (const AtomId n : post_.neighbors(q)) {
      if (!st.corr.has_post(n) && !created_.count(n)) post_groups[element_(false, n)].push_back(n);
    }

    for (const auto& [el, pre_ids] : pre_groups) {
      auto it = post_groups.find(el);
      if (it == post_groups.end()) continue;
      std::vector<AtomId> post_ids = it->second;

      if (is_h_(true, pre_ids.front())) {
        const std::size_t n = std::min(pre_ids.size(), post_ids.size());
        for (std::size_t i = 0; i < n; ++i) pair_(st, pre_ids[i], post_ids[i]);
        continue;
      }
      if (pre_ids.size() != post_ids.size()) continue;
      if (pre_ids.size() == 1) {
        pair_(st, pre_ids.front(), post_ids.front());
        continue;
      }
      for (const AtomId a : pre_ids) {
        const auto r = resolve_symmetric_(a, post_ids);
        if (!r) continue;
        pair_(st, a, *r);
        post_ids.erase(std::find(post_ids.begin(), post_ids.end(), *r));
      }
    }
  }
}

bool AtomMatcher::missing_round_(State& st, bool inference, MatchReport* report) const {
  bool progress = false;
  for (const auto& atom : pre_.atoms()) {
    const AtomId a = atom.id;
    if (st.corr.has_pre(a)) continue;

    const std::string el = element_(true, a);
    std::vector<AtomId> candidates;
    for (const auto& b : post_.atoms()) {
      if (st.corr.has_post(b.id) || created_.count(b.id)) continue;
      if (element_(false, b.id) == el) candidates.push_back(b.id);
    }
    if (candidates.empty()) continue;

    // Prefer candidates bonded to the partner of an already mapped neighbour.
    std::vector<AtomId> anchored;
    for (const AtomId c : candidates) {
      for (const AtomId n : pre_.neighbors(a)) {
        const auto pn = st.corr.post_of(n);
        if (pn && post_.bonded(c, *pn)) {
          anchored.push_back(c);
          break;
        }
      }
    }
    if (!anchored.empty()) candidates = std::move(anchored);

    std::optional<AtomId> pick;
    if (candidates.size() == 1 || is_h_(true, a)) {
      pick = candidates.front();
    } else {
      pick = resolve_symmetric_(a, candidates);
      if (!pick && inference) {
        pick = candidates.front();
        std::cerr << "[RXMAP] note: pre atom " << a << " assigned to post atom " << *pick
                  << " by inference (candidates: " << join(candidates) << "); please check\n";
        if (report) report->inferred.emplace_back(a, *pick);
      }
    }
    if (!pick) continue;
    pair_(st, a, *pick);
    progress = true;
  }
  run_queue_(st);
  return progress;
}

Correspondence AtomMatcher::match(MatchReport* report) const {
  State st;
  for (std::size_t k = 0; k < 2; ++k) pair_(st, spec_.pre_bonding[k], spec_.post_bonding[k]);
  for (std::size_t k = 0; k < spec_.post_delete_atoms.size(); ++k) {
    const AtomId a = spec_.delete_atoms[k];
    const AtomId b = spec_.post_delete_atoms[k];
    if (!pre_.contains(a)) throw std::runtime_error("AtomMatcher: delete atom " + std::to_string(a) + " not found");
    if (!post_.contains(b)) throw std::runtime_error("AtomMatcher: post delete atom " + std::to_string(b) + " not found");
    pair_(st, a, b);
  }
  run_queue_(st);

  auto unmatched = [&]() {
    std::size_t n = 0;
    for (const auto& a : pre_.atoms()) n += st.corr.has_pre(a.id) ? 0 : 1;
    return n;
  };

  bool inference = false;
  for (int round = 1; round <= opt_.max_rounds && unmatched() > 0; ++round) {
    const bool inferring = inference && opt_.allow_inference;
    const std::size_t before = unmatched();
    const bool progress = missing_round_(st, inferring, report);
    if (report) report->rounds = round;
    if (opt_.debug) {
      std::cerr << "[RXMAP]   missing-atom round " << round << ": unmatched pre " << before << " -> " << unmatched()
                << (inferring ? " (inference)" : "") << "\n";
    }
    if (!progress && (inferring || !opt_.allow_inference)) break;
    inference = !progress;
  }

  const std::unordered_set<AtomId> deleted(spec_.delete_atoms.begin(), spec_.delete_atoms.end());
  std::vector<AtomId> missing;
  for (const auto& a : pre_.atoms()) {
    if (st.corr.has_pre(a.id)) continue;
    if (deleted.count(a.id)) {
      if (report) report->unmatched_deletions.push_back(a.id);
      continue;
    }
    missing.push_back(a.id);
  }
  if (!missing.empty()) throw AtomMatchError(std::move(missing));
  return std::move(st.corr);
}

} // namespace rxmap
