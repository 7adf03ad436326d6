#include "rxmap/reaction/MappingEmitter.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "rxmap/core/Errors.hpp"

namespace rxmap {

namespace {

std::vector<AtomId> by_local(const std::vector<MappingEntry>& entries, std::size_t count, bool pre) {
  std::vector<AtomId> out(count, 0);
  for (const auto& e : entries) {
    const auto& local = pre ? e.pre_local : e.post_local;
    const auto& id = pre ? e.pre_id : e.post_id;
    if (!local || !id) continue;
    out.at(static_cast<std::size_t>(*local - 1)) = *id;
  }
  return out;
}

std::unordered_map<AtomId, int> local_map(const std::vector<MappingEntry>& entries, bool pre) {
  std::unordered_map<AtomId, int> out;
  for (const auto& e : entries) {
    const auto& local = pre ? e.pre_local : e.post_local;
    const auto& id = pre ? e.pre_id : e.post_id;
    if (local && id) out.emplace(*id, *local);
  }
  return out;
}

} // namespace

std::vector<AtomId> MappingRecord::pre_atoms_by_local() const { return by_local(entries, pre_count, true); }
std::vector<AtomId> MappingRecord::post_atoms_by_local() const { return by_local(entries, post_count, false); }
std::unordered_map<AtomId, int> MappingRecord::pre_local_ids() const { return local_map(entries, true); }
std::unordered_map<AtomId, int> MappingRecord::post_local_ids() const { return local_map(entries, false); }

MappingRecord emit_mapping(const ReactionContext& ctx, const TemplateSets& sets, const ByproductReport& byproducts,
                           const std::vector<AtomId>& pre_edge_atoms) {
  const std::vector<AtomId> pre_ids = sets.pre.ids();
  const std::vector<AtomId> post_ids = sets.post.ids();

  std::vector<AtomId> pre_only_deleted;
  std::vector<AtomId> created;
  std::vector<AtomId> unmatched_pre;
  std::vector<AtomId> unmatched_post;

  for (const AtomId id : pre_ids) {
    const auto p = ctx.partner(Side::Pre, id);
    if (p && sets.post.contains(*p)) continue;
    if (ctx.is_pre_only_deletion(id)) {
      pre_only_deleted.push_back(id);
    } else {
      unmatched_pre.push_back(id);
    }
  }
  for (const AtomId id : post_ids) {
    const auto p = ctx.partner(Side::Post, id);
    if (p && sets.pre.contains(*p)) continue;
    if (ctx.is_created(Side::Post, id)) {
      created.push_back(id);
    } else {
      unmatched_post.push_back(id);
    }
  }

  const std::int64_t delta = (static_cast<std::int64_t>(pre_ids.size()) - static_cast<std::int64_t>(pre_only_deleted.size())) -
                             (static_cast<std::int64_t>(post_ids.size()) - static_cast<std::int64_t>(created.size()));
  if (delta != 0 || !unmatched_pre.empty() || !unmatched_post.empty()) {
    throw CountMismatchError(delta, std::move(unmatched_pre), std::move(unmatched_post));
  }

  const std::unordered_set<AtomId> by_pre(byproducts.pre.begin(), byproducts.pre.end());
  const std::unordered_set<AtomId> by_post(byproducts.post.begin(), byproducts.post.end());

  MappingRecord rec;
  int local = 0;
  for (const AtomId id : pre_ids) {
    const auto p = ctx.partner(Side::Pre, id);
    if (!p) continue;
    ++local;
    MappingEntry e;
    e.pre_id = id;
    e.post_id = *p;
    e.pre_local = local;
    e.post_local = local;
    e.deleted = ctx.is_deleted(Side::Pre, id);
    e.byproduct = by_pre.count(id) || by_post.count(*p);
    rec.entries.push_back(e);
  }
  const int paired = local;

  int pre_local = paired;
  for (const AtomId id : pre_only_deleted) {
    MappingEntry e;
    e.pre_id = id;
    e.pre_local = ++pre_local;
    e.deleted = true;
    e.byproduct = by_pre.count(id) != 0;
    rec.entries.push_back(e);
  }
  int post_local = paired;
  for (const AtomId id : created) {
    MappingEntry e;
    e.post_id = id;
    e.post_local = ++post_local;
    e.created = true;
    e.byproduct = by_post.count(id) != 0;
    rec.entries.push_back(e);
  }
  rec.pre_count = static_cast<std::size_t>(pre_local);
  rec.post_count = static_cast<std::size_t>(post_local);

  const auto pre_local_of = rec.pre_local_ids();
  for (int k = 0; k < 2; ++k) {
    const AtomId a = ctx.bonding(Side::Pre)[static_cast<std::size_t>(k)];
    auto it = pre_local_of.find(a);
    if (it == pre_local_of.end()) {
      throw std::runtime_error("MappingEmitter: reacting atom " + std::to_string(a) + " is not in the pre template");
    }
    rec.initiators[static_cast<std::size_t>(k)] = it->second;
  }

  for (const AtomId id : pre_edge_atoms) {
    auto it = pre_local_of.find(id);
    if (it == pre_local_of.end()) {
      throw std::runtime_error("MappingEmitter: edge atom " + std::to_string(id) + " is not in the pre template");
    }
    rec.edges.push_back(it->second);
  }
  std::sort(rec.edges.begin(), rec.edges.end());

  for (const auto& e : rec.entries) {
    if (e.deleted) rec.deletes.push_back(*e.pre_local);
    if (e.created) rec.creates.push_back(*e.post_local);
  }
  std::sort(rec.deletes.begin(), rec.deletes.end());
  std::sort(rec.creates.begin(), rec.creates.end());
  return rec;
}

} // namespace rxmap
