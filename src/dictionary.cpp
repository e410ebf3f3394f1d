#include "firmlink/dictionary.h"
#include "firmlink/errors.h"

#include <algorithm>
#include <iostream>

namespace firmlink {

namespace {

bool same_rows(const AcceptedMatchSet& a, const AcceptedMatchSet& b) {
    if (a.rows.size() != b.rows.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.rows.size(); ++i) {
        if (!a.rows[i].same_assertion(b.rows[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

EntityId CanonicalDictionary::resolve(const RawName& raw) const {
    return resolve_key(normalizer_.normalize(raw));
}

EntityId CanonicalDictionary::resolve_key(const CanonicalKey& key) const {
    if (key.empty()) {
        return kNoEntity;
    }
    auto it = aliases_.find(key);
    return it == aliases_.end() ? kNoEntity : it->second.entity;
}

EntityId CanonicalDictionary::find_entity(const RawName& raw) const {
    CanonicalKey key = normalizer_.normalize(raw);
    auto it = registry_index_.find(key);
    if (it == registry_index_.end()) {
        return kNoEntity;
    }
    EntityId id = registry_[it->second].id;
    return entities_.count(id) > 0 ? id : kNoEntity;
}

const EntityView* CanonicalDictionary::entity(EntityId id) const {
    auto it = entities_.find(id);
    return it == entities_.end() ? nullptr : &it->second;
}

std::string CanonicalDictionary::entity_name(EntityId id) const {
    const EntityView* view = entity(id);
    return view ? view->name : std::string();
}

bool CanonicalDictionary::has_batch(const std::string& batch_id) const {
    return std::any_of(log_.begin(), log_.end(),
                       [&](const AcceptedMatchSet& batch) { return batch.batch_id == batch_id; });
}

EntityId CanonicalDictionary::register_entity(const CanonicalKey& key, const RawName& name) {
    auto it = registry_index_.find(key);
    if (it != registry_index_.end()) {
        return registry_[it->second].id;
    }
    EntityRecord entry{next_id_++, key, name};
    registry_index_.emplace(key, registry_.size());
    registry_.push_back(entry);
    return entry.id;
}

void CanonicalDictionary::restore(std::vector<EntityRecord> registry, EntityId next_id,
                                  std::vector<AcceptedMatchSet> log) {
    std::map<CanonicalKey, std::size_t> index;
    std::set<EntityId> ids;
    EntityId highest = kNoEntity;
    for (std::size_t i = 0; i < registry.size(); ++i) {
        const EntityRecord& entry = registry[i];
        if (entry.id == kNoEntity || entry.key.empty()) {
            throw DictionaryFormatError("entity registry entry " + std::to_string(i) + " has no id or key");
        }
        if (!ids.insert(entry.id).second) {
            throw DictionaryFormatError("entity id " + format_entity_id(entry.id) + " registered twice");
        }
        if (!index.emplace(entry.key, i).second) {
            throw DictionaryFormatError("entity key '" + entry.key + "' registered twice");
        }
        highest = std::max(highest, entry.id);
    }
    if (next_id <= highest) {
        throw DictionaryFormatError("next_id " + std::to_string(next_id) + " would reuse entity " +
                                    format_entity_id(highest));
    }

    registry_ = std::move(registry);
    registry_index_ = std::move(index);
    next_id_ = next_id;
    log_ = std::move(log);
    replay();
}

// The alias view is never edited in place. Every build rewrites the log and
// derives the view again from scratch, batch by batch in log order, so a later
// batch overrides an earlier one and re-applying a batch changes nothing.
void CanonicalDictionary::replay() {
    aliases_.clear();
    entities_.clear();
    conflicts_.clear();
    replay_.clear();

    struct Applied {
        CanonicalKey alias_key;
        RawName alias;
        EntityId entity;
    };
    std::vector<Applied> applied;

    for (const auto& batch : log_) {
        BatchReplay stats;
        stats.batch = batch.batch_id;
        stats.rows = batch.rows.size();

        for (const auto& row : batch.rows) {
            CanonicalKey alias_key = normalizer_.normalize(row.alias);
            CanonicalKey entity_key = normalizer_.normalize(row.entity);
            if (alias_key.empty() || entity_key.empty()) {
                ++stats.invalid;
                continue;
            }

            // The registry outlives the log: an entity keeps its id and first
            // display name even when the batch that introduced it is revised away.
            EntityId id = register_entity(entity_key, row.entity);
            EntityView& view = entities_[id];
            if (view.id == kNoEntity) {
                view.id = id;
                view.key = entity_key;
                view.name = registry_[registry_index_.at(entity_key)].name;
            }
            if (std::find(view.batches.begin(), view.batches.end(), batch.batch_id) == view.batches.end()) {
                view.batches.push_back(batch.batch_id);
            }

            auto it = aliases_.find(alias_key);
            if (it == aliases_.end()) {
                aliases_.emplace(alias_key, AliasEntry{id, row.alias, batch.batch_id});
                ++stats.added;
            } else if (it->second.entity == id) {
                ++stats.duplicates;
            } else {
                ConflictRecord conflict;
                conflict.alias_key = alias_key;
                conflict.alias = row.alias;
                conflict.previous_entity = it->second.entity;
                conflict.previous_name = entity_name(it->second.entity);
                conflict.previous_batch = it->second.batch;
                conflict.new_entity = id;
                conflict.new_name = view.name;
                conflict.new_batch = batch.batch_id;
                conflicts_.push_back(conflict);
                it->second = AliasEntry{id, row.alias, batch.batch_id};
                ++stats.conflicts;
            }
            applied.push_back(Applied{alias_key, row.alias, id});
        }
        replay_.push_back(stats);
    }

    // Raw names are attached only after the last batch, so names whose alias
    // was later taken by another entity do not stay listed under the loser.
    for (const auto& [key, entry] : aliases_) {
        entities_[entry.entity].alias_keys.insert(key);
    }
    for (const auto& item : applied) {
        if (aliases_.at(item.alias_key).entity == item.entity) {
            entities_[item.entity].raw_names.insert(item.alias);
        }
    }
}

BuildResult DictionaryBuilder::build(const std::vector<AcceptedMatchSet>& batches) const {
    return build(CanonicalDictionary(), batches);
}

BuildResult DictionaryBuilder::build(CanonicalDictionary existing, const std::vector<AcceptedMatchSet>& batches) const {
    CanonicalDictionary dictionary = std::move(existing);
    std::set<std::string> touched;
    std::vector<std::string> status;
    status.reserve(batches.size());

    for (const auto& batch : batches) {
        if (batch.batch_id.empty()) {
            throw ConfigError("accepted match set without a batch id");
        }
        auto it = std::find_if(dictionary.log_.begin(), dictionary.log_.end(),
                               [&](const AcceptedMatchSet& logged) { return logged.batch_id == batch.batch_id; });
        if (it == dictionary.log_.end()) {
            dictionary.log_.push_back(batch);
            status.push_back("new");
            touched.insert(batch.batch_id);
        } else if (same_rows(*it, batch)) {
            status.push_back("already-applied");
        } else {
            *it = batch;
            status.push_back("revised");
            touched.insert(batch.batch_id);
        }
    }

    dictionary.replay();

    BuildResult result;
    BuildStatistics& stats = result.statistics;
    stats.total_aliases = dictionary.alias_count();
    stats.total_entities = dictionary.entity_count();
    stats.conflicts = dictionary.conflicts().size();
    for (const auto& conflict : dictionary.conflicts()) {
        if (touched.count(conflict.new_batch) > 0) {
            ++stats.new_conflicts;
        }
    }

    for (std::size_t i = 0; i < batches.size(); ++i) {
        BatchStatistics entry;
        for (const auto& replayed : dictionary.replay_statistics()) {
            if (replayed.batch == batches[i].batch_id) {
                entry.replay = replayed;
                break;
            }
        }
        entry.status = status[i];
        stats.batches.push_back(entry);
        if (verbose_) {
            std::cerr << "[firmlink] batch " << entry.replay.batch << " (" << entry.status << "): "
                      << entry.replay.rows << " rows, " << entry.replay.added << " new, "
                      << entry.replay.duplicates << " duplicate, " << entry.replay.conflicts
                      << " conflict(s), " << entry.replay.invalid << " invalid" << std::endl;
        }
    }

    for (const auto& [id, view] : dictionary.entities()) {
        if (!view.alias_keys.empty()) {
            stats.top_entities.emplace_back(id, view.alias_keys.size());
        }
    }
    std::stable_sort(stats.top_entities.begin(), stats.top_entities.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (stats.top_entities.size() > top_entities_) {
        stats.top_entities.resize(top_entities_);
    }

    if (verbose_) {
        std::cerr << "[firmlink] dictionary: " << stats.total_aliases << " aliases, " << stats.total_entities
                  << " entities, " << stats.conflicts << " conflict(s) (" << stats.new_conflicts
                  << " new)" << std::endl;
    }

    result.conflicts = dictionary.conflicts();
    result.dictionary = std::move(dictionary);
    return result;
}

} // namespace firmlink
