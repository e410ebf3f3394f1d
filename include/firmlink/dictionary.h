#pragma once

#include "normalizer.h"
#include "types.h"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace firmlink {

// "alias refers to entity", one accepted row of a reviewed batch.
struct AliasAssertion {
    RawName alias;
    RawName entity;
    std::size_t row = 0;

    bool same_assertion(const AliasAssertion& other) const {
        return alias == other.alias && entity == other.entity;
    }
};

struct AcceptedMatchSet {
    std::string batch_id;
    std::vector<AliasAssertion> rows;
};

// Persisted identity of an entity. Ids are never reassigned or reused.
struct EntityRecord {
    EntityId id = kNoEntity;
    CanonicalKey key;  // normalized entity name
    RawName name;      // display name, the first raw form seen
};

struct AliasEntry {
    EntityId entity = kNoEntity;
    RawName alias;      // raw form of the assertion that set the mapping
    std::string batch;
};

// Current view of one entity.
struct EntityView {
    EntityId id = kNoEntity;
    RawName name;
    CanonicalKey key;
    std::set<CanonicalKey> alias_keys;
    std::set<RawName> raw_names;
    std::vector<std::string> batches;  // provenance, application order
};

struct ConflictRecord {
    CanonicalKey alias_key;
    RawName alias;
    EntityId previous_entity = kNoEntity;
    RawName previous_name;
    std::string previous_batch;
    EntityId new_entity = kNoEntity;
    RawName new_name;
    std::string new_batch;
    std::string resolution = "most-recent-wins";
};

// Per-batch outcome of the last replay.
struct BatchReplay {
    std::string batch;
    std::size_t rows = 0;
    std::size_t invalid = 0;     // blank alias or entity name
    std::size_t added = 0;       // alias seen for the first time
    std::size_t duplicates = 0;  // alias already mapped to the same entity
    std::size_t conflicts = 0;   // alias moved to another entity
};

// Ordered assertion log plus entity registry. The alias view is derived by
// replaying the log and is never edited directly.
class CanonicalDictionary {
public:
    CanonicalDictionary() = default;
    explicit CanonicalDictionary(NameNormalizer normalizer) : normalizer_(std::move(normalizer)) {}

    EntityId resolve(const RawName& raw) const;
    EntityId resolve_key(const CanonicalKey& key) const;
    // Entity whose own name normalizes like raw
    EntityId find_entity(const RawName& raw) const;

    const EntityView* entity(EntityId id) const;
    std::string entity_name(EntityId id) const;

    std::size_t alias_count() const { return aliases_.size(); }
    std::size_t entity_count() const { return entities_.size(); }
    bool has_batch(const std::string& batch_id) const;

    const std::map<CanonicalKey, AliasEntry>& aliases() const { return aliases_; }
    const std::map<EntityId, EntityView>& entities() const { return entities_; }
    const std::vector<AcceptedMatchSet>& log() const { return log_; }
    const std::vector<EntityRecord>& registry() const { return registry_; }
    const std::vector<ConflictRecord>& conflicts() const { return conflicts_; }
    const std::vector<BatchReplay>& replay_statistics() const { return replay_; }
    EntityId next_id() const { return next_id_; }
    const NameNormalizer& normalizer() const { return normalizer_; }

    // Installs a persisted registry and log, then replays. Throws
    // DictionaryFormatError when the registry is inconsistent.
    void restore(std::vector<EntityRecord> registry, EntityId next_id, std::vector<AcceptedMatchSet> log);

private:
    friend class DictionaryBuilder;

    NameNormalizer normalizer_;
    std::vector<EntityRecord> registry_;
    std::map<CanonicalKey, std::size_t> registry_index_;
    EntityId next_id_ = 1;
    std::vector<AcceptedMatchSet> log_;

    std::map<CanonicalKey, AliasEntry> aliases_;
    std::map<EntityId, EntityView> entities_;
    std::vector<ConflictRecord> conflicts_;
    std::vector<BatchReplay> replay_;

    EntityId register_entity(const CanonicalKey& key, const RawName& name);
    void replay();
};

struct BatchStatistics {
    BatchReplay replay;
    std::string status;  // "new", "revised", "already-applied"
};

struct BuildStatistics {
    std::size_t total_aliases = 0;
    std::size_t total_entities = 0;
    std::size_t conflicts = 0;
    std::size_t new_conflicts = 0;  // conflicts raised by batches applied or revised in this run
    std::vector<BatchStatistics> batches;  // this run's batches, input order
    std::vector<std::pair<EntityId, std::size_t>> top_entities;  // by alias count
};

struct BuildResult {
    CanonicalDictionary dictionary;
    std::vector<ConflictRecord> conflicts;
    BuildStatistics statistics;
};

class DictionaryBuilder {
public:
    explicit DictionaryBuilder(bool verbose = false, std::size_t top_entities = 10)
        : verbose_(verbose), top_entities_(top_entities) {}

    BuildResult build(const std::vector<AcceptedMatchSet>& batches) const;
    // Extends a dictionary loaded from disk. Batches already in its log with
    // identical rows are skipped; with different rows they replace the
    // earlier version in place.
    BuildResult build(CanonicalDictionary existing, const std::vector<AcceptedMatchSet>& batches) const;

private:
    bool verbose_;
    std::size_t top_entities_;
};

} // namespace firmlink
