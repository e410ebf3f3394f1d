#include "firmlink/reference.h"
#include "firmlink/errors.h"

#include <iostream>
#include <set>

namespace firmlink {

namespace {

std::string entity_label(const CanonicalDictionary& dictionary, EntityId id) {
    std::string name = dictionary.entity_name(id);
    return format_entity_id(id) + (name.empty() ? "" : " (" + name + ")");
}

} // namespace

std::vector<RawName> project_reference_names(const Table& table, const std::string& source,
                                             const std::string& name_column) {
    table.require(source, {name_column});
    int column = table.column(name_column);

    std::vector<RawName> names;
    std::set<RawName> seen;
    for (std::size_t row = 0; row < table.rows.size(); ++row) {
        RawName name = table.cell(row, column);
        if (name.empty() || !seen.insert(name).second) {
            continue;
        }
        names.push_back(name);
    }
    return names;
}

std::vector<ReferenceRecord> reference_records(const Table& table, const std::string& source,
                                               const std::string& name_column) {
    table.require(source, {name_column, "gvkey", "cusip", "cik"});
    int name = table.column(name_column);
    int gvkey = table.column("gvkey");
    int cusip = table.column("cusip");
    int cik = table.column("cik");

    std::vector<ReferenceRecord> records;
    std::set<RawName> seen;
    for (std::size_t row = 0; row < table.rows.size(); ++row) {
        ReferenceRecord record;
        record.name = table.cell(row, name);
        if (record.name.empty() || !seen.insert(record.name).second) {
            continue;
        }
        record.ids.gvkey = table.cell(row, gvkey);
        record.ids.cusip = table.cell(row, cusip);
        record.ids.cik = table.cell(row, cik);
        records.push_back(std::move(record));
    }
    return records;
}

ReferenceMatcher::ReferenceMatcher(MatchOptions options, ExecutorOptions executor)
    : matcher_(std::move(options), executor) {}

MatchResult ReferenceMatcher::match(const CanonicalDictionary& dictionary,
                                    const std::vector<RawName>& reference_names) const {
    std::vector<RawName> sources;
    sources.reserve(dictionary.entity_count());
    for (const auto& [id, view] : dictionary.entities()) {
        sources.push_back(view.name);
    }
    return matcher_.match(sources, reference_names);
}

IdentifierMergeResult IdentifierMerger::merge(const CanonicalDictionary& dictionary,
                                              const std::vector<ReferenceRecord>& reference,
                                              const std::vector<AcceptedMatchSet>& reviewed,
                                              const std::map<EntityId, EntityIdentifiers>& existing) const {
    std::map<RawName, const ReferenceRecord*> by_name;
    for (const auto& record : reference) {
        by_name.emplace(record.name, &record);
    }

    IdentifierMergeResult result;
    result.identifiers = existing;

    for (const auto& batch : reviewed) {
        for (const auto& row : batch.rows) {
            // Reviewers see entity names in the review file, but an alias of
            // the entity is accepted as well
            EntityId entity = dictionary.find_entity(row.alias);
            if (entity == kNoEntity) {
                entity = dictionary.resolve(row.alias);
            }
            if (entity == kNoEntity) {
                result.unresolved.push_back({batch.batch_id, row.row, row.alias, row.entity, "source-not-in-dictionary"});
                continue;
            }
            auto record = by_name.find(row.entity);
            if (record == by_name.end()) {
                result.unresolved.push_back({batch.batch_id, row.row, row.alias, row.entity, "reference-name-not-found"});
                continue;
            }

            const IdentifierSet& ids = record->second->ids;
            auto current = result.identifiers.find(entity);
            if (current == result.identifiers.end()) {
                EntityIdentifiers assigned;
                assigned.entity = entity;
                assigned.entity_name = dictionary.entity_name(entity);
                assigned.reference_name = record->second->name;
                assigned.ids = ids;
                assigned.batch = batch.batch_id;
                result.identifiers.emplace(entity, std::move(assigned));
                ++result.assigned;
            } else if (current->second.ids == ids) {
                // Re-applying a reviewed set must not move the batch of record
                ++result.unchanged;
            } else {
                throw IdentifierConflictError(entity_label(dictionary, entity), current->second.batch,
                                              describe(current->second.ids), batch.batch_id, describe(ids));
            }
        }
    }

    if (verbose_) {
        std::cerr << "[firmlink] identifiers: " << result.assigned << " assigned, " << result.unchanged
                  << " unchanged, " << result.unresolved.size() << " unresolved, "
                  << result.identifiers.size() << " entities with identifiers" << std::endl;
    }
    return result;
}

} // namespace firmlink
