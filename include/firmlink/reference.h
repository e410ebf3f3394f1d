#pragma once

#include "dictionary.h"
#include "executor.h"
#include "io_table.h"
#include "matcher.h"
#include "types.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace firmlink {

// Distinct non-blank values of the name column, first occurrence order.
std::vector<RawName> project_reference_names(const Table& table, const std::string& source,
                                             const std::string& name_column = "conm");

// Identifier rows of a reference table, first record per raw name.
std::vector<ReferenceRecord> reference_records(const Table& table, const std::string& source,
                                               const std::string& name_column = "conm");

// Tiered matching of entity display names (sources) against reference
// names (targets).
class ReferenceMatcher {
public:
    explicit ReferenceMatcher(MatchOptions options = {}, ExecutorOptions executor = {});

    MatchResult match(const CanonicalDictionary& dictionary, const std::vector<RawName>& reference_names) const;

private:
    TieredMatcher matcher_;
};

struct EntityIdentifiers {
    EntityId entity = kNoEntity;
    RawName entity_name;
    RawName reference_name;
    IdentifierSet ids;
    std::string batch;  // batch that first assigned the set
};

struct UnresolvedReference {
    std::string batch;
    std::size_t row = 0;
    RawName source;
    RawName reference_name;
    std::string reason;
};

struct IdentifierMergeResult {
    std::map<EntityId, EntityIdentifiers> identifiers;  // existing plus newly assigned
    std::vector<UnresolvedReference> unresolved;
    std::size_t assigned = 0;
    std::size_t unchanged = 0;
};

class IdentifierMerger {
public:
    explicit IdentifierMerger(bool verbose = false) : verbose_(verbose) {}

    // Reviewed rows read alias = entity-side name, entity = reference name.
    // Assigning the same identifier set again is a no-op; a different set
    // for an entity that already has one throws IdentifierConflictError.
    IdentifierMergeResult merge(const CanonicalDictionary& dictionary, const std::vector<ReferenceRecord>& reference,
                                const std::vector<AcceptedMatchSet>& reviewed,
                                const std::map<EntityId, EntityIdentifiers>& existing = {}) const;

private:
    bool verbose_;
};

} // namespace firmlink
