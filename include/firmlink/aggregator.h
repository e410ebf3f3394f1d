#pragma once

#include "dictionary.h"
#include "types.h"

#include <cstddef>
#include <vector>

namespace firmlink {

// A fact left out of the aggregate, with enough context to find it again.
struct FactIssue {
    RawName name;
    CanonicalKey key;
    EntityId entity = kNoEntity;  // set for undated facts
    int year = 0;
    std::size_t row = 0;
};

struct AggregationStats {
    std::size_t total = 0;
    std::size_t resolved = 0;    // counted in a row
    std::size_t unmatched = 0;
    std::size_t undated = 0;
    std::size_t entities = 0;
};

struct AggregationResult {
    std::vector<AggregateRow> rows;      // by entity, then year
    std::vector<FactIssue> unmatched;    // name does not resolve
    std::vector<FactIssue> undated;      // resolves, but has no year
    AggregationStats stats;
};

class Aggregator {
public:
    explicit Aggregator(bool verbose = false) : verbose_(verbose) {}

    // Every fact lands in exactly one place: a row, the unmatched report or
    // the undated report.
    AggregationResult aggregate(const CanonicalDictionary& dictionary, const std::vector<FactRecord>& facts) const;

private:
    bool verbose_;
};

} // namespace firmlink
