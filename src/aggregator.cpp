#include "firmlink/aggregator.h"

#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace firmlink {

namespace {

struct Bucket {
    int patents = 0;
    int inventor_sum = 0;
    std::set<std::string> inventors;
};

} // namespace

AggregationResult Aggregator::aggregate(const CanonicalDictionary& dictionary,
                                        const std::vector<FactRecord>& facts) const {
    AggregationResult result;
    AggregationStats& stats = result.stats;
    stats.total = facts.size();

    std::map<std::pair<EntityId, int>, Bucket> buckets;
    std::map<EntityId, std::set<RawName>> aliases;

    for (const auto& fact : facts) {
        CanonicalKey key = dictionary.normalizer().normalize(fact.name);
        EntityId entity = dictionary.resolve_key(key);
        if (entity == kNoEntity) {
            result.unmatched.push_back(FactIssue{fact.name, key, kNoEntity, fact.year, fact.row});
            continue;
        }
        // Undated facts still name the entity, so their alias is listed on its rows
        aliases[entity].insert(fact.name);
        if (fact.year <= 0) {
            result.undated.push_back(FactIssue{fact.name, key, entity, fact.year, fact.row});
            continue;
        }

        Bucket& bucket = buckets[{entity, fact.year}];
        bucket.patents += 1;
        bucket.inventor_sum += inventor_count(fact);
        for (const auto& inventor : fact.inventors) {
            if (!inventor.empty()) {
                bucket.inventors.insert(inventor);
            }
        }
        ++stats.resolved;
    }

    std::set<EntityId> counted;
    for (const auto& [group, bucket] : buckets) {
        counted.insert(group.first);
        AggregateRow row;
        row.entity = group.first;
        row.entity_name = dictionary.entity_name(group.first);
        row.year = group.second;
        row.patent_count = bucket.patents;
        row.distinct_inventors = static_cast<int>(bucket.inventors.size());
        row.inventor_sum = bucket.inventor_sum;
        const auto& names = aliases[group.first];
        row.aliases.assign(names.begin(), names.end());
        result.rows.push_back(std::move(row));
    }

    stats.unmatched = result.unmatched.size();
    stats.undated = result.undated.size();
    stats.entities = counted.size();

    if (verbose_) {
        std::cerr << "[firmlink] aggregated " << stats.resolved << " of " << stats.total << " facts into "
                  << result.rows.size() << " rows for " << stats.entities << " entities (" << stats.unmatched
                  << " unmatched, " << stats.undated << " undated)" << std::endl;
    }
    return result;
}

} // namespace firmlink
