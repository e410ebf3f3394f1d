#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace firmlink {

// A raw name is kept exactly as read; a key is its normalized form.
using RawName = std::string;
using CanonicalKey = std::string;

// Stable surrogate id of a canonical entity. Zero is never assigned.
using EntityId = std::uint64_t;

inline constexpr EntityId kNoEntity = 0;

std::string format_entity_id(EntityId id);
EntityId parse_entity_id(const std::string& text);  // accepts "E12" or "12", returns kNoEntity on failure

enum class MatchTier {
    Exact,
    StrictRule,
    Fuzzy
};

enum class MatchDecision {
    AutoAccepted,
    NeedsReview,
    Rejected
};

const char* tier_name(MatchTier tier);
const char* decision_name(MatchDecision decision);
bool parse_decision(const std::string& text, MatchDecision& decision);

struct MatchCandidate {
    RawName source;
    RawName target;
    CanonicalKey source_key;
    CanonicalKey target_key;
    MatchTier tier = MatchTier::Exact;
    std::string rule;    // strict rule that fired ("acronym", "containment"), empty otherwise
    double score = 0.0;  // 0-100
    MatchDecision decision = MatchDecision::AutoAccepted;
    std::string stratum; // review policy the source was matched under, may be empty
};

// One observation to aggregate.
struct FactRecord {
    RawName name;
    int year = 0;                        // 0 when the year is missing or unparsable
    int declared_inventors = 0;          // "inventors" column, 0 when absent
    std::vector<std::string> inventors;  // inventor identifiers listed on the record
    std::size_t row = 0;                 // source row, 1-based, for reports
};

// Inventors credited to one record: the larger of the declared count and
// the number of listed identifiers.
int inventor_count(const FactRecord& fact);

struct AggregateRow {
    EntityId entity = kNoEntity;
    std::string entity_name;
    int year = 0;
    int patent_count = 0;
    int distinct_inventors = 0;
    int inventor_sum = 0;
    std::vector<RawName> aliases;  // raw names observed for the entity in any year
};

// External identifiers of a reference-database company.
struct IdentifierSet {
    std::string gvkey;
    std::string cusip;
    std::string cik;

    bool empty() const { return gvkey.empty() && cusip.empty() && cik.empty(); }
    bool operator==(const IdentifierSet& other) const {
        return gvkey == other.gvkey && cusip == other.cusip && cik == other.cik;
    }
    bool operator!=(const IdentifierSet& other) const { return !(*this == other); }
};

std::string describe(const IdentifierSet& ids);

struct ReferenceRecord {
    RawName name;
    IdentifierSet ids;
};

} // namespace firmlink
