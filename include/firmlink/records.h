#pragma once

#include "aggregator.h"
#include "dictionary.h"
#include "io_table.h"
#include "quality.h"
#include "reference.h"
#include "strata.h"
#include "types.h"

#include <map>
#include <string>
#include <vector>

namespace firmlink {

// Fixed column layouts of the pipeline's files.

inline constexpr int kMaxListedInventors = 10;

// facts: name and year columns required; "inventors" and
// "inventor_name1".."inventor_name10" optional
std::vector<FactRecord> facts_from_table(const Table& table, const std::string& source,
                                         const std::string& name_column = "assignee",
                                         const std::string& year_column = "application_year");

// Distinct non-blank values of one column, first occurrence order
std::vector<RawName> names_from_table(const Table& table, const std::string& source, const std::string& column);

// Review file: source_name, target_name, tier, rule, score, decision,
// source_key, target_key, stratum
Table candidates_table(const std::vector<MatchCandidate>& candidates);

// Reviewed batch: source_name and target_name required. Rows whose optional
// decision column reads "rejected" are left out.
AcceptedMatchSet accepted_from_table(const Table& table, const std::string& source, const std::string& batch_id);

Table dictionary_table(const CanonicalDictionary& dictionary);
Table entities_table(const CanonicalDictionary& dictionary);
Table conflicts_table(const std::vector<ConflictRecord>& conflicts);
Table build_statistics_table(const BuildStatistics& statistics);

Table fact_issues_table(const std::vector<FactIssue>& issues);
Table aggregate_table(const std::vector<AggregateRow>& rows);
// One row per entity: entity_id, acquiror_name, patent_<year>...,
// patent_inventor_<year>..., patent_name, patent_name_1... Missing years are 0.
Table aggregate_wide_table(const std::vector<AggregateRow>& rows);

Table identifiers_table(const std::map<EntityId, EntityIdentifiers>& identifiers);
std::map<EntityId, EntityIdentifiers> identifiers_from_table(const Table& table, const std::string& source);
Table unresolved_references_table(const std::vector<UnresolvedReference>& unresolved);

Table assignee_summary_table(const std::vector<AssigneeSummary>& summary);
Table quality_table(const QualityReport& report);

// Score with at most two decimals, trailing zeros dropped
std::string format_score(double score);

} // namespace firmlink
