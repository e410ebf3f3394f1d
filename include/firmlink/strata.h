#pragma once

#include "executor.h"
#include "matcher.h"
#include "types.h"

#include <string>
#include <vector>

namespace firmlink {

struct AssigneeSummary {
    RawName name;
    int patent_count = 0;
    int inventor_sum = 0;
};

struct StrataOptions {
    double top_fraction = 0.05;          // share of assignees, by patent count, reviewed in full
    int min_patents = 5;                 // more than this -> frequent stratum
    double top_review_threshold = 90.0;  // fuzzy floor of the top stratum

    void validate() const;
};

// A slice of source names sharing one review policy.
struct Stratum {
    std::string name;
    std::vector<RawName> sources;
    MatchOptions options;
};

// Patent count and inventor sum per raw assignee name, largest first
// (ties by name).
std::vector<AssigneeSummary> summarize_assignees(const std::vector<FactRecord>& facts);

// Splits a sorted summary into three strata:
//   top      - first floor(n * top_fraction) names: everything goes to review
//              (exact and fuzzy at or above top_review_threshold)
//   frequent - remaining names with more than min_patents patents: exact and
//              strict hits accepted, only perfect fuzzy scores, sent to review
//   tail     - everything else: exact matches only
// Strata with no names are omitted.
std::vector<Stratum> stratify(const std::vector<AssigneeSummary>& summary, const MatchOptions& base,
                              const StrataOptions& options = {});

// Matches each stratum under its own options. Candidates keep the stratum
// order, then the matcher's order within a stratum.
MatchResult match_strata(const std::vector<Stratum>& strata, const std::vector<RawName>& targets,
                         const ExecutorOptions& executor = {});

} // namespace firmlink
