#pragma once

#include "types.h"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace firmlink {

struct QualityOptions {
    double low_score = 95.0;
    std::size_t short_key = 3;  // keys with fewer characters are suspicious
};

// Things a reviewer should look at before accepting a candidate list.
struct QualityReport {
    std::size_t total = 0;
    std::vector<std::pair<RawName, std::vector<RawName>>> one_to_many;  // source -> its distinct targets
    std::vector<MatchCandidate> low_scores;
    std::vector<MatchCandidate> short_keys;
    std::map<std::string, std::size_t> by_tier;
    std::map<std::string, std::size_t> by_decision;
};

QualityReport assess_matches(const std::vector<MatchCandidate>& candidates, const QualityOptions& options = {});

} // namespace firmlink
