#include "firmlink/quality.h"
#include "firmlink/unicode_utils.h"

#include <set>

namespace firmlink {

QualityReport assess_matches(const std::vector<MatchCandidate>& candidates, const QualityOptions& options) {
    QualityReport report;
    report.total = candidates.size();

    std::map<RawName, std::set<RawName>> targets;
    for (const auto& candidate : candidates) {
        targets[candidate.source].insert(candidate.target);
        report.by_tier[tier_name(candidate.tier)] += 1;
        report.by_decision[decision_name(candidate.decision)] += 1;

        if (candidate.score < options.low_score) {
            report.low_scores.push_back(candidate);
        }
        if (unicode::char_count(candidate.source_key) < options.short_key ||
            unicode::char_count(candidate.target_key) < options.short_key) {
            report.short_keys.push_back(candidate);
        }
    }

    for (const auto& [source, names] : targets) {
        if (names.size() > 1) {
            report.one_to_many.emplace_back(source, std::vector<RawName>(names.begin(), names.end()));
        }
    }
    return report;
}

} // namespace firmlink
