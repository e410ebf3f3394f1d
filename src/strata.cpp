#include "firmlink/strata.h"
#include "firmlink/errors.h"

#include <algorithm>
#include <iostream>
#include <map>

namespace firmlink {

void StrataOptions::validate() const {
    if (top_fraction < 0.0 || top_fraction > 1.0) {
        throw ConfigError("top_fraction must be within [0, 1]");
    }
    if (min_patents < 0) {
        throw ConfigError("min_patents must not be negative");
    }
    if (top_review_threshold < 0.0 || top_review_threshold > 100.0) {
        throw ConfigError("top_review_threshold must be within [0, 100]");
    }
}

std::vector<AssigneeSummary> summarize_assignees(const std::vector<FactRecord>& facts) {
    std::map<RawName, AssigneeSummary> by_name;
    for (const auto& fact : facts) {
        if (fact.name.empty()) {
            continue;
        }
        AssigneeSummary& entry = by_name[fact.name];
        entry.name = fact.name;
        entry.patent_count += 1;
        entry.inventor_sum += inventor_count(fact);
    }

    std::vector<AssigneeSummary> summary;
    summary.reserve(by_name.size());
    for (auto& [name, entry] : by_name) {
        summary.push_back(std::move(entry));
    }
    std::stable_sort(summary.begin(), summary.end(), [](const AssigneeSummary& a, const AssigneeSummary& b) {
        return a.patent_count > b.patent_count;
    });
    return summary;
}

std::vector<Stratum> stratify(const std::vector<AssigneeSummary>& summary, const MatchOptions& base,
                              const StrataOptions& options) {
    options.validate();

    std::size_t top_count = static_cast<std::size_t>(static_cast<double>(summary.size()) * options.top_fraction);

    Stratum top{"top", {}, base};
    top.options.review_all = true;
    top.options.fuzzy = true;
    top.options.fuzzy_threshold = options.top_review_threshold;
    top.options.reject_floor = options.top_review_threshold;

    Stratum frequent{"frequent", {}, base};
    frequent.options.fuzzy = true;
    frequent.options.fuzzy_threshold = 100.0;
    frequent.options.reject_floor = 100.0;
    frequent.options.fuzzy_auto_accept = false;

    Stratum tail{"tail", {}, base};
    tail.options.strict_rules = false;
    tail.options.fuzzy = false;

    for (std::size_t i = 0; i < summary.size(); ++i) {
        if (i < top_count) {
            top.sources.push_back(summary[i].name);
        } else if (summary[i].patent_count > options.min_patents) {
            frequent.sources.push_back(summary[i].name);
        } else {
            tail.sources.push_back(summary[i].name);
        }
    }

    std::vector<Stratum> strata;
    for (Stratum* stratum : {&top, &frequent, &tail}) {
        if (stratum->sources.empty()) {
            continue;
        }
        stratum->options.stratum = stratum->name;
        stratum->options.validate();
        strata.push_back(std::move(*stratum));
    }
    return strata;
}

MatchResult match_strata(const std::vector<Stratum>& strata, const std::vector<RawName>& targets,
                         const ExecutorOptions& executor) {
    MatchResult merged;
    for (const auto& stratum : strata) {
        if (stratum.options.verbose) {
            std::cerr << "[firmlink] stratum " << stratum.name << ": " << stratum.sources.size()
                      << " source name(s)" << std::endl;
        }
        MatchResult result = TieredMatcher(stratum.options, executor).match(stratum.sources, targets);

        merged.candidates.insert(merged.candidates.end(), result.candidates.begin(), result.candidates.end());
        merged.unmatched.insert(merged.unmatched.end(), result.unmatched.begin(), result.unmatched.end());

        MatchStats& total = merged.stats;
        const MatchStats& part = result.stats;
        total.sources += part.sources;
        total.duplicate_sources += part.duplicate_sources;
        total.skipped_empty += part.skipped_empty;
        total.targets = part.targets;
        total.exact += part.exact;
        total.strict_rule += part.strict_rule;
        total.fuzzy += part.fuzzy;
        total.auto_accepted += part.auto_accepted;
        total.needs_review += part.needs_review;
        total.rejected += part.rejected;
        total.unmatched += part.unmatched;

        merged.executor.workers = std::max(merged.executor.workers, result.executor.workers);
        merged.executor.chunks += result.executor.chunks;
        merged.executor.chunks_retried += result.executor.chunks_retried;
    }
    // Strata are matched one after another; the merged list still follows
    // the single-run order.
    std::sort(merged.candidates.begin(), merged.candidates.end(), candidate_before);
    return merged;
}

} // namespace firmlink
