#pragma once

#include "executor.h"
#include "normalizer.h"
#include "types.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace firmlink {

struct MatchOptions {
    double fuzzy_threshold = 90.0;  // fuzzy score at or above -> auto-accepted
    double reject_floor = 80.0;     // fuzzy score below -> rejected, not emitted
    bool strict_rules = true;
    bool fuzzy = true;
    bool review_all = false;        // every emitted candidate goes to review
    bool fuzzy_auto_accept = true;  // false: fuzzy hits above the threshold go to review as well
    std::size_t acronym_min_length = 3;
    std::size_t containment_min_length = 8;
    std::string stratum;            // label copied onto every candidate
    bool verbose = false;
    bool debug = false;

    // Throws ConfigError unless 0 <= reject_floor <= fuzzy_threshold <= 100
    void validate() const;
};

struct MatchStats {
    std::size_t sources = 0;            // distinct raw source names
    std::size_t duplicate_sources = 0;
    std::size_t skipped_empty = 0;      // sources whose key is empty
    std::size_t targets = 0;            // distinct target keys
    std::size_t exact = 0;
    std::size_t strict_rule = 0;
    std::size_t fuzzy = 0;
    std::size_t auto_accepted = 0;
    std::size_t needs_review = 0;
    std::size_t rejected = 0;           // reached the fuzzy tier, nothing at or above the floor
    std::size_t unmatched = 0;          // no candidate emitted (includes rejected)
};

struct MatchResult {
    std::vector<MatchCandidate> candidates;  // at most one per source, in output order
    std::vector<RawName> unmatched;          // sources without a candidate, input order
    MatchStats stats;
    ExecutorStats executor;

    std::vector<MatchCandidate> auto_accepted() const;
    std::vector<MatchCandidate> needs_review() const;
};

class TieredMatcher {
public:
    TieredMatcher();
    explicit TieredMatcher(MatchOptions options, ExecutorOptions executor = {},
                           NameNormalizer normalizer = NameNormalizer());

    // Each source gets the result of the first tier that yields one:
    // exact key, strict rule (acronym, containment), fuzzy token-set score.
    MatchResult match(const std::vector<RawName>& sources, const std::vector<RawName>& targets) const;

    const MatchOptions& options() const { return options_; }
    const NameNormalizer& normalizer() const { return normalizer_; }

private:
    struct Target {
        CanonicalKey key;
        RawName name;  // smallest raw name with this key
        std::vector<std::string> tokens;
    };

    struct TargetIndex {
        std::vector<Target> targets;                        // sorted by key
        std::map<CanonicalKey, std::size_t> by_key;
        std::multimap<std::string, std::size_t> by_initials; // multi-token targets
    };

    MatchOptions options_;
    ExecutorOptions executor_options_;
    NameNormalizer normalizer_;

    TargetIndex index_targets(const std::vector<RawName>& targets) const;
    bool match_rules(const CanonicalKey& key, const TargetIndex& index, std::size_t& target,
                     std::string& rule) const;
    bool match_acronym(const CanonicalKey& key, const std::vector<std::string>& tokens,
                       const TargetIndex& index, std::size_t& target) const;
    bool match_containment(const CanonicalKey& key, const std::vector<std::string>& tokens,
                           const TargetIndex& index, std::size_t& target) const;
    std::vector<FuzzyHit> score_chunk(const SourceChunk& chunk, const std::vector<CanonicalKey>& keys,
                                      const TargetIndex& index) const;
};

// Tiered match with default options apart from the two fuzzy cut points.
MatchResult match(const std::vector<RawName>& sources, const std::vector<RawName>& targets,
                  double fuzzy_threshold, double reject_floor);

// Output order of candidates: tier, then descending score, then source and
// target name.
bool candidate_before(const MatchCandidate& a, const MatchCandidate& b);

// Initials of a multi-token key: with every token, and without the stop
// words "and", "of", "the" (only when two or more tokens remain).
std::vector<std::string> key_initials(const std::vector<std::string>& tokens);

} // namespace firmlink
