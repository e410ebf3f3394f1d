#include "firmlink/matcher.h"
#include "firmlink/errors.h"
#include "firmlink/scorer.h"
#include "firmlink/unicode_utils.h"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>
#include <utility>

namespace firmlink {

namespace {

const std::set<std::string> kAcronymStopWords = {"and", "of", "the"};

// First code point of a UTF-8 token
std::string first_char(const std::string& token) {
    if (token.empty()) {
        return token;
    }
    std::size_t len = 1;
    while (len < token.size() && (static_cast<unsigned char>(token[len]) & 0xC0) == 0x80) {
        ++len;
    }
    return token.substr(0, len);
}

std::string initials_of(const std::vector<std::string>& tokens) {
    std::string initials;
    for (const auto& token : tokens) {
        initials += first_char(token);
    }
    return initials;
}

bool contains_run(const std::vector<std::string>& longer, const std::vector<std::string>& shorter) {
    return std::search(longer.begin(), longer.end(), shorter.begin(), shorter.end()) != longer.end();
}

} // namespace

bool candidate_before(const MatchCandidate& a, const MatchCandidate& b) {
    if (a.tier != b.tier) {
        return a.tier < b.tier;
    }
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.source != b.source) {
        return a.source < b.source;
    }
    return a.target < b.target;
}

std::vector<std::string> key_initials(const std::vector<std::string>& tokens) {
    std::vector<std::string> result;
    if (tokens.size() < 2) {
        return result;
    }
    result.push_back(initials_of(tokens));

    std::vector<std::string> content;
    for (const auto& token : tokens) {
        if (kAcronymStopWords.count(token) == 0) {
            content.push_back(token);
        }
    }
    if (content.size() >= 2 && content.size() != tokens.size()) {
        std::string stripped = initials_of(content);
        if (stripped != result.front()) {
            result.push_back(stripped);
        }
    }
    return result;
}

void MatchOptions::validate() const {
    if (reject_floor < 0.0 || reject_floor > fuzzy_threshold || fuzzy_threshold > 100.0) {
        std::ostringstream msg;
        msg << "invalid fuzzy cut points: need 0 <= reject_floor (" << reject_floor
            << ") <= fuzzy_threshold (" << fuzzy_threshold << ") <= 100";
        throw ConfigError(msg.str());
    }
}

std::vector<MatchCandidate> MatchResult::auto_accepted() const {
    std::vector<MatchCandidate> selected;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(selected),
                 [](const MatchCandidate& c) { return c.decision == MatchDecision::AutoAccepted; });
    return selected;
}

std::vector<MatchCandidate> MatchResult::needs_review() const {
    std::vector<MatchCandidate> selected;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(selected),
                 [](const MatchCandidate& c) { return c.decision == MatchDecision::NeedsReview; });
    return selected;
}

TieredMatcher::TieredMatcher() : TieredMatcher(MatchOptions()) {}

TieredMatcher::TieredMatcher(MatchOptions options, ExecutorOptions executor, NameNormalizer normalizer)
    : options_(std::move(options)), executor_options_(executor), normalizer_(std::move(normalizer)) {
    options_.validate();
    executor_options_.validate();
}

TieredMatcher::TargetIndex TieredMatcher::index_targets(const std::vector<RawName>& targets) const {
    std::map<CanonicalKey, RawName> representatives;
    for (const auto& raw : targets) {
        CanonicalKey key = normalizer_.normalize(raw);
        if (key.empty()) {
            continue;
        }
        // Several raw targets can share a key; the smallest name stands for all
        auto it = representatives.find(key);
        if (it == representatives.end()) {
            representatives.emplace(std::move(key), raw);
        } else if (raw < it->second) {
            it->second = raw;
        }
    }

    TargetIndex index;
    index.targets.reserve(representatives.size());
    for (auto& [key, name] : representatives) {
        std::size_t position = index.targets.size();
        Target target{key, name, split_tokens(key)};
        index.by_key.emplace(key, position);
        for (const auto& initials : key_initials(target.tokens)) {
            index.by_initials.emplace(initials, position);
        }
        index.targets.push_back(std::move(target));
    }
    return index;
}

bool TieredMatcher::match_acronym(const CanonicalKey& key, const std::vector<std::string>& tokens,
                                  const TargetIndex& index, std::size_t& target) const {
    // A single-token source may be the acronym of a target; a multi-token
    // source may spell out a single-token target. Either way only a unique hit counts.
    std::set<std::size_t> hits;
    if (tokens.size() == 1) {
        if (unicode::char_count(key) >= options_.acronym_min_length) {
            auto range = index.by_initials.equal_range(key);
            for (auto it = range.first; it != range.second; ++it) {
                hits.insert(it->second);
            }
        }
    } else {
        for (const auto& initials : key_initials(tokens)) {
            if (unicode::char_count(initials) < options_.acronym_min_length) {
                continue;
            }
            auto it = index.by_key.find(initials);
            if (it != index.by_key.end() && index.targets[it->second].tokens.size() == 1) {
                hits.insert(it->second);
            }
        }
    }
    if (hits.size() != 1) {
        return false;
    }
    target = *hits.begin();
    return true;
}

bool TieredMatcher::match_containment(const CanonicalKey& key, const std::vector<std::string>& tokens,
                                      const TargetIndex& index, std::size_t& target) const {
    const std::size_t key_length = unicode::char_count(key);
    std::size_t hits = 0;
    for (std::size_t i = 0; i < index.targets.size(); ++i) {
        const Target& candidate = index.targets[i];
        if (candidate.tokens.size() == tokens.size()) {
            continue;
        }
        bool source_shorter = tokens.size() < candidate.tokens.size();
        std::size_t shorter_length = source_shorter ? key_length : unicode::char_count(candidate.key);
        if (shorter_length < options_.containment_min_length) {
            continue;
        }
        bool contained = source_shorter ? contains_run(candidate.tokens, tokens)
                                        : contains_run(tokens, candidate.tokens);
        if (!contained) {
            continue;
        }
        if (++hits > 1) {
            return false;  // ambiguous
        }
        target = i;
    }
    return hits == 1;
}

bool TieredMatcher::match_rules(const CanonicalKey& key, const TargetIndex& index, std::size_t& target,
                                std::string& rule) const {
    std::vector<std::string> tokens = split_tokens(key);
    if (match_acronym(key, tokens, index, target)) {
        rule = "acronym";
        return true;
    }
    if (match_containment(key, tokens, index, target)) {
        rule = "containment";
        return true;
    }
    return false;
}

std::vector<FuzzyHit> TieredMatcher::score_chunk(const SourceChunk& chunk, const std::vector<CanonicalKey>& keys,
                                                 const TargetIndex& index) const {
    std::vector<FuzzyHit> hits;
    for (std::size_t s = chunk.begin; s < chunk.end; ++s) {
        KeyScorer scorer(keys[s]);
        bool found = false;
        std::size_t best = 0;
        double best_score = 0.0;
        std::size_t best_overlap = 0;

        // Targets scoring below the floor, or below the best so far, are cut off
        // inside the scorer. Equal scores go to the larger shared token length,
        // then to the smaller target name, so the pick does not depend on the
        // order targets were given in.
        for (std::size_t t = 0; t < index.targets.size(); ++t) {
            const Target& target = index.targets[t];
            double cutoff = found ? best_score : options_.reject_floor;
            double score = scorer.score(target.key, cutoff);
            if (score < cutoff || score <= 0.0) {
                continue;
            }
            std::size_t overlap = scorer.overlap(target.key);
            if (found && score == best_score) {
                if (overlap < best_overlap) {
                    continue;
                }
                if (overlap == best_overlap && !(target.name < index.targets[best].name)) {
                    continue;
                }
            }
            found = true;
            best = t;
            best_score = score;
            best_overlap = overlap;
        }
        if (found) {
            hits.push_back(FuzzyHit{s, best, best_score});
        }
    }
    return hits;
}

MatchResult TieredMatcher::match(const std::vector<RawName>& sources, const std::vector<RawName>& targets) const {
    MatchResult result;
    MatchStats& stats = result.stats;

    TargetIndex index = index_targets(targets);
    stats.targets = index.targets.size();

    std::vector<RawName> names;
    std::vector<CanonicalKey> keys;
    std::set<RawName> seen;
    for (const auto& raw : sources) {
        if (!seen.insert(raw).second) {
            ++stats.duplicate_sources;
            continue;
        }
        CanonicalKey key = normalizer_.normalize(raw);
        if (key.empty()) {
            ++stats.skipped_empty;
            continue;
        }
        names.push_back(raw);
        keys.push_back(std::move(key));
    }
    stats.sources = seen.size();

    std::vector<bool> matched(names.size(), false);
    auto emit = [&](std::size_t source, std::size_t target, MatchTier tier, const std::string& rule, double score) {
        MatchCandidate candidate;
        candidate.source = names[source];
        candidate.target = index.targets[target].name;
        candidate.source_key = keys[source];
        candidate.target_key = index.targets[target].key;
        candidate.tier = tier;
        candidate.rule = rule;
        candidate.score = score;
        candidate.stratum = options_.stratum;
        if (tier == MatchTier::Fuzzy) {
            bool accept = score >= options_.fuzzy_threshold && options_.fuzzy_auto_accept;
            candidate.decision = accept ? MatchDecision::AutoAccepted : MatchDecision::NeedsReview;
        } else {
            candidate.decision = MatchDecision::AutoAccepted;
        }
        if (options_.review_all) {
            candidate.decision = MatchDecision::NeedsReview;
        }
        if (options_.debug) {
            std::cerr << "[firmlink] " << tier_name(tier) << (rule.empty() ? "" : "/" + rule) << " '"
                      << candidate.source << "' -> '" << candidate.target << "' score=" << score
                      << " " << decision_name(candidate.decision) << std::endl;
        }
        matched[source] = true;
        result.candidates.push_back(std::move(candidate));
    };

    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < names.size(); ++i) {
        auto exact = index.by_key.find(keys[i]);
        if (exact != index.by_key.end()) {
            emit(i, exact->second, MatchTier::Exact, "", 100.0);
            continue;
        }
        std::size_t target = 0;
        std::string rule;
        if (options_.strict_rules && match_rules(keys[i], index, target, rule)) {
            emit(i, target, MatchTier::StrictRule, rule, 100.0);
            continue;
        }
        pending.push_back(i);
    }

    if (options_.fuzzy && !pending.empty()) {
        std::vector<RawName> pending_names;
        std::vector<CanonicalKey> pending_keys;
        pending_names.reserve(pending.size());
        pending_keys.reserve(pending.size());
        for (std::size_t i : pending) {
            pending_names.push_back(names[i]);
            pending_keys.push_back(keys[i]);
        }

        ScoringExecutor executor(executor_options_);
        std::vector<FuzzyHit> hits;
        if (!index.targets.empty()) {
            hits = executor.run(pending_names, [&](const SourceChunk& chunk) {
                return score_chunk(chunk, pending_keys, index);
            });
        }
        result.executor = executor.stats();
        // Hit sources index into pending, not names
        for (const auto& hit : hits) {
            emit(pending[hit.source], hit.target, MatchTier::Fuzzy, "", hit.score);
        }
        stats.rejected = pending.size() - hits.size();
    }

    std::sort(result.candidates.begin(), result.candidates.end(), candidate_before);

    for (std::size_t i = 0; i < names.size(); ++i) {
        if (!matched[i]) {
            result.unmatched.push_back(names[i]);
        }
    }
    for (const auto& candidate : result.candidates) {
        switch (candidate.tier) {
            case MatchTier::Exact: ++stats.exact; break;
            case MatchTier::StrictRule: ++stats.strict_rule; break;
            case MatchTier::Fuzzy: ++stats.fuzzy; break;
        }
        if (candidate.decision == MatchDecision::AutoAccepted) {
            ++stats.auto_accepted;
        } else {
            ++stats.needs_review;
        }
    }
    stats.unmatched = result.unmatched.size();

    if (options_.verbose) {
        std::cerr << "[firmlink] matched " << stats.sources << " sources against " << stats.targets
                  << " target keys" << (options_.stratum.empty() ? "" : " (" + options_.stratum + ")")
                  << ": exact=" << stats.exact << " strict=" << stats.strict_rule
                  << " fuzzy=" << stats.fuzzy << " review=" << stats.needs_review
                  << " rejected=" << stats.rejected << " unmatched=" << stats.unmatched
                  << " empty=" << stats.skipped_empty << std::endl;
    }
    return result;
}

MatchResult match(const std::vector<RawName>& sources, const std::vector<RawName>& targets,
                  double fuzzy_threshold, double reject_floor) {
    MatchOptions options;
    options.fuzzy_threshold = fuzzy_threshold;
    options.reject_floor = reject_floor;
    return TieredMatcher(options).match(sources, targets);
}

} // namespace firmlink
