#include <catch2/catch.hpp>

#include "firmlink/quality.h"

#include <string>
#include <vector>

using namespace firmlink;

namespace {

MatchCandidate candidate(const std::string& source, const std::string& target, const std::string& source_key,
                         const std::string& target_key, MatchTier tier, double score,
                         MatchDecision decision = MatchDecision::AutoAccepted) {
    MatchCandidate c;
    c.source = source;
    c.target = target;
    c.source_key = source_key;
    c.target_key = target_key;
    c.tier = tier;
    c.score = score;
    c.decision = decision;
    return c;
}

} // namespace

TEST_CASE("Quality report flags suspicious candidates", "[quality]") {
    std::vector<MatchCandidate> candidates = {
        candidate("Acme", "Acme Holdings", "acme", "acme holdings", MatchTier::Fuzzy, 100.0),
        candidate("Acme", "Acme Group", "acme", "acme group", MatchTier::Fuzzy, 91.5, MatchDecision::NeedsReview),
        candidate("GE", "GE Capital", "ge", "ge capital", MatchTier::Fuzzy, 100.0, MatchDecision::NeedsReview),
        candidate("IBM", "International Business Machines", "ibm", "international business machines",
                  MatchTier::StrictRule, 100.0),
        candidate("Beta", "Beta", "beta", "beta", MatchTier::Exact, 100.0),
    };
    QualityReport report = assess_matches(candidates);

    CHECK(report.total == 5);

    REQUIRE(report.one_to_many.size() == 1);
    CHECK(report.one_to_many[0].first == "Acme");
    CHECK(report.one_to_many[0].second == std::vector<RawName>{"Acme Group", "Acme Holdings"});

    REQUIRE(report.low_scores.size() == 1);
    CHECK(report.low_scores[0].target == "Acme Group");

    REQUIRE(report.short_keys.size() == 1);
    CHECK(report.short_keys[0].source == "GE");

    CHECK(report.by_tier.at("fuzzy") == 3);
    CHECK(report.by_tier.at("strict-rule") == 1);
    CHECK(report.by_tier.at("exact") == 1);
    CHECK(report.by_decision.at("auto-accepted") == 3);
    CHECK(report.by_decision.at("needs-review") == 2);
}

TEST_CASE("Quality thresholds are configurable", "[quality]") {
    std::vector<MatchCandidate> candidates = {
        candidate("IBM", "International Business Machines", "ibm", "international business machines",
                  MatchTier::StrictRule, 100.0),
    };
    QualityOptions options;
    options.short_key = 4;
    options.low_score = 100.5;
    QualityReport report = assess_matches(candidates, options);
    CHECK(report.short_keys.size() == 1);
    CHECK(report.low_scores.size() == 1);

    CHECK(assess_matches({}).total == 0);
}
