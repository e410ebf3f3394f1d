#include <catch2/catch.hpp>

#include "firmlink/errors.h"
#include "firmlink/strata.h"

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

using namespace firmlink;

namespace {

std::string firm_name(int i) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "Firm %02d", i);
    return buffer;
}

std::vector<FactRecord> firm_facts() {
    std::vector<FactRecord> facts;
    for (int i = 0; i < 40; ++i) {
        int patents = i < 20 ? 10 : 2;
        for (int p = 0; p < patents; ++p) {
            FactRecord fact;
            fact.name = firm_name(i);
            fact.year = 2019;
            fact.declared_inventors = 1;
            facts.push_back(fact);
        }
    }
    return facts;
}

} // namespace

TEST_CASE("Assignees are summarized largest first", "[strata]") {
    std::vector<FactRecord> facts;
    for (const char* name : {"Beta", "Acme", "Beta", "", "Gamma", "Acme"}) {
        FactRecord fact;
        fact.name = name;
        fact.inventors = {"x", "y"};
        facts.push_back(fact);
    }
    std::vector<AssigneeSummary> summary = summarize_assignees(facts);

    REQUIRE(summary.size() == 3);
    CHECK(summary[0].name == "Acme");
    CHECK(summary[0].patent_count == 2);
    CHECK(summary[0].inventor_sum == 4);
    CHECK(summary[1].name == "Beta");
    CHECK(summary[2].name == "Gamma");
    CHECK(summary[2].patent_count == 1);
}

TEST_CASE("Forty assignees split into three strata", "[strata]") {
    std::vector<Stratum> strata = stratify(summarize_assignees(firm_facts()), MatchOptions());

    REQUIRE(strata.size() == 3);
    CHECK(strata[0].name == "top");
    CHECK(strata[0].sources == std::vector<RawName>{"Firm 00", "Firm 01"});
    CHECK(strata[1].name == "frequent");
    CHECK(strata[1].sources.size() == 18);
    CHECK(strata[1].sources.front() == "Firm 02");
    CHECK(strata[2].name == "tail");
    CHECK(strata[2].sources.size() == 20);

    const MatchOptions& top = strata[0].options;
    CHECK(top.review_all);
    CHECK(top.fuzzy_threshold == 90.0);
    CHECK(top.reject_floor == 90.0);
    CHECK(top.stratum == "top");

    const MatchOptions& frequent = strata[1].options;
    CHECK(frequent.strict_rules);
    CHECK(frequent.reject_floor == 100.0);
    CHECK_FALSE(frequent.fuzzy_auto_accept);
    CHECK_FALSE(frequent.review_all);

    const MatchOptions& tail = strata[2].options;
    CHECK_FALSE(tail.strict_rules);
    CHECK_FALSE(tail.fuzzy);
}

TEST_CASE("Small inputs have no top stratum", "[strata]") {
    std::vector<AssigneeSummary> summary = {{"Acme", 3, 0}, {"Beta", 1, 0}};
    std::vector<Stratum> strata = stratify(summary, MatchOptions());
    REQUIRE(strata.size() == 1);
    CHECK(strata[0].name == "tail");
    CHECK(strata[0].sources.size() == 2);

    StrataOptions invalid;
    invalid.top_fraction = -0.1;
    CHECK_THROWS_AS(stratify(summary, MatchOptions(), invalid), ConfigError);
}

TEST_CASE("Each stratum is matched under its own policy", "[strata]") {
    std::vector<AssigneeSummary> summary = {{"Acme Corp", 50, 0}, {"Acme Widgets", 6, 0}, {"Beta Labs", 1, 0}};
    StrataOptions options;
    options.top_fraction = 0.34;
    std::vector<Stratum> strata = stratify(summary, MatchOptions(), options);
    REQUIRE(strata.size() == 3);

    MatchResult result = match_strata(strata, {"Acme", "Acme Widget", "Beta"});

    REQUIRE(result.candidates.size() == 2);
    CHECK(result.candidates[0].source == "Acme Corp");
    CHECK(result.candidates[0].tier == MatchTier::Exact);
    CHECK(result.candidates[0].decision == MatchDecision::NeedsReview);
    CHECK(result.candidates[0].stratum == "top");

    CHECK(result.candidates[1].source == "Acme Widgets");
    CHECK(result.candidates[1].tier == MatchTier::Fuzzy);
    CHECK(result.candidates[1].score == 100.0);
    CHECK(result.candidates[1].decision == MatchDecision::NeedsReview);
    CHECK(result.candidates[1].stratum == "frequent");

    CHECK(result.unmatched == std::vector<RawName>{"Beta Labs"});
    CHECK(result.stats.sources == 3);
    CHECK(result.stats.needs_review == 2);
    CHECK(result.stats.rejected == 0);
}

TEST_CASE("Merged strata keep the tier and score order", "[strata]") {
    std::vector<AssigneeSummary> summary = {{"Acme Widgets", 50, 0}, {"Beta Labs", 1, 0}};
    StrataOptions options;
    options.top_fraction = 0.5;
    std::vector<Stratum> strata = stratify(summary, MatchOptions(), options);
    REQUIRE(strata.size() == 2);
    CHECK(strata[0].name == "top");
    CHECK(strata[1].name == "tail");

    MatchResult result = match_strata(strata, {"Acme Widget", "Beta Labs"});

    REQUIRE(result.candidates.size() == 2);
    CHECK(result.candidates[0].source == "Beta Labs");
    CHECK(result.candidates[0].tier == MatchTier::Exact);
    CHECK(result.candidates[0].stratum == "tail");
    CHECK(result.candidates[1].source == "Acme Widgets");
    CHECK(result.candidates[1].tier == MatchTier::Fuzzy);
    CHECK(result.candidates[1].stratum == "top");
    CHECK(std::is_sorted(result.candidates.begin(), result.candidates.end(), candidate_before));
}
