#include <catch2/catch.hpp>

#include "firmlink/dictionary.h"
#include "firmlink/errors.h"
#include "firmlink/io_dictionary.h"

#include <string>
#include <vector>

using namespace firmlink;

namespace {

AcceptedMatchSet make_batch(const std::string& id, const std::vector<std::pair<std::string, std::string>>& rows) {
    AcceptedMatchSet batch;
    batch.batch_id = id;
    std::size_t row = 0;
    for (const auto& [alias, entity] : rows) {
        batch.rows.push_back(AliasAssertion{alias, entity, ++row});
    }
    return batch;
}

std::vector<AcceptedMatchSet> quarterly_batches() {
    return {
        make_batch("q1", {{"Acme", "Entity One"},
                          {"Beta Labs", "Entity Two"},
                          {"Gamma Inc", "Entity Three"},
                          {"Delta Corp", "Entity Four"},
                          {"Epsilon Ltd", "Entity Five"},
                          {"Zeta", "Entity Six"}}),
        make_batch("q2", {{"Acme", "Entity Seven"}, {"Acme Holdings", "Entity Seven"}}),
    };
}

} // namespace

TEST_CASE("The most recent batch wins a conflicting alias", "[dictionary]") {
    BuildResult result = DictionaryBuilder().build(quarterly_batches());
    const CanonicalDictionary& dictionary = result.dictionary;

    CHECK(dictionary.resolve("Acme") == 7);
    CHECK(dictionary.resolve("ACME Corp.") == 7);
    CHECK(dictionary.entity_name(7) == "Entity Seven");
    CHECK(dictionary.resolve("Beta Labs") == 2);

    REQUIRE(result.conflicts.size() == 1);
    const ConflictRecord& conflict = result.conflicts[0];
    CHECK(conflict.alias_key == "acme");
    CHECK(conflict.previous_entity == 1);
    CHECK(conflict.previous_name == "Entity One");
    CHECK(conflict.previous_batch == "q1");
    CHECK(conflict.new_entity == 7);
    CHECK(conflict.new_batch == "q2");
    CHECK(conflict.resolution == "most-recent-wins");

    CHECK(result.statistics.total_aliases == 7);
    CHECK(result.statistics.conflicts == 1);
    CHECK(result.statistics.new_conflicts == 1);
    REQUIRE(result.statistics.batches.size() == 2);
    CHECK(result.statistics.batches[0].status == "new");
    CHECK(result.statistics.batches[0].replay.added == 6);
    CHECK(result.statistics.batches[1].replay.conflicts == 1);
    CHECK(result.statistics.batches[1].replay.added == 1);
}

TEST_CASE("Entities keep their view after losing every alias", "[dictionary]") {
    BuildResult result = DictionaryBuilder().build(quarterly_batches());
    const EntityView* one = result.dictionary.entity(1);
    REQUIRE(one != nullptr);
    CHECK(one->alias_keys.empty());
    CHECK(one->raw_names.empty());

    const EntityView* seven = result.dictionary.entity(7);
    REQUIRE(seven != nullptr);
    CHECK(seven->alias_keys == std::set<CanonicalKey>{"acme", "acme holdings"});
    CHECK(seven->raw_names == std::set<RawName>{"Acme", "Acme Holdings"});
    CHECK(seven->batches == std::vector<std::string>{"q2"});

    REQUIRE_FALSE(result.statistics.top_entities.empty());
    CHECK(result.statistics.top_entities.front().first == 7);
    CHECK(result.statistics.top_entities.front().second == 2);
}

TEST_CASE("Rebuilding with the same batches changes nothing", "[dictionary]") {
    DictionaryBuilder builder;
    BuildResult first = builder.build(quarterly_batches());
    BuildResult second = builder.build(first.dictionary, quarterly_batches());

    CHECK(dump_dictionary(first.dictionary) == dump_dictionary(second.dictionary));
    CHECK(second.statistics.new_conflicts == 0);
    CHECK(second.statistics.conflicts == 1);
    REQUIRE(second.statistics.batches.size() == 2);
    CHECK(second.statistics.batches[0].status == "already-applied");
    CHECK(second.statistics.batches[1].status == "already-applied");
}

TEST_CASE("Applying batches one run at a time equals applying them together", "[dictionary]") {
    auto batches = quarterly_batches();
    DictionaryBuilder builder;
    BuildResult together = builder.build(batches);
    BuildResult first = builder.build({batches[0]});
    BuildResult incremental = builder.build(first.dictionary, {batches[1]});

    CHECK(dump_dictionary(together.dictionary) == dump_dictionary(incremental.dictionary));
    CHECK(incremental.statistics.new_conflicts == 1);
}

TEST_CASE("A revised batch replaces its earlier version without reusing ids", "[dictionary]") {
    DictionaryBuilder builder;
    BuildResult first = builder.build(quarterly_batches());

    AcceptedMatchSet revised = make_batch("q2", {{"Acme Holdings", "Entity Seven"}, {"Omega", "Entity Eight"}});
    BuildResult second = builder.build(first.dictionary, {revised});

    REQUIRE(second.statistics.batches.size() == 1);
    CHECK(second.statistics.batches[0].status == "revised");
    CHECK(second.dictionary.resolve("Acme") == 1);
    CHECK(second.dictionary.resolve("Acme Holdings") == 7);
    CHECK(second.dictionary.resolve("Omega") == 8);
    CHECK(second.dictionary.next_id() == 9);
    CHECK(second.conflicts.empty());

    // Entity Seven keeps its id even though q2 no longer introduces it first
    AcceptedMatchSet shrunk = make_batch("q2", {{"Omega", "Entity Eight"}});
    BuildResult third = builder.build(second.dictionary, {shrunk});
    CHECK(third.dictionary.entity(7) == nullptr);
    AcceptedMatchSet back = make_batch("q3", {{"Acme Holdings", "Entity Seven"}});
    BuildResult fourth = builder.build(third.dictionary, {back});
    CHECK(fourth.dictionary.resolve("Acme Holdings") == 7);
    CHECK(fourth.dictionary.next_id() == 9);
}

TEST_CASE("Blank rows are counted as invalid and repeats as duplicates", "[dictionary]") {
    AcceptedMatchSet batch = make_batch("q1", {{"Acme", "Entity One"},
                                               {"", "Entity One"},
                                               {"Acme Widgets", "  "},
                                               {"ACME INC", "Entity One"}});
    BuildResult result = DictionaryBuilder().build({batch});

    REQUIRE(result.statistics.batches.size() == 1);
    const BatchReplay& replay = result.statistics.batches[0].replay;
    CHECK(replay.rows == 4);
    CHECK(replay.invalid == 2);
    CHECK(replay.added == 1);
    CHECK(replay.duplicates == 1);
    CHECK(result.dictionary.alias_count() == 1);
    CHECK(result.dictionary.entity_count() == 1);
}

TEST_CASE("The entity name is not an alias by itself", "[dictionary]") {
    BuildResult result = DictionaryBuilder().build({make_batch("q1", {{"Acme", "Acme Holdings Group"}})});
    CHECK(result.dictionary.resolve("Acme Holdings Group") == kNoEntity);
    CHECK(result.dictionary.find_entity("ACME HOLDINGS GROUP INC") == 1);
    CHECK(result.dictionary.find_entity("Unknown") == kNoEntity);
    CHECK(result.dictionary.resolve("") == kNoEntity);
}

TEST_CASE("Batches need an id", "[dictionary]") {
    CHECK_THROWS_AS(DictionaryBuilder().build({make_batch("", {{"Acme", "Entity One"}})}), ConfigError);
}

TEST_CASE("has_batch reports the assertion log", "[dictionary]") {
    BuildResult result = DictionaryBuilder().build(quarterly_batches());
    CHECK(result.dictionary.has_batch("q1"));
    CHECK(result.dictionary.has_batch("q2"));
    CHECK_FALSE(result.dictionary.has_batch("q3"));
    CHECK(result.dictionary.log().size() == 2);
}

TEST_CASE("A large batch registers every entity once", "[dictionary]") {
    AcceptedMatchSet batch;
    batch.batch_id = "bulk";
    const std::size_t count = 60000;
    for (std::size_t i = 0; i < count; ++i) {
        std::string firm = "Firm " + std::to_string(i);
        batch.rows.push_back(AliasAssertion{firm, firm + " Holdings", i + 1});
    }

    BuildResult result = DictionaryBuilder().build({batch});
    CHECK(result.dictionary.entity_count() == count);
    CHECK(result.dictionary.alias_count() == count);
    CHECK(result.dictionary.entity_name(count) == "Firm 59999 Holdings");
    CHECK(result.dictionary.resolve("FIRM 31337") == 31338);
}
