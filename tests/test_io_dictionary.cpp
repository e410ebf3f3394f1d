#include <catch2/catch.hpp>

#include "firmlink/dictionary.h"
#include "firmlink/errors.h"
#include "firmlink/io_dictionary.h"

#include <filesystem>
#include <stdexcept>
#include <string>

using namespace firmlink;

namespace {

CanonicalDictionary sample_dictionary() {
    AcceptedMatchSet q1;
    q1.batch_id = "q1";
    q1.rows = {{"Acme", "Acme Holdings", 1}, {"Acme Widgets", "Acme Holdings", 2}, {"Beta Labs", "Beta", 3}};
    AcceptedMatchSet q2;
    q2.batch_id = "q2";
    q2.rows = {{"Beta Labs", "Acme Holdings", 1}};
    return DictionaryBuilder().build({q1, q2}).dictionary;
}

const char* kValidJson = R"({
  "format": "firmlink-dictionary",
  "version": 1,
  "next_id": 3,
  "entities": [
    {"id": "E1", "key": "acme holdings", "name": "Acme Holdings"},
    {"id": "E2", "key": "beta", "name": "Beta"}
  ],
  "batches": [
    {"batch": "q1", "rows": [
      {"alias": "Acme", "entity": "Acme Holdings", "row": 1},
      {"alias": "Beta Labs", "entity": "Beta", "row": 2}
    ]}
  ],
  "aliases": [
    {"key": "acme", "alias": "Acme", "entity": "E1", "batch": "q1"},
    {"key": "beta labs", "alias": "Beta Labs", "entity": "E2", "batch": "q1"}
  ]
})";

} // namespace

TEST_CASE("A dumped dictionary parses back to the same state", "[io][dictionary]") {
    CanonicalDictionary original = sample_dictionary();
    std::string text = dump_dictionary(original);
    CanonicalDictionary restored = parse_dictionary(text);

    CHECK(dump_dictionary(restored) == text);
    CHECK(restored.resolve("Beta Labs") == original.resolve("Beta Labs"));
    CHECK(restored.next_id() == original.next_id());
    CHECK(restored.conflicts().size() == 1);
}

TEST_CASE("Dictionaries survive a trip through a file", "[io][dictionary]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "firmlink_test_dictionary.json";

    CanonicalDictionary original = sample_dictionary();
    save_dictionary(original, path.string());
    CanonicalDictionary loaded = load_dictionary(path.string());
    fs::remove(path);

    CHECK(loaded.alias_count() == original.alias_count());
    CHECK(loaded.entity_count() == original.entity_count());
    CHECK(loaded.resolve("ACME WIDGETS INC") == original.resolve("Acme Widgets"));
}

TEST_CASE("A hand-written dictionary loads", "[io][dictionary]") {
    CanonicalDictionary dictionary = parse_dictionary(kValidJson);
    CHECK(dictionary.resolve("Acme Corp") == 1);
    CHECK(dictionary.resolve("Beta Labs") == 2);
    CHECK(dictionary.entity_name(2) == "Beta");
}

TEST_CASE("Inconsistent or malformed dictionaries are rejected", "[io][dictionary]") {
    SECTION("alias view edited by hand") {
        std::string text = kValidJson;
        auto at = text.find(R"("entity": "E2", "batch")");
        REQUIRE(at != std::string::npos);
        text.replace(at, 14, R"("entity": "E1")");
        CHECK_THROWS_AS(parse_dictionary(text), DictionaryFormatError);
    }
    SECTION("alias view missing an entry") {
        std::string text = kValidJson;
        auto begin = text.find(R"(,
    {"key": "beta labs")");
        auto end = text.find("}", begin + 2);
        REQUIRE(begin != std::string::npos);
        text.erase(begin, end - begin + 1);
        CHECK_THROWS_AS(parse_dictionary(text), DictionaryFormatError);
    }
    SECTION("next_id would reuse an id") {
        std::string text = kValidJson;
        auto at = text.find(R"("next_id": 3)");
        text.replace(at, 12, R"("next_id": 2)");
        CHECK_THROWS_AS(parse_dictionary(text), DictionaryFormatError);
    }
    SECTION("log names an entity the registry lacks") {
        std::string text = kValidJson;
        auto at = text.find(R"("entity": "Beta", "row")");
        text.replace(at, 16, R"("entity": "Gamma")");
        CHECK_THROWS_AS(parse_dictionary(text), DictionaryFormatError);
    }
    SECTION("not JSON") {
        CHECK_THROWS_AS(parse_dictionary("{ not json"), DictionaryFormatError);
    }
    SECTION("wrong format tag") {
        CHECK_THROWS_AS(parse_dictionary(R"({"format": "something-else", "version": 1})"), DictionaryFormatError);
    }
    SECTION("wrong field type") {
        CHECK_THROWS_AS(parse_dictionary(R"({"format": "firmlink-dictionary", "version": 1, "next_id": "3",
                                             "entities": [], "batches": [], "aliases": []})"),
                        DictionaryFormatError);
    }
}

TEST_CASE("Loading a missing file fails with a format error", "[io][dictionary]") {
    CHECK_THROWS_AS(load_dictionary("/nonexistent/firmlink/dictionary.json"), DictionaryFormatError);
}

TEST_CASE("A failed save leaves the existing dictionary in place", "[io][dictionary]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "firmlink_test_dictionary_keep.json";
    save_dictionary(sample_dictionary(), path.string());
    std::string before = dump_dictionary(load_dictionary(path.string()));

    AcceptedMatchSet latin1;
    latin1.batch_id = "q3";
    latin1.rows = {{"Nestl\xE9 SA", "Nestle", 1}};
    CanonicalDictionary broken = DictionaryBuilder().build({latin1}).dictionary;

    CHECK_THROWS_AS(dump_dictionary(broken), DictionaryFormatError);
    CHECK_THROWS_AS(save_dictionary(broken, path.string()), DictionaryFormatError);
    CHECK_FALSE(fs::exists(path.string() + ".tmp"));

    CanonicalDictionary survivor = load_dictionary(path.string());
    fs::remove(path);
    CHECK(dump_dictionary(survivor) == before);
    CHECK(survivor.resolve("Acme Widgets") == 1);
}

TEST_CASE("Saving over a dictionary replaces it", "[io][dictionary]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "firmlink_test_dictionary_replace.json";
    save_dictionary(parse_dictionary(kValidJson), path.string());
    save_dictionary(sample_dictionary(), path.string());

    CanonicalDictionary loaded = load_dictionary(path.string());
    CHECK_FALSE(fs::exists(path.string() + ".tmp"));
    fs::remove(path);
    CHECK(dump_dictionary(loaded) == dump_dictionary(sample_dictionary()));
}

TEST_CASE("Saving to an unwritable path fails", "[io][dictionary]") {
    CHECK_THROWS_AS(save_dictionary(sample_dictionary(), "/nonexistent/firmlink/dictionary.json"), std::runtime_error);
}
