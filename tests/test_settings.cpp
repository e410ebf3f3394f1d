#include <catch2/catch.hpp>

#include "firmlink/errors.h"
#include "firmlink/settings.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace firmlink;

namespace {

Settings parse(std::vector<std::string> args) {
    args.insert(args.begin(), "firmlink");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_arguments(static_cast<int>(argv.size()), argv.data());
}

std::string write_settings_file(const std::string& name, const std::string& xml) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << xml;
    return path.string();
}

const char* kSettingsXml = R"(<firmlink fuzzy_threshold="92" max_workers="2">
  <parameters>
    <item pid="strict" fuzzy="0" reject_floor="85"/>
    <item pid="loose" fuzzy_threshold="80" reject_floor="60" outfile="loose"/>
  </parameters>
  <batches>
    <batch id="q1" file="batches/q1.tsv"/>
    <batch file="batches/q2.tsv"/>
  </batches>
</firmlink>
)";

} // namespace

TEST_CASE("Command line arguments", "[settings]") {
    Settings settings = parse({"match", "extra", "--fuzzy_threshold=85", "--verbose", "--outfile=out/run"});

    CHECK(settings.command == "match");
    CHECK(settings.positional == std::vector<std::string>{"extra"});
    CHECK(settings.get("fuzzy_threshold") == "85");
    CHECK(settings.get_float("fuzzy_threshold", 90.0) == 85.0);
    CHECK(settings.verbose);
    CHECK_FALSE(settings.debug);
    CHECK(settings.outfile == "out/run");
    CHECK(settings.get("missing", "fallback") == "fallback");
}

TEST_CASE("--debug implies --verbose", "[settings]") {
    Settings settings = parse({"build", "--debug"});
    CHECK(settings.debug);
    CHECK(settings.verbose);
}

TEST_CASE("Batch lists keep their order", "[settings]") {
    Settings settings = parse({"build", "--batches=q1=a.tsv,dir/b.tsv", "--batch=q9=c.csv"});
    REQUIRE(settings.batches.size() == 3);
    CHECK(settings.batches[0].id == "q1");
    CHECK(settings.batches[0].path == "a.tsv");
    CHECK(settings.batches[1].id == "b");
    CHECK(settings.batches[1].path == "dir/b.tsv");
    CHECK(settings.batches[2].id == "q9");

    CHECK_THROWS_AS(parse_batch_source("=a.tsv"), ConfigError);
    CHECK_THROWS_AS(parse_batch_source("q1="), ConfigError);
}

TEST_CASE("Typed getters reject malformed values", "[settings]") {
    Settings settings = parse({"match", "--worker_count=four", "--fuzzy=maybe", "--reject_floor=7x"});
    CHECK_THROWS_AS(settings.get_int("worker_count", 0), ConfigError);
    CHECK_THROWS_AS(settings.get_bool("fuzzy", true), ConfigError);
    CHECK_THROWS_AS(settings.get_float("reject_floor", 80.0), ConfigError);
    CHECK(settings.get_int("absent", 7) == 7);
}

TEST_CASE("Option structs are filled and validated", "[settings]") {
    SECTION("match options") {
        Settings settings = parse({"match", "--fuzzy_threshold=95", "--reject_floor=85", "--strict_rules=no",
                                   "--review_all=yes"});
        MatchOptions options = match_options_from(settings);
        CHECK(options.fuzzy_threshold == 95.0);
        CHECK(options.reject_floor == 85.0);
        CHECK_FALSE(options.strict_rules);
        CHECK(options.review_all);
        CHECK(options.fuzzy);
    }
    SECTION("cut points out of order") {
        Settings settings = parse({"match", "--fuzzy_threshold=70", "--reject_floor=85"});
        CHECK_THROWS_AS(match_options_from(settings), ConfigError);
    }
    SECTION("executor options") {
        Settings settings = parse({"match", "--worker_count=3", "--max_workers=6", "--min_parallel_sources=0"});
        ExecutorOptions options = executor_options_from(settings);
        CHECK(options.worker_count == 3);
        CHECK(options.max_workers == 6);
        CHECK(options.min_parallel_sources == 0);
        CHECK_THROWS_AS(executor_options_from(parse({"match", "--max_workers=0"})), ConfigError);
        CHECK_THROWS_AS(executor_options_from(parse({"match", "--worker_count=-1"})), ConfigError);
    }
    SECTION("strata options") {
        StrataOptions options = strata_options_from(parse({"match", "--top_fraction=0.1", "--min_patents=3"}));
        CHECK(options.top_fraction == 0.1);
        CHECK(options.min_patents == 3);
        CHECK_THROWS_AS(strata_options_from(parse({"match", "--top_fraction=1.5"})), ConfigError);
    }
}

TEST_CASE("Settings files layer under the command line", "[settings]") {
    std::string path = write_settings_file("firmlink_test_settings.xml", kSettingsXml);

    SECTION("pid selects a parameter set") {
        Settings settings = load_settings(parse({"match", "--settings=" + path, "--pid=loose", "--reject_floor=70"}));
        CHECK(settings.get_float("fuzzy_threshold", 0) == 80.0);
        CHECK(settings.get_float("reject_floor", 0) == 70.0);
        CHECK(settings.get_int("max_workers", 0) == 2);
        CHECK(settings.outfile == "loose");
    }
    SECTION("without pid the first set is used") {
        Settings settings = load_settings(parse({"match", "--settings=" + path}));
        CHECK_FALSE(settings.get_bool("fuzzy", true));
        CHECK(settings.get_float("fuzzy_threshold", 0) == 92.0);
        CHECK(settings.get_float("reject_floor", 0) == 85.0);
    }
    SECTION("batches come from the file unless given on the command line") {
        Settings from_file = load_settings(parse({"build", "--settings=" + path}));
        REQUIRE(from_file.batches.size() == 2);
        CHECK(from_file.batches[0].id == "q1");
        CHECK(from_file.batches[1].id == "q2");
        CHECK(from_file.batches[1].path == "batches/q2.tsv");

        Settings from_cli = load_settings(parse({"build", "--settings=" + path, "--batch=q7=x.tsv"}));
        REQUIRE(from_cli.batches.size() == 1);
        CHECK(from_cli.batches[0].id == "q7");
    }
    SECTION("unknown pid") {
        CHECK_THROWS_AS(load_settings(parse({"match", "--settings=" + path, "--pid=nope"})), ConfigError);
    }

    std::filesystem::remove(path);
}

TEST_CASE("No settings file leaves the command line untouched", "[settings]") {
    Settings base = parse({"match", "--fuzzy_threshold=88"});
    Settings settings = load_settings(base);
    CHECK(settings.options == base.options);
    CHECK_THROWS_AS(load_settings(parse({"match", "--settings=/nonexistent/firmlink.xml"})), ConfigError);
}
