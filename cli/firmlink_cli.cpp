#include "firmlink/aggregator.h"
#include "firmlink/dictionary.h"
#include "firmlink/errors.h"
#include "firmlink/io_dictionary.h"
#include "firmlink/io_table.h"
#include "firmlink/matcher.h"
#include "firmlink/normalizer.h"
#include "firmlink/quality.h"
#include "firmlink/records.h"
#include "firmlink/reference.h"
#include "firmlink/settings.h"
#include "firmlink/strata.h"

#include <fstream>
#include <iostream>
#include <map>

using namespace firmlink;

namespace {

void print_usage() {
    std::cerr << "Usage: firmlink <command> [--key=value ...]\n"
              << "Commands:\n"
              << "  normalize  --input=FILE --column=NAME | NAME...\n"
              << "  match      --sources=FILE --source_column=NAME --targets=FILE --target_column=NAME [--stratify]\n"
              << "  build      --batch=[ID=]FILE ... [--dictionary=FILE]\n"
              << "  aggregate  --dictionary=FILE --facts=FILE\n"
              << "  refmatch   --dictionary=FILE --reference=FILE\n"
              << "  refmerge   --dictionary=FILE --reference=FILE --batch=[ID=]FILE ... [--existing=FILE]\n"
              << "Common: --settings=FILE --pid=ID --outfile=PREFIX --format=tsv|csv --verbose --debug"
              << std::endl;
}

std::string require_option(const Settings& settings, const std::string& key) {
    std::string value = settings.get(key);
    if (value.empty()) {
        throw ConfigError("--" + key + " option is required for '" + settings.command + "'");
    }
    return value;
}

std::string output_path(const Settings& settings, const std::string& fallback, const std::string& part) {
    std::string prefix = settings.outfile.empty() ? fallback : settings.outfile;
    std::string ext = settings.get("format", "tsv") == "csv" ? ".csv" : ".tsv";
    return prefix + "_" + part + ext;
}

void write_table(const Settings& settings, const Table& table, const std::string& path) {
    save_table(table, path);
    if (settings.verbose) {
        std::cerr << "[firmlink] wrote " << table.rows.size() << " row(s) to " << path << std::endl;
    }
}

bool file_exists(const std::string& path) {
    std::ifstream probe(path);
    return static_cast<bool>(probe);
}

std::vector<AcceptedMatchSet> load_batches(const Settings& settings) {
    if (settings.batches.empty()) {
        throw ConfigError("no batches given (--batch=[ID=]FILE or <batches> in the settings file)");
    }
    std::vector<AcceptedMatchSet> batches;
    for (const auto& source : settings.batches) {
        batches.push_back(accepted_from_table(load_table(source.path), source.path, source.id));
    }
    return batches;
}

int run_normalize(const Settings& settings) {
    NameNormalizer normalizer;
    if (!settings.positional.empty()) {
        for (const auto& name : settings.positional) {
            std::cout << normalizer.normalize(name) << "\n";
        }
        return 0;
    }

    std::string input = require_option(settings, "input");
    std::string column = settings.get("column", "name");
    Table table = load_table(input);
    table.require(input, {column});
    int index = table.column(column);

    Table keys;
    keys.columns = {column, "key"};
    for (std::size_t row = 0; row < table.rows.size(); ++row) {
        std::string raw = table.cell(row, index);
        keys.rows.push_back({raw, normalizer.normalize(raw)});
    }
    if (settings.outfile.empty()) {
        std::cout << dump_table(keys, TableFormat::Tsv);
    } else {
        write_table(settings, keys, settings.outfile);
    }
    return 0;
}

int run_match(const Settings& settings) {
    std::string sources_file = require_option(settings, "sources");
    std::string targets_file = require_option(settings, "targets");
    std::string source_column = settings.get("source_column", "assignee");
    std::string target_column = settings.get("target_column", "acquiror_name");

    Table sources_table = load_table(sources_file);
    std::vector<RawName> targets = names_from_table(load_table(targets_file), targets_file, target_column);
    MatchOptions options = match_options_from(settings);
    ExecutorOptions executor = executor_options_from(settings);

    MatchResult result;
    if (settings.get_bool("stratify", false)) {
        std::vector<FactRecord> facts = facts_from_table(sources_table, sources_file, source_column,
                                                         settings.get("year_column", "application_year"));
        std::vector<AssigneeSummary> summary = summarize_assignees(facts);
        write_table(settings, assignee_summary_table(summary), output_path(settings, "match", "summary"));
        result = match_strata(stratify(summary, options, strata_options_from(settings)), targets, executor);
    } else {
        std::vector<RawName> sources = names_from_table(sources_table, sources_file, source_column);
        result = TieredMatcher(options, executor).match(sources, targets);
    }

    write_table(settings, candidates_table(result.auto_accepted()), output_path(settings, "match", "auto"));
    write_table(settings, candidates_table(result.needs_review()), output_path(settings, "match", "review"));

    Table unmatched;
    unmatched.columns = {"source_name"};
    for (const auto& name : result.unmatched) {
        unmatched.rows.push_back({name});
    }
    write_table(settings, unmatched, output_path(settings, "match", "unmatched"));
    write_table(settings, quality_table(assess_matches(result.candidates)), output_path(settings, "match", "quality"));

    const MatchStats& stats = result.stats;
    std::cout << stats.sources << " sources: " << stats.exact << " exact, " << stats.strict_rule << " strict-rule, "
              << stats.fuzzy << " fuzzy (" << stats.auto_accepted << " auto-accepted, " << stats.needs_review
              << " for review), " << stats.unmatched << " unmatched" << std::endl;
    return 0;
}

int run_build(const Settings& settings) {
    std::string dictionary_file = settings.get("dictionary", "dictionary.json");
    std::vector<AcceptedMatchSet> batches = load_batches(settings);

    DictionaryBuilder builder(settings.verbose, static_cast<std::size_t>(settings.get_int("top_entities", 10)));
    BuildResult result = file_exists(dictionary_file)
        ? builder.build(load_dictionary(dictionary_file), batches)
        : builder.build(batches);

    std::string target = settings.get("save", dictionary_file);
    save_dictionary(result.dictionary, target);
    write_table(settings, dictionary_table(result.dictionary), output_path(settings, "dictionary", "aliases"));
    write_table(settings, entities_table(result.dictionary), output_path(settings, "dictionary", "entities"));
    write_table(settings, conflicts_table(result.conflicts), output_path(settings, "dictionary", "conflicts"));
    write_table(settings, build_statistics_table(result.statistics), output_path(settings, "dictionary", "statistics"));

    const BuildStatistics& stats = result.statistics;
    std::cout << stats.total_aliases << " aliases, " << stats.total_entities << " entities, " << stats.conflicts
              << " conflict(s) (" << stats.new_conflicts << " new) -> " << target << std::endl;
    if (settings.verbose) {
        for (const auto& [id, count] : stats.top_entities) {
            std::cerr << "[firmlink]   " << format_entity_id(id) << " " << result.dictionary.entity_name(id)
                      << ": " << count << " alias(es)" << std::endl;
        }
    }
    return 0;
}

int run_aggregate(const Settings& settings) {
    CanonicalDictionary dictionary = load_dictionary(require_option(settings, "dictionary"));
    std::string facts_file = require_option(settings, "facts");
    std::vector<FactRecord> facts = facts_from_table(load_table(facts_file), facts_file,
                                                     settings.get("name_column", "assignee"),
                                                     settings.get("year_column", "application_year"));

    AggregationResult result = Aggregator(settings.verbose).aggregate(dictionary, facts);
    write_table(settings, aggregate_wide_table(result.rows), output_path(settings, "aggregate", "wide"));
    write_table(settings, aggregate_table(result.rows), output_path(settings, "aggregate", "long"));
    write_table(settings, fact_issues_table(result.unmatched), output_path(settings, "aggregate", "unmatched"));
    write_table(settings, fact_issues_table(result.undated), output_path(settings, "aggregate", "undated"));

    const AggregationStats& stats = result.stats;
    std::cout << stats.resolved << " of " << stats.total << " facts aggregated for " << stats.entities
              << " entities, " << stats.unmatched << " unmatched, " << stats.undated << " undated" << std::endl;
    return 0;
}

int run_refmatch(const Settings& settings) {
    CanonicalDictionary dictionary = load_dictionary(require_option(settings, "dictionary"));
    std::string reference_file = require_option(settings, "reference");
    std::vector<RawName> names = project_reference_names(load_table(reference_file), reference_file,
                                                         settings.get("reference_column", "conm"));

    ReferenceMatcher matcher(match_options_from(settings), executor_options_from(settings));
    MatchResult result = matcher.match(dictionary, names);
    write_table(settings, candidates_table(result.candidates), output_path(settings, "reference", "review"));

    std::cout << result.candidates.size() << " of " << dictionary.entity_count()
              << " entities have a reference candidate (" << result.stats.needs_review << " for review)" << std::endl;
    return 0;
}

int run_refmerge(const Settings& settings) {
    CanonicalDictionary dictionary = load_dictionary(require_option(settings, "dictionary"));
    std::string reference_file = require_option(settings, "reference");
    std::vector<ReferenceRecord> reference = reference_records(load_table(reference_file), reference_file,
                                                               settings.get("reference_column", "conm"));
    std::vector<AcceptedMatchSet> batches = load_batches(settings);

    std::map<EntityId, EntityIdentifiers> existing;
    std::string existing_file = settings.get("existing");
    if (!existing_file.empty() && file_exists(existing_file)) {
        existing = identifiers_from_table(load_table(existing_file), existing_file);
    }

    IdentifierMergeResult result = IdentifierMerger(settings.verbose).merge(dictionary, reference, batches, existing);
    write_table(settings, identifiers_table(result.identifiers), output_path(settings, "reference", "identifiers"));
    write_table(settings, unresolved_references_table(result.unresolved), output_path(settings, "reference", "unresolved"));

    std::cout << result.identifiers.size() << " entities with identifiers (" << result.assigned << " new, "
              << result.unchanged << " unchanged), " << result.unresolved.size() << " unresolved row(s)" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        Settings settings = load_settings(cli_settings);

        if (settings.command == "normalize") {
            return run_normalize(settings);
        }
        if (settings.command == "match") {
            return run_match(settings);
        }
        if (settings.command == "build") {
            return run_build(settings);
        }
        if (settings.command == "aggregate") {
            return run_aggregate(settings);
        }
        if (settings.command == "refmatch") {
            return run_refmatch(settings);
        }
        if (settings.command == "refmerge") {
            return run_refmerge(settings);
        }

        print_usage();
        return settings.command.empty() || settings.command == "help" ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
