#include "firmlink/aggregator.h"
#include "firmlink/dictionary.h"
#include "firmlink/io_dictionary.h"
#include "firmlink/matcher.h"
#include "firmlink/normalizer.h"
#include "firmlink/settings.h"
#include "firmlink/unicode_utils.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {
using firmlink::unicode::sanitize_utf8;
}

using firmlink::AcceptedMatchSet;
using firmlink::Aggregator;
using firmlink::AliasAssertion;
using firmlink::CanonicalDictionary;
using firmlink::DictionaryBuilder;
using firmlink::EntityId;
using firmlink::FactRecord;
using firmlink::MatchCandidate;
using firmlink::MatchResult;
using firmlink::Settings;
using firmlink::TieredMatcher;

namespace {

std::string to_string_any(const py::handle& value) {
    if (value.is_none()) {
        return "";
    }
    if (py::isinstance<py::bool_>(value)) {
        return py::cast<bool>(value) ? "1" : "0";
    }
    return py::cast<std::string>(py::str(value));
}

Settings settings_from_py(const py::dict& options) {
    Settings settings;
    for (const auto& item : options) {
        auto key = py::cast<std::string>(item.first);
        std::string value = to_string_any(item.second);
        settings.options[key] = value;
        if (key == "verbose") {
            settings.verbose = settings.get_bool(key, false);
        } else if (key == "debug") {
            settings.debug = settings.get_bool(key, false);
        }
    }
    return settings;
}

py::dict candidate_to_py(const MatchCandidate& c) {
    py::dict out;
    out["source"] = sanitize_utf8(c.source);
    out["target"] = sanitize_utf8(c.target);
    out["source_key"] = c.source_key;
    out["target_key"] = c.target_key;
    out["tier"] = firmlink::tier_name(c.tier);
    out["rule"] = c.rule;
    out["score"] = c.score;
    out["decision"] = firmlink::decision_name(c.decision);
    out["stratum"] = c.stratum;
    return out;
}

py::dict match_result_to_py(const MatchResult& result) {
    py::list candidates;
    for (const auto& c : result.candidates) {
        candidates.append(candidate_to_py(c));
    }
    py::dict stats;
    stats["sources"] = result.stats.sources;
    stats["skipped_empty"] = result.stats.skipped_empty;
    stats["exact"] = result.stats.exact;
    stats["strict_rule"] = result.stats.strict_rule;
    stats["fuzzy"] = result.stats.fuzzy;
    stats["auto_accepted"] = result.stats.auto_accepted;
    stats["needs_review"] = result.stats.needs_review;
    stats["rejected"] = result.stats.rejected;
    stats["unmatched"] = result.stats.unmatched;
    stats["workers"] = result.executor.workers;

    py::dict out;
    out["candidates"] = candidates;
    out["unmatched"] = result.unmatched;
    out["stats"] = stats;
    return out;
}

py::dict match_py(const std::vector<std::string>& sources, const std::vector<std::string>& targets,
                  const py::dict& options) {
    Settings settings = settings_from_py(options);
    TieredMatcher matcher(firmlink::match_options_from(settings), firmlink::executor_options_from(settings));
    MatchResult result;
    {
        py::gil_scoped_release release;
        result = matcher.match(sources, targets);
    }
    return match_result_to_py(result);
}

// Batches as (batch_id, [(alias, entity), ...])
std::vector<AcceptedMatchSet> batches_from_py(const py::list& batches) {
    std::vector<AcceptedMatchSet> converted;
    for (const auto& item : batches) {
        auto batch = py::cast<py::tuple>(item);
        if (batch.size() != 2) {
            throw std::runtime_error("batch must be a (batch_id, rows) tuple");
        }
        AcceptedMatchSet set;
        set.batch_id = py::cast<std::string>(batch[0]);
        std::size_t row = 0;
        for (const auto& pair : py::cast<py::list>(batch[1])) {
            auto assertion = py::cast<std::pair<std::string, std::string>>(pair);
            set.rows.push_back(AliasAssertion{assertion.first, assertion.second, ++row});
        }
        converted.push_back(std::move(set));
    }
    return converted;
}

class FirmlinkDictionary {
public:
    FirmlinkDictionary() = default;
    explicit FirmlinkDictionary(const std::string& path) : dictionary_(firmlink::load_dictionary(path)) {}

    py::dict apply(const py::list& batches, bool verbose) {
        firmlink::BuildResult result = DictionaryBuilder(verbose).build(dictionary_, batches_from_py(batches));
        dictionary_ = std::move(result.dictionary);

        py::list conflicts;
        for (const auto& c : result.conflicts) {
            py::dict entry;
            entry["alias"] = c.alias;
            entry["alias_key"] = c.alias_key;
            entry["previous_entity"] = firmlink::format_entity_id(c.previous_entity);
            entry["previous_batch"] = c.previous_batch;
            entry["new_entity"] = firmlink::format_entity_id(c.new_entity);
            entry["new_batch"] = c.new_batch;
            conflicts.append(entry);
        }
        py::dict out;
        out["conflicts"] = conflicts;
        out["new_conflicts"] = result.statistics.new_conflicts;
        out["aliases"] = result.statistics.total_aliases;
        out["entities"] = result.statistics.total_entities;
        return out;
    }

    py::object resolve(const std::string& name) const {
        EntityId id = dictionary_.resolve(name);
        if (id == firmlink::kNoEntity) {
            return py::none();
        }
        return py::str(firmlink::format_entity_id(id));
    }

    std::string entity_name(const std::string& entity) const {
        return dictionary_.entity_name(firmlink::parse_entity_id(entity));
    }

    void save(const std::string& path) const { firmlink::save_dictionary(dictionary_, path); }
    std::string dump() const { return firmlink::dump_dictionary(dictionary_); }
    std::size_t alias_count() const { return dictionary_.alias_count(); }
    std::size_t entity_count() const { return dictionary_.entity_count(); }

    const CanonicalDictionary& dictionary() const { return dictionary_; }

private:
    CanonicalDictionary dictionary_;
};

// Facts as dicts with "name", "year" and optional "inventors" (count) and
// "inventor_names" (list)
py::dict aggregate_py(const FirmlinkDictionary& dictionary, const py::list& facts) {
    std::vector<FactRecord> records;
    std::size_t row = 0;
    for (const auto& item : facts) {
        auto fact = py::cast<py::dict>(item);
        FactRecord record;
        record.name = to_string_any(fact.attr("get")("name"));
        record.year = py::cast<int>(fact.attr("get")("year", 0));
        record.declared_inventors = py::cast<int>(fact.attr("get")("inventors", 0));
        if (auto names = fact.attr("get")("inventor_names"); !names.is_none()) {
            record.inventors = py::cast<std::vector<std::string>>(names);
        }
        record.row = ++row;
        records.push_back(std::move(record));
    }

    firmlink::AggregationResult result = Aggregator().aggregate(dictionary.dictionary(), records);

    py::list rows;
    for (const auto& r : result.rows) {
        py::dict entry;
        entry["entity"] = firmlink::format_entity_id(r.entity);
        entry["entity_name"] = sanitize_utf8(r.entity_name);
        entry["year"] = r.year;
        entry["patent_count"] = r.patent_count;
        entry["distinct_inventors"] = r.distinct_inventors;
        entry["inventor_sum"] = r.inventor_sum;
        entry["aliases"] = r.aliases;
        rows.append(entry);
    }
    py::list unmatched;
    for (const auto& issue : result.unmatched) {
        unmatched.append(py::make_tuple(issue.name, issue.year, issue.row));
    }
    py::dict out;
    out["rows"] = rows;
    out["unmatched"] = unmatched;
    out["undated"] = result.undated.size();
    return out;
}

} // namespace

PYBIND11_MODULE(firmlink_py, m) {
    m.doc() = "Python bindings for the firmlink company-name resolver";

    m.def("normalize", &firmlink::normalize, py::arg("name"), "Normalize a raw company name to its comparison key");

    m.def("match", &match_py, py::arg("sources"), py::arg("targets"), py::arg("options") = py::dict(),
          "Tiered exact / strict-rule / fuzzy match of source names against target names");

    py::class_<FirmlinkDictionary>(m, "Dictionary")
        .def(py::init<>())
        .def(py::init<const std::string&>(), py::arg("path"))
        .def("apply", &FirmlinkDictionary::apply, py::arg("batches"), py::arg("verbose") = false,
             "Apply accepted batches [(batch_id, [(alias, entity), ...]), ...] in order")
        .def("resolve", &FirmlinkDictionary::resolve, py::arg("name"))
        .def("entity_name", &FirmlinkDictionary::entity_name, py::arg("entity"))
        .def("save", &FirmlinkDictionary::save, py::arg("path"))
        .def("dump", &FirmlinkDictionary::dump)
        .def_property_readonly("alias_count", &FirmlinkDictionary::alias_count)
        .def_property_readonly("entity_count", &FirmlinkDictionary::entity_count);

    m.def("aggregate", &aggregate_py, py::arg("dictionary"), py::arg("facts"),
          "Aggregate fact dicts per entity and year through a dictionary");
}
