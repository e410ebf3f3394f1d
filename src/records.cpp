#include "firmlink/records.h"
#include "firmlink/errors.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace firmlink {

namespace {

// Whole numbers, also when written as "2019.0"
bool parse_count(const std::string& text, int& value) {
    std::size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return false;
    }
    try {
        std::size_t used = 0;
        double parsed = std::stod(text.substr(start), &used);
        if (used != text.size() - start || !std::isfinite(parsed) || parsed != std::floor(parsed) ||
            std::fabs(parsed) > std::numeric_limits<int>::max()) {
            return false;
        }
        value = static_cast<int>(parsed);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

std::string join(const std::vector<std::string>& values, const std::string& separator) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += value;
    }
    return joined;
}

template <typename Container>
std::string join_all(const Container& values, const std::string& separator) {
    return join(std::vector<std::string>(values.begin(), values.end()), separator);
}

} // namespace

std::string format_score(double score) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << score;
    std::string text = out.str();
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

std::vector<FactRecord> facts_from_table(const Table& table, const std::string& source,
                                         const std::string& name_column, const std::string& year_column) {
    table.require(source, {name_column, year_column});
    int name = table.column(name_column);
    int year = table.column(year_column);
    int declared = table.column("inventors");
    std::vector<int> listed;
    for (int i = 1; i <= kMaxListedInventors; ++i) {
        int column = table.column("inventor_name" + std::to_string(i));
        if (column >= 0) {
            listed.push_back(column);
        }
    }

    std::vector<FactRecord> facts;
    facts.reserve(table.rows.size());
    for (std::size_t row = 0; row < table.rows.size(); ++row) {
        FactRecord fact;
        fact.name = table.cell(row, name);
        fact.row = row + 1;
        if (!parse_count(table.cell(row, year), fact.year) || fact.year < 0) {
            fact.year = 0;
        }
        if (!parse_count(table.cell(row, declared), fact.declared_inventors) || fact.declared_inventors < 0) {
            fact.declared_inventors = 0;
        }
        for (int column : listed) {
            std::string inventor = table.cell(row, column);
            if (!inventor.empty()) {
                fact.inventors.push_back(inventor);
            }
        }
        facts.push_back(std::move(fact));
    }
    return facts;
}

std::vector<RawName> names_from_table(const Table& table, const std::string& source, const std::string& column) {
    table.require(source, {column});
    int index = table.column(column);
    std::vector<RawName> names;
    std::set<RawName> seen;
    for (std::size_t row = 0; row < table.rows.size(); ++row) {
        RawName name = table.cell(row, index);
        if (!name.empty() && seen.insert(name).second) {
            names.push_back(name);
        }
    }
    return names;
}

Table candidates_table(const std::vector<MatchCandidate>& candidates) {
    Table table;
    table.columns = {"source_name", "target_name", "tier", "rule", "score", "decision",
                     "source_key", "target_key", "stratum"};
    for (const auto& c : candidates) {
        table.rows.push_back({c.source, c.target, tier_name(c.tier), c.rule, format_score(c.score),
                              decision_name(c.decision), c.source_key, c.target_key, c.stratum});
    }
    return table;
}

AcceptedMatchSet accepted_from_table(const Table& table, const std::string& source, const std::string& batch_id) {
    table.require(source, {"source_name", "target_name"});
    int alias = table.column("source_name");
    int entity = table.column("target_name");
    int decision = table.column("decision");

    AcceptedMatchSet batch;
    batch.batch_id = batch_id;
    for (std::size_t row = 0; row < table.rows.size(); ++row) {
        MatchDecision parsed;
        if (decision >= 0 && parse_decision(table.cell(row, decision), parsed) && parsed == MatchDecision::Rejected) {
            continue;
        }
        batch.rows.push_back(AliasAssertion{table.cell(row, alias), table.cell(row, entity), row + 1});
    }
    return batch;
}

Table dictionary_table(const CanonicalDictionary& dictionary) {
    Table table;
    table.columns = {"alias_key", "alias", "entity_id", "entity_name", "batch"};
    for (const auto& [key, entry] : dictionary.aliases()) {
        table.rows.push_back({key, entry.alias, format_entity_id(entry.entity), dictionary.entity_name(entry.entity),
                              entry.batch});
    }
    return table;
}

Table entities_table(const CanonicalDictionary& dictionary) {
    Table table;
    table.columns = {"entity_id", "entity_name", "alias_count", "aliases", "batches"};
    for (const auto& [id, view] : dictionary.entities()) {
        table.rows.push_back({format_entity_id(id), view.name, std::to_string(view.alias_keys.size()),
                              join_all(view.raw_names, " | "), join(view.batches, ",")});
    }
    return table;
}

Table conflicts_table(const std::vector<ConflictRecord>& conflicts) {
    Table table;
    table.columns = {"alias_key", "alias", "previous_entity", "previous_name", "previous_batch",
                     "new_entity", "new_name", "new_batch", "resolution"};
    for (const auto& c : conflicts) {
        table.rows.push_back({c.alias_key, c.alias, format_entity_id(c.previous_entity), c.previous_name,
                              c.previous_batch, format_entity_id(c.new_entity), c.new_name, c.new_batch,
                              c.resolution});
    }
    return table;
}

Table build_statistics_table(const BuildStatistics& statistics) {
    Table table;
    table.columns = {"batch", "status", "rows", "invalid", "new", "duplicates", "conflicts"};
    for (const auto& batch : statistics.batches) {
        const BatchReplay& r = batch.replay;
        table.rows.push_back({r.batch, batch.status, std::to_string(r.rows), std::to_string(r.invalid),
                              std::to_string(r.added), std::to_string(r.duplicates), std::to_string(r.conflicts)});
    }
    table.rows.push_back({"(total)", "", "", "", std::to_string(statistics.total_aliases), "",
                          std::to_string(statistics.conflicts)});
    return table;
}

Table fact_issues_table(const std::vector<FactIssue>& issues) {
    Table table;
    table.columns = {"name", "key", "entity_id", "year", "row"};
    for (const auto& issue : issues) {
        table.rows.push_back({issue.name, issue.key,
                              issue.entity == kNoEntity ? std::string() : format_entity_id(issue.entity),
                              issue.year > 0 ? std::to_string(issue.year) : std::string(),
                              std::to_string(issue.row)});
    }
    return table;
}

Table aggregate_table(const std::vector<AggregateRow>& rows) {
    Table table;
    table.columns = {"entity_id", "entity_name", "year", "patent_count", "distinct_inventors", "inventor_sum", "aliases"};
    for (const auto& row : rows) {
        table.rows.push_back({format_entity_id(row.entity), row.entity_name, std::to_string(row.year),
                              std::to_string(row.patent_count), std::to_string(row.distinct_inventors),
                              std::to_string(row.inventor_sum), join(row.aliases, " | ")});
    }
    return table;
}

Table aggregate_wide_table(const std::vector<AggregateRow>& rows) {
    std::set<int> years;
    std::size_t max_aliases = 0;
    std::vector<EntityId> order;
    std::map<EntityId, std::vector<const AggregateRow*>> by_entity;
    for (const auto& row : rows) {
        years.insert(row.year);
        max_aliases = std::max(max_aliases, row.aliases.size());
        auto& group = by_entity[row.entity];
        if (group.empty()) {
            order.push_back(row.entity);
        }
        group.push_back(&row);
    }

    Table table;
    table.columns = {"entity_id", "acquiror_name"};
    for (int year : years) {
        table.columns.push_back("patent_" + std::to_string(year));
    }
    for (int year : years) {
        table.columns.push_back("patent_inventor_" + std::to_string(year));
    }
    for (std::size_t i = 0; i < max_aliases; ++i) {
        table.columns.push_back(i == 0 ? "patent_name" : "patent_name_" + std::to_string(i));
    }

    for (EntityId entity : order) {
        const auto& group = by_entity[entity];
        std::map<int, const AggregateRow*> by_year;
        for (const AggregateRow* row : group) {
            by_year[row->year] = row;
        }

        std::vector<std::string> values = {format_entity_id(entity), group.front()->entity_name};
        for (int year : years) {
            auto it = by_year.find(year);
            values.push_back(std::to_string(it == by_year.end() ? 0 : it->second->patent_count));
        }
        for (int year : years) {
            auto it = by_year.find(year);
            values.push_back(std::to_string(it == by_year.end() ? 0 : it->second->inventor_sum));
        }
        const auto& aliases = group.front()->aliases;
        for (std::size_t i = 0; i < max_aliases; ++i) {
            values.push_back(i < aliases.size() ? aliases[i] : std::string());
        }
        table.rows.push_back(std::move(values));
    }
    return table;
}

Table identifiers_table(const std::map<EntityId, EntityIdentifiers>& identifiers) {
    Table table;
    table.columns = {"entity_id", "entity_name", "reference_name", "gvkey", "cusip", "cik", "batch"};
    for (const auto& [id, entry] : identifiers) {
        table.rows.push_back({format_entity_id(id), entry.entity_name, entry.reference_name, entry.ids.gvkey,
                              entry.ids.cusip, entry.ids.cik, entry.batch});
    }
    return table;
}

std::map<EntityId, EntityIdentifiers> identifiers_from_table(const Table& table, const std::string& source) {
    table.require(source, {"entity_id", "gvkey", "cusip", "cik", "batch"});
    int id_column = table.column("entity_id");
    int name = table.column("entity_name");
    int reference = table.column("reference_name");
    int gvkey = table.column("gvkey");
    int cusip = table.column("cusip");
    int cik = table.column("cik");
    int batch = table.column("batch");

    std::map<EntityId, EntityIdentifiers> identifiers;
    for (std::size_t row = 0; row < table.rows.size(); ++row) {
        EntityId id = parse_entity_id(table.cell(row, id_column));
        if (id == kNoEntity) {
            throw std::runtime_error(source + ": row " + std::to_string(row + 1) + " has no valid entity_id");
        }
        EntityIdentifiers entry;
        entry.entity = id;
        entry.entity_name = table.cell(row, name);
        entry.reference_name = table.cell(row, reference);
        entry.ids = IdentifierSet{table.cell(row, gvkey), table.cell(row, cusip), table.cell(row, cik)};
        entry.batch = table.cell(row, batch);

        auto [it, inserted] = identifiers.emplace(id, entry);
        if (!inserted && it->second.ids != entry.ids) {
            throw IdentifierConflictError(format_entity_id(id), it->second.batch, describe(it->second.ids),
                                          entry.batch, describe(entry.ids));
        }
    }
    return identifiers;
}

Table unresolved_references_table(const std::vector<UnresolvedReference>& unresolved) {
    Table table;
    table.columns = {"batch", "row", "source_name", "reference_name", "reason"};
    for (const auto& item : unresolved) {
        table.rows.push_back({item.batch, std::to_string(item.row), item.source, item.reference_name, item.reason});
    }
    return table;
}

Table assignee_summary_table(const std::vector<AssigneeSummary>& summary) {
    Table table;
    table.columns = {"assignee", "patent_count", "inventor_sum"};
    for (const auto& entry : summary) {
        table.rows.push_back({entry.name, std::to_string(entry.patent_count), std::to_string(entry.inventor_sum)});
    }
    return table;
}

Table quality_table(const QualityReport& report) {
    Table table;
    table.columns = {"check", "source_name", "target_name", "score", "detail"};
    for (const auto& [source, targets] : report.one_to_many) {
        table.rows.push_back({"one-to-many", source, join(targets, " | "), "",
                              std::to_string(targets.size()) + " targets"});
    }
    for (const auto& c : report.low_scores) {
        table.rows.push_back({"low-score", c.source, c.target, format_score(c.score), tier_name(c.tier)});
    }
    for (const auto& c : report.short_keys) {
        table.rows.push_back({"short-key", c.source, c.target, format_score(c.score),
                              "'" + c.source_key + "' / '" + c.target_key + "'"});
    }
    for (const auto& [tier, count] : report.by_tier) {
        table.rows.push_back({"tier", "", "", "", tier + "=" + std::to_string(count)});
    }
    for (const auto& [decision, count] : report.by_decision) {
        table.rows.push_back({"decision", "", "", "", decision + "=" + std::to_string(count)});
    }
    return table;
}

} // namespace firmlink
