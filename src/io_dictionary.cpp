#include "firmlink/io_dictionary.h"
#include "firmlink/errors.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace firmlink {

namespace {

constexpr const char* kFormat = "firmlink-dictionary";
constexpr int kVersion = 1;

const nlohmann::json& require_array(const nlohmann::json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || !it->is_array()) {
        throw DictionaryFormatError(std::string("dictionary has no '") + name + "' array");
    }
    return *it;
}

std::string require_string(const nlohmann::json& node, const char* name) {
    auto it = node.find(name);
    if (it == node.end() || !it->is_string()) {
        throw DictionaryFormatError(std::string("dictionary entry without string '") + name + "'");
    }
    return it->get<std::string>();
}

EntityId require_entity(const nlohmann::json& node, const char* name) {
    EntityId id = parse_entity_id(require_string(node, name));
    if (id == kNoEntity) {
        throw DictionaryFormatError(std::string("dictionary entry with invalid entity id in '") + name + "'");
    }
    return id;
}

nlohmann::json to_json(const CanonicalDictionary& dictionary) {
    nlohmann::json root;
    root["format"] = kFormat;
    root["version"] = kVersion;
    root["next_id"] = dictionary.next_id();

    nlohmann::json entities = nlohmann::json::array();
    for (const auto& entry : dictionary.registry()) {
        entities.push_back({{"id", format_entity_id(entry.id)}, {"key", entry.key}, {"name", entry.name}});
    }
    root["entities"] = entities;

    nlohmann::json batches = nlohmann::json::array();
    for (const auto& batch : dictionary.log()) {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& row : batch.rows) {
            rows.push_back({{"alias", row.alias}, {"entity", row.entity}, {"row", row.row}});
        }
        batches.push_back({{"batch", batch.batch_id}, {"rows", rows}});
    }
    root["batches"] = batches;

    nlohmann::json aliases = nlohmann::json::array();
    for (const auto& [key, entry] : dictionary.aliases()) {
        aliases.push_back({{"key", key},
                           {"alias", entry.alias},
                           {"entity", format_entity_id(entry.entity)},
                           {"batch", entry.batch}});
    }
    root["aliases"] = aliases;
    return root;
}

CanonicalDictionary from_json(const nlohmann::json& root) {
    if (!root.is_object() || root.value("format", std::string{}) != kFormat) {
        throw DictionaryFormatError("not a firmlink dictionary");
    }
    if (root.value("version", 0) != kVersion) {
        throw DictionaryFormatError("unsupported dictionary version " + std::to_string(root.value("version", 0)));
    }
    auto next_it = root.find("next_id");
    if (next_it == root.end() || !next_it->is_number_unsigned()) {
        throw DictionaryFormatError("dictionary has no next_id");
    }

    std::vector<EntityRecord> registry;
    for (const auto& node : require_array(root, "entities")) {
        registry.push_back(EntityRecord{require_entity(node, "id"), require_string(node, "key"),
                                        require_string(node, "name")});
    }

    std::vector<AcceptedMatchSet> log;
    for (const auto& node : require_array(root, "batches")) {
        AcceptedMatchSet batch;
        batch.batch_id = require_string(node, "batch");
        for (const auto& row : require_array(node, "rows")) {
            batch.rows.push_back(AliasAssertion{require_string(row, "alias"), require_string(row, "entity"),
                                                row.value("row", std::size_t{0})});
        }
        log.push_back(std::move(batch));
    }

    std::map<CanonicalKey, AliasEntry> stored;
    for (const auto& node : require_array(root, "aliases")) {
        stored.emplace(require_string(node, "key"),
                       AliasEntry{require_entity(node, "entity"), require_string(node, "alias"),
                                  require_string(node, "batch")});
    }

    std::size_t registered = registry.size();
    CanonicalDictionary dictionary;
    dictionary.restore(std::move(registry), next_it->get<EntityId>(), std::move(log));

    if (dictionary.registry().size() != registered) {
        throw DictionaryFormatError("assertion log names entities missing from the registry");
    }
    if (stored.size() != dictionary.aliases().size()) {
        throw DictionaryFormatError("stored alias view has " + std::to_string(stored.size()) +
                                    " entries, replay gives " + std::to_string(dictionary.aliases().size()));
    }
    for (const auto& [key, entry] : dictionary.aliases()) {
        auto it = stored.find(key);
        if (it == stored.end() || it->second.entity != entry.entity || it->second.alias != entry.alias ||
            it->second.batch != entry.batch) {
            throw DictionaryFormatError("stored alias view disagrees with the log at '" + key + "'");
        }
    }
    return dictionary;
}

} // namespace

CanonicalDictionary parse_dictionary(const std::string& text) {
    try {
        return from_json(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        throw DictionaryFormatError(std::string("malformed dictionary: ") + e.what());
    }
}

CanonicalDictionary load_dictionary(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw DictionaryFormatError("Failed to open dictionary file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    try {
        return parse_dictionary(buffer.str());
    } catch (const DictionaryFormatError& e) {
        throw DictionaryFormatError(path + ": " + e.what());
    }
}

std::string dump_dictionary(const CanonicalDictionary& dictionary) {
    try {
        return to_json(dictionary).dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw DictionaryFormatError(std::string("cannot serialise dictionary: ") + e.what());
    }
}

void save_dictionary(const CanonicalDictionary& dictionary, const std::string& path) {
    // Serialise fully, then write a sibling and rename it over the target;
    // the previous file stays intact on any failure.
    std::string text = dump_dictionary(dictionary);
    std::string temporary = path + ".tmp";
    {
        std::ofstream output(temporary, std::ios::binary);
        if (!output) {
            throw std::runtime_error("Failed to open dictionary file for writing: " + temporary);
        }
        output << text << "\n";
        output.close();
        if (!output) {
            std::remove(temporary.c_str());
            throw std::runtime_error("Failed to write dictionary file: " + temporary);
        }
    }
    if (std::rename(temporary.c_str(), path.c_str()) != 0) {
        std::remove(temporary.c_str());
        throw std::runtime_error("Failed to replace dictionary file: " + path);
    }
}

} // namespace firmlink
