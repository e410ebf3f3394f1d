#include "firmlink/settings.h"
#include "firmlink/errors.h"

#include <pugixml.hpp>

#include <iostream>
#include <stdexcept>

namespace firmlink {

namespace {

[[noreturn]] void invalid_value(const std::string& key, const std::string& value) {
    throw ConfigError("invalid value for '" + key + "': '" + value + "'");
}

std::string file_stem(const std::string& path) {
    std::size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    std::size_t dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return name;
}

void add_batches(Settings& settings, const std::string& value) {
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t comma = value.find(',', start);
        std::string item = value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (!item.empty()) {
            settings.batches.push_back(parse_batch_source(item));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
}

void push_option(Settings& settings, const std::string& key, const std::string& value) {
    settings.options[key] = value;
    if (key == "pid") {
        settings.pid = value;
    } else if (key == "settings") {
        settings.settings_file = value;
    } else if (key == "outfile") {
        settings.outfile = value;
    } else if (key == "batch" || key == "batches") {
        add_batches(settings, value);
    } else if (key == "verbose") {
        settings.verbose = settings.get_bool("verbose", true);
    } else if (key == "debug") {
        settings.debug = settings.get_bool("debug", true);
        if (settings.debug) {
            settings.verbose = true;
        }
    }
}

} // namespace

std::string Settings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

int Settings::get_int(const std::string& key, int fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    try {
        std::size_t used = 0;
        int value = std::stoi(it->second, &used);
        if (used != it->second.size()) {
            invalid_value(key, it->second);
        }
        return value;
    } catch (const std::logic_error&) {
        invalid_value(key, it->second);
    }
}

double Settings::get_float(const std::string& key, double fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    try {
        std::size_t used = 0;
        double value = std::stod(it->second, &used);
        if (used != it->second.size()) {
            invalid_value(key, it->second);
        }
        return value;
    } catch (const std::logic_error&) {
        invalid_value(key, it->second);
    }
}

bool Settings::get_bool(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    const std::string& val = it->second;
    if (val == "1" || val == "true" || val == "TRUE" || val == "yes") {
        return true;
    }
    if (val == "0" || val == "false" || val == "FALSE" || val == "no") {
        return false;
    }
    invalid_value(key, val);
}

BatchSource parse_batch_source(const std::string& text) {
    BatchSource source;
    std::size_t eq = text.find('=');
    if (eq == std::string::npos) {
        source.path = text;
        source.id = file_stem(text);
    } else {
        source.id = text.substr(0, eq);
        source.path = text.substr(eq + 1);
    }
    if (source.id.empty() || source.path.empty()) {
        throw ConfigError("invalid batch '" + text + "' (expected id=path or path)");
    }
    return source;
}

Settings parse_arguments(int argc, char** argv) {
    Settings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            if (settings.command.empty()) {
                settings.command = arg;
            } else {
                settings.positional.push_back(arg);
            }
            continue;
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            push_option(settings, arg.substr(2), "1");
        } else {
            push_option(settings, arg.substr(2, eq - 2), arg.substr(eq + 1));
        }
    }
    return settings;
}

Settings load_settings(const Settings& base) {
    Settings combined = base;
    if (base.settings_file.empty()) {
        return combined;
    }

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_file(base.settings_file.c_str());
    if (!parsed) {
        throw ConfigError("Failed to load settings file: " + base.settings_file + " (" + parsed.description() + ")");
    }

    pugi::xml_node selected;
    for (const auto& node : doc.select_nodes("//firmlink/parameters/item")) {
        pugi::xml_node param = node.node();
        if (base.pid.empty() || std::string(param.attribute("pid").value()) == base.pid) {
            selected = param;
            break;
        }
    }
    if (!selected && !base.pid.empty()) {
        throw ConfigError("No parameter set '" + base.pid + "' in " + base.settings_file);
    }

    if (selected) {
        for (const auto& attr : selected.attributes()) {
            if (base.options.count(attr.name()) > 0) {
                continue;
            }
            push_option(combined, attr.name(), attr.value());
        }
    }
    pugi::xml_node root = doc.child("firmlink");
    for (const auto& attr : root.attributes()) {
        if (combined.options.count(attr.name()) > 0) {
            continue;
        }
        push_option(combined, attr.name(), attr.value());
    }

    // Batch order on the command line replaces the file's list
    if (base.batches.empty()) {
        for (const auto& batch : root.child("batches").children("batch")) {
            BatchSource source;
            source.path = batch.attribute("file").value();
            source.id = batch.attribute("id").as_string(file_stem(source.path).c_str());
            if (source.path.empty()) {
                throw ConfigError("batch without file attribute in " + base.settings_file);
            }
            combined.batches.push_back(source);
        }
    }

    if (combined.debug) {
        std::cerr << "[firmlink] settings from " << base.settings_file
                  << (selected ? " pid=" + std::string(selected.attribute("pid").value()) : std::string())
                  << ", " << combined.options.size() << " option(s)" << std::endl;
    }
    return combined;
}

MatchOptions match_options_from(const Settings& settings) {
    MatchOptions options;
    options.fuzzy_threshold = settings.get_float("fuzzy_threshold", options.fuzzy_threshold);
    options.reject_floor = settings.get_float("reject_floor", options.reject_floor);
    options.strict_rules = settings.get_bool("strict_rules", options.strict_rules);
    options.fuzzy = settings.get_bool("fuzzy", options.fuzzy);
    options.review_all = settings.get_bool("review_all", options.review_all);
    options.fuzzy_auto_accept = settings.get_bool("fuzzy_auto_accept", options.fuzzy_auto_accept);

    int acronym = settings.get_int("acronym_min_length", static_cast<int>(options.acronym_min_length));
    int containment = settings.get_int("containment_min_length", static_cast<int>(options.containment_min_length));
    if (acronym < 1 || containment < 1) {
        throw ConfigError("acronym_min_length and containment_min_length must be positive");
    }
    options.acronym_min_length = static_cast<std::size_t>(acronym);
    options.containment_min_length = static_cast<std::size_t>(containment);
    options.verbose = settings.verbose;
    options.debug = settings.debug;
    options.validate();
    return options;
}

ExecutorOptions executor_options_from(const Settings& settings) {
    ExecutorOptions options;
    int workers = settings.get_int("worker_count", static_cast<int>(options.worker_count));
    int max_workers = settings.get_int("max_workers", static_cast<int>(options.max_workers));
    int min_parallel = settings.get_int("min_parallel_sources", static_cast<int>(options.min_parallel_sources));
    if (workers < 0 || max_workers < 1 || min_parallel < 0) {
        throw ConfigError("worker_count and min_parallel_sources must be >= 0, max_workers >= 1");
    }
    options.worker_count = static_cast<unsigned>(workers);
    options.max_workers = static_cast<unsigned>(max_workers);
    options.min_parallel_sources = static_cast<std::size_t>(min_parallel);
    options.verbose = settings.verbose;
    options.validate();
    return options;
}

StrataOptions strata_options_from(const Settings& settings) {
    StrataOptions options;
    options.top_fraction = settings.get_float("top_fraction", options.top_fraction);
    options.min_patents = settings.get_int("min_patents", options.min_patents);
    options.top_review_threshold = settings.get_float("top_review_threshold", options.top_review_threshold);
    options.validate();
    return options;
}

} // namespace firmlink
