#pragma once

#include "executor.h"
#include "matcher.h"
#include "strata.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace firmlink {

// One reviewed batch file; the id defaults to the file's stem.
struct BatchSource {
    std::string id;
    std::string path;
};

struct Settings {
    std::unordered_map<std::string, std::string> options;
    std::string command;                  // first positional argument
    std::vector<std::string> positional;  // remaining positional arguments
    std::string pid;
    std::string settings_file;
    std::string outfile;
    std::vector<BatchSource> batches;     // application order
    bool verbose = false;
    bool debug = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    int get_int(const std::string& key, int fallback) const;
    double get_float(const std::string& key, double fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;
};

// --key=value and --flag arguments; the first bare argument is the command.
Settings parse_arguments(int argc, char** argv);

// Layers the parameter set selected by pid (or the first one) from the XML
// settings file under base. Values already present in base win.
Settings load_settings(const Settings& base);

// Parses "id=path" or "path" (id = file stem).
BatchSource parse_batch_source(const std::string& text);

MatchOptions match_options_from(const Settings& settings);
ExecutorOptions executor_options_from(const Settings& settings);
StrataOptions strata_options_from(const Settings& settings);

} // namespace firmlink
