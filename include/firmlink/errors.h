#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace firmlink {

// A required column is missing from an input table.
class InputSchemaError : public std::runtime_error {
public:
    InputSchemaError(const std::string& source, const std::vector<std::string>& missing);

    const std::string& source() const { return source_; }
    const std::vector<std::string>& missing_columns() const { return missing_; }

private:
    std::string source_;
    std::vector<std::string> missing_;
};

// An entity would receive two different reference identifier sets.
class IdentifierConflictError : public std::runtime_error {
public:
    IdentifierConflictError(const std::string& entity, const std::string& existing_batch,
                            const std::string& existing_ids, const std::string& new_batch,
                            const std::string& new_ids);

    const std::string& entity() const { return entity_; }
    const std::string& existing_batch() const { return existing_batch_; }
    const std::string& new_batch() const { return new_batch_; }

private:
    std::string entity_;
    std::string existing_batch_;
    std::string new_batch_;
};

// A fuzzy-scoring chunk failed in its worker and again on sequential retry.
class WorkerExecutionError : public std::runtime_error {
public:
    WorkerExecutionError(std::size_t chunk, const std::string& first_source,
                         const std::string& last_source, const std::string& cause);

    std::size_t chunk() const { return chunk_; }
    const std::string& first_source() const { return first_source_; }
    const std::string& last_source() const { return last_source_; }

private:
    std::size_t chunk_;
    std::string first_source_;
    std::string last_source_;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DictionaryFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace firmlink
