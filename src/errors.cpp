#include "firmlink/errors.h"

#include <sstream>

namespace firmlink {

namespace {

std::string schema_message(const std::string& source, const std::vector<std::string>& missing) {
    std::ostringstream out;
    out << source << ": missing required column";
    if (missing.size() > 1) {
        out << "s";
    }
    for (std::size_t i = 0; i < missing.size(); ++i) {
        out << (i == 0 ? " " : ", ") << "'" << missing[i] << "'";
    }
    return out.str();
}

} // namespace

InputSchemaError::InputSchemaError(const std::string& source, const std::vector<std::string>& missing)
    : std::runtime_error(schema_message(source, missing)), source_(source), missing_(missing) {}

IdentifierConflictError::IdentifierConflictError(const std::string& entity,
                                                 const std::string& existing_batch,
                                                 const std::string& existing_ids,
                                                 const std::string& new_batch,
                                                 const std::string& new_ids)
    : std::runtime_error("identifier conflict for " + entity + ": batch '" + existing_batch +
                         "' assigned [" + existing_ids + "], batch '" + new_batch +
                         "' assigns [" + new_ids + "]"),
      entity_(entity),
      existing_batch_(existing_batch),
      new_batch_(new_batch) {}

WorkerExecutionError::WorkerExecutionError(std::size_t chunk, const std::string& first_source,
                                           const std::string& last_source, const std::string& cause)
    : std::runtime_error("fuzzy scoring chunk " + std::to_string(chunk) + " failed after retry (sources '" +
                         first_source + "' .. '" + last_source + "'): " + cause),
      chunk_(chunk),
      first_source_(first_source),
      last_source_(last_source) {}

} // namespace firmlink
