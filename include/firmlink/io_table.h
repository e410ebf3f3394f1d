#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace firmlink {

struct Table {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    // -1 when absent
    int column(const std::string& name) const;
    // Throws InputSchemaError naming source and every missing column
    void require(const std::string& source, const std::vector<std::string>& names) const;
    // Empty for a missing column or a short row
    std::string cell(std::size_t row, int column) const;
};

enum class TableFormat {
    Tsv,
    Csv
};

// CSV for a ".csv" extension, TSV otherwise
TableFormat table_format_for(const std::string& path);

// First line is the header. CSV follows RFC 4180 quoting; TSV fields are
// taken verbatim. A leading UTF-8 byte order mark and blank lines are ignored.
// A field that is not well-formed UTF-8 throws, naming record and field.
Table parse_table(const std::string& text, TableFormat format);
Table load_table(const std::string& path);

std::string dump_table(const Table& table, TableFormat format);
void save_table(const Table& table, const std::string& path);

} // namespace firmlink
