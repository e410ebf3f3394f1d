#include "firmlink/io_table.h"
#include "firmlink/errors.h"
#include "firmlink/unicode_utils.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace firmlink {

namespace {

std::string trim(const std::string& value) {
    std::size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    std::size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

bool blank(const std::vector<std::string>& record) {
    for (const auto& field : record) {
        if (!field.empty()) {
            return false;
        }
    }
    return true;
}

std::vector<std::vector<std::string>> split_tsv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::vector<std::string> record;
        std::size_t start = 0;
        while (true) {
            std::size_t tab = line.find('\t', start);
            record.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
            if (tab == std::string::npos) {
                break;
            }
            start = tab + 1;
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<std::vector<std::string>> split_csv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool quoted = false;
    bool pending = false;  // a record has started

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        switch (c) {
            case '"':
                quoted = true;
                pending = true;
                break;
            case ',':
                record.push_back(std::move(field));
                field.clear();
                pending = true;
                break;
            case '\r':
                break;
            case '\n':
                record.push_back(std::move(field));
                field.clear();
                records.push_back(std::move(record));
                record.clear();
                pending = false;
                break;
            default:
                field += c;
                pending = true;
                break;
        }
    }
    if (quoted) {
        throw std::runtime_error("unterminated quoted CSV field");
    }
    if (pending || !field.empty()) {
        record.push_back(std::move(field));
        records.push_back(std::move(record));
    }
    return records;
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string tsv_field(const std::string& value) {
    std::string clean = value;
    for (char& c : clean) {
        if (c == '\t' || c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return clean;
}

} // namespace

int Table::column(const std::string& name) const {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void Table::require(const std::string& source, const std::vector<std::string>& names) const {
    std::vector<std::string> missing;
    for (const auto& name : names) {
        if (column(name) < 0) {
            missing.push_back(name);
        }
    }
    if (!missing.empty()) {
        throw InputSchemaError(source, missing);
    }
}

std::string Table::cell(std::size_t row, int column) const {
    if (column < 0 || row >= rows.size()) {
        return "";
    }
    const auto& values = rows[row];
    std::size_t index = static_cast<std::size_t>(column);
    return index < values.size() ? values[index] : std::string();
}

TableFormat table_format_for(const std::string& path) {
    std::size_t dot = path.rfind('.');
    if (dot != std::string::npos) {
        std::string ext = path.substr(dot + 1);
        if (ext == "csv" || ext == "CSV") {
            return TableFormat::Csv;
        }
    }
    return TableFormat::Tsv;
}

Table parse_table(const std::string& text, TableFormat format) {
    std::string body = text;
    if (body.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        body.erase(0, 3);
    }

    auto records = format == TableFormat::Csv ? split_csv(body) : split_tsv(body);

    Table table;
    bool header = true;
    std::size_t number = 0;
    for (auto& record : records) {
        ++number;
        if (blank(record)) {
            continue;
        }
        // Names are persisted as JSON, so bytes that are not UTF-8 stop the run here
        for (std::size_t i = 0; i < record.size(); ++i) {
            if (!unicode::is_valid_utf8(record[i])) {
                throw std::runtime_error("record " + std::to_string(number) + ", field " + std::to_string(i + 1) +
                                         ": invalid UTF-8");
            }
        }
        if (header) {
            for (const auto& name : record) {
                table.columns.push_back(trim(name));
            }
            header = false;
        } else {
            table.rows.push_back(std::move(record));
        }
    }
    return table;
}

Table load_table(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open table: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    try {
        return parse_table(buffer.str(), table_format_for(path));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

std::string dump_table(const Table& table, TableFormat format) {
    std::ostringstream out;
    auto write_record = [&](const std::vector<std::string>& record) {
        for (std::size_t i = 0; i < record.size(); ++i) {
            if (i > 0) {
                out << (format == TableFormat::Csv ? ',' : '\t');
            }
            out << (format == TableFormat::Csv ? csv_field(record[i]) : tsv_field(record[i]));
        }
        out << '\n';
    };
    write_record(table.columns);
    for (const auto& row : table.rows) {
        write_record(row);
    }
    return out.str();
}

void save_table(const Table& table, const std::string& path) {
    std::ofstream output(path, std::ios::binary);
    if (!output) {
        throw std::runtime_error("Failed to open table for writing: " + path);
    }
    output << dump_table(table, table_format_for(path));
    if (!output) {
        throw std::runtime_error("Failed to write table: " + path);
    }
}

} // namespace firmlink
