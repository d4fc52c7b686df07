#pragma once

#include "clump_match/core/types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clump_match::io {

// One table column. FITS numeric columns arrive in `values`; text columns
// (every delimited-text column, FITS string columns) arrive in `text`.
struct TableColumn {
    std::string name;
    bool numeric = false;
    std::vector<double> values;
    std::vector<std::string> text;
    std::string unit;
};

struct Table {
    std::vector<TableColumn> columns;
    size_t n_rows = 0;
    std::map<std::string, std::string> header;

    // Case-insensitive lookup, FITS column names are case-insensitive.
    const TableColumn* find(const std::string& name) const;
    std::optional<std::string> header_value(const std::string& key) const;

    void add_numeric(const std::string& name, std::vector<double> values,
                     const std::string& unit = "");
    void add_text(const std::string& name, std::vector<std::string> text);
};

enum class TableFormat {
    FITS,
    CSV
};

bool is_fits_table_path(const fs::path& path);

// Resolve "auto" from the file extension.
TableFormat resolve_table_format(const fs::path& path, const std::string& format);

// Reads the given 1-based HDU, or the first table HDU when hdu == 0.
// Header keywords of the primary HDU are merged under the table's own.
Table read_fits_table(const fs::path& path, int hdu = 0);

void write_fits_table(const fs::path& path, const Table& table,
                      const std::string& extname);

// Delimited text with one header row. Lines starting with '#' before the
// header row may carry "KEY = value" or "KEY: value" metadata.
Table read_delimited_table(const fs::path& path, const std::string& delimiter);

void write_delimited_table(const fs::path& path, const Table& table, char delimiter = ',');

} // namespace clump_match::io
