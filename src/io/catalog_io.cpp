#include "clump_match/io/catalog_io.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace clump_match::io {

const TableColumn* Table::find(const std::string& name) const {
    const std::string wanted = core::to_lower(name);
    for (const auto& col : columns) {
        if (core::to_lower(col.name) == wanted) {
            return &col;
        }
    }
    return nullptr;
}

std::optional<std::string> Table::header_value(const std::string& key) const {
    if (key.empty()) return std::nullopt;
    auto it = header.find(key);
    if (it != header.end()) {
        return it->second;
    }
    return std::nullopt;
}

void Table::add_numeric(const std::string& name, std::vector<double> values,
                        const std::string& unit) {
    TableColumn col;
    col.name = name;
    col.numeric = true;
    col.values = std::move(values);
    col.unit = unit;
    n_rows = std::max(n_rows, col.values.size());
    columns.push_back(std::move(col));
}

void Table::add_text(const std::string& name, std::vector<std::string> text) {
    TableColumn col;
    col.name = name;
    col.numeric = false;
    col.text = std::move(text);
    n_rows = std::max(n_rows, col.text.size());
    columns.push_back(std::move(col));
}

bool is_fits_table_path(const fs::path& path) {
    std::string name = core::to_lower(path.filename().string());
    if (core::ends_with(name, ".gz") || core::ends_with(name, ".fz")) {
        name = name.substr(0, name.size() - 3);
    }
    return core::ends_with(name, ".fit") || core::ends_with(name, ".fits") ||
           core::ends_with(name, ".fts");
}

TableFormat resolve_table_format(const fs::path& path, const std::string& format) {
    if (format == "fits") return TableFormat::FITS;
    if (format == "csv") return TableFormat::CSV;
    return is_fits_table_path(path) ? TableFormat::FITS : TableFormat::CSV;
}

// ─── FITS ────────────────────────────────────────────────────────────────

static std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

static std::string strip_fits_string(const std::string& value) {
    std::string v = core::trim(value);
    if (v.size() >= 2 && v.front() == '\'' && v.back() == '\'') {
        v = core::trim(v.substr(1, v.size() - 2));
    }
    return v;
}

// Keywords cfitsio writes from the table layout itself. They describe the
// file they were read from and must not be copied into another one.
static bool is_structural_fits_key(const std::string& key) {
    static const char* const exact[] = {"SIMPLE", "BITPIX",  "EXTEND", "XTENSION", "PCOUNT",
                                        "GCOUNT", "TFIELDS", "THEAP",  "EXTNAME",  "END",
                                        "CHECKSUM", "DATASUM"};
    for (const char* k : exact) {
        if (key == k) return true;
    }
    static const char* const indexed[] = {"NAXIS", "TTYPE", "TFORM", "TUNIT", "TNULL",
                                          "TSCAL", "TZERO", "TDIM",  "TBCOL", "TDISP"};
    for (const char* prefix : indexed) {
        if (!core::starts_with(key, prefix)) continue;
        const std::string rest = key.substr(std::string(prefix).size());
        if (std::all_of(rest.begin(), rest.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return true;
        }
    }
    return false;
}

static void read_header_records(fitsfile* fptr, std::map<std::string, std::string>& out) {
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) return;

    for (int i = 1; i <= nkeys; ++i) {
        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        status = 0;
        fits_read_keyn(fptr, i, keyname, value, comment, &status);
        if (status) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY") continue;
        if (is_structural_fits_key(key)) continue;
        out[key] = strip_fits_string(value);
    }
}

Table read_fits_table(const fs::path& path, int hdu) {
    if (!fs::exists(path)) {
        throw IOError("Catalog file not found: " + path.string());
    }

    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    Table table;
    read_header_records(fptr, table.header);

    int hdu_type = 0;
    if (hdu > 0) {
        fits_movabs_hdu(fptr, hdu, &hdu_type, &status);
        if (status) {
            int close_status = 0;
            fits_close_file(fptr, &close_status);
            throw FitsError("Cannot move to HDU " + std::to_string(hdu) + " in " + path.string());
        }
        if (hdu_type != BINARY_TBL && hdu_type != ASCII_TBL) {
            int close_status = 0;
            fits_close_file(fptr, &close_status);
            throw FitsError("HDU " + std::to_string(hdu) + " of " + path.string() + " is not a table");
        }
    } else {
        int nhdus = 0;
        fits_get_num_hdus(fptr, &nhdus, &status);
        bool found = false;
        for (int h = 2; !status && h <= nhdus; ++h) {
            fits_movabs_hdu(fptr, h, &hdu_type, &status);
            if (!status && (hdu_type == BINARY_TBL || hdu_type == ASCII_TBL)) {
                found = true;
                break;
            }
        }
        if (status || !found) {
            int close_status = 0;
            fits_close_file(fptr, &close_status);
            throw FitsError("No table HDU found in " + path.string());
        }
    }

    // Table keywords take precedence over the primary header.
    read_header_records(fptr, table.header);

    long nrows = 0;
    int ncols = 0;
    fits_get_num_rows(fptr, &nrows, &status);
    fits_get_num_cols(fptr, &ncols, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot read table dimensions: " + path.string());
    }
    table.n_rows = static_cast<size_t>(nrows);

    for (int c = 1; c <= ncols; ++c) {
        char keyname[FLEN_KEYWORD];
        char colname[FLEN_VALUE];
        fits_make_keyn("TTYPE", c, keyname, &status);
        fits_read_key(fptr, TSTRING, keyname, colname, nullptr, &status);
        if (status) {
            // Unnamed columns cannot be mapped, skip them
            status = 0;
            continue;
        }

        int typecode = 0;
        long repeat = 0;
        long width = 0;
        fits_get_coltype(fptr, c, &typecode, &repeat, &width, &status);
        if (status) {
            int close_status = 0;
            fits_close_file(fptr, &close_status);
            throw FitsError("Cannot read type of column " + std::string(colname) +
                            " in " + path.string());
        }

        TableColumn col;
        col.name = core::trim(colname);

        if (typecode == TSTRING) {
            std::vector<std::vector<char>> storage(
                table.n_rows,
                std::vector<char>(static_cast<size_t>(std::max(repeat, width)) + 1, '\0'));
            std::vector<char*> ptrs(table.n_rows);
            for (size_t r = 0; r < table.n_rows; ++r) ptrs[r] = storage[r].data();
            char nullstr[] = "";
            int anynul = 0;
            if (table.n_rows > 0) {
                fits_read_col(fptr, TSTRING, c, 1, 1, nrows, nullstr, ptrs.data(),
                              &anynul, &status);
            }
            if (status) {
                int close_status = 0;
                fits_close_file(fptr, &close_status);
                throw FitsError("Cannot read column " + col.name + " in " + path.string());
            }
            col.numeric = false;
            col.text.reserve(table.n_rows);
            for (size_t r = 0; r < table.n_rows; ++r) {
                col.text.push_back(core::trim(storage[r].data()));
            }
        } else if (repeat == 1) {
            col.numeric = true;
            col.values.assign(table.n_rows, 0.0);
            double nulval = std::numeric_limits<double>::quiet_NaN();
            int anynul = 0;
            if (table.n_rows > 0) {
                fits_read_col(fptr, TDOUBLE, c, 1, 1, nrows, &nulval, col.values.data(),
                              &anynul, &status);
            }
            if (status) {
                int close_status = 0;
                fits_close_file(fptr, &close_status);
                throw FitsError("Cannot read column " + col.name + " in " + path.string());
            }
            char unitkey[FLEN_KEYWORD];
            char unit[FLEN_VALUE];
            int unit_status = 0;
            fits_make_keyn("TUNIT", c, unitkey, &unit_status);
            fits_read_key(fptr, TSTRING, unitkey, unit, nullptr, &unit_status);
            if (unit_status == 0) col.unit = core::trim(unit);
        } else {
            // Vector columns have no scalar catalog meaning
            continue;
        }

        table.columns.push_back(std::move(col));
    }

    fits_close_file(fptr, &status);
    return table;
}

void write_fits_table(const fs::path& path, const Table& table, const std::string& extname) {
    fitsfile* fptr = nullptr;
    int status = 0;

    // Leading '!' makes cfitsio overwrite an existing file
    const std::string target = "!" + path.string();
    if (fits_create_file(&fptr, target.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    const int ncols = static_cast<int>(table.columns.size());
    std::vector<std::string> ttype_s, tform_s, tunit_s;
    for (const auto& col : table.columns) {
        ttype_s.push_back(col.name);
        tunit_s.push_back(col.unit);
        if (col.numeric) {
            tform_s.push_back("1D");
        } else {
            size_t width = 1;
            for (const auto& s : col.text) width = std::max(width, s.size());
            tform_s.push_back(std::to_string(width) + "A");
        }
    }
    std::vector<char*> ttype, tform, tunit;
    for (int c = 0; c < ncols; ++c) {
        ttype.push_back(const_cast<char*>(ttype_s[c].c_str()));
        tform.push_back(const_cast<char*>(tform_s[c].c_str()));
        tunit.push_back(const_cast<char*>(tunit_s[c].c_str()));
    }

    fits_create_tbl(fptr, BINARY_TBL, static_cast<LONGLONG>(table.n_rows), ncols,
                    ttype.data(), tform.data(), tunit.data(),
                    const_cast<char*>(extname.c_str()), &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot create table in " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    for (const auto& [key, value] : table.header) {
        // FITS keywords are at most 8 characters
        if (key.empty() || key.size() > 8 || is_structural_fits_key(key)) continue;
        fits_update_key(fptr, TSTRING, key.c_str(), const_cast<char*>(value.c_str()),
                        nullptr, &status);
    }

    for (int c = 0; c < ncols && !status; ++c) {
        const auto& col = table.columns[static_cast<size_t>(c)];
        if (table.n_rows == 0) break;
        if (col.numeric) {
            std::vector<double> data = col.values;
            data.resize(table.n_rows, std::numeric_limits<double>::quiet_NaN());
            fits_write_col(fptr, TDOUBLE, c + 1, 1, 1, static_cast<LONGLONG>(table.n_rows),
                           data.data(), &status);
        } else {
            std::vector<std::string> text = col.text;
            text.resize(table.n_rows);
            std::vector<char*> ptrs;
            for (auto& s : text) ptrs.push_back(const_cast<char*>(s.c_str()));
            fits_write_col(fptr, TSTRING, c + 1, 1, 1, static_cast<LONGLONG>(table.n_rows),
                           ptrs.data(), &status);
        }
    }

    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot write table data to " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close " + path.string() + " (" + fits_status_text(status) + ")");
    }
}

// ─── Delimited text ──────────────────────────────────────────────────────

// Double-quoted fields may hold the delimiter; "" inside them is a quote.
// Returns false for an unterminated quote or text after a closing quote.
static bool split_quoted(const std::string& line, char delim, std::vector<std::string>& fields) {
    fields.clear();
    std::string field;
    bool in_quotes = false;
    bool was_quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (in_quotes) {
            if (ch != '"') {
                field += ch;
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else {
                in_quotes = false;
            }
        } else if (ch == delim) {
            fields.push_back(was_quoted ? field : core::trim(field));
            field.clear();
            was_quoted = false;
        } else if (was_quoted) {
            if (!std::isspace(static_cast<unsigned char>(ch))) return false;
        } else if (ch == '"' && core::trim(field).empty()) {
            field.clear();
            in_quotes = true;
            was_quoted = true;
        } else {
            field += ch;
        }
    }
    if (in_quotes) return false;
    fields.push_back(was_quoted ? field : core::trim(field));
    return true;
}

static std::vector<std::string> split_row(const std::string& line, const std::string& delimiter,
                                          const std::string& where) {
    if (delimiter == "whitespace") {
        auto fields = core::split_whitespace(line);
        for (auto& f : fields) {
            if (f.size() >= 2 && f.front() == '"' && f.back() == '"') {
                f = f.substr(1, f.size() - 2);
            }
        }
        return fields;
    }
    const char delim = (delimiter == "\\t") ? '\t' : delimiter.front();
    std::vector<std::string> fields;
    if (!split_quoted(line, delim, fields)) {
        throw MalformedCatalogError(where + ": unbalanced quotes");
    }
    return fields;
}

// Quote a cell that would otherwise split, lose its quotes or its padding.
static std::string quote_cell(const std::string& text, char delimiter) {
    if (text.find_first_of("\r\n") != std::string::npos) {
        throw ValidationError("table cell contains a line break: " + text);
    }
    const bool padded = !text.empty() && (std::isspace(static_cast<unsigned char>(text.front())) ||
                                          std::isspace(static_cast<unsigned char>(text.back())));
    if (!padded && text.find(delimiter) == std::string::npos &&
        text.find('"') == std::string::npos) {
        return text;
    }
    std::string out = "\"";
    for (char ch : text) {
        if (ch == '"') out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

static void parse_comment_metadata(const std::string& line,
                                   std::map<std::string, std::string>& header) {
    std::string body = core::trim(line.substr(1));
    size_t sep = body.find('=');
    if (sep == std::string::npos) sep = body.find(':');
    if (sep == std::string::npos) return;
    std::string key = core::trim(body.substr(0, sep));
    if (key.empty()) return;
    header[key] = strip_fits_string(body.substr(sep + 1));
}

Table read_delimited_table(const fs::path& path, const std::string& delimiter) {
    if (!fs::exists(path)) {
        throw IOError("Catalog file not found: " + path.string());
    }
    if (delimiter.empty()) {
        throw ValidationError("empty delimiter");
    }

    const std::string text = core::read_text(path);
    std::istringstream iss(text);

    Table table;
    std::vector<std::string> names;
    std::vector<std::vector<std::string>> cells;
    std::string line;
    size_t line_no = 0;

    while (std::getline(iss, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (core::trim(line).empty()) continue;

        if (core::starts_with(core::trim(line), "#")) {
            if (names.empty()) parse_comment_metadata(core::trim(line), table.header);
            continue;
        }

        auto fields =
            split_row(line, delimiter, path.string() + " line " + std::to_string(line_no));
        if (names.empty()) {
            names = fields;
            cells.assign(names.size(), {});
            continue;
        }

        if (fields.size() != names.size()) {
            throw MalformedCatalogError(path.string() + " line " + std::to_string(line_no) +
                                        ": expected " + std::to_string(names.size()) +
                                        " fields, found " + std::to_string(fields.size()));
        }
        for (size_t c = 0; c < fields.size(); ++c) {
            cells[c].push_back(fields[c]);
        }
        ++table.n_rows;
    }

    if (names.empty()) {
        throw MalformedCatalogError(path.string() + ": no header row");
    }

    for (size_t c = 0; c < names.size(); ++c) {
        TableColumn col;
        col.name = names[c];
        col.numeric = false;
        col.text = std::move(cells[c]);
        table.columns.push_back(std::move(col));
    }
    return table;
}

void write_delimited_table(const fs::path& path, const Table& table, char delimiter) {
    std::ostringstream oss;
    for (const auto& [key, value] : table.header) {
        if ((key + value).find_first_of("\r\n") != std::string::npos) {
            throw ValidationError("header entry " + key + " contains a line break");
        }
        oss << "# " << key << " = " << value << "\n";
    }

    std::vector<std::string> names;
    for (const auto& col : table.columns) names.push_back(quote_cell(col.name, delimiter));
    oss << core::join(names, std::string(1, delimiter)) << "\n";

    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (size_t r = 0; r < table.n_rows; ++r) {
        for (size_t c = 0; c < table.columns.size(); ++c) {
            const auto& col = table.columns[c];
            if (c > 0) oss << delimiter;
            if (col.numeric) {
                const double v = r < col.values.size() ? col.values[r]
                                                       : std::numeric_limits<double>::quiet_NaN();
                if (std::isnan(v)) {
                    oss << "nan";
                } else {
                    oss << v;
                }
            } else if (r < col.text.size()) {
                oss << quote_cell(col.text[r], delimiter);
            }
        }
        oss << "\n";
    }

    core::write_text(path, oss.str());
}

} // namespace clump_match::io
