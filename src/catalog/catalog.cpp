#include "clump_match/catalog/catalog.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/core/utils.hpp"

#include <iostream>
#include <sstream>

namespace clump_match::catalog {

Catalog::Catalog(std::vector<Detection> detections, std::string epoch,
                 std::string frame, std::map<std::string, std::string> metadata)
    : detections_(std::move(detections)),
      epoch_(std::move(epoch)),
      frame_(std::move(frame)),
      metadata_(std::move(metadata)) {
    index_.reserve(detections_.size());
    for (size_t i = 0; i < detections_.size(); ++i) {
        const std::string& id = detections_[i].id;
        if (id.empty()) {
            throw MalformedCatalogError("empty identifier at row " + std::to_string(i + 1));
        }
        auto [it, inserted] = index_.emplace(id, i);
        if (!inserted) {
            throw MalformedCatalogError("duplicate identifier '" + id + "' at rows " +
                                        std::to_string(it->second + 1) + " and " +
                                        std::to_string(i + 1));
        }
    }
}

int Catalog::index_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return -1;
    return static_cast<int>(it->second);
}

namespace {

std::string format_id(double v) {
    if (std::isfinite(v) && v == std::floor(v) && std::abs(v) < 1.0e15) {
        return std::to_string(static_cast<long long>(v));
    }
    std::ostringstream oss;
    oss.precision(15);
    oss << v;
    return oss.str();
}

const io::TableColumn& require_column(const io::Table& table, const std::string& name,
                                      const std::string& logical,
                                      const std::string& source_name) {
    const io::TableColumn* col = table.find(name);
    if (!col) {
        throw MalformedCatalogError(source_name + ": missing column '" + name +
                                    "' (mapped to " + logical + ")");
    }
    return *col;
}

std::vector<double> numeric_values(const io::TableColumn& col, size_t n_rows,
                                   const std::string& source_name) {
    if (col.numeric) {
        std::vector<double> out = col.values;
        out.resize(n_rows, std::numeric_limits<double>::quiet_NaN());
        return out;
    }
    std::vector<double> out(n_rows, std::numeric_limits<double>::quiet_NaN());
    for (size_t r = 0; r < n_rows && r < col.text.size(); ++r) {
        if (!core::parse_double(col.text[r], out[r])) {
            throw MalformedCatalogError(source_name + ": non-numeric value '" + col.text[r] +
                                        "' in column '" + col.name + "' at row " +
                                        std::to_string(r + 1));
        }
    }
    return out;
}

// Optional logical columns: an empty mapping means "not measured".
std::vector<double> optional_values(const io::Table& table, const std::string& name,
                                    const std::string& logical,
                                    const std::string& source_name) {
    if (name.empty()) {
        return std::vector<double>(table.n_rows, std::numeric_limits<double>::quiet_NaN());
    }
    return numeric_values(require_column(table, name, logical, source_name), table.n_rows,
                          source_name);
}

} // namespace

Catalog catalog_from_table(const io::Table& table, const config::CatalogConfig& cfg,
                           const std::string& source_name) {
    const auto& cols = cfg.columns;

    const auto& id_col = require_column(table, cols.id, "id", source_name);
    const auto x = numeric_values(require_column(table, cols.x, "x", source_name),
                                  table.n_rows, source_name);
    const auto y = numeric_values(require_column(table, cols.y, "y", source_name),
                                  table.n_rows, source_name);
    const auto flux = numeric_values(require_column(table, cols.flux, "flux", source_name),
                                     table.n_rows, source_name);
    const auto pos_err = optional_values(table, cols.position_error, "position_error", source_name);
    const auto flux_err = optional_values(table, cols.flux_error, "flux_error", source_name);
    const auto size = optional_values(table, cols.size, "size", source_name);

    std::vector<double> size_minor;
    if (!cols.size_minor.empty()) {
        size_minor = optional_values(table, cols.size_minor, "size_minor", source_name);
    }

    std::vector<Detection> detections;
    detections.reserve(table.n_rows);
    for (size_t r = 0; r < table.n_rows; ++r) {
        Detection d;
        if (id_col.numeric) {
            d.id = r < id_col.values.size() ? format_id(id_col.values[r]) : "";
        } else {
            d.id = r < id_col.text.size() ? core::trim(id_col.text[r]) : "";
        }
        d.x = x[r];
        d.y = y[r];
        d.position_error = pos_err[r];
        d.flux = flux[r];
        d.flux_error = flux_err[r];
        if (!size_minor.empty()) {
            // Effective size from the two FWHM axes
            d.size = std::sqrt(size[r] * size_minor[r]) * cfg.size_factor;
        } else {
            d.size = size[r] * cfg.size_factor;
        }
        detections.push_back(std::move(d));
    }

    std::string epoch;
    if (auto v = table.header_value(cfg.epoch_key)) epoch = *v;
    if (epoch.empty()) epoch = fs::path(source_name).stem().string();

    std::string frame;
    if (auto v = table.header_value(cfg.frame_key)) frame = *v;

    return Catalog(std::move(detections), epoch, frame, table.header);
}

Catalog load_catalog(const fs::path& path, const config::CatalogConfig& cfg) {
    if (!fs::exists(path)) {
        throw IOError("Catalog file not found: " + path.string());
    }

    io::Table table;
    if (io::resolve_table_format(path, cfg.format) == io::TableFormat::FITS) {
        table = io::read_fits_table(path, cfg.hdu);
    } else {
        table = io::read_delimited_table(path, cfg.delimiter);
    }

    Catalog catalog = catalog_from_table(table, cfg, path.string());
    std::cerr << "[LOAD] " << path.filename().string() << ": " << catalog.size()
              << " detections, epoch=" << catalog.epoch() << std::endl;
    return catalog;
}

io::Table catalog_to_table(const Catalog& catalog) {
    const size_t n = catalog.size();
    std::vector<std::string> ids;
    std::vector<double> x, y, pos_err, flux, flux_err, size;
    ids.reserve(n);
    for (const auto& d : catalog) {
        ids.push_back(d.id);
        x.push_back(d.x);
        y.push_back(d.y);
        pos_err.push_back(d.position_error);
        flux.push_back(d.flux);
        flux_err.push_back(d.flux_error);
        size.push_back(d.size);
    }

    io::Table table;
    table.header = catalog.metadata();
    table.add_text("id", std::move(ids));
    table.add_numeric("x", std::move(x));
    table.add_numeric("y", std::move(y));
    table.add_numeric("position_error", std::move(pos_err));
    table.add_numeric("flux", std::move(flux));
    table.add_numeric("flux_error", std::move(flux_err));
    table.add_numeric("size", std::move(size));
    table.n_rows = n;
    return table;
}

void write_catalog(const fs::path& path, const Catalog& catalog) {
    const io::Table table = catalog_to_table(catalog);
    if (io::is_fits_table_path(path)) {
        io::write_fits_table(path, table, "CATALOG");
    } else {
        io::write_delimited_table(path, table, ',');
    }
}

} // namespace clump_match::catalog
