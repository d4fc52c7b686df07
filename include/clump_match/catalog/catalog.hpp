#pragma once

#include "clump_match/config/configuration.hpp"
#include "clump_match/core/types.hpp"
#include "clump_match/io/catalog_io.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace clump_match::catalog {

// One detected clump. Uncertainties and size are NaN when not measured.
struct Detection {
    std::string id;
    double x = 0.0;   // Cartesian x, or RA in degrees
    double y = 0.0;   // Cartesian y, or Dec in degrees
    double position_error = std::numeric_limits<double>::quiet_NaN();
    double flux = 0.0;
    double flux_error = std::numeric_limits<double>::quiet_NaN();
    double size = std::numeric_limits<double>::quiet_NaN();  // FWHM-like

    bool has_valid_position() const { return std::isfinite(x) && std::isfinite(y); }
    bool has_valid_flux() const { return std::isfinite(flux); }
};

// Ordered, read-only list of detections from one epoch. Identifiers are
// unique and non-empty.
class Catalog {
public:
    Catalog() = default;
    explicit Catalog(std::vector<Detection> detections,
                     std::string epoch = "",
                     std::string frame = "",
                     std::map<std::string, std::string> metadata = {});

    size_t size() const { return detections_.size(); }
    bool empty() const { return detections_.empty(); }

    const Detection& operator[](size_t i) const { return detections_[i]; }
    const Detection& at(size_t i) const { return detections_.at(i); }
    const std::vector<Detection>& detections() const { return detections_; }

    std::vector<Detection>::const_iterator begin() const { return detections_.begin(); }
    std::vector<Detection>::const_iterator end() const { return detections_.end(); }

    const std::string& epoch() const { return epoch_; }
    const std::string& frame() const { return frame_; }
    const std::map<std::string, std::string>& metadata() const { return metadata_; }

    // Index of the detection with this id, or -1.
    int index_of(const std::string& id) const;

private:
    std::vector<Detection> detections_;
    std::string epoch_;
    std::string frame_;
    std::map<std::string, std::string> metadata_;
    std::unordered_map<std::string, size_t> index_;
};

// Build a catalog from a loaded table using the configured column mapping.
Catalog catalog_from_table(const io::Table& table, const config::CatalogConfig& cfg,
                           const std::string& source_name);

Catalog load_catalog(const fs::path& path, const config::CatalogConfig& cfg);

// Table with columns id, x, y, position_error, flux, flux_error, size.
io::Table catalog_to_table(const Catalog& catalog);

// Format follows the extension (.fits/.fit/.fts, otherwise CSV).
void write_catalog(const fs::path& path, const Catalog& catalog);

} // namespace clump_match::catalog
