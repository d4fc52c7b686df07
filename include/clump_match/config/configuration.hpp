#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace clump_match::config {

namespace fs = std::filesystem;

// Logical catalog column -> table column name. An empty name marks the
// column as absent (only allowed for uncertainties and sizes).
struct ColumnMapping {
  std::string id = "id";
  std::string x = "x";
  std::string y = "y";
  std::string position_error = "position_error";
  std::string flux = "flux";
  std::string flux_error = "flux_error";
  std::string size = "size";
  std::string size_minor;  // optional second axis, size = sqrt(size * size_minor)
};

struct CatalogConfig {
  std::string format = "auto";   // auto | fits | csv
  int hdu = 0;                    // 1-based FITS HDU number, 0 = first table
  std::string delimiter = ",";    // single char, "\t" or "whitespace"
  ColumnMapping columns;
  double size_factor = 1.0;
  std::string epoch_key = "DATE-OBS";
  std::string frame_key = "RADESYS";
};

struct MatchingConfig {
  std::string coordinates = "cartesian";  // cartesian | spherical
  double max_separation = 10.0;           // coordinate units, arcsec if spherical
  std::string ambiguity_policy = "nearest"; // nearest | reject
  double ambiguity_margin = 0.0;
  std::optional<double> min_reference_flux;
  std::optional<double> max_reference_size;
};

struct NormalizationConfig {
  double clip_sigma = 3.0;
  int max_clip_iterations = 10;
  int min_matches_required = 3;
  bool fit_scale_position = false;
  bool fit_flux_zero_point = false;
  bool fit_size_ratio = false;
  bool use_uncertainty_weights = false;
  double reference_flux_epsilon = 1.0e-12;
};

struct OutputConfig {
  std::string table_format = "csv";  // csv | fits | both
  bool write_normalized_catalog = false;
  bool write_events = true;
};

struct Config {
  CatalogConfig catalog;
  MatchingConfig matching;
  NormalizationConfig normalization;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace clump_match::config
