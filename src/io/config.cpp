#include "clump_match/config/configuration.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/core/types.hpp"

#include <cmath>
#include <fstream>

namespace clump_match::config {

static void read_optional_double(const YAML::Node& n, std::optional<double>& out) {
    if (!n) return;
    if (n.IsNull()) {
        out.reset();
    } else {
        out = n.as<double>();
    }
}

static void write_optional_double(YAML::Node n, const std::optional<double>& v) {
    if (v) {
        n = *v;
    } else {
        n = YAML::Null;
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["catalog"]) {
        auto c = node["catalog"];
        if (c["format"]) cfg.catalog.format = c["format"].as<std::string>();
        if (c["hdu"]) cfg.catalog.hdu = c["hdu"].as<int>();
        if (c["delimiter"]) cfg.catalog.delimiter = c["delimiter"].as<std::string>();
        if (c["size_factor"]) cfg.catalog.size_factor = c["size_factor"].as<double>();
        if (c["epoch_key"]) cfg.catalog.epoch_key = c["epoch_key"].as<std::string>();
        if (c["frame_key"]) cfg.catalog.frame_key = c["frame_key"].as<std::string>();

        if (c["columns"]) {
            auto col = c["columns"];
            if (col["id"]) cfg.catalog.columns.id = col["id"].as<std::string>();
            if (col["x"]) cfg.catalog.columns.x = col["x"].as<std::string>();
            if (col["y"]) cfg.catalog.columns.y = col["y"].as<std::string>();
            if (col["position_error"]) cfg.catalog.columns.position_error = col["position_error"].as<std::string>();
            if (col["flux"]) cfg.catalog.columns.flux = col["flux"].as<std::string>();
            if (col["flux_error"]) cfg.catalog.columns.flux_error = col["flux_error"].as<std::string>();
            if (col["size"]) cfg.catalog.columns.size = col["size"].as<std::string>();
            if (col["size_minor"]) cfg.catalog.columns.size_minor = col["size_minor"].as<std::string>();
        }
    }

    if (node["matching"]) {
        auto m = node["matching"];
        if (m["coordinates"]) cfg.matching.coordinates = m["coordinates"].as<std::string>();
        if (m["max_separation"]) cfg.matching.max_separation = m["max_separation"].as<double>();
        if (m["ambiguity_policy"]) cfg.matching.ambiguity_policy = m["ambiguity_policy"].as<std::string>();
        if (m["ambiguity_margin"]) cfg.matching.ambiguity_margin = m["ambiguity_margin"].as<double>();
        read_optional_double(m["min_reference_flux"], cfg.matching.min_reference_flux);
        read_optional_double(m["max_reference_size"], cfg.matching.max_reference_size);
    }

    if (node["normalization"]) {
        auto n = node["normalization"];
        if (n["clip_sigma"]) cfg.normalization.clip_sigma = n["clip_sigma"].as<double>();
        if (n["max_clip_iterations"]) cfg.normalization.max_clip_iterations = n["max_clip_iterations"].as<int>();
        if (n["min_matches_required"]) cfg.normalization.min_matches_required = n["min_matches_required"].as<int>();
        if (n["fit_scale_position"]) cfg.normalization.fit_scale_position = n["fit_scale_position"].as<bool>();
        if (n["fit_flux_zero_point"]) cfg.normalization.fit_flux_zero_point = n["fit_flux_zero_point"].as<bool>();
        if (n["fit_size_ratio"]) cfg.normalization.fit_size_ratio = n["fit_size_ratio"].as<bool>();
        if (n["use_uncertainty_weights"]) {
            cfg.normalization.use_uncertainty_weights = n["use_uncertainty_weights"].as<bool>();
        }
        if (n["reference_flux_epsilon"]) {
            cfg.normalization.reference_flux_epsilon = n["reference_flux_epsilon"].as<double>();
        }
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["table_format"]) cfg.output.table_format = o["table_format"].as<std::string>();
        if (o["write_normalized_catalog"]) cfg.output.write_normalized_catalog = o["write_normalized_catalog"].as<bool>();
        if (o["write_events"]) cfg.output.write_events = o["write_events"].as<bool>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["catalog"]["format"] = catalog.format;
    node["catalog"]["hdu"] = catalog.hdu;
    node["catalog"]["delimiter"] = catalog.delimiter;
    node["catalog"]["columns"]["id"] = catalog.columns.id;
    node["catalog"]["columns"]["x"] = catalog.columns.x;
    node["catalog"]["columns"]["y"] = catalog.columns.y;
    node["catalog"]["columns"]["position_error"] = catalog.columns.position_error;
    node["catalog"]["columns"]["flux"] = catalog.columns.flux;
    node["catalog"]["columns"]["flux_error"] = catalog.columns.flux_error;
    node["catalog"]["columns"]["size"] = catalog.columns.size;
    node["catalog"]["columns"]["size_minor"] = catalog.columns.size_minor;
    node["catalog"]["size_factor"] = catalog.size_factor;
    node["catalog"]["epoch_key"] = catalog.epoch_key;
    node["catalog"]["frame_key"] = catalog.frame_key;

    node["matching"]["coordinates"] = matching.coordinates;
    node["matching"]["max_separation"] = matching.max_separation;
    node["matching"]["ambiguity_policy"] = matching.ambiguity_policy;
    node["matching"]["ambiguity_margin"] = matching.ambiguity_margin;
    write_optional_double(node["matching"]["min_reference_flux"], matching.min_reference_flux);
    write_optional_double(node["matching"]["max_reference_size"], matching.max_reference_size);

    node["normalization"]["clip_sigma"] = normalization.clip_sigma;
    node["normalization"]["max_clip_iterations"] = normalization.max_clip_iterations;
    node["normalization"]["min_matches_required"] = normalization.min_matches_required;
    node["normalization"]["fit_scale_position"] = normalization.fit_scale_position;
    node["normalization"]["fit_flux_zero_point"] = normalization.fit_flux_zero_point;
    node["normalization"]["fit_size_ratio"] = normalization.fit_size_ratio;
    node["normalization"]["use_uncertainty_weights"] = normalization.use_uncertainty_weights;
    node["normalization"]["reference_flux_epsilon"] = normalization.reference_flux_epsilon;

    node["output"]["table_format"] = output.table_format;
    node["output"]["write_normalized_catalog"] = output.write_normalized_catalog;
    node["output"]["write_events"] = output.write_events;

    return node;
}

void Config::validate() const {
    if (catalog.format != "auto" && catalog.format != "fits" && catalog.format != "csv") {
        throw ValidationError("catalog.format must be 'auto', 'fits' or 'csv'");
    }
    if (catalog.hdu < 0) {
        throw ValidationError("catalog.hdu must be >= 0");
    }
    if (catalog.delimiter != "whitespace" && catalog.delimiter != "\\t" &&
        catalog.delimiter.size() != 1) {
        throw ValidationError("catalog.delimiter must be a single character, '\\t' or 'whitespace'");
    }
    if (catalog.columns.id.empty() || catalog.columns.x.empty() ||
        catalog.columns.y.empty() || catalog.columns.flux.empty()) {
        throw ValidationError("catalog.columns.id/x/y/flux must name a column");
    }
    if (!catalog.columns.size_minor.empty() && catalog.columns.size.empty()) {
        throw ValidationError("catalog.columns.size_minor requires catalog.columns.size");
    }
    if (!(catalog.size_factor > 0.0) || !std::isfinite(catalog.size_factor)) {
        throw ValidationError("catalog.size_factor must be > 0");
    }

    if (string_to_coordinate_system(matching.coordinates) == CoordinateSystem::UNKNOWN) {
        throw ValidationError("matching.coordinates must be 'cartesian' or 'spherical'");
    }
    if (!(matching.max_separation >= 0.0) || !std::isfinite(matching.max_separation)) {
        throw ValidationError("matching.max_separation must be >= 0");
    }
    if (string_to_ambiguity_policy(matching.ambiguity_policy) == AmbiguityPolicy::UNKNOWN) {
        throw ValidationError("matching.ambiguity_policy must be 'nearest' or 'reject'");
    }
    if (!(matching.ambiguity_margin >= 0.0) || !std::isfinite(matching.ambiguity_margin)) {
        throw ValidationError("matching.ambiguity_margin must be >= 0");
    }
    if (matching.min_reference_flux && std::isnan(*matching.min_reference_flux)) {
        throw ValidationError("matching.min_reference_flux must be a number or null");
    }
    if (matching.max_reference_size && !(*matching.max_reference_size > 0.0)) {
        throw ValidationError("matching.max_reference_size must be > 0 or null");
    }

    if (!(normalization.clip_sigma > 0.0) || !std::isfinite(normalization.clip_sigma)) {
        throw ValidationError("normalization.clip_sigma must be > 0");
    }
    if (normalization.max_clip_iterations < 1) {
        throw ValidationError("normalization.max_clip_iterations must be >= 1");
    }
    if (normalization.min_matches_required < 1) {
        throw ValidationError("normalization.min_matches_required must be >= 1");
    }
    if (normalization.fit_scale_position && normalization.min_matches_required < 2) {
        throw ValidationError("normalization.min_matches_required must be >= 2 with fit_scale_position");
    }
    if (!(normalization.reference_flux_epsilon >= 0.0)) {
        throw ValidationError("normalization.reference_flux_epsilon must be >= 0");
    }

    if (output.table_format != "csv" && output.table_format != "fits" &&
        output.table_format != "both") {
        throw ValidationError("output.table_format must be 'csv', 'fits' or 'both'");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "catalog": {
      "type": "object",
      "properties": {
        "format": {"type": "string", "enum": ["auto", "fits", "csv"]},
        "hdu": {"type": "integer", "minimum": 0},
        "delimiter": {"type": "string"},
        "columns": {
          "type": "object",
          "properties": {
            "id": {"type": "string", "minLength": 1},
            "x": {"type": "string", "minLength": 1},
            "y": {"type": "string", "minLength": 1},
            "position_error": {"type": "string"},
            "flux": {"type": "string", "minLength": 1},
            "flux_error": {"type": "string"},
            "size": {"type": "string"},
            "size_minor": {"type": "string"}
          }
        },
        "size_factor": {"type": "number", "exclusiveMinimum": 0},
        "epoch_key": {"type": "string"},
        "frame_key": {"type": "string"}
      }
    },
    "matching": {
      "type": "object",
      "properties": {
        "coordinates": {"type": "string", "enum": ["cartesian", "spherical"]},
        "max_separation": {"type": "number", "minimum": 0},
        "ambiguity_policy": {"type": "string", "enum": ["nearest", "reject"]},
        "ambiguity_margin": {"type": "number", "minimum": 0},
        "min_reference_flux": {"type": ["number", "null"]},
        "max_reference_size": {"type": ["number", "null"], "exclusiveMinimum": 0}
      }
    },
    "normalization": {
      "type": "object",
      "properties": {
        "clip_sigma": {"type": "number", "exclusiveMinimum": 0},
        "max_clip_iterations": {"type": "integer", "minimum": 1},
        "min_matches_required": {"type": "integer", "minimum": 1},
        "fit_scale_position": {"type": "boolean"},
        "fit_flux_zero_point": {"type": "boolean"},
        "fit_size_ratio": {"type": "boolean"},
        "use_uncertainty_weights": {"type": "boolean"},
        "reference_flux_epsilon": {"type": "number", "minimum": 0}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "table_format": {"type": "string", "enum": ["csv", "fits", "both"]},
        "write_normalized_catalog": {"type": "boolean"},
        "write_events": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace clump_match::config
