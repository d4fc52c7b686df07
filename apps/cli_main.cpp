#include "clump_match/catalog/catalog.hpp"
#include "clump_match/config/configuration.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/core/events.hpp"
#include "clump_match/core/types.hpp"
#include "clump_match/core/utils.hpp"
#include "clump_match/pipeline/report.hpp"
#include "clump_match/pipeline/source_match.hpp"
#include "clump_match/stats/robust_fit.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace clump_match;

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_MALFORMED_CATALOG = 2;
constexpr int EXIT_INSUFFICIENT_SAMPLES = 3;
constexpr int EXIT_DEGENERATE_FIT = 4;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static int exit_code_for(const std::exception& e) {
    if (dynamic_cast<const MalformedCatalogError*>(&e)) return EXIT_MALFORMED_CATALOG;
    if (dynamic_cast<const InsufficientSamplesError*>(&e)) return EXIT_INSUFFICIENT_SAMPLES;
    if (dynamic_cast<const DegenerateFitError*>(&e)) return EXIT_DEGENERATE_FIT;
    return EXIT_ERROR;
}

static int report_error(const std::string& command, const std::exception& e) {
    std::cerr << "[" << command << "] " << e.what() << std::endl;
    json result;
    result["ok"] = false;
    result["error"] = e.what();
    result["error_type"] = error_kind(e);
    print_json(result);
    return exit_code_for(e);
}

static double parse_number_arg(const std::string& name, const std::string& value) {
    double v = 0.0;
    if (!core::parse_double(value, v) || std::isnan(v)) {
        throw ValidationError(name + " expects a number, got '" + value + "'");
    }
    return v;
}

static int parse_int_arg(const std::string& name, const std::string& value) {
    int v = 0;
    if (!core::parse_int(value, v)) {
        throw ValidationError(name + " expects an integer, got '" + value + "'");
    }
    return v;
}

// Command line overrides for the match command
struct MatchOverrides {
    std::string max_separation;
    std::string clip_sigma;
    std::string max_clip_iterations;
    std::string min_matches;
    std::string coordinates;
    bool fit_scale_position = false;
    bool fit_flux_zero_point = false;
};

static void apply_overrides(config::Config& cfg, const MatchOverrides& o) {
    if (!o.max_separation.empty()) {
        cfg.matching.max_separation = parse_number_arg("--max-separation", o.max_separation);
    }
    if (!o.clip_sigma.empty()) {
        cfg.normalization.clip_sigma = parse_number_arg("--clip-sigma", o.clip_sigma);
    }
    if (!o.max_clip_iterations.empty()) {
        cfg.normalization.max_clip_iterations =
            parse_int_arg("--max-clip-iterations", o.max_clip_iterations);
    }
    if (!o.min_matches.empty()) {
        cfg.normalization.min_matches_required = parse_int_arg("--min-matches", o.min_matches);
    }
    if (!o.coordinates.empty()) {
        cfg.matching.coordinates = o.coordinates;
    }
    if (o.fit_scale_position) cfg.normalization.fit_scale_position = true;
    if (o.fit_flux_zero_point) cfg.normalization.fit_flux_zero_point = true;
}

static config::Config load_config_or_default(const std::string& path) {
    if (path.empty()) return config::Config();
    if (!fs::exists(path)) {
        throw ConfigError("File not found: " + path);
    }
    return config::Config::load(path);
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return EXIT_OK;
}

// ============================================================================
// default-config
// ============================================================================
int cmd_default_config() {
    YAML::Emitter out;
    out << config::Config().to_yaml();
    std::cout << out.c_str() << std::endl;
    return EXIT_OK;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }

        YAML::Node node = YAML::Load(yaml_text);
        config::Config cfg = config::Config::from_yaml(node);
        cfg.validate();
        result["valid"] = true;

        if (cfg.normalization.fit_scale_position && cfg.normalization.min_matches_required < 3) {
            result["warnings"].push_back(
                "fit_scale_position with fewer than 3 required matches gives no error estimate");
        }
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("YAML parse error: ") + e.what());
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? EXIT_OK : EXIT_ERROR;
    }
    return EXIT_OK;
}

// ============================================================================
// catalog-info <path> [--config P]
// ============================================================================
int cmd_catalog_info(const std::string& path, const std::string& config_path) {
    try {
        const config::Config cfg = load_config_or_default(config_path);
        cfg.validate();
        const catalog::Catalog cat = catalog::load_catalog(path, cfg.catalog);

        int n_invalid = 0;
        std::vector<double> flux, size, xs, ys;
        for (const auto& d : cat) {
            if (!d.has_valid_position() || !d.has_valid_flux()) {
                ++n_invalid;
                continue;
            }
            flux.push_back(d.flux);
            xs.push_back(d.x);
            ys.push_back(d.y);
            if (std::isfinite(d.size)) size.push_back(d.size);
        }

        json result;
        result["ok"] = true;
        result["path"] = path;
        result["n_detections"] = cat.size();
        result["n_invalid"] = n_invalid;
        result["epoch"] = cat.epoch();
        result["frame"] = cat.frame();
        result["metadata"] = cat.metadata();
        if (!flux.empty()) {
            result["x_median"] = stats::median_of(xs);
            result["y_median"] = stats::median_of(ys);
            result["flux_median"] = stats::median_of(flux);
        }
        if (!size.empty()) {
            result["size_median"] = stats::median_of(size);
        }
        print_json(result);
        return EXIT_OK;
    } catch (const std::exception& e) {
        return report_error("catalog-info", e);
    }
}

// ============================================================================
// match <target> <reference> [--config P] [--out-dir D] [overrides...]
// ============================================================================
int cmd_match(const std::string& target_path, const std::string& reference_path,
              const std::string& config_path, const std::string& out_dir,
              const MatchOverrides& overrides) {
    const std::string run_id = core::new_run_id();
    core::EventLog log(nullptr, run_id);
    std::unique_ptr<std::ofstream> events_file;

    try {
        config::Config cfg = load_config_or_default(config_path);
        apply_overrides(cfg, overrides);
        cfg.validate();

        if (!out_dir.empty() && cfg.output.write_events) {
            fs::create_directories(out_dir);
            events_file = std::make_unique<std::ofstream>(fs::path(out_dir) / "events.jsonl");
            if (!*events_file) {
                throw IOError("Cannot open events log in " + out_dir);
            }
            log.attach(events_file.get());
        }

        log.write("run_start", {{"target", target_path},
                                {"reference", reference_path},
                                {"config", config_path}});

        pipeline::SourceMatchOutput output =
            pipeline::source_match(target_path, reference_path, cfg, &log);

        json result;
        result["ok"] = true;
        result["run_id"] = run_id;
        result["normalization"] = pipeline::normalization_to_json(output.result);
        result["matching"] = pipeline::match_summary_to_json(output.matches);

        if (!out_dir.empty()) {
            log.phase_start(Phase::WRITE_OUTPUTS);
            std::vector<fs::path> written;
            try {
                written = pipeline::write_outputs(out_dir, output, cfg, run_id);
            } catch (const std::exception& e) {
                log.error(e);
                log.phase_end(Phase::WRITE_OUTPUTS, "error", {{"error", e.what()}});
                throw;
            }
            json files = json::array();
            for (const auto& p : written) files.push_back(p.string());
            result["outputs"] = files;
            log.phase_end(Phase::WRITE_OUTPUTS, "ok", {{"files", files}});
        }

        log.phase_start(Phase::DONE);
        log.phase_end(Phase::DONE, "ok");
        log.write("run_end", {{"success", true}, {"status", "ok"}});
        print_json(result);
        return EXIT_OK;
    } catch (const std::exception& e) {
        log.write("run_end", {{"success", false}, {"status", error_kind(e)}});
        return report_error("match", e);
    }
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: clump_match_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  match <target> <reference> [--config P] [--out-dir D]\n"
              << "        [--max-separation X] [--clip-sigma K] [--max-clip-iterations N]\n"
              << "        [--min-matches N] [--coordinates cartesian|spherical]\n"
              << "        [--fit-scale-position] [--fit-flux-zero-point]\n"
              << "                                  Match a target catalog to a reference and normalize\n"
              << "  catalog-info <path> [--config P]  Summarize a catalog\n"
              << "  validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]\n"
              << "                                  Validate config\n"
              << "  default-config                  Print the default config as YAML\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "\nExit codes: 0 ok, 1 usage/config/I/O error, 2 malformed catalog,\n"
              << "            3 insufficient samples, 4 degenerate fit\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_ERROR;
    }

    std::string command = argv[1];

    // Options that take no value
    const std::set<std::string> bool_flags = {
        "--stdin", "--strict-exit-codes", "--fit-scale-position", "--fit-flux-zero-point"};

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-' || std::strcmp(argv[i], "-") == 0) {
                if (count == pos) return argv[i];
                ++count;
            } else if (!bool_flags.count(argv[i]) && i + 1 < argc) {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "default-config") {
        return cmd_default_config();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return EXIT_ERROR;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "catalog-info") {
        std::string path = get_positional(0);
        if (path.empty()) {
            std::cerr << "catalog-info requires a path argument\n";
            return EXIT_ERROR;
        }
        return cmd_catalog_info(path, get_arg("--config"));
    }

    if (command == "match") {
        std::string target = get_positional(0);
        std::string reference = get_positional(1);
        if (target.empty() || reference.empty()) {
            std::cerr << "match requires <target> and <reference> arguments\n";
            return EXIT_ERROR;
        }
        MatchOverrides overrides;
        overrides.max_separation = get_arg("--max-separation");
        overrides.clip_sigma = get_arg("--clip-sigma");
        overrides.max_clip_iterations = get_arg("--max-clip-iterations");
        overrides.min_matches = get_arg("--min-matches");
        overrides.coordinates = get_arg("--coordinates");
        overrides.fit_scale_position = has_flag("--fit-scale-position");
        overrides.fit_flux_zero_point = has_flag("--fit-flux-zero-point");
        return cmd_match(target, reference, get_arg("--config"), get_arg("--out-dir"),
                         overrides);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return EXIT_ERROR;
}
