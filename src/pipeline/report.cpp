#include "clump_match/pipeline/report.hpp"
#include "clump_match/catalog/catalog.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/core/utils.hpp"

#include <iostream>

namespace clump_match::pipeline {

json normalization_to_json(const normalize::NormalizationResult& r) {
    json j;
    j["coordinates"] = coordinate_system_to_string(r.coordinates);
    j["offset"] = {
        {"x", r.offset_x},
        {"y", r.offset_y},
        {"x_error", r.offset_x_error},
        {"y_error", r.offset_y_error},
        {"scatter_x", r.scatter_x},
        {"scatter_y", r.scatter_y},
        {"units", r.coordinates == CoordinateSystem::SPHERICAL ? "arcsec" : "input"}
    };
    if (r.position_scale) {
        j["position_scale"] = {
            {"value", *r.position_scale},
            {"error", r.position_scale_error},
            {"pivot_x", r.pivot_x},
            {"pivot_y", r.pivot_y}
        };
    } else {
        j["position_scale"] = nullptr;
    }
    j["flux_model"] = flux_model_to_string(r.flux_model);
    j["flux_scale"] = {
        {"value", r.flux_scale},
        {"error", r.flux_scale_error},
        {"scatter", r.flux_scatter}
    };
    if (r.zero_point_fitted) {
        j["flux_zero_point"] = {
            {"value", r.flux_zero_point},
            {"error", r.flux_zero_point_error}
        };
    } else {
        j["flux_zero_point"] = nullptr;
    }
    if (r.size_ratio) {
        j["size_ratio"] = {
            {"value", *r.size_ratio},
            {"error", r.size_ratio_error}
        };
    } else {
        j["size_ratio"] = nullptr;
    }
    j["weighted"] = r.weighted;
    j["n_matches"] = r.n_matches;
    j["n_used"] = r.n_used;
    j["n_rejected"] = r.n_rejected;
    j["n_flux_excluded"] = r.n_flux_excluded;
    j["warnings"] = r.warnings;
    return j;
}

json match_summary_to_json(const match::MatchSet& ms, bool list_detections) {
    auto unmatched_json = [list_detections](const std::vector<match::Unmatched>& list) {
        json by_reason = json::object();
        json ids = json::array();
        for (const auto& u : list) {
            const std::string reason = match::unmatched_reason_to_string(u.reason);
            by_reason[reason] = by_reason.value(reason, 0) + 1;
            ids.push_back({{"id", u.detection.id}, {"index", u.index}, {"reason", reason}});
        }
        json j{{"count", list.size()}, {"by_reason", by_reason}};
        if (list_detections) j["detections"] = ids;
        return j;
    };

    json j;
    j["coordinates"] = coordinate_system_to_string(ms.coordinates);
    j["max_separation"] = ms.max_separation;
    j["n_candidates"] = ms.n_candidates;
    j["n_matches"] = ms.matches.size();
    j["n_ambiguous"] = ms.count_ambiguous();
    j["unmatched_target"] = unmatched_json(ms.unmatched_target);
    j["unmatched_reference"] = unmatched_json(ms.unmatched_reference);
    return j;
}

json catalog_summary_to_json(const catalog::Catalog& cat, const fs::path& path) {
    return {
        {"path", path.string()},
        {"n_detections", cat.size()},
        {"epoch", cat.epoch()},
        {"frame", cat.frame()}
    };
}

io::Table build_match_table(const match::MatchSet& ms,
                            const normalize::NormalizationResult& result) {
    if (result.diagnostics.size() != ms.matches.size()) {
        throw ValidationError("normalization diagnostics do not belong to this match set");
    }

    const size_t n = ms.matches.size();
    std::vector<std::string> target_id, reference_id, status;
    std::vector<double> target_index, reference_index, separation, dx, dy, rx, ry,
        flux_ratio, flux_residual, size_ratio, pos_in, flux_in, size_in, used,
        ambiguous;

    for (size_t i = 0; i < n; ++i) {
        const auto& d = result.diagnostics[i];
        target_id.push_back(d.target_id);
        reference_id.push_back(d.reference_id);
        target_index.push_back(d.target_index);
        reference_index.push_back(d.reference_index);
        separation.push_back(d.separation);
        dx.push_back(d.dx);
        dy.push_back(d.dy);
        rx.push_back(d.residual_x);
        ry.push_back(d.residual_y);
        flux_ratio.push_back(d.flux_ratio);
        flux_residual.push_back(d.flux_residual);
        size_ratio.push_back(d.size_ratio);
        pos_in.push_back(d.position_inlier ? 1.0 : 0.0);
        flux_in.push_back(d.flux_inlier ? 1.0 : 0.0);
        size_in.push_back(d.size_inlier ? 1.0 : 0.0);
        used.push_back(d.used ? 1.0 : 0.0);
        ambiguous.push_back(d.ambiguous ? 1.0 : 0.0);
        status.push_back(d.used ? "used" : "rejected");
    }

    const std::string pos_unit =
        result.coordinates == CoordinateSystem::SPHERICAL ? "arcsec" : "";

    io::Table table;
    table.add_text("target_id", std::move(target_id));
    table.add_text("reference_id", std::move(reference_id));
    table.add_numeric("target_index", std::move(target_index));
    table.add_numeric("reference_index", std::move(reference_index));
    table.add_numeric("separation", std::move(separation), pos_unit);
    table.add_numeric("dx", std::move(dx), pos_unit);
    table.add_numeric("dy", std::move(dy), pos_unit);
    table.add_numeric("residual_x", std::move(rx), pos_unit);
    table.add_numeric("residual_y", std::move(ry), pos_unit);
    table.add_numeric("flux_ratio", std::move(flux_ratio));
    table.add_numeric("flux_residual", std::move(flux_residual));
    table.add_numeric("size_ratio", std::move(size_ratio));
    table.add_numeric("position_inlier", std::move(pos_in));
    table.add_numeric("flux_inlier", std::move(flux_in));
    table.add_numeric("size_inlier", std::move(size_in));
    table.add_numeric("used", std::move(used));
    table.add_numeric("ambiguous", std::move(ambiguous));
    table.add_text("status", std::move(status));
    table.n_rows = n;
    return table;
}

std::vector<fs::path> write_outputs(const fs::path& out_dir,
                                    const SourceMatchOutput& output,
                                    const config::Config& cfg,
                                    const std::string& run_id) {
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        throw IOError("Cannot create output directory " + out_dir.string() + ": " + ec.message());
    }

    std::vector<fs::path> written;

    json provenance = {
        {"run_id", run_id},
        {"created", core::utc_timestamp()},
        {"target", {{"path", output.target_path.string()},
                    {"epoch", output.target.epoch()},
                    {"n_detections", output.target.size()}}},
        {"reference", {{"path", output.reference_path.string()},
                       {"epoch", output.reference.epoch()},
                       {"n_detections", output.reference.size()}}}
    };
    if (!output.target_path.empty() && fs::exists(output.target_path)) {
        provenance["target"]["sha256"] = core::sha256_file(output.target_path);
    }
    if (!output.reference_path.empty() && fs::exists(output.reference_path)) {
        provenance["reference"]["sha256"] = core::sha256_file(output.reference_path);
    }

    json doc;
    doc["normalization"] = normalization_to_json(output.result);
    doc["matching"] = match_summary_to_json(output.matches);
    doc["provenance"] = provenance;

    const fs::path json_path = out_dir / "normalization.json";
    core::write_text(json_path, doc.dump(2));
    written.push_back(json_path);

    const io::Table table = build_match_table(output.matches, output.result);
    const std::string& fmt = cfg.output.table_format;
    if (fmt == "csv" || fmt == "both") {
        const fs::path p = out_dir / "matches.csv";
        io::write_delimited_table(p, table, ',');
        written.push_back(p);
    }
    if (fmt == "fits" || fmt == "both") {
        const fs::path p = out_dir / "matches.fits";
        io::write_fits_table(p, table, "MATCHES");
        written.push_back(p);
    }

    const fs::path cfg_path = out_dir / "config.yaml";
    cfg.save(cfg_path);
    written.push_back(cfg_path);

    if (cfg.output.write_normalized_catalog) {
        const fs::path p = out_dir / "normalized_catalog.csv";
        catalog::write_catalog(p, normalize::apply_normalization(output.target, output.result));
        written.push_back(p);
    }

    std::cerr << "[OUT] wrote " << written.size() << " files to " << out_dir.string()
              << std::endl;
    return written;
}

} // namespace clump_match::pipeline
