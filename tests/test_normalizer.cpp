#include "clump_match/catalog/catalog.hpp"
#include "clump_match/config/configuration.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/match/matcher.hpp"
#include "clump_match/normalize/normalizer.hpp"

#include <cmath>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace clump_match;

namespace {

catalog::Detection det(const std::string& id, double x, double y, double flux) {
    catalog::Detection d;
    d.id = id;
    d.x = x;
    d.y = y;
    d.flux = flux;
    return d;
}

// Jitter pattern -2..2 repeating with period five
int jitter_step(int i) { return (i % 5) - 2; }

const normalize::MatchDiagnostic& diagnostic_for(const normalize::NormalizationResult& res,
                                                 const std::string& target_id) {
    for (const auto& d : res.diagnostics) {
        if (d.target_id == target_id) return d;
    }
    FAIL("no diagnostic for " << target_id);
    return res.diagnostics.front();
}

struct ShiftedGrid {
    catalog::Catalog reference;
    catalog::Catalog target;
};

// Five references with flux 100; the target is shifted by 0.1 with flux 105.
ShiftedGrid five_point_grid(bool extra_target) {
    const double pts[5][2] = {{0, 0}, {1, 0}, {0, 1}, {1, 1}, {2, 2}};
    std::vector<catalog::Detection> ref, tgt;
    for (int i = 0; i < 5; ++i) {
        ref.push_back(det("r" + std::to_string(i), pts[i][0], pts[i][1], 100.0));
        tgt.push_back(det("t" + std::to_string(i), pts[i][0] + 0.1, pts[i][1] + 0.1, 105.0));
    }
    if (extra_target) tgt.push_back(det("t5", 10.0, 10.0, 500.0));
    return {catalog::Catalog(ref), catalog::Catalog(tgt)};
}

// Six references spread over a 1024 pixel frame, target shifted by an exact
// (0.3, -0.2) with every flux scaled by 1.05.
ShiftedGrid pixel_frame_shift(double zero_point) {
    const double pts[6][2] = {{100, 200}, {350, 120}, {512, 512},
                              {800, 33},  {1023, 999}, {640, 480}};
    std::vector<catalog::Detection> ref, tgt;
    for (int i = 0; i < 6; ++i) {
        const double rflux = 20000.0 + 15000.0 * i;
        ref.push_back(det("r" + std::to_string(i), pts[i][0], pts[i][1], rflux));
        tgt.push_back(det("t" + std::to_string(i), pts[i][0] + 0.3, pts[i][1] - 0.2,
                          1.05 * rflux + zero_point));
    }
    return {catalog::Catalog(ref), catalog::Catalog(tgt)};
}

} // namespace

TEST_CASE("normalize_recovers_offset_and_flux_scale") {
    const auto grid = five_point_grid(false);
    config::Config cfg;
    cfg.matching.max_separation = 0.5;

    const auto ms = match::match(grid.target, grid.reference, cfg.matching);
    REQUIRE(ms.size() == 5);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.offset_x == Catch::Approx(0.1));
    REQUIRE(res.offset_y == Catch::Approx(0.1));
    REQUIRE(res.flux_scale == Catch::Approx(1.05));
    REQUIRE(res.n_matches == 5);
    REQUIRE(res.n_used == 5);
    REQUIRE(res.n_rejected == 0);
    REQUIRE_FALSE(res.position_scale.has_value());
    REQUIRE_FALSE(res.zero_point_fitted);
    REQUIRE(res.flux_model == FluxModel::RATIO);
    REQUIRE(res.warnings.empty());
}

TEST_CASE("normalize_exact_shift_on_pixel_coordinates_keeps_every_match") {
    const auto frame = pixel_frame_shift(0.0);
    config::Config cfg;
    const auto ms = match::match(frame.target, frame.reference, cfg.matching);
    REQUIRE(ms.size() == 6);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.offset_x == Catch::Approx(0.3).margin(1e-9));
    REQUIRE(res.offset_y == Catch::Approx(-0.2).margin(1e-9));
    REQUIRE(res.flux_scale == Catch::Approx(1.05));
    REQUIRE(res.n_used == 6);
    REQUIRE(res.n_rejected == 0);
    for (const auto& d : res.diagnostics) {
        REQUIRE(d.position_inlier);
        REQUIRE(d.flux_inlier);
    }
}

TEST_CASE("normalize_exact_shift_with_position_scale_keeps_every_match") {
    const auto frame = pixel_frame_shift(0.0);
    config::Config cfg;
    cfg.normalization.fit_scale_position = true;
    const auto ms = match::match(frame.target, frame.reference, cfg.matching);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.position_scale.has_value());
    REQUIRE(*res.position_scale == Catch::Approx(1.0).margin(1e-9));
    REQUIRE(res.offset_x == Catch::Approx(0.3).margin(1e-6));
    REQUIRE(res.offset_y == Catch::Approx(-0.2).margin(1e-6));
    REQUIRE(res.n_used == 6);
    REQUIRE(res.n_rejected == 0);
}

TEST_CASE("normalize_exact_linear_flux_relation_keeps_every_match") {
    const auto frame = pixel_frame_shift(250.0);
    config::Config cfg;
    cfg.normalization.fit_flux_zero_point = true;
    const auto ms = match::match(frame.target, frame.reference, cfg.matching);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.flux_model == FluxModel::LINEAR);
    REQUIRE(res.flux_scale == Catch::Approx(1.05).margin(1e-9));
    REQUIRE(res.flux_zero_point == Catch::Approx(250.0).margin(1e-4));
    REQUIRE(res.n_used == 6);
    REQUIRE(res.n_rejected == 0);
}

TEST_CASE("normalize_excludes_zero_reference_flux_from_flux_fit_only") {
    std::vector<catalog::Detection> ref, tgt;
    for (int i = 0; i < 6; ++i) {
        const double j = 0.01 * jitter_step(i);
        const double rflux = (i == 2) ? 0.0 : 100.0 + 20.0 * i;
        const double tflux = (i == 2) ? 7.0 : 1.05 * (1.0 + j) * rflux;
        ref.push_back(det("r" + std::to_string(i), 40.0 * i, 10.0, rflux));
        tgt.push_back(det("t" + std::to_string(i), 40.0 * i + 0.4 + j, 9.8 - j, tflux));
    }

    config::Config cfg;
    cfg.matching.max_separation = 2.0;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);
    REQUIRE(ms.size() == 6);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.n_flux_excluded == 1);
    REQUIRE(res.flux_scale == Catch::Approx(1.05).margin(0.02));
    REQUIRE(res.n_used == 6);
    REQUIRE(res.n_rejected == 0);

    const auto& zero_flux = diagnostic_for(res, "t2");
    REQUIRE(zero_flux.flux_excluded);
    REQUIRE(zero_flux.position_inlier);
    REQUIRE(zero_flux.used);
    REQUIRE_FALSE(zero_flux.flux_inlier);
    REQUIRE(std::isnan(zero_flux.flux_ratio));
    REQUIRE(std::isnan(zero_flux.flux_residual));
}

TEST_CASE("normalize_ignores_unmatched_extra_target") {
    const auto grid = five_point_grid(true);
    config::Config cfg;
    cfg.matching.max_separation = 0.5;

    const auto ms = match::match(grid.target, grid.reference, cfg.matching);
    REQUIRE(ms.size() == 5);
    REQUIRE(ms.unmatched_target.size() == 1);
    REQUIRE(ms.unmatched_target[0].detection.id == "t5");

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.offset_x == Catch::Approx(0.1));
    REQUIRE(res.offset_y == Catch::Approx(0.1));
    REQUIRE(res.flux_scale == Catch::Approx(1.05));
    REQUIRE(res.n_used == 5);
}

TEST_CASE("normalize_rejects_injected_outliers") {
    std::vector<catalog::Detection> ref, tgt;
    for (int i = 0; i < 10; ++i) {
        const double j = 0.01 * jitter_step(i);
        const double rflux = 100.0 + 10.0 * i;
        ref.push_back(det("r" + std::to_string(i), 10.0 * i, 0.0, rflux));

        double x = 10.0 * i + 0.5 + j;
        double ratio = 2.0 * (1.0 + j);
        if (i == 3) x += 3.0;      // position outlier
        if (i == 7) ratio = 10.0;  // flux outlier
        tgt.push_back(det("t" + std::to_string(i), x, -0.3 + j, rflux * ratio));
    }

    config::Config cfg;
    cfg.matching.max_separation = 4.0;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);
    REQUIRE(ms.size() == 10);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.offset_x == Catch::Approx(0.5).margin(0.01));
    REQUIRE(res.offset_y == Catch::Approx(-0.3).margin(0.01));
    REQUIRE(res.flux_scale == Catch::Approx(2.0).margin(0.02));
    REQUIRE(res.n_used == 8);
    REQUIRE(res.n_rejected == 2);

    const auto& pos_outlier = diagnostic_for(res, "t3");
    REQUIRE_FALSE(pos_outlier.position_inlier);
    REQUIRE(pos_outlier.flux_inlier);
    REQUIRE_FALSE(pos_outlier.used);

    const auto& flux_outlier = diagnostic_for(res, "t7");
    REQUIRE(flux_outlier.position_inlier);
    REQUIRE_FALSE(flux_outlier.flux_inlier);
    REQUIRE_FALSE(flux_outlier.used);
    REQUIRE(flux_outlier.flux_ratio == Catch::Approx(10.0));

    REQUIRE(diagnostic_for(res, "t0").used);
}

TEST_CASE("normalize_requires_minimum_matches") {
    std::vector<catalog::Detection> ref = {det("r0", 0, 0, 1), det("r1", 5, 5, 1)};
    std::vector<catalog::Detection> tgt = {det("t0", 0.1, 0, 1), det("t1", 5.1, 5, 1)};

    config::Config cfg;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);
    REQUIRE(ms.size() == 2);

    try {
        normalize::normalize(ms, cfg);
        FAIL("expected InsufficientSamplesError");
    } catch (const InsufficientSamplesError& e) {
        REQUIRE(e.available() == 2);
        REQUIRE(e.required() == 3);
    }

    cfg.normalization.min_matches_required = 2;
    REQUIRE_NOTHROW(normalize::normalize(ms, cfg));
}

TEST_CASE("normalize_recovers_position_scale_and_inverts_it") {
    std::vector<catalog::Detection> ref, tgt;
    int i = 0;
    for (int gy = 0; gy < 4; ++gy) {
        for (int gx = 0; gx < 4; ++gx, ++i) {
            const double rx = 10.0 * gx;
            const double ry = 10.0 * gy;
            const double jx = 0.002 * jitter_step(i);
            const double jy = 0.002 * jitter_step(i + 3);
            ref.push_back(det("r" + std::to_string(i), rx, ry, 50.0));
            tgt.push_back(det("t" + std::to_string(i), 15.0 + 1.02 * (rx - 15.0) + 0.3 + jx,
                              15.0 + 1.02 * (ry - 15.0) - 0.2 + jy, 50.0));
        }
    }
    const catalog::Catalog target(tgt);

    config::Config cfg;
    cfg.matching.max_separation = 2.0;
    cfg.normalization.fit_scale_position = true;
    const auto ms = match::match(target, catalog::Catalog(ref), cfg.matching);
    REQUIRE(ms.size() == 16);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.position_scale.has_value());
    REQUIRE(*res.position_scale == Catch::Approx(1.02).margin(1e-3));
    REQUIRE(res.pivot_x == Catch::Approx(15.0));
    REQUIRE(res.pivot_y == Catch::Approx(15.0));
    REQUIRE(res.offset_x == Catch::Approx(0.3).margin(5e-3));
    REQUIRE(res.offset_y == Catch::Approx(-0.2).margin(5e-3));
    REQUIRE(res.position_scale_error > 0.0);
    REQUIRE(res.n_used == 16);

    const auto normalized = normalize::apply_normalization(target, res);
    REQUIRE(normalized.size() == target.size());
    for (size_t k = 0; k < normalized.size(); ++k) {
        REQUIRE(normalized[k].id == target[k].id);
        REQUIRE(normalized[k].x == Catch::Approx(ref[k].x).margin(0.01));
        REQUIRE(normalized[k].y == Catch::Approx(ref[k].y).margin(0.01));
    }
}

TEST_CASE("normalize_identical_reference_positions_are_degenerate") {
    std::vector<catalog::Detection> ref = {det("r0", 5, 5, 10), det("r1", 5, 5, 10),
                                           det("r2", 5, 5, 10)};
    std::vector<catalog::Detection> tgt = {det("t0", 5.1, 5, 10), det("t1", 5, 5.1, 10),
                                           det("t2", 4.9, 5, 10)};

    config::Config cfg;
    cfg.matching.max_separation = 1.0;
    cfg.normalization.fit_scale_position = true;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);
    REQUIRE(ms.size() == 3);

    REQUIRE_THROWS_AS(normalize::normalize(ms, cfg), DegenerateFitError);
}

TEST_CASE("normalize_zero_reference_flux_is_degenerate") {
    std::vector<catalog::Detection> ref = {det("r0", 0, 0, 0), det("r1", 10, 0, 0),
                                           det("r2", 20, 0, 0)};
    std::vector<catalog::Detection> tgt = {det("t0", 0.5, 0, 3), det("t1", 10.5, 0, 4),
                                           det("t2", 20.5, 0, 5)};

    config::Config cfg;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);
    REQUIRE(ms.size() == 3);

    REQUIRE_THROWS_AS(normalize::normalize(ms, cfg), DegenerateFitError);
}

TEST_CASE("normalize_recovers_flux_zero_point") {
    std::vector<catalog::Detection> ref, tgt;
    for (int i = 0; i < 10; ++i) {
        const double rflux = 100.0 * (i + 1);
        double tflux = 1.5 * rflux + 20.0 + 0.5 * jitter_step(i);
        if (i == 4) tflux += 500.0;
        ref.push_back(det("r" + std::to_string(i), 10.0 * i, 0.0, rflux));
        tgt.push_back(det("t" + std::to_string(i), 10.0 * i + 0.5, 0.25, tflux));
    }

    config::Config cfg;
    cfg.matching.max_separation = 2.0;
    cfg.normalization.fit_flux_zero_point = true;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);
    REQUIRE(ms.size() == 10);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.zero_point_fitted);
    REQUIRE(res.flux_model == FluxModel::LINEAR);
    REQUIRE(res.flux_scale == Catch::Approx(1.5).margin(0.01));
    REQUIRE(res.flux_zero_point == Catch::Approx(20.0).margin(2.0));
    REQUIRE(res.n_used == 9);
    REQUIRE_FALSE(diagnostic_for(res, "t4").flux_inlier);
    REQUIRE(std::abs(diagnostic_for(res, "t0").flux_residual) < 2.0);
}

TEST_CASE("normalize_zero_point_with_equal_reference_fluxes_is_degenerate") {
    std::vector<catalog::Detection> ref = {det("r0", 0, 0, 100), det("r1", 10, 0, 100),
                                           det("r2", 20, 0, 100)};
    std::vector<catalog::Detection> tgt = {det("t0", 0.5, 0, 150), det("t1", 10.5, 0, 151),
                                           det("t2", 20.5, 0, 149)};

    config::Config cfg;
    cfg.normalization.fit_flux_zero_point = true;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);
    REQUIRE_THROWS_AS(normalize::normalize(ms, cfg), DegenerateFitError);
}

TEST_CASE("normalize_size_ratio_and_apply_normalization") {
    std::vector<catalog::Detection> ref, tgt;
    for (int i = 0; i < 5; ++i) {
        auto r = det("r" + std::to_string(i), 10.0 * i, 0.0, 100.0);
        r.size = 1.0 + i;
        auto t = det("t" + std::to_string(i), 10.0 * i + 0.25, -0.5, 250.0);
        t.size = 2.0 * r.size;
        t.flux_error = 5.0;
        ref.push_back(r);
        tgt.push_back(t);
    }
    const catalog::Catalog target(tgt, "epoch_b", "ICRS");

    config::Config cfg;
    cfg.matching.max_separation = 1.0;
    cfg.normalization.fit_size_ratio = true;
    const auto ms = match::match(target, catalog::Catalog(ref), cfg.matching);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.size_ratio.has_value());
    REQUIRE(*res.size_ratio == Catch::Approx(2.0));
    REQUIRE(res.flux_scale == Catch::Approx(2.5));

    const auto normalized = normalize::apply_normalization(target, res);
    REQUIRE(normalized.epoch() == "epoch_b");
    REQUIRE(normalized.frame() == "ICRS");
    for (size_t k = 0; k < normalized.size(); ++k) {
        REQUIRE(normalized[k].x == Catch::Approx(ref[k].x).margin(1e-9));
        REQUIRE(normalized[k].y == Catch::Approx(0.0).margin(1e-9));
        REQUIRE(normalized[k].flux == Catch::Approx(100.0));
        REQUIRE(normalized[k].flux_error == Catch::Approx(2.0));
        REQUIRE(normalized[k].size == Catch::Approx(ref[k].size));
    }
}

TEST_CASE("normalize_weights_fall_back_with_warning") {
    const auto grid = five_point_grid(false);
    config::Config cfg;
    cfg.matching.max_separation = 0.5;
    cfg.normalization.use_uncertainty_weights = true;

    const auto ms = match::match(grid.target, grid.reference, cfg.matching);
    const auto res = normalize::normalize(ms, cfg);
    REQUIRE_FALSE(res.weighted);
    REQUIRE(res.warnings.size() == 2);
    REQUIRE(res.offset_x == Catch::Approx(0.1));
    REQUIRE(res.flux_scale == Catch::Approx(1.05));
}

TEST_CASE("normalize_uses_weights_when_uncertainties_present") {
    std::vector<catalog::Detection> ref, tgt;
    for (int i = 0; i < 6; ++i) {
        auto r = det("r" + std::to_string(i), 10.0 * i, 0.0, 100.0);
        r.position_error = 0.1;
        r.flux_error = 2.0;
        auto t = det("t" + std::to_string(i), 10.0 * i + 0.5, 0.25, 300.0);
        t.position_error = 0.1 * (i + 1);
        t.flux_error = 3.0 * (i + 1);
        ref.push_back(r);
        tgt.push_back(t);
    }

    config::Config cfg;
    cfg.matching.max_separation = 1.0;
    cfg.normalization.use_uncertainty_weights = true;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.weighted);
    REQUIRE(res.warnings.empty());
    REQUIRE(res.offset_x == Catch::Approx(0.5));
    REQUIRE(res.offset_y == Catch::Approx(0.25));
    REQUIRE(res.flux_scale == Catch::Approx(3.0));
    REQUIRE(res.n_used == 6);
}

TEST_CASE("normalize_spherical_offsets_across_ra_wrap") {
    const std::vector<double> ras = {359.99, 359.995, 359.9997, 0.005, 0.01};
    std::vector<catalog::Detection> ref, tgt;
    for (int i = 0; i < 5; ++i) {
        const double dra_arcsec = 2.0 + 0.02 * jitter_step(i);
        double tra = ras[static_cast<size_t>(i)] + dra_arcsec / 3600.0;
        if (tra >= 360.0) tra -= 360.0;
        ref.push_back(det("r" + std::to_string(i), ras[static_cast<size_t>(i)], 0.0, 1.0));
        tgt.push_back(det("t" + std::to_string(i), tra, 0.0, 1.0));
    }

    config::Config cfg;
    cfg.matching.coordinates = "spherical";
    cfg.matching.max_separation = 5.0;
    const auto ms = match::match(catalog::Catalog(tgt), catalog::Catalog(ref), cfg.matching);
    REQUIRE(ms.size() == 5);

    const auto res = normalize::normalize(ms, cfg);
    REQUIRE(res.coordinates == CoordinateSystem::SPHERICAL);
    REQUIRE(res.offset_x == Catch::Approx(2.0).margin(1e-6));
    REQUIRE(res.offset_y == Catch::Approx(0.0).margin(1e-9));
    REQUIRE(res.n_used == 5);
}

TEST_CASE("apply_normalization_rejects_zero_flux_scale") {
    const auto grid = five_point_grid(false);
    normalize::NormalizationResult res;
    res.flux_scale = 0.0;
    REQUIRE_THROWS_AS(normalize::apply_normalization(grid.target, res), DegenerateFitError);
}
