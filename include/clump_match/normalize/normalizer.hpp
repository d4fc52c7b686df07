#pragma once

#include "clump_match/catalog/catalog.hpp"
#include "clump_match/config/configuration.hpp"
#include "clump_match/core/types.hpp"
#include "clump_match/match/matcher.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clump_match::normalize {

// Per-match residuals and clipping flags
struct MatchDiagnostic {
    int target_index = -1;
    int reference_index = -1;
    std::string target_id;
    std::string reference_id;
    double separation = 0.0;
    bool ambiguous = false;

    double dx = 0.0;            // target - reference (arcsec for spherical)
    double dy = 0.0;
    double residual_x = 0.0;    // after the fitted position model
    double residual_y = 0.0;
    double flux_ratio = 0.0;    // target / reference, NaN when excluded
    double flux_residual = 0.0; // target - (scale * reference + zero point)
    double size_ratio = 0.0;    // NaN unless both sizes are finite and positive

    bool position_inlier = false;
    bool flux_inlier = false;
    bool size_inlier = false;
    bool flux_excluded = false;  // ratio undefined, |reference flux| <= epsilon
    bool used = false;           // inlier in every statistic it contributed to
};

struct NormalizationResult {
    CoordinateSystem coordinates = CoordinateSystem::CARTESIAN;

    // Position: target - pivot = s * (reference - pivot) + offset
    double offset_x = 0.0;
    double offset_y = 0.0;
    double offset_x_error = 0.0;
    double offset_y_error = 0.0;
    double scatter_x = 0.0;
    double scatter_y = 0.0;
    std::optional<double> position_scale;
    double position_scale_error = 0.0;
    double pivot_x = 0.0;
    double pivot_y = 0.0;

    // Flux: target = flux_scale * reference + flux_zero_point
    FluxModel flux_model = FluxModel::RATIO;
    double flux_scale = 1.0;
    double flux_scale_error = 0.0;
    double flux_scatter = 0.0;
    bool zero_point_fitted = false;
    double flux_zero_point = 0.0;
    double flux_zero_point_error = 0.0;

    std::optional<double> size_ratio;
    double size_ratio_error = 0.0;

    bool weighted = false;
    int n_matches = 0;
    int n_used = 0;
    int n_rejected = 0;
    int n_flux_excluded = 0;

    std::vector<MatchDiagnostic> diagnostics;  // same order as the MatchSet
    std::vector<std::string> warnings;
};

// Robust offsets and flux scale from matched pairs. Throws
// InsufficientSamplesError when too few matches exist or survive clipping,
// DegenerateFitError when a scale is undefined.
NormalizationResult normalize(const match::MatchSet& matches, const config::Config& cfg);

// Map a target catalog into the reference frame (inverse of the fitted
// relation). Identifiers and metadata are preserved.
catalog::Catalog apply_normalization(const catalog::Catalog& target,
                                     const NormalizationResult& result);

} // namespace clump_match::normalize
