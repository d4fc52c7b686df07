#include "clump_match/normalize/normalizer.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/match/geometry.hpp"
#include "clump_match/stats/robust_fit.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace clump_match::normalize {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kArcsecPerDegree = 3600.0;
// Rounding allowance, in ulps of the largest input magnitude
constexpr double kRoundingUlps = 1024.0;

bool finite_positive(double v) { return std::isfinite(v) && v > 0.0; }

stats::RobustFitOptions fit_options(const config::NormalizationConfig& ncfg) {
    stats::RobustFitOptions opts;
    opts.clip_sigma = ncfg.clip_sigma;
    opts.max_iterations = ncfg.max_clip_iterations;
    opts.min_samples = ncfg.min_matches_required;
    return opts;
}

stats::RobustFitOptions with_tolerance(stats::RobustFitOptions opts, double magnitude) {
    opts.tolerance = kRoundingUlps * std::numeric_limits<double>::epsilon() * magnitude;
    return opts;
}

double max_abs(const std::vector<double>& values) {
    double m = 0.0;
    for (double v : values) {
        if (std::isfinite(v)) m = std::max(m, std::abs(v));
    }
    return m;
}

// Offsets inherit the rounding of the coordinates they are differences of.
double position_magnitude(const match::MatchSet& ms) {
    double m = 0.0;
    for (const auto& pair : ms.matches) {
        m = std::max({m, std::abs(pair.target.x), std::abs(pair.target.y),
                      std::abs(pair.reference.x), std::abs(pair.reference.y)});
    }
    return ms.coordinates == CoordinateSystem::SPHERICAL ? m * kArcsecPerDegree : m;
}

double flux_magnitude(const match::MatchSet& ms, double s0) {
    double m = 0.0;
    for (const auto& pair : ms.matches) {
        m = std::max({m, std::abs(pair.target.flux), std::abs(s0 * pair.reference.flux)});
    }
    return std::isfinite(m) ? m : 0.0;
}

void warn(NormalizationResult& res, const std::string& message) {
    std::cerr << "[NORM] Warning: " << message << std::endl;
    res.warnings.push_back(message);
}

// Inverse-variance weights from the combined positional uncertainty.
bool position_weights(const match::MatchSet& ms, std::vector<double>& out) {
    out.clear();
    for (const auto& m : ms.matches) {
        const double et = m.target.position_error;
        const double er = m.reference.position_error;
        if (!finite_positive(et) || !finite_positive(er)) return false;
        out.push_back(1.0 / (et * et + er * er));
    }
    return true;
}

// Weights for the flux ratio t/r from first-order error propagation.
// Excluded pairs get weight zero.
bool flux_ratio_weights(const match::MatchSet& ms, const std::vector<double>& ratios,
                        std::vector<double>& out) {
    out.assign(ms.matches.size(), 0.0);
    for (size_t i = 0; i < ms.matches.size(); ++i) {
        if (!std::isfinite(ratios[i])) continue;
        const auto& m = ms.matches[i];
        const double ft = m.target.flux;
        const double fr = m.reference.flux;
        const double et = m.target.flux_error;
        const double er = m.reference.flux_error;
        if (!finite_positive(et) || !finite_positive(er) || ft == 0.0) return false;
        const double rel = (et / ft) * (et / ft) + (er / fr) * (er / fr);
        const double var = ratios[i] * ratios[i] * rel;
        if (!finite_positive(var)) return false;
        out[i] = 1.0 / var;
    }
    return true;
}

// Weights for target = s * reference + zp, with s fixed at an initial guess.
bool flux_linear_weights(const match::MatchSet& ms, double s0, std::vector<double>& out) {
    out.clear();
    for (const auto& m : ms.matches) {
        const double et = m.target.flux_error;
        const double er = m.reference.flux_error;
        if (!finite_positive(et) || !finite_positive(er)) return false;
        out.push_back(1.0 / (et * et + s0 * s0 * er * er));
    }
    return true;
}

double initial_flux_scale(const std::vector<double>& ratios) {
    std::vector<double> finite;
    for (double r : ratios) {
        if (std::isfinite(r)) finite.push_back(r);
    }
    return finite.empty() ? 1.0 : stats::median_of(finite);
}

Eigen::Vector2d median_reference_position(const match::MatchSet& ms) {
    // Median of local offsets from the first reference keeps RA wrap-safe
    const auto& first = ms.matches.front().reference;
    std::vector<double> ux, uy;
    for (const auto& m : ms.matches) {
        const Eigen::Vector2d u = match::local_offset(m.reference.x, m.reference.y,
                                                      first.x, first.y, ms.coordinates);
        ux.push_back(u.x());
        uy.push_back(u.y());
    }
    const Eigen::Vector2d med(stats::median_of(ux), stats::median_of(uy));
    return match::apply_local_offset(med, first.x, first.y, ms.coordinates);
}

void fit_offsets(const match::MatchSet& ms, const std::vector<double>& dx,
                 const std::vector<double>& dy, const std::vector<double>* weights,
                 const stats::RobustFitOptions& opts, NormalizationResult& res) {
    const auto fx = stats::robust_fit(dx, weights, opts);
    const auto fy = stats::robust_fit(dy, weights, opts);

    res.offset_x = fx.center;
    res.offset_y = fy.center;
    res.offset_x_error = fx.standard_error();
    res.offset_y_error = fy.standard_error();
    res.scatter_x = fx.scale;
    res.scatter_y = fy.scale;

    for (size_t i = 0; i < ms.matches.size(); ++i) {
        auto& d = res.diagnostics[i];
        d.residual_x = dx[i] - res.offset_x;
        d.residual_y = dy[i] - res.offset_y;
        d.position_inlier = fx.inlier_mask[i] && fy.inlier_mask[i];
    }
}

// target - pivot = s * (reference - pivot) + d, solved over the current
// inliers and re-clipped until the inlier set is stable.
void fit_offsets_with_scale(const match::MatchSet& ms, const std::vector<double>* weights,
                            const stats::RobustFitOptions& opts, NormalizationResult& res) {
    const int n = static_cast<int>(ms.matches.size());
    const Eigen::Vector2d pivot = median_reference_position(ms);
    res.pivot_x = pivot.x();
    res.pivot_y = pivot.y();

    Eigen::MatrixXd ut(n, 2);
    Eigen::MatrixXd ur(n, 2);
    for (int i = 0; i < n; ++i) {
        const auto& m = ms.matches[static_cast<size_t>(i)];
        ut.row(i) = match::local_offset(m.target.x, m.target.y, pivot.x(), pivot.y(),
                                        ms.coordinates).transpose();
        ur.row(i) = match::local_offset(m.reference.x, m.reference.y, pivot.x(), pivot.y(),
                                        ms.coordinates).transpose();
    }

    std::vector<bool> inliers(static_cast<size_t>(n), true);
    std::vector<double> rx(static_cast<size_t>(n)), ry(static_cast<size_t>(n));
    Eigen::Vector3d p = Eigen::Vector3d::Zero();
    Eigen::Matrix3d normal = Eigen::Matrix3d::Zero();
    double chi2 = 0.0;
    int n_fit = 0;
    stats::RobustFitResult fx, fy;

    for (int iter = 0; iter < opts.max_iterations; ++iter) {
        n_fit = 0;
        for (bool b : inliers) n_fit += b ? 1 : 0;
        if (n_fit < opts.min_samples) {
            throw InsufficientSamplesError("position scale fit", n_fit, opts.min_samples);
        }

        Eigen::MatrixXd A = Eigen::MatrixXd::Zero(2 * n_fit, 3);
        Eigen::VectorXd b(2 * n_fit);
        int row = 0;
        for (int i = 0; i < n; ++i) {
            if (!inliers[static_cast<size_t>(i)]) continue;
            const double sw = weights ? std::sqrt((*weights)[static_cast<size_t>(i)]) : 1.0;
            A(row, 0) = sw * ur(i, 0);
            A(row, 1) = sw;
            b(row) = sw * ut(i, 0);
            ++row;
            A(row, 0) = sw * ur(i, 1);
            A(row, 2) = sw;
            b(row) = sw * ut(i, 1);
            ++row;
        }

        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
        if (qr.rank() < 3) {
            throw DegenerateFitError("reference positions do not constrain a position scale");
        }
        p = qr.solve(b);
        normal = A.transpose() * A;
        chi2 = (A * p - b).squaredNorm();

        for (int i = 0; i < n; ++i) {
            rx[static_cast<size_t>(i)] = ut(i, 0) - p(0) * ur(i, 0) - p(1);
            ry[static_cast<size_t>(i)] = ut(i, 1) - p(0) * ur(i, 1) - p(2);
        }
        fx = stats::robust_fit(rx, weights, opts);
        fy = stats::robust_fit(ry, weights, opts);

        std::vector<bool> next(static_cast<size_t>(n));
        for (size_t i = 0; i < next.size(); ++i) {
            next[i] = fx.inlier_mask[i] && fy.inlier_mask[i];
        }
        if (next == inliers) break;
        inliers = std::move(next);
    }

    if (!(p(0) > 0.0)) {
        throw DegenerateFitError("fitted position scale is not positive (" +
                                 std::to_string(p(0)) + ")");
    }

    res.position_scale = p(0);
    res.offset_x = p(1);
    res.offset_y = p(2);
    res.scatter_x = fx.scale;
    res.scatter_y = fy.scale;

    const int dof = 2 * n_fit - 3;
    if (dof > 0) {
        const Eigen::Matrix3d cov = (chi2 / dof) * normal.inverse();
        res.position_scale_error = std::sqrt(std::max(0.0, cov(0, 0)));
        res.offset_x_error = std::sqrt(std::max(0.0, cov(1, 1)));
        res.offset_y_error = std::sqrt(std::max(0.0, cov(2, 2)));
    } else {
        res.position_scale_error = kNaN;
        res.offset_x_error = kNaN;
        res.offset_y_error = kNaN;
    }

    for (int i = 0; i < n; ++i) {
        auto& d = res.diagnostics[static_cast<size_t>(i)];
        d.residual_x = rx[static_cast<size_t>(i)];
        d.residual_y = ry[static_cast<size_t>(i)];
        d.position_inlier = fx.inlier_mask[static_cast<size_t>(i)] &&
                            fy.inlier_mask[static_cast<size_t>(i)];
    }
}

// target = s * reference + zp over the current inliers, re-clipped on the
// residuals until the inlier set is stable.
void fit_flux_linear(const match::MatchSet& ms, const std::vector<double>* weights,
                     const stats::RobustFitOptions& opts, NormalizationResult& res) {
    const int n = static_cast<int>(ms.matches.size());
    std::vector<bool> inliers(static_cast<size_t>(n), true);
    std::vector<double> resid(static_cast<size_t>(n));
    Eigen::Vector2d p = Eigen::Vector2d::Zero();
    Eigen::Matrix2d normal = Eigen::Matrix2d::Zero();
    double chi2 = 0.0;
    int n_fit = 0;
    stats::RobustFitResult ff;

    for (int iter = 0; iter < opts.max_iterations; ++iter) {
        n_fit = 0;
        for (bool b : inliers) n_fit += b ? 1 : 0;
        if (n_fit < opts.min_samples) {
            throw InsufficientSamplesError("flux zero point fit", n_fit, opts.min_samples);
        }

        Eigen::MatrixXd A(n_fit, 2);
        Eigen::VectorXd b(n_fit);
        int row = 0;
        for (int i = 0; i < n; ++i) {
            if (!inliers[static_cast<size_t>(i)]) continue;
            const auto& m = ms.matches[static_cast<size_t>(i)];
            const double sw = weights ? std::sqrt((*weights)[static_cast<size_t>(i)]) : 1.0;
            A(row, 0) = sw * m.reference.flux;
            A(row, 1) = sw;
            b(row) = sw * m.target.flux;
            ++row;
        }

        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
        if (qr.rank() < 2) {
            throw DegenerateFitError(
                "reference fluxes do not constrain both flux scale and zero point");
        }
        p = qr.solve(b);
        normal = A.transpose() * A;
        chi2 = (A * p - b).squaredNorm();

        for (int i = 0; i < n; ++i) {
            const auto& m = ms.matches[static_cast<size_t>(i)];
            resid[static_cast<size_t>(i)] = m.target.flux - p(0) * m.reference.flux - p(1);
        }
        ff = stats::robust_fit(resid, weights, opts);
        if (ff.inlier_mask == inliers) break;
        inliers = ff.inlier_mask;
    }

    res.zero_point_fitted = true;
    res.flux_scale = p(0);
    res.flux_zero_point = p(1);
    res.flux_scatter = ff.scale;

    const int dof = n_fit - 2;
    if (dof > 0) {
        const Eigen::Matrix2d cov = (chi2 / dof) * normal.inverse();
        res.flux_scale_error = std::sqrt(std::max(0.0, cov(0, 0)));
        res.flux_zero_point_error = std::sqrt(std::max(0.0, cov(1, 1)));
    } else {
        res.flux_scale_error = kNaN;
        res.flux_zero_point_error = kNaN;
    }

    for (size_t i = 0; i < res.diagnostics.size(); ++i) {
        res.diagnostics[i].flux_inlier = ff.inlier_mask[i];
    }
}

} // namespace

NormalizationResult normalize(const match::MatchSet& ms, const config::Config& cfg) {
    const auto& ncfg = cfg.normalization;
    const auto opts = fit_options(ncfg);

    NormalizationResult res;
    res.coordinates = ms.coordinates;
    const int n = static_cast<int>(ms.matches.size());
    res.n_matches = n;

    if (n < ncfg.min_matches_required) {
        throw InsufficientSamplesError("normalization (matches)", n, ncfg.min_matches_required);
    }
    if (!(ncfg.clip_sigma > 0.0) || ncfg.max_clip_iterations < 1 ||
        ncfg.min_matches_required < 1) {
        throw ValidationError("normalization needs clip_sigma > 0, max_clip_iterations >= 1 "
                              "and min_matches_required >= 1");
    }
    if (ncfg.fit_scale_position && ncfg.min_matches_required < 2) {
        throw ValidationError("fit_scale_position requires min_matches_required >= 2");
    }

    res.diagnostics.resize(static_cast<size_t>(n));
    std::vector<double> dx(static_cast<size_t>(n)), dy(static_cast<size_t>(n));
    std::vector<double> ratios(static_cast<size_t>(n), kNaN);

    for (size_t i = 0; i < ms.matches.size(); ++i) {
        const auto& m = ms.matches[i];
        auto& d = res.diagnostics[i];
        d.target_index = m.target_index;
        d.reference_index = m.reference_index;
        d.target_id = m.target.id;
        d.reference_id = m.reference.id;
        d.separation = m.separation;
        d.ambiguous = m.ambiguous;

        const Eigen::Vector2d off = match::position_offset(m.target, m.reference, ms.coordinates);
        dx[i] = off.x();
        dy[i] = off.y();
        d.dx = dx[i];
        d.dy = dy[i];

        if (std::abs(m.reference.flux) <= ncfg.reference_flux_epsilon) {
            d.flux_excluded = true;
            ++res.n_flux_excluded;
        } else {
            ratios[i] = m.target.flux / m.reference.flux;
        }
        d.flux_ratio = ratios[i];

        d.size_ratio = (finite_positive(m.target.size) && finite_positive(m.reference.size))
                           ? m.target.size / m.reference.size
                           : kNaN;
    }

    // Optional inverse-variance weights
    std::vector<double> pos_w;
    std::vector<double> flux_w;
    const std::vector<double>* pos_w_ptr = nullptr;
    const std::vector<double>* flux_w_ptr = nullptr;
    if (ncfg.use_uncertainty_weights) {
        if (position_weights(ms, pos_w)) {
            pos_w_ptr = &pos_w;
        } else {
            warn(res, "position uncertainties missing or non-positive, position fit unweighted");
        }
        const bool flux_ok = ncfg.fit_flux_zero_point
                                 ? flux_linear_weights(ms, initial_flux_scale(ratios), flux_w)
                                 : flux_ratio_weights(ms, ratios, flux_w);
        if (flux_ok) {
            flux_w_ptr = &flux_w;
        } else {
            warn(res, "flux uncertainties missing or non-positive, flux fit unweighted");
        }
        res.weighted = pos_w_ptr != nullptr || flux_w_ptr != nullptr;
    }

    // Position
    const auto pos_opts = with_tolerance(opts, position_magnitude(ms));
    if (ncfg.fit_scale_position) {
        fit_offsets_with_scale(ms, pos_w_ptr, pos_opts, res);
    } else {
        fit_offsets(ms, dx, dy, pos_w_ptr, pos_opts, res);
    }

    // Flux scale, jointly with the zero point when requested
    if (ncfg.fit_flux_zero_point) {
        res.flux_model = FluxModel::LINEAR;
        const double s0 = initial_flux_scale(ratios);
        fit_flux_linear(ms, flux_w_ptr, with_tolerance(opts, flux_magnitude(ms, s0)), res);
    } else {
        if (res.n_flux_excluded == n) {
            throw DegenerateFitError("every matched reference flux is zero, flux scale undefined");
        }
        res.flux_model = FluxModel::RATIO;
        const auto ff =
            stats::robust_fit(ratios, flux_w_ptr, with_tolerance(opts, max_abs(ratios)));
        res.flux_scale = ff.center;
        res.flux_scale_error = ff.standard_error();
        res.flux_scatter = ff.scale;
        for (size_t i = 0; i < res.diagnostics.size(); ++i) {
            res.diagnostics[i].flux_inlier = ff.inlier_mask[i];
        }
    }

    for (size_t i = 0; i < ms.matches.size(); ++i) {
        const auto& m = ms.matches[i];
        auto& d = res.diagnostics[i];
        d.flux_residual = (d.flux_excluded && !res.zero_point_fitted)
                              ? kNaN
                              : m.target.flux - (res.flux_scale * m.reference.flux +
                                                 res.flux_zero_point);
    }

    // Size ratio
    if (ncfg.fit_size_ratio) {
        std::vector<double> size_ratios(static_cast<size_t>(n));
        for (size_t i = 0; i < res.diagnostics.size(); ++i) {
            size_ratios[i] = res.diagnostics[i].size_ratio;
        }
        const auto fsize =
            stats::robust_fit(size_ratios, nullptr, with_tolerance(opts, max_abs(size_ratios)));
        res.size_ratio = fsize.center;
        res.size_ratio_error = fsize.standard_error();
        for (size_t i = 0; i < res.diagnostics.size(); ++i) {
            res.diagnostics[i].size_inlier = fsize.inlier_mask[i];
        }
    }

    // A match is used only if it survived every statistic it fed
    for (auto& d : res.diagnostics) {
        bool used = d.position_inlier;
        if (res.zero_point_fitted || !d.flux_excluded) {
            used = used && d.flux_inlier;
        }
        if (res.size_ratio && std::isfinite(d.size_ratio)) {
            used = used && d.size_inlier;
        }
        d.used = used;
        if (used) ++res.n_used;
    }
    res.n_rejected = res.n_matches - res.n_used;

    if (res.n_used < ncfg.min_matches_required) {
        throw InsufficientSamplesError("normalization (matches used)", res.n_used,
                                       ncfg.min_matches_required);
    }

    std::cerr << "[NORM] offset=(" << res.offset_x << ", " << res.offset_y << ")"
              << " flux_scale=" << res.flux_scale;
    if (res.position_scale) std::cerr << " position_scale=" << *res.position_scale;
    if (res.zero_point_fitted) std::cerr << " zero_point=" << res.flux_zero_point;
    if (res.size_ratio) std::cerr << " size_ratio=" << *res.size_ratio;
    std::cerr << " used=" << res.n_used << "/" << res.n_matches
              << " rejected=" << res.n_rejected << std::endl;

    return res;
}

catalog::Catalog apply_normalization(const catalog::Catalog& target,
                                     const NormalizationResult& result) {
    if (!std::isfinite(result.flux_scale) || result.flux_scale == 0.0) {
        throw DegenerateFitError("flux scale " + std::to_string(result.flux_scale) +
                                 " cannot be inverted");
    }
    const double s = result.position_scale.value_or(1.0);
    if (!(s > 0.0)) {
        throw DegenerateFitError("position scale " + std::to_string(s) + " cannot be inverted");
    }
    const CoordinateSystem cs = result.coordinates;
    const Eigen::Vector2d offset(result.offset_x, result.offset_y);

    std::vector<catalog::Detection> out;
    out.reserve(target.size());
    for (const auto& d : target) {
        catalog::Detection n = d;

        if (result.position_scale) {
            const Eigen::Vector2d ut =
                match::local_offset(d.x, d.y, result.pivot_x, result.pivot_y, cs);
            const Eigen::Vector2d ur = (ut - offset) / s;
            const Eigen::Vector2d pos =
                match::apply_local_offset(ur, result.pivot_x, result.pivot_y, cs);
            n.x = pos.x();
            n.y = pos.y();
            n.position_error = d.position_error / s;
        } else {
            const Eigen::Vector2d pos = match::apply_local_offset(-offset, d.x, d.y, cs);
            n.x = pos.x();
            n.y = pos.y();
        }

        n.flux = (d.flux - result.flux_zero_point) / result.flux_scale;
        n.flux_error = d.flux_error / std::abs(result.flux_scale);
        if (result.size_ratio && *result.size_ratio > 0.0) {
            n.size = d.size / *result.size_ratio;
        }
        out.push_back(std::move(n));
    }

    return catalog::Catalog(std::move(out), target.epoch(), target.frame(), target.metadata());
}

} // namespace clump_match::normalize
