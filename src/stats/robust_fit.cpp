#include "clump_match/stats/robust_fit.hpp"
#include "clump_match/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace clump_match::stats {

double RobustFitResult::standard_error() const {
    if (n_inliers <= 0) return std::numeric_limits<double>::quiet_NaN();
    return scale / std::sqrt(static_cast<double>(n_inliers));
}

double median_of(std::vector<double> values) {
    if (values.empty()) {
        throw InsufficientSamplesError("median", 0, 1);
    }
    const size_t n = values.size();
    const size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<long>(mid), values.end());
    const double upper = values[mid];
    if (n % 2 == 1) return upper;
    const double lower = *std::max_element(values.begin(), values.begin() + static_cast<long>(mid));
    return 0.5 * (lower + upper);
}

double weighted_median(const std::vector<double>& values, const std::vector<double>& weights) {
    if (values.size() != weights.size()) {
        throw ValidationError("weighted_median: " + std::to_string(values.size()) +
                              " values but " + std::to_string(weights.size()) + " weights");
    }
    if (values.empty()) {
        throw InsufficientSamplesError("weighted median", 0, 1);
    }

    std::vector<std::pair<double, double>> vw;
    vw.reserve(values.size());
    double total = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (weights[i] > 0.0) {
            vw.emplace_back(values[i], weights[i]);
            total += weights[i];
        }
    }
    if (vw.empty() || !(total > 0.0)) {
        throw ValidationError("weighted_median: weights sum to zero");
    }
    std::sort(vw.begin(), vw.end());

    const double half = 0.5 * total;
    const double tol = 1.0e-12 * total;
    double cum = 0.0;
    for (size_t k = 0; k < vw.size(); ++k) {
        cum += vw[k].second;
        if (cum >= half - tol) {
            // Exactly half the weight below: midpoint with the next value
            if (std::abs(cum - half) <= tol && k + 1 < vw.size()) {
                return 0.5 * (vw[k].first + vw[k + 1].first);
            }
            return vw[k].first;
        }
    }
    return vw.back().first;
}

namespace {

struct CenterScale {
    double center;
    double scale;
};

CenterScale estimate(const std::vector<double>& samples, const std::vector<double>* weights,
                     const std::vector<bool>& mask) {
    std::vector<double> vals;
    std::vector<double> wts;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (!mask[i]) continue;
        vals.push_back(samples[i]);
        if (weights) wts.push_back((*weights)[i]);
    }

    CenterScale cs{};
    cs.center = weights ? weighted_median(vals, wts) : median_of(vals);
    for (double& v : vals) v = std::abs(v - cs.center);
    const double mad = weights ? weighted_median(vals, wts) : median_of(vals);
    cs.scale = MAD_TO_SIGMA * mad;
    return cs;
}

} // namespace

RobustFitResult robust_fit(const std::vector<double>& samples,
                           const std::vector<double>* weights,
                           const RobustFitOptions& options) {
    if (!(options.clip_sigma > 0.0)) {
        throw ValidationError("clip_sigma must be > 0");
    }
    if (options.max_iterations < 1) {
        throw ValidationError("max_iterations must be >= 1");
    }
    if (options.min_samples < 1) {
        throw ValidationError("min_samples must be >= 1");
    }
    if (!std::isfinite(options.tolerance) || options.tolerance < 0.0) {
        throw ValidationError("tolerance must be finite and non-negative");
    }
    if (weights) {
        if (weights->size() != samples.size()) {
            throw ValidationError("robust_fit: " + std::to_string(samples.size()) +
                                  " samples but " + std::to_string(weights->size()) + " weights");
        }
        for (double w : *weights) {
            if (!std::isfinite(w) || w < 0.0) {
                throw ValidationError("robust_fit: weights must be finite and non-negative");
            }
        }
    }

    RobustFitResult res;
    res.inlier_mask.assign(samples.size(), false);
    int n = 0;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (std::isfinite(samples[i])) {
            res.inlier_mask[i] = true;
            ++n;
        }
    }
    if (n < options.min_samples) {
        throw InsufficientSamplesError("robust fit", n, options.min_samples);
    }

    CenterScale cs{};
    for (int iter = 1; iter <= options.max_iterations; ++iter) {
        cs = estimate(samples, weights, res.inlier_mask);
        res.iterations = iter;

        // A zero scale still keeps samples within rounding of the center
        const double floor = std::max(options.tolerance,
                                      64.0 * std::numeric_limits<double>::epsilon() *
                                          std::max(1.0, std::abs(cs.center)));
        const double threshold = std::max(options.clip_sigma * cs.scale, floor);

        int removed = 0;
        for (size_t i = 0; i < samples.size(); ++i) {
            if (!res.inlier_mask[i]) continue;
            if (std::abs(samples[i] - cs.center) > threshold) {
                res.inlier_mask[i] = false;
                ++removed;
            }
        }

        if (removed == 0) {
            res.converged = true;
            break;
        }
        n -= removed;
        if (n < options.min_samples) {
            throw InsufficientSamplesError("robust fit after clipping", n, options.min_samples);
        }
    }

    if (!res.converged) {
        cs = estimate(samples, weights, res.inlier_mask);
    }

    res.center = cs.center;
    res.scale = cs.scale;
    res.n_inliers = n;
    return res;
}

} // namespace clump_match::stats
