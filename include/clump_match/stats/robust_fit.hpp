#pragma once

#include <vector>

namespace clump_match::stats {

// MAD to Gaussian sigma
constexpr double MAD_TO_SIGMA = 1.4826;

struct RobustFitOptions {
    double clip_sigma = 3.0;  // clip beyond k robust sigmas
    int max_iterations = 10;
    int min_samples = 3;
    // Absolute rounding tolerance of the samples. Deviations within it are
    // never clipped, so a zero scale keeps samples that differ only by
    // the precision of the values they were derived from.
    double tolerance = 0.0;
};

struct RobustFitResult {
    double center = 0.0;
    double scale = 0.0;             // 1.4826 * MAD of the final inliers
    std::vector<bool> inlier_mask;  // same length as the input samples
    int n_inliers = 0;
    int iterations = 0;
    bool converged = false;         // stopped because nothing was removed

    double standard_error() const;
};

// Median of the values (mean of the two middle values for even counts).
double median_of(std::vector<double> values);

// Weighted median. With equal weights this equals median_of.
double weighted_median(const std::vector<double>& values, const std::vector<double>& weights);

// Iterative sigma clipping around the (weighted) median. Non-finite samples
// start out as outliers. Throws InsufficientSamplesError when fewer than
// options.min_samples inliers exist at the start or after any iteration,
// ValidationError for bad weights or options. The clip threshold never
// drops below max(options.tolerance, 64 * eps * max(1, |center|)).
RobustFitResult robust_fit(const std::vector<double>& samples,
                           const std::vector<double>* weights = nullptr,
                           const RobustFitOptions& options = RobustFitOptions());

} // namespace clump_match::stats
