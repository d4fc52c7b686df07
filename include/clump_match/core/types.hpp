#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace clump_match {

namespace fs = std::filesystem;

using MatrixXd = Eigen::MatrixXd;
using VectorXd = Eigen::VectorXd;

namespace detail {

inline std::string normalize_token(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

} // namespace detail

// Coordinate convention of catalog positions
enum class CoordinateSystem {
    UNKNOWN,
    CARTESIAN,  // x/y in arbitrary linear units, Euclidean separations
    SPHERICAL   // RA/Dec in degrees, great-circle separations in arcsec
};

inline std::string coordinate_system_to_string(CoordinateSystem cs) {
    switch (cs) {
        case CoordinateSystem::CARTESIAN: return "cartesian";
        case CoordinateSystem::SPHERICAL: return "spherical";
        default: return "unknown";
    }
}

inline CoordinateSystem string_to_coordinate_system(const std::string& s) {
    const std::string norm = detail::normalize_token(s);
    if (norm == "cartesian" || norm == "euclidean") return CoordinateSystem::CARTESIAN;
    if (norm == "spherical" || norm == "sky") return CoordinateSystem::SPHERICAL;
    return CoordinateSystem::UNKNOWN;
}

// What the matcher does with a pair that has a near-tied competitor
enum class AmbiguityPolicy {
    UNKNOWN,
    NEAREST,  // accept in nearest-first order, flag as ambiguous
    REJECT    // withhold the detection that has a near-tied competitor
};

inline std::string ambiguity_policy_to_string(AmbiguityPolicy policy) {
    switch (policy) {
        case AmbiguityPolicy::NEAREST: return "nearest";
        case AmbiguityPolicy::REJECT: return "reject";
        default: return "unknown";
    }
}

inline AmbiguityPolicy string_to_ambiguity_policy(const std::string& s) {
    const std::string norm = detail::normalize_token(s);
    if (norm == "nearest") return AmbiguityPolicy::NEAREST;
    if (norm == "reject") return AmbiguityPolicy::REJECT;
    return AmbiguityPolicy::UNKNOWN;
}

// Estimator behind the fitted flux scale
enum class FluxModel {
    RATIO,   // clipped median of target / reference
    LINEAR   // target = scale * reference + zero point, least squares
};

inline std::string flux_model_to_string(FluxModel model) {
    return model == FluxModel::LINEAR ? "linear" : "ratio";
}

// Pipeline phase enumeration
enum class Phase {
    LOAD_TARGET = 0,
    LOAD_REFERENCE = 1,
    MATCH = 2,
    NORMALIZE = 3,
    WRITE_OUTPUTS = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_TARGET: return "LOAD_TARGET";
        case Phase::LOAD_REFERENCE: return "LOAD_REFERENCE";
        case Phase::MATCH: return "MATCH";
        case Phase::NORMALIZE: return "NORMALIZE";
        case Phase::WRITE_OUTPUTS: return "WRITE_OUTPUTS";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace clump_match
