#pragma once

#include "clump_match/catalog/catalog.hpp"
#include "clump_match/core/types.hpp"

#include <Eigen/Core>

namespace clump_match::match {

constexpr double DEG_TO_RAD = 0.017453292519943295;
constexpr double ARCSEC_PER_DEG = 3600.0;

// Unit vector for (ra, dec) in degrees.
Eigen::Vector3d unit_vector(double ra_deg, double dec_deg);

// Great-circle separation in arcseconds.
double angular_separation_arcsec(double ra1_deg, double dec1_deg,
                                 double ra2_deg, double dec2_deg);

// Separation between two detections: Euclidean for CARTESIAN, great-circle
// arcseconds for SPHERICAL.
double separation(const catalog::Detection& a, const catalog::Detection& b,
                  CoordinateSystem cs);

// Offset of `target` relative to `reference`. For SPHERICAL this is the
// local tangent-plane offset in arcseconds, RA component scaled by
// cos(Dec of the reference).
Eigen::Vector2d position_offset(const catalog::Detection& target,
                                const catalog::Detection& reference,
                                CoordinateSystem cs);

// Offset of (x, y) from an origin in the same units as position_offset.
Eigen::Vector2d local_offset(double x, double y, double origin_x, double origin_y,
                             CoordinateSystem cs);

// Inverse of local_offset: position at `offset` from the origin.
Eigen::Vector2d apply_local_offset(const Eigen::Vector2d& offset,
                                   double origin_x, double origin_y,
                                   CoordinateSystem cs);

} // namespace clump_match::match
