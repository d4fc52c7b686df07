#include "clump_match/match/geometry.hpp"

#include <Eigen/Geometry>
#include <cmath>

namespace clump_match::match {

Eigen::Vector3d unit_vector(double ra_deg, double dec_deg) {
    const double ra = ra_deg * DEG_TO_RAD;
    const double dec = dec_deg * DEG_TO_RAD;
    const double cos_dec = std::cos(dec);
    return Eigen::Vector3d(cos_dec * std::cos(ra), cos_dec * std::sin(ra), std::sin(dec));
}

double angular_separation_arcsec(double ra1_deg, double dec1_deg,
                                 double ra2_deg, double dec2_deg) {
    const Eigen::Vector3d v1 = unit_vector(ra1_deg, dec1_deg);
    const Eigen::Vector3d v2 = unit_vector(ra2_deg, dec2_deg);
    const double rad = std::atan2(v1.cross(v2).norm(), v1.dot(v2));
    return rad / DEG_TO_RAD * ARCSEC_PER_DEG;
}

double separation(const catalog::Detection& a, const catalog::Detection& b,
                  CoordinateSystem cs) {
    if (cs == CoordinateSystem::SPHERICAL) {
        return angular_separation_arcsec(a.x, a.y, b.x, b.y);
    }
    return std::hypot(a.x - b.x, a.y - b.y);
}

static double wrap_ra_delta(double dra_deg) {
    double d = std::fmod(dra_deg, 360.0);
    if (d > 180.0) d -= 360.0;
    if (d < -180.0) d += 360.0;
    return d;
}

Eigen::Vector2d local_offset(double x, double y, double origin_x, double origin_y,
                             CoordinateSystem cs) {
    if (cs == CoordinateSystem::SPHERICAL) {
        const double cos_dec = std::cos(origin_y * DEG_TO_RAD);
        return Eigen::Vector2d(wrap_ra_delta(x - origin_x) * cos_dec * ARCSEC_PER_DEG,
                               (y - origin_y) * ARCSEC_PER_DEG);
    }
    return Eigen::Vector2d(x - origin_x, y - origin_y);
}

Eigen::Vector2d apply_local_offset(const Eigen::Vector2d& offset,
                                   double origin_x, double origin_y,
                                   CoordinateSystem cs) {
    if (cs == CoordinateSystem::SPHERICAL) {
        const double cos_dec = std::cos(origin_y * DEG_TO_RAD);
        double ra = origin_x;
        if (cos_dec > 0.0) {
            ra += offset.x() / ARCSEC_PER_DEG / cos_dec;
        }
        ra = std::fmod(ra, 360.0);
        if (ra < 0.0) ra += 360.0;
        return Eigen::Vector2d(ra, origin_y + offset.y() / ARCSEC_PER_DEG);
    }
    return Eigen::Vector2d(origin_x + offset.x(), origin_y + offset.y());
}

Eigen::Vector2d position_offset(const catalog::Detection& target,
                                const catalog::Detection& reference,
                                CoordinateSystem cs) {
    return local_offset(target.x, target.y, reference.x, reference.y, cs);
}

} // namespace clump_match::match
