#ifndef SKYTRAFFIC_TRACKING_GEO_UTILS_HPP
#define SKYTRAFFIC_TRACKING_GEO_UTILS_HPP

#include <algorithm>
#include <cmath>
#include <utility>

namespace skytraffic {
namespace tracking {

inline constexpr double R_EARTH_NM  = 3440.065;          // mean Earth radius (nautical miles)
inline constexpr double DEG_TO_RAD  = M_PI / 180.0;
inline constexpr double RAD_TO_DEG  = 180.0 / M_PI;

/**
 * Haversine great-circle distance between two points on the sphere.
 * @param lat1  Latitude of point 1 in degrees
 * @param lon1  Longitude of point 1 in degrees
 * @param lat2  Latitude of point 2 in degrees
 * @param lon2  Longitude of point 2 in degrees
 * @return Distance in nautical miles
 */
inline double haversine_nm(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = lat1 * DEG_TO_RAD;
    const double phi2 = lat2 * DEG_TO_RAD;
    const double dlat = (lat2 - lat1) * DEG_TO_RAD;
    const double dlon = (lon2 - lon1) * DEG_TO_RAD;

    const double a = std::sin(dlat * 0.5) * std::sin(dlat * 0.5)
                   + std::cos(phi1) * std::cos(phi2)
                   * std::sin(dlon * 0.5) * std::sin(dlon * 0.5);
    const double c = 2.0 * std::asin(std::sqrt(std::min(1.0, a)));

    return R_EARTH_NM * c;
}

/**
 * Initial great-circle bearing from point 1 to point 2.
 * @return Bearing in degrees, range [0, 360)
 */
inline double great_circle_bearing_deg(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = lat1 * DEG_TO_RAD;
    const double phi2 = lat2 * DEG_TO_RAD;
    const double dlon = (lon2 - lon1) * DEG_TO_RAD;

    const double y = std::sin(dlon) * std::cos(phi2);
    const double x = std::cos(phi1) * std::sin(phi2)
                   - std::sin(phi1) * std::cos(phi2) * std::cos(dlon);
    const double theta = std::atan2(y, x) * RAD_TO_DEG;

    return std::fmod(theta + 360.0, 360.0);
}

/**
 * Shortest signed angular difference from b to a, in degrees.
 * @return Signed difference, range [-180, 180]
 */
inline double angle_diff_deg(double a, double b) {
    double d = std::fmod(a - b, 360.0);
    if (d > 180.0)  d -= 360.0;
    if (d < -180.0) d += 360.0;
    return d;
}

/**
 * Destination point given start, bearing and distance along a great circle.
 * Used by the synthetic traffic source to move aircraft.
 * @return {lat2, lon2} in degrees
 */
inline std::pair<double, double> destination_point(double lat, double lon,
                                                   double bearing_deg, double distance_nm) {
    const double delta = distance_nm / R_EARTH_NM;
    const double phi   = lat * DEG_TO_RAD;
    const double brg   = bearing_deg * DEG_TO_RAD;

    const double sin_phi = std::sin(phi);
    const double cos_phi = std::cos(phi);
    const double sin_d   = std::sin(delta);
    const double cos_d   = std::cos(delta);

    const double phi2 = std::asin(sin_phi * cos_d + cos_phi * sin_d * std::cos(brg));
    const double lam2 = lon * DEG_TO_RAD
                      + std::atan2(std::sin(brg) * sin_d * cos_phi,
                                   cos_d - sin_phi * std::sin(phi2));

    double lon2 = lam2 * RAD_TO_DEG;
    lon2 = std::fmod(lon2 + 540.0, 360.0) - 180.0;
    return {phi2 * RAD_TO_DEG, lon2};
}

} // namespace tracking
} // namespace skytraffic

#endif // SKYTRAFFIC_TRACKING_GEO_UTILS_HPP
