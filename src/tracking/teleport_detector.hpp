#ifndef SKYTRAFFIC_TRACKING_TELEPORT_DETECTOR_HPP
#define SKYTRAFFIC_TRACKING_TELEPORT_DETECTOR_HPP

#include "tracking/tracked_aircraft.hpp"

namespace skytraffic::tracking {

inline constexpr double DEFAULT_TELEPORT_THRESHOLD_NM = 5.0;

/**
 * Position jump check between consecutive frames.
 * @param previous      Prior frame; the (0,0) sentinel never teleports
 * @param current       Latest frame
 * @param threshold_nm  Great-circle distance above which the jump is impossible
 * @return true if the haversine distance exceeds the threshold
 */
bool is_teleport(const TelemetrySample& previous,
                 const TelemetrySample& current,
                 double threshold_nm = DEFAULT_TELEPORT_THRESHOLD_NM);

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_TELEPORT_DETECTOR_HPP
