#include "tracking/teleport_detector.hpp"
#include "tracking/geo_utils.hpp"

namespace skytraffic::tracking {

bool is_teleport(const TelemetrySample& previous,
                 const TelemetrySample& current,
                 double threshold_nm) {
    if (is_position_sentinel(previous)) {
        return false;  // first observation
    }

    const double distance = haversine_nm(previous.lat, previous.lon,
                                         current.lat, current.lon);
    return distance > threshold_nm;
}

} // namespace skytraffic::tracking
