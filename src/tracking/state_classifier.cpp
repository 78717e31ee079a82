#include "tracking/state_classifier.hpp"
#include "tracking/geo_utils.hpp"
#include <cmath>

namespace skytraffic::tracking {

TrafficState StateClassifier::classify(const TelemetrySample& current,
                                       const TelemetrySample& previous) const {
    const double spd = current.airspeed_kt;

    // ── Ground states ──
    if (current.on_ground) {
        if (spd < config_.parked_speed_kt) {
            return TrafficState::PARKED;
        }
        if (spd < config_.pushback_speed_kt) {
            return is_reversing(current, previous) ? TrafficState::PUSHBACK
                                                   : TrafficState::TAXIING;
        }
        if (spd < config_.takeoff_speed_kt) {
            return TrafficState::TAXIING;
        }
        return TrafficState::TAKEOFF_ROLL;
    }

    // ── Air states ──

    // Ground contact just lost
    if (previous.on_ground) {
        return TrafficState::AIRBORNE;
    }

    if (current.altitude_ft < config_.approach_altitude_ft &&
        current.vertical_speed_fpm < config_.approach_vs_fpm) {
        return TrafficState::APPROACH;
    }

    return TrafficState::AIRBORNE;
}

bool StateClassifier::is_reversing(const TelemetrySample& current,
                                   const TelemetrySample& previous) const {
    if (!config_.detect_pushback) return false;
    if (is_position_sentinel(previous)) return false;

    const double moved = haversine_nm(previous.lat, previous.lon,
                                      current.lat, current.lon);
    if (!(moved >= config_.min_reverse_displacement_nm)) return false;

    const double track = great_circle_bearing_deg(previous.lat, previous.lon,
                                                  current.lat, current.lon);
    return std::fabs(angle_diff_deg(track, current.heading_deg)) > config_.reverse_angle_deg;
}

} // namespace skytraffic::tracking
