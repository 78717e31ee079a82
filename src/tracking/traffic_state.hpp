#ifndef SKYTRAFFIC_TRACKING_TRAFFIC_STATE_HPP
#define SKYTRAFFIC_TRACKING_TRAFFIC_STATE_HPP

#include <string>

namespace skytraffic::tracking {

// LANDING and VACATING are reserved; the classifier never produces them.
enum class TrafficState {
    UNKNOWN,
    PARKED,
    PUSHBACK,
    TAXIING,
    TAKEOFF_ROLL,
    AIRBORNE,
    APPROACH,
    LANDING,
    VACATING
};

const char* to_string(TrafficState state);

/// Inverse of to_string. Throws std::invalid_argument on an unknown name.
TrafficState parse_traffic_state(const std::string& name);

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_TRAFFIC_STATE_HPP
