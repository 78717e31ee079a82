#include "tracking/traffic_state.hpp"

#include <stdexcept>

namespace skytraffic::tracking {

const char* to_string(TrafficState state) {
    switch (state) {
        case TrafficState::UNKNOWN:      return "UNKNOWN";
        case TrafficState::PARKED:       return "PARKED";
        case TrafficState::PUSHBACK:     return "PUSHBACK";
        case TrafficState::TAXIING:      return "TAXIING";
        case TrafficState::TAKEOFF_ROLL: return "TAKEOFF_ROLL";
        case TrafficState::AIRBORNE:     return "AIRBORNE";
        case TrafficState::APPROACH:     return "APPROACH";
        case TrafficState::LANDING:      return "LANDING";
        case TrafficState::VACATING:     return "VACATING";
    }
    return "UNKNOWN";
}

TrafficState parse_traffic_state(const std::string& name) {
    if (name == "UNKNOWN")      return TrafficState::UNKNOWN;
    if (name == "PARKED")       return TrafficState::PARKED;
    if (name == "PUSHBACK")     return TrafficState::PUSHBACK;
    if (name == "TAXIING")      return TrafficState::TAXIING;
    if (name == "TAKEOFF_ROLL") return TrafficState::TAKEOFF_ROLL;
    if (name == "AIRBORNE")     return TrafficState::AIRBORNE;
    if (name == "APPROACH")     return TrafficState::APPROACH;
    if (name == "LANDING")      return TrafficState::LANDING;
    if (name == "VACATING")     return TrafficState::VACATING;
    throw std::invalid_argument("Unknown traffic state: " + name);
}

} // namespace skytraffic::tracking
