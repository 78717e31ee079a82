#include "tracking/hysteresis_gate.hpp"

namespace skytraffic::tracking {

std::optional<StateChange> HysteresisGate::apply(TrackedAircraft& ac,
                                                 TrafficState candidate,
                                                 double now) const {
    // Noise back to the confirmed state
    if (candidate == ac.state) {
        ac.pending_state.reset();
        return std::nullopt;
    }

    if (ac.pending_state && *ac.pending_state == candidate) {
        if (now - ac.pending_since < window_) {
            return std::nullopt;  // still waiting
        }

        StateChange change;
        change.id = ac.id;
        change.old_state = ac.state;
        change.new_state = candidate;
        change.telemetry = ac.telemetry;
        change.voice = ac.voice;
        change.time = now;

        ac.state = candidate;
        ac.pending_state.reset();
        return change;
    }

    // New candidate: restart the window
    ac.pending_state = candidate;
    ac.pending_since = now;
    return std::nullopt;
}

} // namespace skytraffic::tracking
