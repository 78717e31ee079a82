/**
 * HysteresisGate — Time-windowed debounce of candidate states.
 *
 * A candidate that differs from the confirmed state becomes pending and
 * starts a timer. It is promoted once it has been seen continuously for
 * the full window. Any other candidate restarts the timer; a candidate
 * equal to the confirmed state drops the pending one.
 */

#ifndef SKYTRAFFIC_TRACKING_HYSTERESIS_GATE_HPP
#define SKYTRAFFIC_TRACKING_HYSTERESIS_GATE_HPP

#include "tracking/tracked_aircraft.hpp"
#include <optional>

namespace skytraffic::tracking {

class HysteresisGate {
public:
    explicit HysteresisGate(double window_seconds = 2.0)
        : window_(window_seconds) {}

    /**
     * Feed one candidate for an aircraft.
     * Returns the confirmed transition on the tick that promotes the
     * pending state, nullopt otherwise.
     */
    std::optional<StateChange> apply(TrackedAircraft& ac,
                                     TrafficState candidate,
                                     double now) const;

    double window() const { return window_; }

private:
    double window_;
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_HYSTERESIS_GATE_HPP
