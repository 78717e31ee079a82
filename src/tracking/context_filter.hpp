#ifndef SKYTRAFFIC_TRACKING_CONTEXT_FILTER_HPP
#define SKYTRAFFIC_TRACKING_CONTEXT_FILTER_HPP

#include "tracking/tracked_aircraft.hpp"
#include <string>
#include <vector>

namespace skytraffic::tracking {

/**
 * Procedural-context predicates over a tracked aircraft's latest telemetry.
 *
 *   ground    on ground, below 40 kt
 *   tower     on ground at 40 kt or more, or airborne below 3000 ft
 *   approach  airborne, below 10000 ft, descending
 *   center    airborne at or above 10000 ft
 *   other     every aircraft
 */
class ContextFilter {
public:
    static bool matches(const TrackedAircraft& ac, const std::string& tag);

    /// Rows of the snapshot that match the tag, in snapshot order.
    static std::vector<ContextEntry> filter(const TrafficSnapshot& snapshot,
                                            const std::string& tag);
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_CONTEXT_FILTER_HPP
