#include "tracking/context_filter.hpp"

namespace skytraffic::tracking {

static constexpr double GROUND_SPEED_LIMIT_KT = 40.0;
static constexpr double TOWER_CEILING_FT      = 3000.0;
static constexpr double APPROACH_CEILING_FT   = 10000.0;

bool ContextFilter::matches(const TrackedAircraft& ac, const std::string& tag) {
    const TelemetrySample& t = ac.telemetry;

    if (tag == "ground") {
        return t.on_ground && t.airspeed_kt < GROUND_SPEED_LIMIT_KT;
    }
    if (tag == "tower") {
        return (t.on_ground && t.airspeed_kt >= GROUND_SPEED_LIMIT_KT) ||
               (!t.on_ground && t.altitude_ft < TOWER_CEILING_FT);
    }
    if (tag == "approach") {
        return !t.on_ground && t.altitude_ft < APPROACH_CEILING_FT &&
               t.vertical_speed_fpm < 0.0;
    }
    if (tag == "center") {
        return !t.on_ground && t.altitude_ft >= APPROACH_CEILING_FT;
    }
    return true;
}

std::vector<ContextEntry> ContextFilter::filter(const TrafficSnapshot& snapshot,
                                                const std::string& tag) {
    std::vector<ContextEntry> result;
    for (const auto& ac : snapshot) {
        if (!matches(ac, tag)) continue;

        ContextEntry entry;
        entry.id = ac.id;
        entry.state = ac.state;
        entry.altitude_ft = ac.telemetry.altitude_ft;
        entry.airspeed_kt = ac.telemetry.airspeed_kt;
        result.push_back(std::move(entry));
    }
    return result;
}

} // namespace skytraffic::tracking
