/**
 * TrackedAircraft — Flat per-aircraft record owned by the TrafficRegistry.
 *
 * Plain value types only: the registry hands out copies, never references
 * into its map. Also defines the samples fed in by telemetry sources and
 * the records handed to listeners (state changes, bulk snapshots).
 */

#ifndef SKYTRAFFIC_TRACKING_TRACKED_AIRCRAFT_HPP
#define SKYTRAFFIC_TRACKING_TRACKED_AIRCRAFT_HPP

#include "tracking/traffic_state.hpp"
#include <optional>
#include <string>
#include <vector>

namespace skytraffic::tracking {

// ── Telemetry ──

struct TelemetrySample {
    double lat = 0.0;                 // degrees
    double lon = 0.0;                 // degrees
    double altitude_ft = 0.0;
    double heading_deg = 0.0;
    double airspeed_kt = 0.0;
    double vertical_speed_fpm = 0.0;
    bool on_ground = true;
};

/// (0,0) marks "no prior observation" for teleport and reversing checks.
inline bool is_position_sentinel(const TelemetrySample& t) {
    return t.lat == 0.0 && t.lon == 0.0;
}

/// One observation as delivered by a TelemetrySource.
struct Observation {
    std::string id;
    TelemetrySample sample;
};

// ── Tracked entity ──

struct TrackedAircraft {
    std::string id;
    TrafficState state = TrafficState::UNKNOWN;
    std::optional<TrafficState> pending_state;
    double pending_since = 0.0;      // valid only while pending_state is set

    TelemetrySample telemetry;
    TelemetrySample prev_telemetry;

    double last_seen = 0.0;
    std::string voice;
};

// ── Outbound records ──

struct StateChange {
    std::string id;
    TrafficState old_state = TrafficState::UNKNOWN;
    TrafficState new_state = TrafficState::UNKNOWN;
    TelemetrySample telemetry;
    std::string voice;
    double time = 0.0;
};

struct AircraftRemoved {
    std::string id;
    TrafficState last_state = TrafficState::UNKNOWN;
    double last_seen = 0.0;
};

/// Row of a context query.
struct ContextEntry {
    std::string id;
    TrafficState state = TrafficState::UNKNOWN;
    double altitude_ft = 0.0;
    double airspeed_kt = 0.0;
};

using TrafficSnapshot = std::vector<TrackedAircraft>;

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_TRACKED_AIRCRAFT_HPP
