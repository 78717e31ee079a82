/**
 * Traffic output — JSON Lines serialization of engine events.
 *
 * One compact JSON object per line, tagged by "type":
 *   state_change  {callsign, old_state, new_state, latitude, longitude,
 *                  altitude, heading, airspeed, voice_id, time}
 *   snapshot      {time, aircraft: [{callsign, latitude, longitude, altitude,
 *                  heading, airspeed, vertical_speed, state, on_ground}]}
 *   removed       {callsign, last_state, last_seen}
 */

#ifndef SKYTRAFFIC_TRACKING_TRAFFIC_OUTPUT_HPP
#define SKYTRAFFIC_TRACKING_TRAFFIC_OUTPUT_HPP

#include "tracking/tracked_aircraft.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace skytraffic::tracking {

void write_state_change_json(const StateChange& change, std::ostream& out);

void write_snapshot_json(double time, const TrafficSnapshot& snapshot, std::ostream& out);

void write_removed_json(const AircraftRemoved& removed, std::ostream& out);

void write_context_json(const std::string& tag, const std::vector<ContextEntry>& entries,
                        std::ostream& out);

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_TRAFFIC_OUTPUT_HPP
