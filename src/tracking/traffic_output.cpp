#include "tracking/traffic_output.hpp"
#include "io/json_writer.hpp"

namespace skytraffic::tracking {

void write_state_change_json(const StateChange& change, std::ostream& out) {
    skytraffic::JsonWriter w(out, 0);
    w.begin_object();
    w.kv("type", "state_change");
    w.kv("time", change.time);
    w.kv("callsign", change.id);
    w.kv("old_state", to_string(change.old_state));
    w.kv("new_state", to_string(change.new_state));
    w.kv("latitude", change.telemetry.lat);
    w.kv("longitude", change.telemetry.lon);
    w.kv("altitude", change.telemetry.altitude_ft);
    w.kv("heading", change.telemetry.heading_deg);
    w.kv("airspeed", change.telemetry.airspeed_kt);
    w.kv("voice_id", change.voice);
    w.end_object();
    out << '\n';
}

void write_snapshot_json(double time, const TrafficSnapshot& snapshot, std::ostream& out) {
    skytraffic::JsonWriter w(out, 0);
    w.begin_object();
    w.kv("type", "snapshot");
    w.kv("time", time);
    w.key("aircraft").begin_array();
    for (const auto& ac : snapshot) {
        const TelemetrySample& t = ac.telemetry;
        w.begin_object();
        w.kv("callsign", ac.id);
        w.kv("latitude", t.lat);
        w.kv("longitude", t.lon);
        w.kv("altitude", t.altitude_ft);
        w.kv("heading", t.heading_deg);
        w.kv("airspeed", t.airspeed_kt);
        w.kv("vertical_speed", t.vertical_speed_fpm);
        w.kv("state", to_string(ac.state));
        w.kv("on_ground", t.on_ground);
        w.end_object();
    }
    w.end_array();
    w.end_object();
    out << '\n';
}

void write_removed_json(const AircraftRemoved& removed, std::ostream& out) {
    skytraffic::JsonWriter w(out, 0);
    w.begin_object();
    w.kv("type", "removed");
    w.kv("callsign", removed.id);
    w.kv("last_state", to_string(removed.last_state));
    w.kv("last_seen", removed.last_seen);
    w.end_object();
    out << '\n';
}

void write_context_json(const std::string& tag, const std::vector<ContextEntry>& entries,
                        std::ostream& out) {
    skytraffic::JsonWriter w(out, 0);
    w.begin_object();
    w.kv("type", "context");
    w.kv("context", tag);
    w.key("aircraft").begin_array();
    for (const auto& e : entries) {
        w.begin_object();
        w.kv("callsign", e.id);
        w.kv("state", to_string(e.state));
        w.kv("altitude", e.altitude_ft);
        w.kv("airspeed", e.airspeed_kt);
        w.end_object();
    }
    w.end_array();
    w.end_object();
    out << '\n';
}

} // namespace skytraffic::tracking
