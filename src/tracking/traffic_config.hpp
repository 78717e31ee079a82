/**
 * TrafficConfig — Tuning for the tracking engine and its tick loop.
 *
 * Read from the "traffic" object of the application config JSON.
 * Missing or mistyped keys keep their defaults.
 */

#ifndef SKYTRAFFIC_TRACKING_TRAFFIC_CONFIG_HPP
#define SKYTRAFFIC_TRACKING_TRAFFIC_CONFIG_HPP

#include "io/json_reader.hpp"
#include <string>
#include <vector>

namespace skytraffic::tracking {

struct ClassifierConfig {
    double parked_speed_kt = 1.0;
    double pushback_speed_kt = 5.0;
    double takeoff_speed_kt = 40.0;
    double approach_altitude_ft = 3000.0;
    double approach_vs_fpm = -200.0;

    // Reversing heuristic (PUSHBACK)
    bool detect_pushback = true;
    double reverse_angle_deg = 90.0;
    double min_reverse_displacement_nm = 0.0002;
};

struct TrafficConfig {
    bool enabled = true;
    bool verbose = false;

    double hysteresis_seconds = 2.0;
    double teleport_threshold_nm = 5.0;
    double stale_timeout = 30.0;

    double scan_interval = 0.5;       // 2 Hz
    double snapshot_interval = 1.0;
    double eviction_interval = 1.0;

    ClassifierConfig classifier;
    std::vector<std::string> voices = default_voices();

    static std::vector<std::string> default_voices();
};

class TrafficConfigParser {
public:
    /**
     * Build a config from the application root JSON.
     * Only the "traffic" member is read; an absent member yields defaults.
     * @throws std::runtime_error on out-of-range values
     */
    static TrafficConfig parse(const skytraffic::JsonValue& root);

    /// Parse a config file from disk.
    static TrafficConfig parse_file(const std::string& path);

    /// Reject non-positive windows/intervals and an empty voice pool.
    static void validate(const TrafficConfig& config);
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_TRAFFIC_CONFIG_HPP
