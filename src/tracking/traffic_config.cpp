#include "tracking/traffic_config.hpp"

#include <stdexcept>

namespace skytraffic::tracking {

std::vector<std::string> TrafficConfig::default_voices() {
    return {
        "en-GB-RyanNeural",
        "en-US-GuyNeural",
        "en-AU-WilliamNeural",
        "en-IN-PrabhatNeural",
        "en-GB-ThomasNeural",
        "en-US-ChristopherNeural",
        "en-AU-NatashaNeural",
        "en-GB-SoniaNeural",
    };
}

TrafficConfig TrafficConfigParser::parse(const skytraffic::JsonValue& root) {
    TrafficConfig config;

    const auto& t = root["traffic"];
    if (!t.is_object()) {
        return config;
    }

    config.enabled = t["enabled"].get_bool(config.enabled);
    config.verbose = t["verbose"].get_bool(config.verbose);

    config.hysteresis_seconds    = t["hysteresis_seconds"].get_number(config.hysteresis_seconds);
    config.teleport_threshold_nm = t["teleport_threshold_nm"].get_number(config.teleport_threshold_nm);
    config.stale_timeout         = t["stale_timeout"].get_number(config.stale_timeout);

    config.scan_interval     = t["scan_interval"].get_number(config.scan_interval);
    config.snapshot_interval = t["snapshot_interval"].get_number(config.snapshot_interval);
    config.eviction_interval = t["eviction_interval"].get_number(config.eviction_interval);

    // Classifier thresholds may sit at top level or in a "classifier" object
    const auto& c = t.has("classifier") ? t["classifier"] : t;
    ClassifierConfig& cc = config.classifier;
    cc.parked_speed_kt      = c["parked_speed_kt"].get_number(cc.parked_speed_kt);
    cc.pushback_speed_kt    = c["pushback_speed_kt"].get_number(cc.pushback_speed_kt);
    cc.takeoff_speed_kt     = c["takeoff_speed_kt"].get_number(cc.takeoff_speed_kt);
    cc.approach_altitude_ft = c["approach_altitude_ft"].get_number(cc.approach_altitude_ft);
    cc.approach_vs_fpm      = c["approach_vs_fpm"].get_number(cc.approach_vs_fpm);
    cc.detect_pushback      = c["detect_pushback"].get_bool(cc.detect_pushback);
    cc.reverse_angle_deg    = c["reverse_angle_deg"].get_number(cc.reverse_angle_deg);
    cc.min_reverse_displacement_nm =
        c["min_reverse_displacement_nm"].get_number(cc.min_reverse_displacement_nm);

    const auto& voices = t["voices"];
    if (voices.is_array()) {
        config.voices.clear();
        for (size_t i = 0; i < voices.size(); i++) {
            if (!voices[i].is_string()) {
                throw std::runtime_error("traffic.voices[" + std::to_string(i) +
                                         "] is not a string");
            }
            config.voices.push_back(voices[i].as_string());
        }
    }

    validate(config);
    return config;
}

TrafficConfig TrafficConfigParser::parse_file(const std::string& path) {
    return parse(skytraffic::JsonReader::parse_file(path));
}

void TrafficConfigParser::validate(const TrafficConfig& config) {
    auto require_positive = [](double v, const char* name) {
        if (!(v > 0.0)) {
            throw std::runtime_error(std::string("traffic.") + name +
                                     " must be positive, got " + std::to_string(v));
        }
    };

    require_positive(config.hysteresis_seconds, "hysteresis_seconds");
    require_positive(config.teleport_threshold_nm, "teleport_threshold_nm");
    require_positive(config.stale_timeout, "stale_timeout");
    require_positive(config.scan_interval, "scan_interval");
    require_positive(config.snapshot_interval, "snapshot_interval");
    require_positive(config.eviction_interval, "eviction_interval");

    if (config.voices.empty()) {
        throw std::runtime_error("traffic.voices must not be empty");
    }
}

} // namespace skytraffic::tracking
