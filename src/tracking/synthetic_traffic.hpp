/**
 * SyntheticTrafficSource — Scripted airport traffic for running without a simulator.
 *
 * Departures: gate → pushback → taxi out → takeoff roll → climb out.
 * Arrivals:   descending approach → rollout → taxi in → gate.
 * Aircraft are spawned at a fixed stagger, reported every poll while
 * active, and go silent once their script ends so the registry's
 * eviction sweep removes them. Optional speed noise and position jumps
 * exercise the hysteresis and teleport paths.
 *
 * Deterministic for a given seed and poll schedule.
 */

#ifndef SKYTRAFFIC_TRACKING_SYNTHETIC_TRAFFIC_HPP
#define SKYTRAFFIC_TRACKING_SYNTHETIC_TRAFFIC_HPP

#include "tracking/traffic_scheduler.hpp"
#include "tracking/sim_rng.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skytraffic::tracking {

struct SyntheticConfig {
    int departures = 4;
    int arrivals = 4;
    double airport_lat = 40.6413;
    double airport_lon = -73.7781;
    uint32_t seed = 42;
    double stagger_seconds = 10.0;         // spawn spacing
    double speed_noise_kt = 1.5;           // 1-sigma on moving phases
    double teleport_probability = 0.0;     // per aircraft per poll
    double teleport_distance_nm = 60.0;
};

enum class SyntheticPhase {
    GATE,
    PUSHBACK,
    TAXI_OUT,
    TAKEOFF,
    CLIMB,
    APPROACH,
    ROLLOUT,
    TAXI_IN,
    PARKED_IN,
    DONE
};

struct SyntheticAircraft {
    std::string callsign;
    SyntheticPhase phase = SyntheticPhase::GATE;
    double spawn_time = 0.0;     // seconds after first poll
    bool spawned = false;
    double phase_time = 0.0;     // seconds spent in current phase
    double gate_hold = 10.0;
    TelemetrySample truth;       // noise-free kinematics
};

class SyntheticTrafficSource : public TelemetrySource {
public:
    /// @throws std::invalid_argument if the counts are negative or exceed the callsign space
    explicit SyntheticTrafficSource(const SyntheticConfig& config = SyntheticConfig{});

    std::vector<Observation> poll(double now) override;

    const std::vector<SyntheticAircraft>& aircraft() const { return aircraft_; }

    /// True once every scripted aircraft has finished.
    bool finished() const;

private:
    SyntheticConfig config_;
    SimRng rng_;
    std::vector<SyntheticAircraft> aircraft_;
    std::optional<double> start_time_;
    double last_poll_ = 0.0;

    std::string make_callsign(const std::vector<std::string>& taken);
    void spawn_departure(SyntheticAircraft& ac);
    void spawn_arrival(SyntheticAircraft& ac);
    void advance(SyntheticAircraft& ac, double dt);
    void move(TelemetrySample& t, double bearing_deg, double dt);
    Observation observe(const SyntheticAircraft& ac);
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_SYNTHETIC_TRAFFIC_HPP
