/**
 * SyntheticTrafficSource — Phase scripts and kinematics.
 *
 * Phase timings (seconds) and rates:
 *   pushback 20 @ 3 kt reversing, taxi out 45 @ 15 kt,
 *   takeoff roll +4 kt/s to 150 kt, climb 2000 fpm @ 200 kt to 12000 ft;
 *   approach from 20 nm / 6000 ft at -800 fpm @ 160 kt,
 *   rollout -4 kt/s to 15 kt, taxi in 30, parked 20.
 */

#include "tracking/synthetic_traffic.hpp"
#include "tracking/geo_utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace skytraffic::tracking {

static constexpr double PUSHBACK_SECONDS  = 20.0;
static constexpr double PUSHBACK_SPEED_KT = 3.0;
static constexpr double TAXI_OUT_SECONDS  = 45.0;
static constexpr double TAXI_SPEED_KT     = 15.0;
static constexpr double ROLL_ACCEL_KTPS   = 4.0;
static constexpr double ROTATE_SPEED_KT   = 150.0;
static constexpr double CLIMB_SPEED_KT    = 200.0;
static constexpr double CLIMB_RATE_FPM    = 2000.0;
static constexpr double DEPARTURE_EXIT_FT = 12000.0;

static constexpr double ARRIVAL_RANGE_NM  = 20.0;
static constexpr double ARRIVAL_ALT_FT    = 6000.0;
static constexpr double ARRIVAL_VS_FPM    = -800.0;
static constexpr double ARRIVAL_SPEED_KT  = 160.0;
static constexpr double TOUCHDOWN_KT      = 130.0;
static constexpr double TAXI_IN_SECONDS   = 30.0;
static constexpr double PARKED_IN_SECONDS = 20.0;

static const char* const AIRLINE_PREFIXES[] = {
    "CCA", "DAL", "UAL", "AAL", "BAW", "DLH", "AFR", "JBU"
};

// Prefix count x flight numbers 100-999
static constexpr int CALLSIGN_SPACE =
    static_cast<int>(sizeof(AIRLINE_PREFIXES) / sizeof(AIRLINE_PREFIXES[0])) * 900;

SyntheticTrafficSource::SyntheticTrafficSource(const SyntheticConfig& config)
    : config_(config), rng_(config.seed) {
    if (config_.departures < 0 || config_.arrivals < 0) {
        throw std::invalid_argument("Synthetic traffic counts must be non-negative");
    }
    if (static_cast<long>(config_.departures) + config_.arrivals > CALLSIGN_SPACE) {
        throw std::invalid_argument("Synthetic traffic needs " +
                                    std::to_string(static_cast<long>(config_.departures) +
                                                   config_.arrivals) +
                                    " unique callsigns, only " +
                                    std::to_string(CALLSIGN_SPACE) + " exist");
    }

    std::vector<std::string> taken;

    for (int i = 0; i < config_.departures; i++) {
        SyntheticAircraft ac;
        ac.callsign = make_callsign(taken);
        ac.spawn_time = i * config_.stagger_seconds;
        spawn_departure(ac);
        taken.push_back(ac.callsign);
        aircraft_.push_back(std::move(ac));
    }

    for (int i = 0; i < config_.arrivals; i++) {
        SyntheticAircraft ac;
        ac.callsign = make_callsign(taken);
        ac.spawn_time = (i + 0.5) * config_.stagger_seconds;
        spawn_arrival(ac);
        taken.push_back(ac.callsign);
        aircraft_.push_back(std::move(ac));
    }
}

std::string SyntheticTrafficSource::make_callsign(const std::vector<std::string>& taken) {
    constexpr int n_prefixes = static_cast<int>(sizeof(AIRLINE_PREFIXES) / sizeof(AIRLINE_PREFIXES[0]));
    while (true) {
        std::string cs = std::string(AIRLINE_PREFIXES[rng_.uniform_int(0, n_prefixes - 1)]) +
                         std::to_string(rng_.uniform_int(100, 999));
        if (std::find(taken.begin(), taken.end(), cs) == taken.end()) {
            return cs;
        }
    }
}

void SyntheticTrafficSource::spawn_departure(SyntheticAircraft& ac) {
    auto [lat, lon] = destination_point(config_.airport_lat, config_.airport_lon,
                                        rng_.uniform(0.0, 360.0), rng_.uniform(0.3, 0.8));
    ac.phase = SyntheticPhase::GATE;
    ac.gate_hold = rng_.uniform(5.0, 20.0);
    ac.truth = TelemetrySample{};
    ac.truth.lat = lat;
    ac.truth.lon = lon;
    ac.truth.heading_deg = rng_.uniform(0.0, 360.0);
    ac.truth.on_ground = true;
}

void SyntheticTrafficSource::spawn_arrival(SyntheticAircraft& ac) {
    const double bearing_out = rng_.uniform(0.0, 360.0);
    auto [lat, lon] = destination_point(config_.airport_lat, config_.airport_lon,
                                        bearing_out, ARRIVAL_RANGE_NM);
    ac.phase = SyntheticPhase::APPROACH;
    ac.truth = TelemetrySample{};
    ac.truth.lat = lat;
    ac.truth.lon = lon;
    ac.truth.altitude_ft = ARRIVAL_ALT_FT;
    ac.truth.heading_deg = std::fmod(bearing_out + 180.0, 360.0);
    ac.truth.airspeed_kt = ARRIVAL_SPEED_KT;
    ac.truth.vertical_speed_fpm = ARRIVAL_VS_FPM;
    ac.truth.on_ground = false;
}

void SyntheticTrafficSource::move(TelemetrySample& t, double bearing_deg, double dt) {
    const double distance_nm = t.airspeed_kt * dt / 3600.0;
    if (distance_nm <= 0.0) return;
    auto [lat, lon] = destination_point(t.lat, t.lon, bearing_deg, distance_nm);
    t.lat = lat;
    t.lon = lon;
}

void SyntheticTrafficSource::advance(SyntheticAircraft& ac, double dt) {
    TelemetrySample& t = ac.truth;
    ac.phase_time += dt;

    auto next_phase = [&ac](SyntheticPhase p) {
        ac.phase = p;
        ac.phase_time = 0.0;
    };

    switch (ac.phase) {
        case SyntheticPhase::GATE:
            t.airspeed_kt = 0.0;
            if (ac.phase_time >= ac.gate_hold) next_phase(SyntheticPhase::PUSHBACK);
            break;

        case SyntheticPhase::PUSHBACK:
            t.airspeed_kt = PUSHBACK_SPEED_KT;
            move(t, t.heading_deg + 180.0, dt);
            if (ac.phase_time >= PUSHBACK_SECONDS) {
                t.heading_deg = std::fmod(t.heading_deg + 90.0, 360.0);
                next_phase(SyntheticPhase::TAXI_OUT);
            }
            break;

        case SyntheticPhase::TAXI_OUT:
            t.airspeed_kt = TAXI_SPEED_KT;
            move(t, t.heading_deg, dt);
            if (ac.phase_time >= TAXI_OUT_SECONDS) next_phase(SyntheticPhase::TAKEOFF);
            break;

        case SyntheticPhase::TAKEOFF:
            t.airspeed_kt = std::min(ROTATE_SPEED_KT, t.airspeed_kt + ROLL_ACCEL_KTPS * dt);
            move(t, t.heading_deg, dt);
            if (t.airspeed_kt >= ROTATE_SPEED_KT) {
                t.on_ground = false;
                next_phase(SyntheticPhase::CLIMB);
            }
            break;

        case SyntheticPhase::CLIMB:
            t.airspeed_kt = CLIMB_SPEED_KT;
            t.vertical_speed_fpm = CLIMB_RATE_FPM;
            t.altitude_ft += CLIMB_RATE_FPM / 60.0 * dt;
            move(t, t.heading_deg, dt);
            if (t.altitude_ft >= DEPARTURE_EXIT_FT) next_phase(SyntheticPhase::DONE);
            break;

        case SyntheticPhase::APPROACH:
            t.altitude_ft += t.vertical_speed_fpm / 60.0 * dt;
            move(t, t.heading_deg, dt);
            if (t.altitude_ft <= 0.0) {
                t.altitude_ft = 0.0;
                t.vertical_speed_fpm = 0.0;
                t.airspeed_kt = TOUCHDOWN_KT;
                t.on_ground = true;
                next_phase(SyntheticPhase::ROLLOUT);
            }
            break;

        case SyntheticPhase::ROLLOUT:
            t.airspeed_kt = std::max(TAXI_SPEED_KT, t.airspeed_kt - ROLL_ACCEL_KTPS * dt);
            move(t, t.heading_deg, dt);
            if (t.airspeed_kt <= TAXI_SPEED_KT) next_phase(SyntheticPhase::TAXI_IN);
            break;

        case SyntheticPhase::TAXI_IN:
            t.airspeed_kt = TAXI_SPEED_KT;
            move(t, t.heading_deg, dt);
            if (ac.phase_time >= TAXI_IN_SECONDS) {
                t.airspeed_kt = 0.0;
                next_phase(SyntheticPhase::PARKED_IN);
            }
            break;

        case SyntheticPhase::PARKED_IN:
            t.airspeed_kt = 0.0;
            if (ac.phase_time >= PARKED_IN_SECONDS) next_phase(SyntheticPhase::DONE);
            break;

        case SyntheticPhase::DONE:
            break;
    }
}

Observation SyntheticTrafficSource::observe(const SyntheticAircraft& ac) {
    Observation obs;
    obs.id = ac.callsign;
    obs.sample = ac.truth;

    // Parked aircraft report a clean zero; everything moving gets speed noise
    if (ac.truth.airspeed_kt > 0.0 && config_.speed_noise_kt > 0.0) {
        obs.sample.airspeed_kt = std::max(
            0.0, rng_.gaussian(ac.truth.airspeed_kt, config_.speed_noise_kt));
    }
    return obs;
}

std::vector<Observation> SyntheticTrafficSource::poll(double now) {
    if (!start_time_) {
        start_time_ = now;
        last_poll_ = now;
    }
    const double dt = std::max(0.0, now - last_poll_);
    const double elapsed = now - *start_time_;
    last_poll_ = now;

    std::vector<Observation> out;
    for (auto& ac : aircraft_) {
        if (ac.phase == SyntheticPhase::DONE) continue;
        if (elapsed < ac.spawn_time) continue;

        if (!ac.spawned) {
            ac.spawned = true;
        } else {
            advance(ac, dt);
            if (ac.phase == SyntheticPhase::DONE) continue;
        }

        if (config_.teleport_probability > 0.0 &&
            rng_.bernoulli(config_.teleport_probability)) {
            auto [lat, lon] = destination_point(ac.truth.lat, ac.truth.lon,
                                                rng_.uniform(0.0, 360.0),
                                                config_.teleport_distance_nm);
            ac.truth.lat = lat;
            ac.truth.lon = lon;
        }

        out.push_back(observe(ac));
    }
    return out;
}

bool SyntheticTrafficSource::finished() const {
    return std::all_of(aircraft_.begin(), aircraft_.end(), [](const SyntheticAircraft& ac) {
        return ac.phase == SyntheticPhase::DONE;
    });
}

} // namespace skytraffic::tracking
