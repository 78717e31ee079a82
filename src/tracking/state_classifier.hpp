/**
 * StateClassifier — Candidate flight phase from a single telemetry frame.
 *
 * Ground states are split by airspeed bands; airborne states by the
 * ground-contact edge and a low/descending approach test. The previous
 * frame supplies the was-on-ground flag and the position used to derive
 * the instantaneous ground track for pushback detection.
 *
 * Pure and deterministic: no clock, no I/O.
 */

#ifndef SKYTRAFFIC_TRACKING_STATE_CLASSIFIER_HPP
#define SKYTRAFFIC_TRACKING_STATE_CLASSIFIER_HPP

#include "tracking/tracked_aircraft.hpp"
#include "tracking/traffic_config.hpp"

namespace skytraffic::tracking {

class StateClassifier {
public:
    explicit StateClassifier(const ClassifierConfig& config = ClassifierConfig{})
        : config_(config) {}

    /**
     * Classify the current frame.
     * @param current   Latest sample
     * @param previous  Sample immediately before it (zeroed for a new aircraft)
     */
    TrafficState classify(const TelemetrySample& current,
                          const TelemetrySample& previous) const;

    /**
     * True when the aircraft moves opposite to where its nose points:
     * ground track (previous → current) differs from the reported
     * heading by more than reverse_angle_deg, over a displacement of at
     * least min_reverse_displacement_nm.
     */
    bool is_reversing(const TelemetrySample& current,
                      const TelemetrySample& previous) const;

    const ClassifierConfig& config() const { return config_; }

private:
    ClassifierConfig config_;
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_STATE_CLASSIFIER_HPP
