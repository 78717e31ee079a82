/**
 * TrafficRegistry — Owner of every tracked aircraft.
 *
 * Per update: teleport check → (hard reset | classify → hysteresis gate).
 * Confirmed transitions are delivered to state-change listeners on the
 * calling thread after the map lock has been released. Callers only ever
 * receive copies; aircraft are addressed by callsign.
 *
 * A mutex guards the map. It is held for the bookkeeping of one update,
 * one eviction sweep or one snapshot copy, never while the classifier or
 * listeners run. A second mutex serializes writers (update, evict).
 */

#ifndef SKYTRAFFIC_TRACKING_TRAFFIC_REGISTRY_HPP
#define SKYTRAFFIC_TRACKING_TRAFFIC_REGISTRY_HPP

#include "tracking/tracked_aircraft.hpp"
#include "tracking/traffic_config.hpp"
#include "tracking/state_classifier.hpp"
#include "tracking/hysteresis_gate.hpp"
#include "tracking/voice_assigner.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skytraffic::tracking {

class TrafficRegistry {
public:
    using StateChangeListener = std::function<void(const StateChange&)>;
    using RemovalListener     = std::function<void(const AircraftRemoved&)>;
    using ListenerId          = size_t;
    using Classifier          = std::function<TrafficState(const TelemetrySample& current,
                                                           const TelemetrySample& previous)>;

    explicit TrafficRegistry(const TrafficConfig& config = TrafficConfig{});

    TrafficRegistry(const TrafficRegistry&) = delete;
    TrafficRegistry& operator=(const TrafficRegistry&) = delete;

    /**
     * Ingest one sample for an aircraft, creating it on first sight.
     * Returns the confirmed transition if this sample completed one.
     */
    std::optional<StateChange> update(const std::string& id,
                                      const TelemetrySample& sample,
                                      double now);

    /**
     * Remove aircraft with now - last_seen >= stale_timeout.
     * Removal listeners are notified after the sweep.
     * @return ids removed, in key order
     */
    std::vector<std::string> evict(double now);

    /// Copy of all aircraft, ordered by id.
    TrafficSnapshot snapshot() const;

    std::optional<TrackedAircraft> find(const std::string& id) const;

    /// Aircraft relevant to a procedural context ("ground", "tower", ...).
    std::vector<ContextEntry> get_in_context(const std::string& tag) const;

    size_t size() const;

    // ── Subscriptions ──

    ListenerId on_state_change(StateChangeListener listener);
    ListenerId on_removed(RemovalListener listener);
    void remove_listener(ListenerId id);

    /**
     * Replace the built-in StateClassifier; nullptr restores it.
     * The classifier runs without the map lock and may call the read-only
     * queries (find, size, snapshot). It must not call update() or evict().
     */
    void set_classifier(Classifier classifier);

    const TrafficConfig& config() const { return config_; }

private:
    TrafficConfig config_;
    StateClassifier classifier_;
    HysteresisGate gate_;
    VoiceAssigner voices_;
    Classifier custom_classifier_;

    std::mutex write_mutex_;
    mutable std::mutex mutex_;
    std::map<std::string, TrackedAircraft> aircraft_;

    std::mutex listeners_mutex_;
    ListenerId next_listener_id_ = 1;
    std::vector<std::pair<ListenerId, StateChangeListener>> change_listeners_;
    std::vector<std::pair<ListenerId, RemovalListener>> removal_listeners_;

    void notify(const StateChange& change);
    void notify(const AircraftRemoved& removed);
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_TRAFFIC_REGISTRY_HPP
