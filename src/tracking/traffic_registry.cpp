#include "tracking/traffic_registry.hpp"
#include "tracking/teleport_detector.hpp"
#include "tracking/context_filter.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace skytraffic::tracking {

static const TrafficConfig& validated(const TrafficConfig& config) {
    TrafficConfigParser::validate(config);
    return config;
}

TrafficRegistry::TrafficRegistry(const TrafficConfig& config)
    : config_(validated(config)),
      classifier_(config.classifier),
      gate_(config.hysteresis_seconds),
      voices_(config.voices) {}

std::optional<StateChange> TrafficRegistry::update(const std::string& id,
                                                   const TelemetrySample& sample,
                                                   double now) {
    std::optional<StateChange> change;

    {
        // Writers are serialized so the entry cannot change while the map lock
        // is released for classification.
        std::lock_guard<std::mutex> write_lock(write_mutex_);

        TelemetrySample current;
        TelemetrySample previous;
        Classifier custom;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = aircraft_.find(id);
            if (it == aircraft_.end()) {
                TrackedAircraft fresh;
                fresh.id = id;
                fresh.voice = voices_.assign(id);
                it = aircraft_.emplace(id, std::move(fresh)).first;

                if (config_.verbose) {
                    std::cerr << "[TRAFFIC] New aircraft detected: " << id
                              << " (voice " << it->second.voice << ")\n";
                }
            }

            TrackedAircraft& ac = it->second;
            ac.prev_telemetry = ac.telemetry;
            ac.telemetry = sample;
            ac.last_seen = now;

            if (is_teleport(ac.prev_telemetry, ac.telemetry, config_.teleport_threshold_nm)) {
                ac.state = TrafficState::UNKNOWN;
                ac.pending_state.reset();
                if (config_.verbose) {
                    std::cerr << "[TRAFFIC] " << id << " teleported - resetting state\n";
                }
                return std::nullopt;
            }

            current = ac.telemetry;
            previous = ac.prev_telemetry;
            custom = custom_classifier_;
        }

        // Caller-supplied classifiers run without the map lock
        const TrafficState candidate = custom ? custom(current, previous)
                                              : classifier_.classify(current, previous);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = aircraft_.find(id);
            if (it == aircraft_.end()) return std::nullopt;
            change = gate_.apply(it->second, candidate, now);
        }
    }

    if (change) {
        if (config_.verbose) {
            std::cerr << "[TRAFFIC] " << change->id << " state: "
                      << to_string(change->old_state) << " -> "
                      << to_string(change->new_state) << "\n";
        }
        notify(*change);
    }
    return change;
}

std::vector<std::string> TrafficRegistry::evict(double now) {
    std::vector<AircraftRemoved> removed;

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = aircraft_.begin(); it != aircraft_.end();) {
            if (now - it->second.last_seen >= config_.stale_timeout) {
                removed.push_back({it->first, it->second.state, it->second.last_seen});
                it = aircraft_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::vector<std::string> ids;
    ids.reserve(removed.size());
    for (const auto& r : removed) {
        if (config_.verbose) {
            std::cerr << "[TRAFFIC] Removed stale aircraft: " << r.id << "\n";
        }
        notify(r);
        ids.push_back(r.id);
    }
    return ids;
}

TrafficSnapshot TrafficRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TrafficSnapshot out;
    out.reserve(aircraft_.size());
    for (const auto& [id, ac] : aircraft_) {
        out.push_back(ac);
    }
    return out;
}

std::optional<TrackedAircraft> TrafficRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aircraft_.find(id);
    if (it == aircraft_.end()) return std::nullopt;
    return it->second;
}

std::vector<ContextEntry> TrafficRegistry::get_in_context(const std::string& tag) const {
    return ContextFilter::filter(snapshot(), tag);
}

void TrafficRegistry::set_classifier(Classifier classifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    custom_classifier_ = std::move(classifier);
}

size_t TrafficRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aircraft_.size();
}

// ══════════════════════════════════════════════════════════════════
//  Listeners
// ══════════════════════════════════════════════════════════════════

TrafficRegistry::ListenerId TrafficRegistry::on_state_change(StateChangeListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    change_listeners_.emplace_back(id, std::move(listener));
    return id;
}

TrafficRegistry::ListenerId TrafficRegistry::on_removed(RemovalListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    removal_listeners_.emplace_back(id, std::move(listener));
    return id;
}

void TrafficRegistry::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto same_id = [id](const auto& entry) { return entry.first == id; };
    change_listeners_.erase(std::remove_if(change_listeners_.begin(),
                                           change_listeners_.end(), same_id),
                            change_listeners_.end());
    removal_listeners_.erase(std::remove_if(removal_listeners_.begin(),
                                            removal_listeners_.end(), same_id),
                             removal_listeners_.end());
}

// Listeners run on a copy of the list so they may subscribe or unsubscribe.
void TrafficRegistry::notify(const StateChange& change) {
    std::vector<std::pair<ListenerId, StateChangeListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = change_listeners_;
    }
    for (const auto& [id, fn] : listeners) {
        try {
            fn(change);
        } catch (const std::exception& e) {
            std::cerr << "[TRAFFIC] State-change listener " << id
                      << " failed for " << change.id << ": " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[TRAFFIC] State-change listener " << id
                      << " failed for " << change.id << ": unknown exception\n";
        }
    }
}

void TrafficRegistry::notify(const AircraftRemoved& removed) {
    std::vector<std::pair<ListenerId, RemovalListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = removal_listeners_;
    }
    for (const auto& [id, fn] : listeners) {
        try {
            fn(removed);
        } catch (const std::exception& e) {
            std::cerr << "[TRAFFIC] Removal listener " << id
                      << " failed for " << removed.id << ": " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[TRAFFIC] Removal listener " << id
                      << " failed for " << removed.id << ": unknown exception\n";
        }
    }
}

} // namespace skytraffic::tracking
