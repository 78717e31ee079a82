#include "tracking/traffic_scheduler.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace skytraffic::tracking {

static double steady_seconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

TrafficScheduler::TrafficScheduler(TrafficRegistry& registry, TelemetrySource& source,
                                   Clock clock)
    : registry_(registry),
      source_(source),
      clock_(clock ? std::move(clock) : Clock(steady_seconds)),
      scan_interval_(registry.config().scan_interval),
      snapshot_interval_(registry.config().snapshot_interval),
      eviction_interval_(registry.config().eviction_interval),
      verbose_(registry.config().verbose) {}

TrafficScheduler::~TrafficScheduler() {
    stop();
}

void TrafficScheduler::on_snapshot(SnapshotListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    snapshot_listeners_.push_back(std::move(listener));
}

TickStats TrafficScheduler::run_tick(double now) {
    TickStats stats;

    std::vector<Observation> observations;
    try {
        observations = source_.poll(now);
    } catch (const std::exception& e) {
        std::cerr << "[TRAFFIC] Telemetry poll failed: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[TRAFFIC] Telemetry poll failed: unknown exception\n";
    }
    stats.observations = observations.size();

    // Per-aircraft isolation: one bad observation never ends the tick
    for (const auto& obs : observations) {
        try {
            if (registry_.update(obs.id, obs.sample, now)) {
                stats.state_changes++;
            }
        } catch (const std::exception& e) {
            stats.failures++;
            std::cerr << "[TRAFFIC] Update failed for " << obs.id << ": "
                      << e.what() << "\n";
        } catch (...) {
            stats.failures++;
            std::cerr << "[TRAFFIC] Update failed for " << obs.id
                      << ": unknown exception\n";
        }
    }

    if (!last_snapshot_ || now - *last_snapshot_ >= snapshot_interval_) {
        emit_snapshot(now);
        last_snapshot_ = now;
        stats.snapshot_emitted = true;
    }

    if (!last_eviction_ || now - *last_eviction_ >= eviction_interval_) {
        stats.evicted = registry_.evict(now).size();
        last_eviction_ = now;
    }

    ticks_++;
    return stats;
}

void TrafficScheduler::emit_snapshot(double now) {
    std::vector<SnapshotListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = snapshot_listeners_;
    }
    if (listeners.empty()) return;

    // Copy under the registry lock, deliver without it
    const TrafficSnapshot snap = registry_.snapshot();
    for (const auto& fn : listeners) {
        try {
            fn(now, snap);
        } catch (const std::exception& e) {
            std::cerr << "[TRAFFIC] Snapshot listener failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[TRAFFIC] Snapshot listener failed: unknown exception\n";
        }
    }
}

bool TrafficScheduler::start() {
    if (!registry_.config().enabled) {
        std::cerr << "[TRAFFIC] Traffic tracking disabled in config\n";
        return false;
    }
    if (running_.exchange(true)) {
        return false;
    }

    stop_requested_ = false;
    thread_ = std::thread(&TrafficScheduler::loop, this);

    if (verbose_) {
        std::cerr << "[TRAFFIC] Scheduler started (tick " << scan_interval_ << "s)\n";
    }
    return true;
}

void TrafficScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        if (verbose_) {
            std::cerr << "[TRAFFIC] Scheduler stopped after " << ticks_.load() << " ticks\n";
        }
    }
    running_ = false;
}

void TrafficScheduler::loop() {
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(scan_interval_));
    auto next_tick = std::chrono::steady_clock::now();

    while (!stop_requested_) {
        try {
            run_tick(clock_());
        } catch (const std::exception& e) {
            std::cerr << "[TRAFFIC] Tick failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[TRAFFIC] Tick failed: unknown exception\n";
        }

        next_tick += period;
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_until(lock, next_tick, [this] { return stop_requested_.load(); });
    }
}

} // namespace skytraffic::tracking
