/**
 * TrafficScheduler — Fixed-cadence tick loop driving a TrafficRegistry.
 *
 * Each tick: poll the telemetry source → update() every observation in
 * order → emit a bulk snapshot if snapshot_interval has passed since the
 * last one → evict if eviction_interval has passed since the last sweep.
 *
 * The loop thread is the sole writer to the registry. A failure in one
 * observation is logged and the rest of the tick continues. stop() is
 * cooperative: it takes effect between ticks.
 */

#ifndef SKYTRAFFIC_TRACKING_TRAFFIC_SCHEDULER_HPP
#define SKYTRAFFIC_TRACKING_TRAFFIC_SCHEDULER_HPP

#include "tracking/traffic_registry.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace skytraffic::tracking {

/// Producer of observations; polled once per tick from the loop thread.
class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;
    virtual std::vector<Observation> poll(double now) = 0;
};

struct TickStats {
    size_t observations = 0;
    size_t failures = 0;
    size_t state_changes = 0;
    bool snapshot_emitted = false;
    size_t evicted = 0;
};

class TrafficScheduler {
public:
    using SnapshotListener = std::function<void(double now, const TrafficSnapshot&)>;
    using Clock = std::function<double()>;

    /**
     * @param registry  Engine to drive; must outlive the scheduler
     * @param source    Observation producer; must outlive the scheduler
     * @param clock     Seconds on a monotonic scale; defaults to steady_clock
     */
    TrafficScheduler(TrafficRegistry& registry, TelemetrySource& source,
                     Clock clock = nullptr);
    ~TrafficScheduler();

    TrafficScheduler(const TrafficScheduler&) = delete;
    TrafficScheduler& operator=(const TrafficScheduler&) = delete;

    /// Safe to call while the loop is running; takes effect from the next snapshot.
    void on_snapshot(SnapshotListener listener);

    /// One synchronous tick at the given time. Used by the loop and by tests.
    TickStats run_tick(double now);

    /// Start the loop thread. Returns false if tracking is disabled or already running.
    bool start();

    /// Request stop and join. Safe to call repeatedly.
    void stop();

    bool running() const { return running_.load(); }

    size_t ticks() const { return ticks_.load(); }

private:
    TrafficRegistry& registry_;
    TelemetrySource& source_;
    Clock clock_;
    double scan_interval_;
    double snapshot_interval_;
    double eviction_interval_;
    bool verbose_;

    std::mutex listeners_mutex_;
    std::vector<SnapshotListener> snapshot_listeners_;
    std::optional<double> last_snapshot_;
    std::optional<double> last_eviction_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> ticks_{0};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    void loop();
    void emit_snapshot(double now);
};

} // namespace skytraffic::tracking

#endif // SKYTRAFFIC_TRACKING_TRAFFIC_SCHEDULER_HPP
