#include <gtest/gtest.h>
#include "tracking/traffic_scheduler.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace skytraffic::tracking;

namespace {

class ScriptedSource : public TelemetrySource {
public:
    std::function<std::vector<Observation>(double)> script;
    bool fail = false;
    bool fail_raw = false;
    std::atomic<int> polls{0};

    std::vector<Observation> poll(double now) override {
        polls++;
        if (fail) throw std::runtime_error("feed offline");
        if (fail_raw) throw -1;
        return script ? script(now) : std::vector<Observation>{};
    }
};

Observation parked(const std::string& id, double lat = 40.6413, double lon = -73.7781) {
    Observation obs;
    obs.id = id;
    obs.sample.lat = lat;
    obs.sample.lon = lon;
    obs.sample.on_ground = true;
    return obs;
}

} // namespace

class TrafficSchedulerTest : public ::testing::Test {
protected:
    TrafficRegistry registry;
    ScriptedSource source;
};

TEST_F(TrafficSchedulerTest, TickFeedsEveryObservation) {
    source.script = [](double) {
        return std::vector<Observation>{parked("CCA101"), parked("DAL202", 40.64, -73.78)};
    };
    TrafficScheduler scheduler(registry, source);

    TickStats stats = scheduler.run_tick(0.0);
    EXPECT_EQ(stats.observations, 2u);
    EXPECT_EQ(stats.failures, 0u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(scheduler.ticks(), 1u);

    for (double t : {0.5, 1.0, 1.5}) scheduler.run_tick(t);
    stats = scheduler.run_tick(2.0);
    EXPECT_EQ(stats.state_changes, 2u);
    EXPECT_EQ(registry.find("DAL202")->state, TrafficState::PARKED);
}

TEST_F(TrafficSchedulerTest, FailingAircraftDoesNotStopTheTick) {
    // Negative altitude marks the poisoned record
    registry.set_classifier([](const TelemetrySample& cur, const TelemetrySample& prev) {
        if (cur.altitude_ft < 0.0) throw std::runtime_error("bad telemetry");
        return StateClassifier().classify(cur, prev);
    });

    source.script = [](double) {
        Observation bad = parked("BAD", 40.65, -73.77);
        bad.sample.altitude_ft = -1.0;
        return std::vector<Observation>{parked("AAL1"), bad, parked("UAL2", 40.64, -73.78)};
    };
    TrafficScheduler scheduler(registry, source);

    TickStats stats = scheduler.run_tick(0.0);
    EXPECT_EQ(stats.observations, 3u);
    EXPECT_EQ(stats.failures, 1u);

    stats = scheduler.run_tick(2.0);
    EXPECT_EQ(stats.failures, 1u);
    EXPECT_EQ(stats.state_changes, 2u);
    EXPECT_EQ(registry.find("AAL1")->state, TrafficState::PARKED);
    EXPECT_EQ(registry.find("UAL2")->state, TrafficState::PARKED);
    EXPECT_DOUBLE_EQ(registry.find("UAL2")->last_seen, 2.0);
}

TEST_F(TrafficSchedulerTest, NonStandardThrowIsContainedPerAircraft) {
    registry.set_classifier([](const TelemetrySample& cur, const TelemetrySample& prev) {
        if (cur.altitude_ft < 0.0) throw 42;
        return StateClassifier().classify(cur, prev);
    });

    source.script = [](double) {
        Observation bad = parked("BAD", 40.65, -73.77);
        bad.sample.altitude_ft = -1.0;
        return std::vector<Observation>{bad, parked("GOOD")};
    };
    TrafficScheduler scheduler(registry, source);

    TickStats stats;
    EXPECT_NO_THROW(stats = scheduler.run_tick(0.0));
    EXPECT_EQ(stats.failures, 1u);
    ASSERT_TRUE(registry.find("GOOD").has_value());
    EXPECT_EQ(*registry.find("GOOD")->pending_state, TrafficState::PARKED);

    EXPECT_NO_THROW(stats = scheduler.run_tick(2.0));
    EXPECT_EQ(stats.failures, 1u);
    EXPECT_EQ(registry.find("GOOD")->state, TrafficState::PARKED);
}

TEST_F(TrafficSchedulerTest, NonStandardPollThrowIsContained) {
    source.fail_raw = true;
    TrafficScheduler scheduler(registry, source);

    TickStats stats;
    EXPECT_NO_THROW(stats = scheduler.run_tick(0.0));
    EXPECT_EQ(stats.observations, 0u);
    EXPECT_EQ(scheduler.ticks(), 1u);
}

TEST_F(TrafficSchedulerTest, PollFailureSkipsOnlyTheObservations) {
    source.fail = true;
    TrafficScheduler scheduler(registry, source);

    int snapshots = 0;
    scheduler.on_snapshot([&](double, const TrafficSnapshot&) { snapshots++; });

    TickStats stats;
    EXPECT_NO_THROW(stats = scheduler.run_tick(0.0));
    EXPECT_EQ(stats.observations, 0u);
    EXPECT_TRUE(stats.snapshot_emitted);
    EXPECT_EQ(snapshots, 1);
    EXPECT_EQ(scheduler.ticks(), 1u);
}

TEST_F(TrafficSchedulerTest, SnapshotCadence) {
    source.script = [](double) { return std::vector<Observation>{parked("CCA101")}; };
    TrafficScheduler scheduler(registry, source);

    std::vector<double> times;
    std::vector<size_t> sizes;
    scheduler.on_snapshot([&](double now, const TrafficSnapshot& snap) {
        times.push_back(now);
        sizes.push_back(snap.size());
    });

    for (int step = 0; step <= 4; step++) scheduler.run_tick(step * 0.5);

    EXPECT_EQ(times, std::vector<double>({0.0, 1.0, 2.0}));
    EXPECT_EQ(sizes, std::vector<size_t>({1, 1, 1}));
}

TEST_F(TrafficSchedulerTest, SnapshotListenerFailureIsContained) {
    TrafficScheduler scheduler(registry, source);
    int good = 0;
    scheduler.on_snapshot([](double, const TrafficSnapshot&) {
        throw std::runtime_error("sink closed");
    });
    scheduler.on_snapshot([&](double, const TrafficSnapshot&) { good++; });

    EXPECT_NO_THROW(scheduler.run_tick(0.0));
    EXPECT_EQ(good, 1);
}

TEST_F(TrafficSchedulerTest, SilentAircraftEvictedOnSweep) {
    source.script = [](double now) {
        return now == 0.0 ? std::vector<Observation>{parked("CCA101")}
                          : std::vector<Observation>{};
    };
    TrafficScheduler scheduler(registry, source);

    std::vector<std::string> removed;
    registry.on_removed([&](const AircraftRemoved& r) { removed.push_back(r.id); });

    size_t evicted = 0;
    for (int step = 0; step < 60; step++) {
        evicted += scheduler.run_tick(step * 0.5).evicted;
    }
    EXPECT_EQ(evicted, 0u);
    EXPECT_EQ(registry.size(), 1u);

    TickStats stats = scheduler.run_tick(30.0);
    EXPECT_EQ(stats.evicted, 1u);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(removed, std::vector<std::string>({"CCA101"}));
}

TEST_F(TrafficSchedulerTest, EvictionRunsOnItsOwnInterval) {
    TrafficConfig config;
    config.eviction_interval = 5.0;
    config.stale_timeout = 1.0;
    TrafficRegistry slow_sweep(config);

    source.script = [](double now) {
        return now == 0.0 ? std::vector<Observation>{parked("CCA101")}
                          : std::vector<Observation>{};
    };
    TrafficScheduler scheduler(slow_sweep, source);

    scheduler.run_tick(0.0);
    EXPECT_EQ(scheduler.run_tick(2.0).evicted, 0u);
    EXPECT_EQ(slow_sweep.size(), 1u);
    EXPECT_EQ(scheduler.run_tick(5.0).evicted, 1u);
}

TEST_F(TrafficSchedulerTest, DisabledConfigDoesNotStart) {
    TrafficConfig config;
    config.enabled = false;
    TrafficRegistry disabled(config);
    TrafficScheduler scheduler(disabled, source);

    EXPECT_FALSE(scheduler.start());
    EXPECT_FALSE(scheduler.running());
    EXPECT_EQ(source.polls.load(), 0);
}

TEST_F(TrafficSchedulerTest, ThreadedLoopTicksUntilStopped) {
    TrafficConfig config;
    config.scan_interval = 0.02;
    TrafficRegistry fast(config);

    std::mutex mtx;
    std::vector<double> snapshot_times;
    TrafficScheduler scheduler(fast, source, [] { return 42.0; });
    scheduler.on_snapshot([&](double now, const TrafficSnapshot&) {
        std::lock_guard<std::mutex> lock(mtx);
        snapshot_times.push_back(now);
    });

    ASSERT_TRUE(scheduler.start());
    EXPECT_TRUE(scheduler.running());
    EXPECT_FALSE(scheduler.start());

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    scheduler.stop();

    EXPECT_FALSE(scheduler.running());
    EXPECT_GE(scheduler.ticks(), 2u);
    const size_t ticks_at_stop = scheduler.ticks();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(scheduler.ticks(), ticks_at_stop);

    std::lock_guard<std::mutex> lock(mtx);
    ASSERT_FALSE(snapshot_times.empty());
    EXPECT_DOUBLE_EQ(snapshot_times.front(), 42.0);

    scheduler.stop();  // idempotent
}

TEST_F(TrafficSchedulerTest, SubscribeWhileRunning) {
    TrafficConfig config;
    config.scan_interval = 0.01;
    config.snapshot_interval = 0.01;
    TrafficRegistry fast(config);
    TrafficScheduler scheduler(fast, source);

    ASSERT_TRUE(scheduler.start());
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    std::atomic<int> late{0};
    scheduler.on_snapshot([&](double, const TrafficSnapshot&) { late++; });

    for (int i = 0; i < 100 && late.load() == 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    scheduler.stop();
    EXPECT_GT(late.load(), 0);
}
