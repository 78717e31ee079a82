#include <gtest/gtest.h>
#include "tracking/context_filter.hpp"
#include <algorithm>

using namespace skytraffic::tracking;

class ContextFilterTest : public ::testing::Test {
protected:
    TrafficSnapshot snapshot;

    void SetUp() override {
        add("TAXI1", TrafficState::TAXIING, true, 0.0, 15.0, 0.0);
        add("ROLL1", TrafficState::TAKEOFF_ROLL, true, 0.0, 120.0, 0.0);
        add("CLMB1", TrafficState::AIRBORNE, false, 2000.0, 180.0, 1500.0);
        add("ARR1", TrafficState::APPROACH, false, 5000.0, 170.0, -700.0);
        add("CRZ1", TrafficState::AIRBORNE, false, 35000.0, 450.0, 0.0);
    }

    void add(const std::string& id, TrafficState state, bool on_ground,
             double alt, double speed, double vs) {
        TrackedAircraft ac;
        ac.id = id;
        ac.state = state;
        ac.telemetry.on_ground = on_ground;
        ac.telemetry.altitude_ft = alt;
        ac.telemetry.airspeed_kt = speed;
        ac.telemetry.vertical_speed_fpm = vs;
        snapshot.push_back(ac);
    }

    std::vector<std::string> ids(const std::string& tag) const {
        std::vector<std::string> out;
        for (const auto& e : ContextFilter::filter(snapshot, tag)) out.push_back(e.id);
        return out;
    }
};

TEST_F(ContextFilterTest, Ground) {
    EXPECT_EQ(ids("ground"), std::vector<std::string>({"TAXI1"}));
}

TEST_F(ContextFilterTest, Tower) {
    EXPECT_EQ(ids("tower"), std::vector<std::string>({"ROLL1", "CLMB1"}));
}

TEST_F(ContextFilterTest, Approach) {
    EXPECT_EQ(ids("approach"), std::vector<std::string>({"ARR1"}));
}

TEST_F(ContextFilterTest, Center) {
    EXPECT_EQ(ids("center"), std::vector<std::string>({"CRZ1"}));
}

TEST_F(ContextFilterTest, UnknownTagPassesEverything) {
    EXPECT_EQ(ids("ramp").size(), snapshot.size());
    EXPECT_EQ(ids("").size(), snapshot.size());
}

TEST_F(ContextFilterTest, LowDescentMatchesTowerAndApproach) {
    add("FINAL1", TrafficState::APPROACH, false, 1200.0, 140.0, -700.0);
    auto tower = ids("tower");
    auto approach = ids("approach");
    EXPECT_NE(std::find(tower.begin(), tower.end(), "FINAL1"), tower.end());
    EXPECT_NE(std::find(approach.begin(), approach.end(), "FINAL1"), approach.end());
}

TEST_F(ContextFilterTest, EntriesCarryStateAndKinematics) {
    auto rows = ContextFilter::filter(snapshot, "center");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].state, TrafficState::AIRBORNE);
    EXPECT_DOUBLE_EQ(rows[0].altitude_ft, 35000.0);
    EXPECT_DOUBLE_EQ(rows[0].airspeed_kt, 450.0);
}

TEST_F(ContextFilterTest, ThresholdsAreExclusiveBelow) {
    snapshot.clear();
    add("ROLL40", TrafficState::TAKEOFF_ROLL, true, 0.0, 40.0, 0.0);
    add("AIR3000", TrafficState::AIRBORNE, false, 3000.0, 200.0, 500.0);
    add("DESC10K", TrafficState::AIRBORNE, false, 10000.0, 250.0, -1000.0);
    add("LEVEL5K", TrafficState::AIRBORNE, false, 5000.0, 210.0, 0.0);

    EXPECT_TRUE(ids("ground").empty());
    EXPECT_EQ(ids("tower"), std::vector<std::string>({"ROLL40"}));
    EXPECT_TRUE(ids("approach").empty());
    EXPECT_EQ(ids("center"), std::vector<std::string>({"DESC10K"}));
}
