#include <gtest/gtest.h>
#include "io/json_reader.hpp"
#include "io/json_writer.hpp"
#include "tracking/traffic_output.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

using namespace skytraffic;
using namespace skytraffic::tracking;

class TrafficOutputTest : public ::testing::Test {
protected:
    std::ostringstream out;

    static TelemetrySample climbing() {
        TelemetrySample t;
        t.lat = 40.6413;
        t.lon = -73.7781;
        t.altitude_ft = 850.0;
        t.heading_deg = 220.0;
        t.airspeed_kt = 165.0;
        t.vertical_speed_fpm = 2200.0;
        t.on_ground = false;
        return t;
    }

    JsonValue single_line() const {
        const std::string s = out.str();
        EXPECT_FALSE(s.empty());
        EXPECT_EQ(s.back(), '\n');
        EXPECT_EQ(s.find('\n'), s.size() - 1);
        return JsonReader::parse(s);
    }
};

TEST_F(TrafficOutputTest, StateChangeCarriesEventPayload) {
    StateChange change;
    change.id = "CCA101";
    change.old_state = TrafficState::TAKEOFF_ROLL;
    change.new_state = TrafficState::AIRBORNE;
    change.telemetry = climbing();
    change.voice = "en-GB-RyanNeural";
    change.time = 125.5;

    write_state_change_json(change, out);
    JsonValue v = single_line();

    EXPECT_EQ(v["type"].as_string(), "state_change");
    EXPECT_EQ(v["callsign"].as_string(), "CCA101");
    EXPECT_EQ(v["old_state"].as_string(), "TAKEOFF_ROLL");
    EXPECT_EQ(v["new_state"].as_string(), "AIRBORNE");
    EXPECT_DOUBLE_EQ(v["latitude"].as_number(), 40.6413);
    EXPECT_DOUBLE_EQ(v["longitude"].as_number(), -73.7781);
    EXPECT_DOUBLE_EQ(v["altitude"].as_number(), 850.0);
    EXPECT_DOUBLE_EQ(v["heading"].as_number(), 220.0);
    EXPECT_DOUBLE_EQ(v["airspeed"].as_number(), 165.0);
    EXPECT_EQ(v["voice_id"].as_string(), "en-GB-RyanNeural");
    EXPECT_DOUBLE_EQ(v["time"].as_number(), 125.5);
}

TEST_F(TrafficOutputTest, SnapshotListsAircraft) {
    TrackedAircraft a;
    a.id = "DAL202";
    a.state = TrafficState::PARKED;
    TrackedAircraft b;
    b.id = "UAL9";
    b.state = TrafficState::AIRBORNE;
    b.telemetry = climbing();

    write_snapshot_json(3.0, {a, b}, out);
    JsonValue v = single_line();

    EXPECT_EQ(v["type"].as_string(), "snapshot");
    EXPECT_DOUBLE_EQ(v["time"].as_number(), 3.0);
    const auto& list = v["aircraft"].elements();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]["callsign"].as_string(), "DAL202");
    EXPECT_EQ(list[0]["state"].as_string(), "PARKED");
    EXPECT_TRUE(list[0]["on_ground"].as_bool());
    EXPECT_EQ(list[1]["state"].as_string(), "AIRBORNE");
    EXPECT_DOUBLE_EQ(list[1]["vertical_speed"].as_number(), 2200.0);
    EXPECT_FALSE(list[1]["on_ground"].as_bool());
}

TEST_F(TrafficOutputTest, EmptySnapshotIsEmptyArray) {
    write_snapshot_json(0.0, {}, out);
    JsonValue v = single_line();
    EXPECT_TRUE(v["aircraft"].is_array());
    EXPECT_EQ(v["aircraft"].size(), 0u);
}

TEST_F(TrafficOutputTest, RemovedAndContextRecords) {
    write_removed_json({"JBU55", TrafficState::TAXIING, 88.0}, out);
    JsonValue removed = single_line();
    EXPECT_EQ(removed["type"].as_string(), "removed");
    EXPECT_EQ(removed["callsign"].as_string(), "JBU55");
    EXPECT_EQ(removed["last_state"].as_string(), "TAXIING");
    EXPECT_DOUBLE_EQ(removed["last_seen"].as_number(), 88.0);

    out.str("");
    write_context_json("approach", {{"ARR1", TrafficState::APPROACH, 2400.0, 150.0}}, out);
    JsonValue ctx = single_line();
    EXPECT_EQ(ctx["type"].as_string(), "context");
    EXPECT_EQ(ctx["context"].as_string(), "approach");
    ASSERT_EQ(ctx["aircraft"].size(), 1u);
    EXPECT_EQ(ctx["aircraft"].elements()[0]["state"].as_string(), "APPROACH");
}

TEST_F(TrafficOutputTest, CallsignIsEscaped) {
    write_removed_json({"odd\"id\\", TrafficState::UNKNOWN, 0.0}, out);
    EXPECT_EQ(single_line()["callsign"].as_string(), "odd\"id\\");
}

TEST(JsonWriterTest, IndentedOutputParsesBack) {
    std::ostringstream out;
    JsonWriter w(out);
    w.begin_object();
    w.kv("name", "KJFK");
    w.kv("runways", 4);
    w.kv("nan", std::numeric_limits<double>::quiet_NaN());
    w.key("list").begin_array();
    w.value(1.5);
    w.value(true);
    w.null_value();
    w.end_array();
    w.end_object();

    EXPECT_NE(out.str().find('\n'), std::string::npos);
    JsonValue v = JsonReader::parse(out.str());
    EXPECT_EQ(v["name"].as_string(), "KJFK");
    EXPECT_EQ(v["runways"].get_int(), 4);
    EXPECT_TRUE(v["nan"].is_null());
    ASSERT_EQ(v["list"].size(), 3u);
    EXPECT_TRUE(v["list"].elements()[2].is_null());
}

TEST(JsonWriterTest, CallerStreamPrecisionUntouched) {
    std::ostringstream out;
    out.precision(3);
    JsonWriter w(out, 0);
    w.begin_array();
    w.value(40.641312345);
    w.end_array();

    EXPECT_EQ(out.precision(), 3);
    EXPECT_DOUBLE_EQ(JsonReader::parse(out.str()).elements()[0].as_number(), 40.64131235);

    out.str("");
    out << 1.23456;
    EXPECT_EQ(out.str(), "1.23");
}
