/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <missionplan/mission.hpp>

#include <chrono>
#include <cmath>
#include <sstream>
#include <string>

#include <rapidjson/document.h>

namespace missionplan {
namespace {

using namespace std::chrono;

// 2030-07-04 12:00:00 UTC
const time_point LAUNCH = sys_days{year{2030}/July/4} + hours(12);

class MissionTest : public ::testing::Test {
protected:
    Orbit orbit{MU_EARTH, 6771.0, 0.001, 28.5, 0.0, 0.0};
    TransferResult transfer = computeTransfer(MU_EARTH, 6771.0, 42164.0);
};

// ============================================================================
// Telemetry Tests
// ============================================================================

TEST_F(MissionTest, SnapshotAtEpochIsPeriapsis) {
    auto snapshot = snapshotAt(orbit, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.time, 0.0);
    EXPECT_NEAR(snapshot.meanAnomaly, 0.0, 1e-12);
    EXPECT_NEAR(snapshot.range, orbit.periapsisRadius(), 1e-9);
    EXPECT_NEAR(snapshot.position.x, orbit.periapsisRadius(), 1e-9);
    EXPECT_NEAR(snapshot.speed, orbit.velocityAtRadius(orbit.periapsisRadius()), 1e-12);
}

TEST_F(MissionTest, SnapshotRangeMatchesPosition) {
    auto snapshot = snapshotAt(orbit, 1234.5);
    EXPECT_NEAR(snapshot.range, snapshot.position.magnitude(), 1e-6);
    EXPECT_NEAR(snapshot.meanAnomaly, orbit.meanMotion() * 1234.5, 1e-12);
}

TEST_F(MissionTest, SnapshotWrapsAfterFullOrbits) {
    auto first = snapshotAt(orbit, 600.0);
    auto later = snapshotAt(orbit, 600.0 + 3.0 * orbit.period());
    EXPECT_NEAR(first.meanAnomaly, later.meanAnomaly, 1e-9);
    EXPECT_NEAR(first.range, later.range, 1e-6);
}

TEST_F(MissionTest, SnapshotHalfPeriodIsApoapsis) {
    Orbit eccentric(MU_EARTH, 26600.0, 0.74);
    auto snapshot = snapshotAt(eccentric, eccentric.period() / 2.0);
    EXPECT_NEAR(snapshot.range, eccentric.apoapsisRadius(), 1e-3);
}

// ============================================================================
// Timeline Tests
// ============================================================================

TEST_F(MissionTest, TimelineHasFiveEvents) {
    auto timeline = buildTimeline(transfer, LAUNCH);
    ASSERT_EQ(timeline.size(), 5);
    EXPECT_EQ(timeline[0].title, "Launch (T+0)");
    EXPECT_EQ(timeline[1].title, "Parking orbit insertion");
    EXPECT_EQ(timeline[2].title, "Transfer burn (Δv1)");
    EXPECT_EQ(timeline[3].title, "Apogee arrival / Circularize (Δv2)");
    EXPECT_EQ(timeline[4].title, "Mission ops begin");
}

TEST_F(MissionTest, TimelineOffsets) {
    auto timeline = buildTimeline(transfer, LAUNCH);
    ASSERT_EQ(timeline.size(), 5);
    EXPECT_EQ(timeline[0].time, LAUNCH);
    EXPECT_EQ(timeline[1].time, LAUNCH + minutes(30));
    EXPECT_EQ(timeline[2].time, LAUNCH + hours(2));
    // Arrival uses whole seconds of the time of flight
    EXPECT_EQ(timeline[3].time, LAUNCH + seconds(19044));
    EXPECT_EQ(timeline[4].time, LAUNCH + seconds(19044) + hours(1));
}

TEST_F(MissionTest, TimelineIsOrdered) {
    auto timeline = buildTimeline(transfer, LAUNCH);
    for (size_t i = 1; i < timeline.size(); i++) {
        EXPECT_LE(timeline[i - 1].time, timeline[i].time);
    }
}

TEST_F(MissionTest, TimelineDescribesBurns) {
    auto timeline = buildTimeline(transfer, LAUNCH);
    ASSERT_EQ(timeline.size(), 5);
    EXPECT_NE(timeline[2].description.find("2.39947 km/s"), std::string::npos);
    EXPECT_NE(timeline[3].description.find("1.45722 km/s"), std::string::npos);
}

TEST_F(MissionTest, PrintTimeline) {
    std::ostringstream os;
    printTimeline(os, buildTimeline(transfer, LAUNCH));
    std::string output = os.str();
    EXPECT_NE(output.find("2030-07-04 12:00  Launch (T+0)"), std::string::npos);
    EXPECT_NE(output.find("2030-07-04 12:30  Parking orbit insertion"), std::string::npos);
    // 12:00 + 5h 17m 24s
    EXPECT_NE(output.find("2030-07-04 17:17  Apogee arrival"), std::string::npos);
    EXPECT_NE(output.find("2030-07-04 18:17  Mission ops begin"), std::string::npos);
}

// ============================================================================
// Report Tests
// ============================================================================

TEST_F(MissionTest, BuildSummary) {
    auto summary = buildSummary(orbit, transfer, 0.0, LAUNCH);
    EXPECT_DOUBLE_EQ(summary.orbit.getSemiMajorAxis(), 6771.0);
    EXPECT_DOUBLE_EQ(summary.transfer.dvTotal, transfer.dvTotal);
    EXPECT_NEAR(summary.telemetry.range, orbit.periapsisRadius(), 1e-9);
    EXPECT_EQ(summary.timeline.size(), 5);
}

TEST_F(MissionTest, WriteReport) {
    std::ostringstream os;
    writeReport(os, buildSummary(orbit, transfer, 0.0, LAUNCH));
    std::string output = os.str();
    EXPECT_EQ(output.rfind("MISSION REPORT\n", 0), 0);
    EXPECT_NE(output.find("Semi-major axis (a): 6771.00 km"), std::string::npos);
    EXPECT_NE(output.find("Eccentricity: 0.001000"), std::string::npos);
    EXPECT_NE(output.find("Orbital period: 1.540238 hours"), std::string::npos);
    EXPECT_NE(output.find("Hohmann transfer to r=42164.00 km -> Δv_total=3.856689 km/s, TOF=5.290088 hours"),
              std::string::npos);
    EXPECT_NE(output.find("Range from central body at t=0.0 s: 6764.229 km"), std::string::npos);
}

TEST_F(MissionTest, JSONParses) {
    auto json = toJSON(buildSummary(orbit, transfer, 0.0, LAUNCH));
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsObject());
    EXPECT_TRUE(doc.HasMember("orbit"));
    EXPECT_TRUE(doc.HasMember("transfer"));
    EXPECT_TRUE(doc.HasMember("telemetry"));
    EXPECT_TRUE(doc.HasMember("timeline"));
}

TEST_F(MissionTest, JSONCarriesValues) {
    auto json = toJSON(buildSummary(orbit, transfer, 0.0, LAUNCH));
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());

    EXPECT_NEAR(doc["orbit"]["semiMajorAxis"].GetDouble(), 6771.0, 1e-9);
    EXPECT_NEAR(doc["orbit"]["period"].GetDouble(), orbit.period(), 1e-6);
    EXPECT_NEAR(doc["transfer"]["dvTotal"].GetDouble(), transfer.dvTotal, 1e-12);
    EXPECT_NEAR(doc["transfer"]["timeOfFlight"].GetDouble(), transfer.timeOfFlight, 1e-6);
    EXPECT_NEAR(doc["telemetry"]["position"]["x"].GetDouble(), orbit.periapsisRadius(), 1e-6);
    EXPECT_NEAR(doc["telemetry"]["position"]["y"].GetDouble(), 0.0, 1e-6);
}

TEST_F(MissionTest, JSONTimeline) {
    auto json = toJSON(buildSummary(orbit, transfer, 0.0, LAUNCH));
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());

    const auto& timeline = doc["timeline"];
    ASSERT_TRUE(timeline.IsArray());
    ASSERT_EQ(timeline.Size(), 5);
    EXPECT_STREQ(timeline[0]["time"].GetString(), "2030-07-04T12:00:00Z");
    EXPECT_STREQ(timeline[0]["title"].GetString(), "Launch (T+0)");
    EXPECT_EQ(timeline[3]["unix"].GetInt64() - timeline[0]["unix"].GetInt64(), 19044);
}

}
}
