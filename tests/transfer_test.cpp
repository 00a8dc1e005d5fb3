/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <missionplan/transfer.hpp>
#include <missionplan/orbit.hpp>

#include <cmath>
#include <sstream>
#include <string>

namespace missionplan {
namespace {

constexpr double LEO_RADIUS = 6771.0;
constexpr double GEO_RADIUS = 42164.0;

// ============================================================================
// LEO to GEO
// ============================================================================

TEST(HohmannTransferTest, LEOToGEOBurns) {
    auto transfer = computeTransfer(MU_EARTH, LEO_RADIUS, GEO_RADIUS);
    EXPECT_NEAR(transfer.dv1, 2.39947, 1e-5);
    EXPECT_NEAR(transfer.dv2, 1.45722, 1e-5);
    EXPECT_NEAR(transfer.dvTotal, 3.85669, 1e-5);
}

TEST(HohmannTransferTest, LEOToGEOTimeOfFlight) {
    auto transfer = computeTransfer(MU_EARTH, LEO_RADIUS, GEO_RADIUS);
    EXPECT_NEAR(transfer.timeOfFlight, 19044.3, 0.1);
    EXPECT_NEAR(transfer.timeOfFlight / 3600.0, 5.29, 0.01);
}

TEST(HohmannTransferTest, TransferSemiMajorAxis) {
    auto transfer = computeTransfer(MU_EARTH, LEO_RADIUS, GEO_RADIUS);
    EXPECT_DOUBLE_EQ(transfer.transferSemiMajorAxis, 24467.5);
}

TEST(HohmannTransferTest, RecordsInputsAndSpeeds) {
    auto transfer = computeTransfer(MU_EARTH, LEO_RADIUS, GEO_RADIUS);
    EXPECT_DOUBLE_EQ(transfer.r1, LEO_RADIUS);
    EXPECT_DOUBLE_EQ(transfer.r2, GEO_RADIUS);
    EXPECT_NEAR(transfer.v1, std::sqrt(MU_EARTH / LEO_RADIUS), 1e-12);
    EXPECT_NEAR(transfer.v2, std::sqrt(MU_EARTH / GEO_RADIUS), 1e-12);
    EXPECT_GT(transfer.vPerigee, transfer.v1);
    EXPECT_LT(transfer.vApogee, transfer.v2);
}

TEST(HohmannTransferTest, TotalIsSumOfBurns) {
    auto transfer = computeTransfer(MU_EARTH, 7000.0, 12000.0);
    EXPECT_DOUBLE_EQ(transfer.dvTotal, transfer.dv1 + transfer.dv2);
}

// ============================================================================
// Symmetry and Edge Cases
// ============================================================================

TEST(HohmannTransferTest, DirectionSymmetry) {
    auto up = computeTransfer(MU_EARTH, LEO_RADIUS, GEO_RADIUS);
    auto down = computeTransfer(MU_EARTH, GEO_RADIUS, LEO_RADIUS);
    EXPECT_NEAR(up.dvTotal, down.dvTotal, 1e-12);
    EXPECT_NEAR(up.timeOfFlight, down.timeOfFlight, 1e-9);
    EXPECT_DOUBLE_EQ(up.transferSemiMajorAxis, down.transferSemiMajorAxis);
}

TEST(HohmannTransferTest, LoweringSwapsBurns) {
    auto up = computeTransfer(MU_EARTH, LEO_RADIUS, GEO_RADIUS);
    auto down = computeTransfer(MU_EARTH, GEO_RADIUS, LEO_RADIUS);
    EXPECT_NEAR(down.dv1, up.dv2, 1e-12);
    EXPECT_NEAR(down.dv2, up.dv1, 1e-12);
}

TEST(HohmannTransferTest, BurnsAreNonNegative) {
    auto down = computeTransfer(MU_EARTH, 20000.0, 8000.0);
    EXPECT_GE(down.dv1, 0.0);
    EXPECT_GE(down.dv2, 0.0);
}

TEST(HohmannTransferTest, SameRadiusNeedsNoBurns) {
    auto transfer = computeTransfer(MU_EARTH, LEO_RADIUS, LEO_RADIUS);
    EXPECT_NEAR(transfer.dv1, 0.0, 1e-12);
    EXPECT_NEAR(transfer.dv2, 0.0, 1e-12);
    // Half of the circular orbit's period
    Orbit orbit(MU_EARTH, LEO_RADIUS);
    EXPECT_NEAR(transfer.timeOfFlight, orbit.period() / 2.0, 1e-9);
}

TEST(HohmannTransferTest, TimeOfFlightIsHalfTransferPeriod) {
    auto transfer = computeTransfer(MU_EARTH, 7000.0, 30000.0);
    Orbit ellipse(MU_EARTH, transfer.transferSemiMajorAxis, (30000.0 - 7000.0) / 37000.0);
    EXPECT_NEAR(transfer.timeOfFlight, ellipse.period() / 2.0, 1e-6);
}

TEST(HohmannTransferTest, TransferEllipseSpeedsMatchVisViva) {
    double r1 = 7000.0;
    double r2 = 30000.0;
    auto transfer = computeTransfer(MU_EARTH, r1, r2);
    Orbit ellipse(MU_EARTH, transfer.transferSemiMajorAxis, (r2 - r1) / (r1 + r2));
    EXPECT_NEAR(transfer.vPerigee, ellipse.velocityAtRadius(r1), 1e-12);
    EXPECT_NEAR(transfer.vApogee, ellipse.velocityAtRadius(r2), 1e-12);
}

TEST(HohmannTransferTest, OtherCentralBody) {
    // Low Mars orbit to Deimos radius
    constexpr double MU_MARS = 42828.37;
    auto transfer = computeTransfer(MU_MARS, 3800.0, 23460.0);
    EXPECT_GT(transfer.dvTotal, 0.0);
    EXPECT_NEAR(transfer.timeOfFlight,
                M_PI * std::sqrt(std::pow(0.5 * (3800.0 + 23460.0), 3) / MU_MARS), 1e-9);
}

// ============================================================================
// printTransfer Tests
// ============================================================================

TEST(PrintTransferTest, ContainsBurns) {
    std::ostringstream os;
    printTransfer(os, computeTransfer(MU_EARTH, LEO_RADIUS, GEO_RADIUS));
    std::string output = os.str();
    EXPECT_NE(output.find("Target Radius: 42164.00 km"), std::string::npos);
    EXPECT_NE(output.find("Total Δv: 3.85669 km/s"), std::string::npos);
    EXPECT_NE(output.find("5.29009 hours"), std::string::npos);
}

}
}
